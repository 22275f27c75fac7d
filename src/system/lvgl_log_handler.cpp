// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "lvgl_log_handler.h"

#include "lvgl/lvgl.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <string_view>

namespace touchstick {
namespace logging {

namespace {

void lvgl_log_cb(lv_log_level_t level, const char* buf) {
    std::string_view msg(buf ? buf : "");
    // LVGL terminates every message with a newline
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r')) {
        msg.remove_suffix(1);
    }

    switch (level) {
    case LV_LOG_LEVEL_TRACE:
        spdlog::trace("[LVGL] {}", msg);
        break;
    case LV_LOG_LEVEL_INFO:
        spdlog::info("[LVGL] {}", msg);
        break;
    case LV_LOG_LEVEL_WARN:
        spdlog::warn("[LVGL] {}", msg);
        break;
    case LV_LOG_LEVEL_ERROR:
        spdlog::error("[LVGL] {}", msg);
        break;
    default:
        spdlog::debug("[LVGL] {}", msg);
        break;
    }
}

} // namespace

void register_lvgl_log_handler() {
    lv_log_register_print_cb(lvgl_log_cb);
}

void init_logging(int verbosity) {
    auto logger = spdlog::stderr_color_mt("touchstick");
    spdlog::set_default_logger(logger);

    spdlog::level::level_enum level = spdlog::level::warn;
    if (verbosity == 1) {
        level = spdlog::level::info;
    } else if (verbosity == 2) {
        level = spdlog::level::debug;
    } else if (verbosity >= 3) {
        level = spdlog::level::trace;
    }
    spdlog::set_level(level);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
}

} // namespace logging
} // namespace touchstick
