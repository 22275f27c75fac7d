// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file lvgl_log_handler.h
 * @brief Custom LVGL log handler that routes through spdlog
 *
 * Routes all LVGL log messages through spdlog so the live loop has one log
 * stream on stderr, away from the touch events on stdout.
 */

#pragma once

namespace touchstick {
namespace logging {

/**
 * @brief Register the custom LVGL log handler
 *
 * Call after lv_init() and after spdlog initialization. LVGL trace / info /
 * warn / error map to the spdlog level of the same name.
 */
void register_lvgl_log_handler();

/**
 * @brief Configure the default spdlog logger
 *
 * Colored stderr sink. Verbosity 0 logs warnings and errors, 1 adds info,
 * 2 adds debug, 3 and above adds trace.
 */
void init_logging(int verbosity);

} // namespace logging
} // namespace touchstick
