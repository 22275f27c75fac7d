// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "live_loop.h"

#include "command_dispatcher.h"
#include "widget_manager.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace touchstick {

LiveLoop::LiveLoop(CommandDispatcher& dispatcher, WidgetManager& widgets, int input_fd)
    : dispatcher_(dispatcher), widgets_(widgets), fd_(input_fd) {
    poll_timer_ = lv_timer_create(poll_cb, POLL_INTERVAL_MS, this);
}

LiveLoop::~LiveLoop() {
    if (poll_timer_ && lv_is_initialized()) {
        lv_timer_delete(poll_timer_);
    }
}

int LiveLoop::run() {
    spdlog::info("[LiveLoop] Reading commands from fd {}", fd_);
    while (!quit_) {
        uint32_t idle_ms = lv_timer_handler();
        usleep(std::min<uint32_t>(idle_ms, POLL_INTERVAL_MS) * 1000);
    }
    widgets_.cancel_all();
    spdlog::info("[LiveLoop] {} commands, {} rejected", dispatcher_.dispatched_count(),
                 dispatcher_.rejected_count());
    return 0;
}

void LiveLoop::poll_cb(lv_timer_t* timer) {
    auto* self = static_cast<LiveLoop*>(lv_timer_get_user_data(timer));
    self->poll_input();
}

void LiveLoop::poll_input() {
    std::array<char, 4096> chunk{};
    for (;;) {
        pollfd pfd{fd_, POLLIN, 0};
        int ready = ::poll(&pfd, 1, 0);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("[LiveLoop] poll failed: {}", std::strerror(errno));
            quit_ = true;
            return;
        }
        if (ready == 0) {
            return;
        }

        ssize_t n = ::read(fd_, chunk.data(), chunk.size());
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            spdlog::error("[LiveLoop] read failed: {}", std::strerror(errno));
            quit_ = true;
            return;
        }
        if (n == 0) {
            // Flush a trailing command without newline
            if (!buffer_.empty()) {
                dispatch_line(buffer_);
                buffer_.clear();
            }
            spdlog::debug("[LiveLoop] End of input");
            quit_ = true;
            return;
        }
        feed(std::string_view(chunk.data(), static_cast<size_t>(n)));
    }
}

size_t LiveLoop::feed(std::string_view data) {
    buffer_.append(data);
    size_t lines = 0;
    size_t start = 0;
    for (size_t nl = buffer_.find('\n', start); nl != std::string::npos;
         nl = buffer_.find('\n', start)) {
        dispatch_line(std::string_view(buffer_).substr(start, nl - start));
        start = nl + 1;
        ++lines;
    }
    buffer_.erase(0, start);
    return lines;
}

void LiveLoop::dispatch_line(std::string_view line) {
    if (line.find_first_not_of(" \t\r") == std::string_view::npos) {
        return;
    }
    json command = json::parse(line, nullptr, false);
    if (command.is_discarded()) {
        spdlog::warn("[LiveLoop] Ignoring malformed line: {}", line);
        return;
    }
    if (!dispatcher_.dispatch(command)) {
        spdlog::debug("[LiveLoop] Command refused: {}", line);
    }
}

} // namespace touchstick
