// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file live_loop.h
 * @brief Interactive driver: JSON command lines in, touch events out
 *
 * Runs the LVGL timer loop. A periodic lv_timer polls the input descriptor
 * without blocking and dispatches each complete line as a command. End of
 * input aborts all gestures and leaves the loop.
 */

#pragma once

#include "lvgl/lvgl.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace touchstick {

class CommandDispatcher;
class WidgetManager;

class LiveLoop {
  public:
    static constexpr uint32_t POLL_INTERVAL_MS = 5;

    /// lv_init() must have run; the loop does not own the descriptor
    LiveLoop(CommandDispatcher& dispatcher, WidgetManager& widgets, int input_fd);
    ~LiveLoop();

    LiveLoop(const LiveLoop&) = delete;
    LiveLoop& operator=(const LiveLoop&) = delete;

    /// Run until end of input or request_quit(); returns the process exit code
    int run();

    void request_quit() {
        quit_ = true;
    }

    /**
     * @brief Append raw input; every complete line is dispatched
     * @return Number of lines dispatched
     */
    size_t feed(std::string_view data);

  private:
    static void poll_cb(lv_timer_t* timer);
    void poll_input();
    void dispatch_line(std::string_view line);

    CommandDispatcher& dispatcher_;
    WidgetManager& widgets_;
    int fd_;
    lv_timer_t* poll_timer_ = nullptr;
    std::string buffer_;
    bool quit_ = false;
};

} // namespace touchstick
