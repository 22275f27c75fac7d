// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "lvgl/lvgl.h"

#include <cstdint>

/**
 * @brief Shared LVGL setup for tests that drive lv_timer callbacks
 *
 * LVGL is initialized once per process and left running between tests. No
 * tick callback is installed, so time only moves inside process_lvgl().
 */
class LVGLTestFixture {
  public:
    LVGLTestFixture() {
        if (!lv_is_initialized()) {
            lv_init();
        }
    }
    virtual ~LVGLTestFixture() = default;

    /// Advance the LVGL tick by ms, running the timer handler every millisecond
    void process_lvgl(uint32_t ms) {
        for (uint32_t i = 0; i < ms; ++i) {
            lv_tick_inc(1);
            lv_timer_handler();
        }
    }
};
