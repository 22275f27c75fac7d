// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#pragma once

#include "task_scheduler.h"

#include "lvgl/lvgl.h"

#include <memory>
#include <unordered_map>

namespace touchstick {

/**
 * @brief TaskScheduler backed by LVGL one-shot timers
 *
 * Each schedule() creates an lv_timer with repeat count 1; LVGL deletes it
 * after it fires. Callbacks run from lv_timer_handler() on the LVGL thread.
 * Pending timers are deleted on destruction.
 */
class LvglScheduler : public TaskScheduler {
  public:
    LvglScheduler() = default;
    ~LvglScheduler() override;

    // Non-copyable, non-movable (timer user_data points into this object)
    LvglScheduler(const LvglScheduler&) = delete;
    LvglScheduler& operator=(const LvglScheduler&) = delete;
    LvglScheduler(LvglScheduler&&) = delete;
    LvglScheduler& operator=(LvglScheduler&&) = delete;

    TimerId schedule(uint32_t delay_ms, std::function<void()> cb) override;
    bool cancel(TimerId id) override;
    bool pending(TimerId id) const override;
    uint64_t now_ms() const override;

    size_t pending_count() const {
        return slots_.size();
    }

  private:
    struct Slot {
        LvglScheduler* owner;
        TimerId id;
        lv_timer_t* timer;
        std::function<void()> cb;
    };

    static void timer_cb(lv_timer_t* timer);

    TimerId next_id_ = 1;
    std::unordered_map<TimerId, std::unique_ptr<Slot>> slots_;
};

} // namespace touchstick
