// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#include "lvgl_scheduler.h"

#include <spdlog/spdlog.h>

namespace touchstick {

LvglScheduler::~LvglScheduler() {
    if (lv_is_initialized()) {
        for (auto& [id, slot] : slots_) {
            lv_timer_delete(slot->timer);
        }
    }
    slots_.clear();
}

TimerId LvglScheduler::schedule(uint32_t delay_ms, std::function<void()> cb) {
    TimerId id = next_id_++;
    auto slot = std::make_unique<Slot>(Slot{this, id, nullptr, std::move(cb)});
    // LVGL timers need a non-zero period to fire on the next handler pass
    slot->timer = lv_timer_create(timer_cb, delay_ms > 0 ? delay_ms : 1, slot.get());
    lv_timer_set_repeat_count(slot->timer, 1);
    slots_.emplace(id, std::move(slot));
    return id;
}

bool LvglScheduler::cancel(TimerId id) {
    auto it = slots_.find(id);
    if (it == slots_.end()) {
        return false;
    }
    if (lv_is_initialized()) {
        lv_timer_delete(it->second->timer);
    }
    slots_.erase(it);
    return true;
}

bool LvglScheduler::pending(TimerId id) const {
    return slots_.count(id) > 0;
}

uint64_t LvglScheduler::now_ms() const {
    return lv_tick_get();
}

void LvglScheduler::timer_cb(lv_timer_t* timer) {
    auto* slot = static_cast<Slot*>(lv_timer_get_user_data(timer));
    LvglScheduler* self = slot->owner;
    TimerId id = slot->id;

    // One-shot: LVGL deletes the timer after this returns, so drop the slot
    // before invoking (the callback may schedule or cancel other timers)
    auto it = self->slots_.find(id);
    if (it == self->slots_.end()) {
        spdlog::warn("[LvglScheduler] Timer {} fired without a slot", id);
        return;
    }
    auto cb = std::move(it->second->cb);
    self->slots_.erase(it);

    if (cb) {
        cb();
    }
}

} // namespace touchstick
