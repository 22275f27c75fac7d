// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#include "task_scheduler.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace touchstick {

TimerId ManualScheduler::schedule(uint32_t delay_ms, std::function<void()> cb) {
    TimerId id = next_id_++;
    timers_.emplace(id, Entry{now_ + delay_ms, std::move(cb)});
    return id;
}

bool ManualScheduler::cancel(TimerId id) {
    return timers_.erase(id) > 0;
}

bool ManualScheduler::pending(TimerId id) const {
    return timers_.count(id) > 0;
}

size_t ManualScheduler::advance(uint64_t ms) {
    const uint64_t target = now_ + ms;
    size_t fired = 0;

    for (;;) {
        auto next = timers_.end();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (it->second.due <= target &&
                (next == timers_.end() || it->second.due < next->second.due)) {
                next = it;
            }
        }
        if (next == timers_.end()) {
            break;
        }

        now_ = next->second.due;
        auto cb = std::move(next->second.cb);
        timers_.erase(next);
        if (cb) {
            cb();
        }
        ++fired;
    }

    now_ = target;
    return fired;
}

size_t ManualScheduler::run_until_idle(uint64_t max_ms) {
    const uint64_t deadline = now_ + max_ms;
    size_t fired = 0;
    while (!timers_.empty() && now_ < deadline) {
        uint64_t earliest = deadline;
        for (const auto& [id, entry] : timers_) {
            earliest = std::min(earliest, entry.due);
        }
        fired += advance(earliest > now_ ? earliest - now_ : 0);
    }
    if (!timers_.empty()) {
        spdlog::warn("[ManualScheduler] {} timers still pending after {} ms", timers_.size(),
                     max_ms);
    }
    return fired;
}

// ============================================================================
// ScopedTimer
// ============================================================================

void ScopedTimer::start(uint32_t delay_ms, std::function<void()> cb) {
    cancel();
    id_ = scheduler_.schedule(delay_ms, [this, cb = std::move(cb)]() {
        id_ = INVALID_TIMER; // One-shot: clear before invoking (allows restart from callback)
        cb();
    });
}

void ScopedTimer::cancel() {
    if (id_ != INVALID_TIMER) {
        scheduler_.cancel(id_);
        id_ = INVALID_TIMER;
    }
}

bool ScopedTimer::active() const {
    return id_ != INVALID_TIMER && scheduler_.pending(id_);
}

} // namespace touchstick
