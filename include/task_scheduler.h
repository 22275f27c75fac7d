// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#pragma once

#include <cstdint>
#include <functional>
#include <map>

namespace touchstick {

using TimerId = uint64_t;

/// Never returned by schedule()
constexpr TimerId INVALID_TIMER = 0;

/**
 * @brief Single-threaded cooperative one-shot timer service
 *
 * Every gesture delay (interpolation steps, hold timer, queue drain) goes
 * through this interface, so the whole core runs on one loop without locks.
 * Callbacks run on the loop thread; they may schedule or cancel timers.
 */
class TaskScheduler {
  public:
    virtual ~TaskScheduler() = default;

    /**
     * @brief Run cb once after delay_ms
     * @return Handle for cancel(); never INVALID_TIMER
     */
    virtual TimerId schedule(uint32_t delay_ms, std::function<void()> cb) = 0;

    /**
     * @brief Cancel a pending timer
     *
     * Safe to call with an id that already fired or was cancelled.
     *
     * @return true if a pending timer was removed
     */
    virtual bool cancel(TimerId id) = 0;

    virtual bool pending(TimerId id) const = 0;

    /// Monotonic milliseconds
    virtual uint64_t now_ms() const = 0;
};

/**
 * @brief Deterministic scheduler driven by a virtual clock
 *
 * Time only moves in advance(). Timers fire in (due time, creation order)
 * order, and timers scheduled from a callback fire within the same
 * advance() if they fall due inside the window. Used by tests and by the
 * replay driver.
 */
class ManualScheduler : public TaskScheduler {
  public:
    explicit ManualScheduler(uint64_t start_ms = 0) : now_(start_ms) {}

    TimerId schedule(uint32_t delay_ms, std::function<void()> cb) override;
    bool cancel(TimerId id) override;
    bool pending(TimerId id) const override;
    uint64_t now_ms() const override {
        return now_;
    }

    /**
     * @brief Move the clock forward, firing everything that falls due
     * @return Number of callbacks run
     */
    size_t advance(uint64_t ms);

    /// Advance until no timer is pending or max_ms elapsed
    size_t run_until_idle(uint64_t max_ms = 60000);

    size_t pending_count() const {
        return timers_.size();
    }

  private:
    struct Entry {
        uint64_t due;
        std::function<void()> cb;
    };

    uint64_t now_;
    TimerId next_id_ = 1;
    std::map<TimerId, Entry> timers_;
};

/**
 * @brief RAII handle for one pending timer
 *
 * start() replaces any pending callback; cancel() is idempotent; the
 * destructor cancels. The handle clears itself before invoking the callback,
 * so the callback may restart it.
 *
 * @code
 * ScopedTimer step_timer_{scheduler};
 * step_timer_.start(20, [this] { on_step(); });
 * @endcode
 */
class ScopedTimer {
  public:
    explicit ScopedTimer(TaskScheduler& scheduler) : scheduler_(scheduler) {}
    ~ScopedTimer() {
        cancel();
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    void start(uint32_t delay_ms, std::function<void()> cb);

    void cancel();

    /// @return true if a callback is scheduled but hasn't fired yet
    bool active() const;

  private:
    TaskScheduler& scheduler_;
    TimerId id_ = INVALID_TIMER;
};

} // namespace touchstick
