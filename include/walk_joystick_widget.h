// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#pragma once

#include "calibration_controller.h"
#include "calibration_store.h"
#include "config_store.h"
#include "gesture_widget.h"
#include "pointer_mapper.h"
#include "task_scheduler.h"
#include "touch_event.h"

#include <cstdint>
#include <optional>

namespace touchstick {

enum class WalkState {
    Inactive, ///< No gesture, no pointer id
    Moving,   ///< Interpolating from the widget center toward the target
    Holding   ///< At the target; waiting for release or the hold timer
};

const char* walk_state_name(WalkState state);

/**
 * @brief Auto-release delay after a short click
 *
 * Proportional to the pointer's distance from the calibrated center relative
 * to half the surface diagonal: clamp(ratio * 5 s, 0.5 s, 5 s).
 */
double hold_duration_seconds(double pointer_distance, SurfaceSize surface);

/**
 * @brief Click-to-walk virtual joystick
 *
 * A click presses the joystick and glides it toward the mapped direction in
 * 6 steps of 20 ms. A short click keeps the stick deflected for a
 * distance-proportional hold time; holding the button past 300 ms makes the
 * stick follow the pointer until release.
 *
 * Reentrant: a new click while active updates the gesture instead of
 * starting another one.
 */
class WalkJoystickWidget : public GestureWidget {
  public:
    static constexpr uint32_t STEP_INTERVAL_MS = 20;
    static constexpr int MOVE_STEPS = 6;
    static constexpr uint64_t LONG_PRESS_MS = 300;

    static CalibrationLimits default_limits();

    WalkJoystickWidget(WidgetId id, WidgetGeometry geometry, WidgetContext& ctx);
    ~WalkJoystickWidget() override;

    const char* type_name() const override {
        return "walk_joystick";
    }

    void press(Vec2 pointer) override;
    void release(Vec2 pointer) override;
    void cancel() override;

    /// Pointer moved (also fed from MouseMotionEvent on the bus)
    void motion(Vec2 pointer);

    bool is_active() const override {
        return state_ != WalkState::Inactive;
    }

    ConfigStore& config() override {
        return config_;
    }
    Calibratable* calibratable() override {
        return &calibration_;
    }
    Tunable* tunable() override {
        return &calibration_;
    }

    WalkState state() const {
        return state_;
    }
    Vec2 current_position() const {
        return current_;
    }
    Vec2 target_position() const {
        return target_;
    }
    bool hold_timer_active() const {
        return hold_timer_.active();
    }

    const PointerMapper& mapper() const {
        return mapper_;
    }

  private:
    Vec2 compute_target(Vec2 pointer) const;
    void lock_target(Vec2 pointer);
    bool should_follow_pointer(uint64_t now);

    void start_move();
    void on_move_step();
    void on_reached_boundary();
    void start_hold_timer();
    void finish();
    void reset();
    void emit(TouchAction action);

    ConfigStore config_;
    CalibrationStore store_;
    PointerMapper mapper_;
    CalibrationController calibration_;

    WalkState state_ = WalkState::Inactive;
    Vec2 current_;
    Vec2 target_;
    std::optional<Vec2> locked_target_;
    int steps_done_ = 0;

    bool key_pressed_ = false;
    bool long_press_ = false;
    uint64_t press_time_ms_ = 0;
    double pointer_distance_ = 0.0;

    ScopedTimer move_timer_;
    ScopedTimer hold_timer_;
    Subscription motion_sub_;
};

} // namespace touchstick
