// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#include "walk_joystick_widget.h"

#include "pointer_id_allocator.h"
#include "touch_event.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace touchstick {

namespace {

constexpr double MAX_HOLD_S = 5.0;
constexpr double MIN_HOLD_S = 0.5;

BoundaryOptions walk_boundary_options() {
    BoundaryOptions options;
    // No anchors: direction only, full deflection
    options.saturate_without_anchors = true;
    return options;
}

} // namespace

const char* walk_state_name(WalkState state) {
    switch (state) {
    case WalkState::Inactive:
        return "inactive";
    case WalkState::Moving:
        return "moving";
    case WalkState::Holding:
        return "holding";
    }
    return "unknown";
}

double hold_duration_seconds(double pointer_distance, SurfaceSize surface) {
    double half_diagonal = surface.diagonal() / 2.0;
    if (half_diagonal <= 0.0) {
        return MIN_HOLD_S;
    }
    double ratio = std::min(std::max(pointer_distance, 0.0) / half_diagonal, 1.0);
    return std::max(MIN_HOLD_S, ratio * MAX_HOLD_S);
}

CalibrationLimits WalkJoystickWidget::default_limits() {
    CalibrationLimits limits;
    limits.deadzone_default = 0.08;
    limits.deadzone_max = 0.9;
    limits.has_gain_switch = false;
    limits.has_diagonals = false;
    return limits;
}

WalkJoystickWidget::WalkJoystickWidget(WidgetId id, WidgetGeometry geometry, WidgetContext& ctx)
    : GestureWidget(id, geometry, ctx), store_(config_, ctx.surface, default_limits()),
      mapper_(store_, walk_boundary_options()), calibration_(id, store_, mapper_, ctx.bus),
      current_(geometry.center), target_(geometry.center), move_timer_(ctx.scheduler),
      hold_timer_(ctx.scheduler) {
    motion_sub_ = ctx.bus.subscribe<MouseMotionEvent>(
        [this](const MouseMotionEvent& e) { motion(e.position); });
    spdlog::debug("[WalkJoystick] Widget {} created at ({:.0f}, {:.0f}) r={:.0f}", id,
                  geometry.center.x, geometry.center.y, geometry.radius);
}

WalkJoystickWidget::~WalkJoystickWidget() {
    motion_sub_.reset();
    cancel();
    calibration_.abort_interaction();
}

// ============================================================================
// Input
// ============================================================================

void WalkJoystickWidget::press(Vec2 pointer) {
    uint64_t now = context().scheduler.now_ms();

    switch (state_) {
    case WalkState::Inactive: {
        auto pointer_id = context().pointer_ids.allocate(id());
        if (!pointer_id) {
            spdlog::warn("[WalkJoystick] Widget {} has no free pointer id, click ignored", id());
            return;
        }
        lock_target(pointer);
        press_time_ms_ = now;
        long_press_ = false;
        key_pressed_ = true;
        state_ = WalkState::Moving;
        current_ = geometry().center;
        spdlog::debug("[WalkJoystick] Widget {} pressed, pointer id {}", id(), *pointer_id);
        emit(TouchAction::Down);
        start_move();
        break;
    }

    case WalkState::Moving:
        // Keep gliding toward the new locked target
        lock_target(pointer);
        press_time_ms_ = now;
        long_press_ = false;
        key_pressed_ = true;
        break;

    case WalkState::Holding:
        lock_target(pointer);
        current_ = target_;
        emit(TouchAction::Move);
        press_time_ms_ = now;
        long_press_ = false;
        hold_timer_.cancel();
        key_pressed_ = true;
        break;
    }
}

void WalkJoystickWidget::release(Vec2 /*pointer*/) {
    if (state_ == WalkState::Inactive) {
        return;
    }
    key_pressed_ = false;
    if (context().scheduler.now_ms() - press_time_ms_ >= LONG_PRESS_MS) {
        long_press_ = true;
    }

    if (long_press_) {
        finish();
        return;
    }
    if (state_ == WalkState::Holding) {
        start_hold_timer();
    }
    // Moving: the hold timer starts once the boundary is reached
}

void WalkJoystickWidget::motion(Vec2 pointer) {
    if (state_ == WalkState::Inactive) {
        return;
    }
    if (should_follow_pointer(context().scheduler.now_ms())) {
        target_ = compute_target(pointer);
        locked_target_.reset();
    } else if (locked_target_) {
        target_ = *locked_target_;
    }

    if (state_ == WalkState::Holding) {
        current_ = target_;
        emit(TouchAction::Move);
    }
}

void WalkJoystickWidget::cancel() {
    if (state_ == WalkState::Inactive) {
        return;
    }
    spdlog::debug("[WalkJoystick] Widget {} cancelled in state {}", id(),
                  walk_state_name(state_));
    finish();
}

// ============================================================================
// Targeting
// ============================================================================

Vec2 WalkJoystickWidget::compute_target(Vec2 pointer) const {
    return mapper_.map(pointer, geometry().center, geometry().radius).target;
}

void WalkJoystickWidget::lock_target(Vec2 pointer) {
    pointer_distance_ = (pointer - store_.effective_center()).length();
    locked_target_ = compute_target(pointer);
    target_ = *locked_target_;
}

bool WalkJoystickWidget::should_follow_pointer(uint64_t now) {
    if (!key_pressed_) {
        return false;
    }
    if (long_press_) {
        return true;
    }
    if (now - press_time_ms_ > LONG_PRESS_MS) {
        long_press_ = true;
        return true;
    }
    return false;
}

// ============================================================================
// Interpolation and hold
// ============================================================================

void WalkJoystickWidget::start_move() {
    steps_done_ = 0;
    move_timer_.start(STEP_INTERVAL_MS, [this] { on_move_step(); });
}

void WalkJoystickWidget::on_move_step() {
    if (state_ != WalkState::Moving) {
        return;
    }
    if (steps_done_ < MOVE_STEPS) {
        double remaining = MOVE_STEPS - steps_done_;
        current_ = current_ + (target_ - current_) * (1.0 / remaining);
        ++steps_done_;
        emit(TouchAction::Move);
        move_timer_.start(STEP_INTERVAL_MS, [this] { on_move_step(); });
        return;
    }
    current_ = target_;
    on_reached_boundary();
}

void WalkJoystickWidget::on_reached_boundary() {
    state_ = WalkState::Holding;
    spdlog::trace("[WalkJoystick] Widget {} holding at ({:.1f}, {:.1f})", id(), current_.x,
                  current_.y);
    if (!long_press_ && !key_pressed_) {
        start_hold_timer();
    }
}

void WalkJoystickWidget::start_hold_timer() {
    double seconds = hold_duration_seconds(pointer_distance_, store_.surface());
    auto delay = static_cast<uint32_t>(seconds * 1000.0);
    spdlog::trace("[WalkJoystick] Widget {} hold {} ms", id(), delay);
    hold_timer_.start(delay, [this] {
        if (state_ == WalkState::Inactive) {
            return;
        }
        finish();
    });
}

void WalkJoystickWidget::finish() {
    emit(TouchAction::Up);
    reset();
}

void WalkJoystickWidget::reset() {
    state_ = WalkState::Inactive;
    current_ = geometry().center;
    target_ = geometry().center;
    locked_target_.reset();
    steps_done_ = 0;
    key_pressed_ = false;
    long_press_ = false;
    move_timer_.cancel();
    hold_timer_.cancel();
    context().pointer_ids.release(id());
}

void WalkJoystickWidget::emit(TouchAction action) {
    context().emitter.emit(id(), action, current_);
}

} // namespace touchstick
