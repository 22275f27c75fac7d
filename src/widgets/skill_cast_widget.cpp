// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#include "skill_cast_widget.h"

#include "pointer_id_allocator.h"
#include "touch_event.h"

#include <spdlog/spdlog.h>

namespace touchstick {

namespace {

BoundaryOptions skill_boundary_options(bool smooth) {
    BoundaryOptions options;
    options.fallback_radius = SkillCastWidget::DEFAULT_CAST_RADIUS;
    options.smooth_fallback = smooth;
    return options;
}

bool read_flag(const json& value) {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number()) {
        return value.get<double>() != 0.0;
    }
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        return s == "1" || s == "true" || s == "yes" || s == "on";
    }
    return false;
}

} // namespace

const char* skill_state_name(SkillState state) {
    switch (state) {
    case SkillState::Inactive:
        return "inactive";
    case SkillState::Moving:
        return "moving";
    case SkillState::Active:
        return "active";
    case SkillState::Locked:
        return "locked";
    case SkillState::Canceling:
        return "canceling";
    }
    return "unknown";
}

const char* cast_timing_name(CastTiming timing) {
    switch (timing) {
    case CastTiming::OnRelease:
        return "on_release";
    case CastTiming::Immediate:
        return "immediate";
    case CastTiming::Manual:
        return "manual";
    }
    return "on_release";
}

std::optional<CastTiming> parse_cast_timing(const json& value) {
    if (!value.is_string()) {
        return std::nullopt;
    }
    const auto& s = value.get_ref<const std::string&>();
    if (s == "on_release") {
        return CastTiming::OnRelease;
    }
    if (s == "immediate") {
        return CastTiming::Immediate;
    }
    if (s == "manual") {
        return CastTiming::Manual;
    }
    return std::nullopt;
}

CalibrationLimits SkillCastWidget::default_limits() {
    CalibrationLimits limits;
    limits.deadzone_default = 0.1;
    limits.deadzone_max = 0.95;
    limits.has_gain_switch = true;
    limits.has_diagonals = true;
    return limits;
}

SkillCastWidget::SkillCastWidget(WidgetId id, WidgetGeometry geometry, WidgetContext& ctx)
    : GestureWidget(id, geometry, ctx), store_(config_, ctx.surface, default_limits()),
      mapper_(store_, skill_boundary_options(false)),
      calibration_(id, store_, mapper_, ctx.bus), current_(geometry.center),
      mouse_(geometry.center), drain_timer_(ctx.scheduler), step_timer_(ctx.scheduler) {
    mapper_.set_adjuster([this](Vec2 offset) { return adjust_offset(offset); });

    smooth_cb_ = config_.add_change_callback(
        skill_keys::SMOOTH_BOUNDARY, [this](const std::string&, const json& value, ChangeOrigin) {
            mapper_.set_boundary_options(skill_boundary_options(read_flag(value)));
        });
    ideal_cb_ = config_.add_change_callback(
        "", [this](const std::string&, const json&, ChangeOrigin) { ideal_map_loaded_ = false; });

    motion_sub_ = ctx.bus.subscribe<MouseMotionEvent>(
        [this](const MouseMotionEvent& e) { motion(e.position); });
    cancel_sub_ = ctx.bus.subscribe<CancelCastingEvent>(
        [this](const CancelCastingEvent& e) { cancel_cast(e.target); });

    spdlog::debug("[SkillCast] Widget {} created at ({:.0f}, {:.0f}) r={:.0f}", id,
                  geometry.center.x, geometry.center.y, geometry.radius);
}

SkillCastWidget::~SkillCastWidget() {
    motion_sub_.reset();
    cancel_sub_.reset();
    cancel();
    config_.remove_change_callback(smooth_cb_);
    config_.remove_change_callback(ideal_cb_);
    calibration_.abort_interaction();
}

CastTiming SkillCastWidget::cast_timing() const {
    return parse_cast_timing(config_.get(skill_keys::CAST_TIMING)).value_or(CastTiming::OnRelease);
}

void SkillCastWidget::set_cast_timing(CastTiming timing) {
    config_.set(skill_keys::CAST_TIMING, cast_timing_name(timing));
}

// ============================================================================
// Input queue
// ============================================================================

void SkillCastWidget::press(Vec2 pointer) {
    enqueue(SkillEventType::Press, pointer);
}

void SkillCastWidget::release(Vec2 pointer) {
    enqueue(SkillEventType::Release, pointer);
}

void SkillCastWidget::motion(Vec2 pointer) {
    enqueue(SkillEventType::Motion, pointer);
}

void SkillCastWidget::cancel_cast(Vec2 cancel_target) {
    enqueue(SkillEventType::Cancel, cancel_target);
}

void SkillCastWidget::enqueue(SkillEventType type, Vec2 position) {
    if (!queue_.try_push({type, position})) {
        return;
    }
    if (!drain_timer_.active()) {
        drain_timer_.start(0, [this] { drain(); });
    }
}

void SkillCastWidget::drain() {
    while (auto event = queue_.pop()) {
        dispatch(*event);
    }
}

void SkillCastWidget::dispatch(const SkillEvent& event) {
    switch (event.type) {
    case SkillEventType::Press:
        handle_press(event.position);
        break;
    case SkillEventType::Release:
        handle_release();
        break;
    case SkillEventType::Motion:
        handle_motion(event.position);
        break;
    case SkillEventType::Cancel:
        handle_cancel(event.position);
        break;
    }
}

void SkillCastWidget::cancel() {
    queue_.clear();
    drain_timer_.cancel();
    if (state_ == SkillState::Inactive) {
        return;
    }
    spdlog::debug("[SkillCast] Widget {} cancelled in state {}", id(), skill_state_name(state_));
    finish(false);
}

// ============================================================================
// Event handlers
// ============================================================================

void SkillCastWidget::handle_press(Vec2 pointer) {
    mouse_ = pointer;

    switch (state_) {
    case SkillState::Inactive: {
        Vec2 target = compute_target(pointer);
        auto pointer_id = context().pointer_ids.allocate(id());
        if (!pointer_id) {
            spdlog::warn("[SkillCast] Widget {} has no free pointer id, press ignored", id());
            return;
        }
        current_ = geometry().center;
        released_while_moving_ = false;
        spdlog::debug("[SkillCast] Widget {} casting with pointer id {} ({})", id(), *pointer_id,
                      cast_timing_name(cast_timing()));
        emit(TouchAction::Down);
        start_run(target, false);
        break;
    }

    case SkillState::Locked:
        finish(true);
        break;

    case SkillState::Moving:
    case SkillState::Active:
    case SkillState::Canceling:
        spdlog::trace("[SkillCast] Widget {} ignoring press in state {}", id(),
                      skill_state_name(state_));
        break;
    }
}

void SkillCastWidget::handle_release() {
    if (state_ == SkillState::Inactive || state_ == SkillState::Canceling) {
        return;
    }
    // Immediate releases on its own, Manual on the next press
    if (cast_timing() != CastTiming::OnRelease) {
        return;
    }
    if (state_ == SkillState::Moving) {
        released_while_moving_ = true;
    } else if (state_ == SkillState::Active) {
        finish(true);
    }
}

void SkillCastWidget::handle_motion(Vec2 pointer) {
    mouse_ = pointer;
    if (state_ != SkillState::Active && state_ != SkillState::Locked) {
        return;
    }
    current_ = compute_target(pointer);
    emit(TouchAction::Move);
}

void SkillCastWidget::handle_cancel(Vec2 cancel_target) {
    if (state_ == SkillState::Inactive) {
        return;
    }
    cancel_target_ = cancel_target;
    // An in-flight cast move picks the cancel target up when it completes
    if (state_ != SkillState::Moving) {
        start_cancel_move();
    }
}

// ============================================================================
// Mapping
// ============================================================================

Vec2 SkillCastWidget::compute_target(Vec2 pointer) const {
    return mapper_.map(pointer, geometry().center, geometry().radius).target;
}

double SkillCastWidget::boundary_radius_at(double angle) const {
    auto distance = mapper_.boundary().distance_at_angle(angle);
    if (distance && *distance > 0.0) {
        return *distance;
    }
    return DEFAULT_CAST_RADIUS;
}

Vec2 SkillCastWidget::adjust_offset(Vec2 offset) const {
    // No correction while a new map is being sampled
    if (session_.active()) {
        return offset;
    }
    if (!ideal_map_loaded_) {
        ideal_map_ = load_ideal_map(config_, ideal_skill());
        ideal_map_loaded_ = true;
    }
    return ideal_map_ ? ideal_map_->apply(offset) : offset;
}

// ============================================================================
// Interpolation
// ============================================================================

void SkillCastWidget::start_run(Vec2 target, bool canceling) {
    state_ = canceling ? SkillState::Canceling : SkillState::Moving;
    run_ = Run{current_, target, 0, canceling};
    uint64_t generation = ++run_generation_;
    step_timer_.cancel();
    spdlog::trace("[SkillCast] Widget {} run {} to ({:.1f}, {:.1f})", id(), generation, target.x,
                  target.y);
    run_step(generation);
}

void SkillCastWidget::run_step(uint64_t generation) {
    if (generation != run_generation_ || state_ == SkillState::Inactive) {
        return;
    }
    if (run_.step < MOVE_STEPS) {
        ++run_.step;
        double t = static_cast<double>(run_.step) / MOVE_STEPS;
        current_ = run_.start + (run_.target - run_.start) * t;
        emit(TouchAction::Move);
        step_timer_.start(STEP_INTERVAL_MS, [this, generation] { run_step(generation); });
        return;
    }
    on_run_complete(run_.canceling);
}

void SkillCastWidget::on_run_complete(bool canceling) {
    if (canceling) {
        finish(true);
        return;
    }
    if (cancel_target_) {
        start_cancel_move();
        return;
    }

    switch (cast_timing()) {
    case CastTiming::Immediate:
        finish(true);
        break;
    case CastTiming::Manual:
        state_ = SkillState::Locked;
        spdlog::debug("[SkillCast] Widget {} locked", id());
        break;
    case CastTiming::OnRelease:
        if (released_while_moving_) {
            finish(true);
        } else {
            state_ = SkillState::Active;
            spdlog::debug("[SkillCast] Widget {} active", id());
        }
        break;
    }
}

void SkillCastWidget::start_cancel_move() {
    spdlog::debug("[SkillCast] Widget {} canceling toward ({:.0f}, {:.0f})", id(),
                  cancel_target_->x, cancel_target_->y);
    start_run(*cancel_target_, true);
}

// ============================================================================
// Release
// ============================================================================

void SkillCastWidget::finish(bool capture_sample) {
    emit(TouchAction::Up);
    if (capture_sample) {
        capture_ideal_sample();
    }
    reset();
}

void SkillCastWidget::reset() {
    state_ = SkillState::Inactive;
    current_ = geometry().center;
    released_while_moving_ = false;
    cancel_target_.reset();
    ++run_generation_;
    step_timer_.cancel();
    context().pointer_ids.release(id());
}

void SkillCastWidget::emit(TouchAction action) {
    context().emitter.emit(id(), action, current_);
}

void SkillCastWidget::refresh_overlay() {
    context().bus.publish(OverlayEvent{OverlayAction::Refresh, id()});
}

// ============================================================================
// Ideal calibration
// ============================================================================

std::string SkillCastWidget::ideal_skill() const {
    return config_.get<std::string>(skill_keys::IDEAL_SKILL,
                                    IdealCalibrationSession::DEFAULT_SKILL);
}

void SkillCastWidget::start_ideal_calibration(const std::string& skill, int samples) {
    calibration_.abort_interaction();
    session_.start(skill, samples);
    config_.set(skill_keys::IDEAL_SKILL, session_.skill());
    refresh_overlay();
}

void SkillCastWidget::stop_ideal_calibration(bool save_partial) {
    if (!session_.active()) {
        return;
    }
    if (save_partial && !session_.samples().empty()) {
        finalize_ideal_calibration();
    }
    session_.stop();
    refresh_overlay();
}

void SkillCastWidget::confirm_ideal_sample(SampleDecision decision) {
    if (!session_.awaiting_confirmation()) {
        return;
    }
    if (session_.confirm(decision)) {
        finalize_ideal_calibration();
        session_.stop();
    }
    refresh_overlay();
}

bool SkillCastWidget::reset_ideal_calibration(const std::string& skill) {
    return clear_ideal_map(config_, skill);
}

std::optional<IdealTarget> SkillCastWidget::ideal_target() const {
    return session_.current_target(store_.effective_center(),
                                   [this](double angle) { return boundary_radius_at(angle); });
}

void SkillCastWidget::capture_ideal_sample() {
    if (!session_.active() || state_ == SkillState::Canceling) {
        return;
    }
    Vec2 center = store_.effective_center();
    GainPair gains = store_.gains();
    Vec2 raw = mouse_ - center;
    Vec2 offset{raw.x * gains.x, raw.y * gains.y};
    if (session_.capture(offset, center,
                         [this](double angle) { return boundary_radius_at(angle); })) {
        refresh_overlay();
    }
}

void SkillCastWidget::finalize_ideal_calibration() {
    auto map = IdealCalibrationMap::build(session_.samples());
    if (!map) {
        spdlog::warn("[SkillCast] Widget {} could not build an ideal calibration map", id());
        return;
    }
    save_ideal_map(config_, session_.skill(), *map);
}

} // namespace touchstick
