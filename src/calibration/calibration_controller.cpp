// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#include "calibration_controller.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace touchstick {

CalibrationController::CalibrationController(WidgetId widget, CalibrationStore& store,
                                             const PointerMapper& mapper, EventBus& bus)
    : widget_(widget), store_(store), mapper_(mapper), bus_(bus) {
    mask_sub_ = bus_.subscribe<MaskClickedEvent>(
        [this](const MaskClickedEvent& e) { handle_calibration_click(e.position); });

    config_cb_ = store_.config().add_change_callback(
        "", [this](const std::string&, const json&, ChangeOrigin origin) {
            if (origin == ChangeOrigin::Restore) {
                return;
            }
            emit_overlay(OverlayAction::Refresh);
        });

    emit_overlay(OverlayAction::Register);
}

CalibrationController::~CalibrationController() {
    store_.config().remove_change_callback(config_cb_);
    emit_overlay(OverlayAction::Unregister);
}

void CalibrationController::emit_overlay(OverlayAction action) {
    bus_.publish(OverlayEvent{action, widget_});
}

// ============================================================================
// Capture
// ============================================================================

void CalibrationController::begin_center_capture() {
    capture_mode_ = CaptureMode::Center;
    spdlog::debug("[Calibration] Widget {} capturing center", widget_);
    emit_overlay(OverlayAction::Start);
}

void CalibrationController::begin_anchor_capture(AnchorAxis axis) {
    capture_mode_ = CaptureMode::Anchor;
    capture_axis_ = axis;
    spdlog::debug("[Calibration] Widget {} capturing {} anchor", widget_, anchor_axis_name(axis));
    emit_overlay(OverlayAction::Start);
}

bool CalibrationController::begin_diagonal_capture(Quadrant quadrant) {
    if (!store_.limits().has_diagonals || !store_.anchor_distances()) {
        spdlog::debug("[Calibration] Widget {} cannot capture diagonal {} without anchors",
                      widget_, quadrant_key(quadrant));
        return false;
    }
    capture_mode_ = CaptureMode::Diagonal;
    capture_quadrant_ = quadrant;
    spdlog::debug("[Calibration] Widget {} capturing diagonal {}", widget_,
                  quadrant_key(quadrant));
    emit_overlay(OverlayAction::Start);
    return true;
}

void CalibrationController::cancel_capture() {
    if (capture_mode_ == CaptureMode::None) {
        return;
    }
    end_capture();
}

void CalibrationController::end_capture() {
    capture_mode_ = CaptureMode::None;
    emit_overlay(OverlayAction::Stop);
}

bool CalibrationController::handle_calibration_click(Vec2 position) {
    if (capture_mode_ == CaptureMode::None) {
        return false;
    }
    if (!store_.surface().contains(position.x, position.y)) {
        spdlog::debug("[Calibration] Ignoring click ({}, {}) outside the surface", position.x,
                      position.y);
        return false;
    }

    switch (capture_mode_) {
    case CaptureMode::Center:
        if (!store_.set_calibrated_center(position.x, position.y)) {
            return false;
        }
        break;

    case CaptureMode::Anchor: {
        Vec2 c = store_.effective_center();
        double distance = 0.0;
        switch (capture_axis_) {
        case AnchorAxis::Up:
            distance = c.y - position.y;
            break;
        case AnchorAxis::Down:
            distance = position.y - c.y;
            break;
        case AnchorAxis::Left:
            distance = c.x - position.x;
            break;
        case AnchorAxis::Right:
            distance = position.x - c.x;
            break;
        }
        if (!store_.set_anchor(capture_axis_, static_cast<int>(std::lround(distance)))) {
            return false;
        }
        break;
    }

    case CaptureMode::Diagonal: {
        Vec2 c = store_.effective_center();
        DiagonalOffset offset{static_cast<int>(std::lround(position.x - c.x)),
                              static_cast<int>(std::lround(position.y - c.y))};
        if (!store_.store_diagonal_offset(capture_quadrant_, offset)) {
            return false;
        }
        break;
    }

    case CaptureMode::None:
        return false;
    }

    end_capture();
    return true;
}

void CalibrationController::reset_center() {
    store_.clear_calibrated_center();
    store_.reset_gains();
}

// ============================================================================
// Text-field apply
// ============================================================================

bool CalibrationController::apply_center(const json& x, const json& y) {
    auto px = parse_number(x);
    auto py = parse_number(y);
    if (!px || !py) {
        return false;
    }
    return store_.set_calibrated_center(*px, *py);
}

bool CalibrationController::apply_gains(const json& x, const json& y) {
    auto gx = sanitize_gain(x, store_.limits());
    auto gy = sanitize_gain(y, store_.limits());
    if (!gx || !gy) {
        return false;
    }
    store_.set_gains({*gx, *gy});
    return true;
}

bool CalibrationController::apply_deadzone(const json& value) {
    auto dz = sanitize_deadzone(value, store_.limits());
    if (!dz) {
        return false;
    }
    store_.set_deadzone(*dz);
    return true;
}

bool CalibrationController::apply_anchors(const json& up, const json& down, const json& left,
                                          const json& right) {
    int limit = store_.anchor_limit();
    auto u = sanitize_anchor_distance(up, limit);
    auto d = sanitize_anchor_distance(down, limit);
    auto l = sanitize_anchor_distance(left, limit);
    auto r = sanitize_anchor_distance(right, limit);
    if (!u || !d || !l || !r) {
        spdlog::debug("[Calibration] Widget {} rejected anchor input", widget_);
        return false;
    }
    return store_.store_anchor_distances({*u, *d, *l, *r});
}

void CalibrationController::reset_anchors() {
    store_.reset_anchors();
}

std::optional<AnchorOverlayData> CalibrationController::anchor_overlay_data() const {
    auto anchors = store_.anchor_distances();
    if (!anchors) {
        return std::nullopt;
    }
    Vec2 c = store_.effective_center();
    AnchorOverlayData data;
    data.center = c;
    data.anchors = {Vec2{c.x, c.y - anchors->up}, Vec2{c.x, c.y + anchors->down},
                    Vec2{c.x - anchors->left, c.y}, Vec2{c.x + anchors->right, c.y}};
    data.contour = mapper_.boundary().sample_contour(c, 256);
    data.diagonals = diagonal_handle_positions();
    return data;
}

// ============================================================================
// Tuning
// ============================================================================

void CalibrationController::start_tuning() {
    if (tuning_) {
        return;
    }
    tuning_ = store_.gains();
    spdlog::debug("[Calibration] Widget {} tuning from x={:.2f} y={:.2f}", widget_, tuning_->x,
                  tuning_->y);
    emit_overlay(OverlayAction::TuneStart);
}

void CalibrationController::adjust_tuning(GainAxis axis, int steps, bool coarse) {
    if (!tuning_) {
        return;
    }
    const CalibrationLimits& limits = store_.limits();
    double delta = steps * (coarse ? TUNING_COARSE_STEP : TUNING_STEP);
    double& gain = axis == GainAxis::X ? tuning_->x : tuning_->y;
    gain = std::clamp(gain + delta, limits.gain_min, limits.gain_max);
    emit_overlay(OverlayAction::Refresh);
}

void CalibrationController::apply_tuning() {
    if (!tuning_) {
        return;
    }
    GainPair committed = *tuning_;
    tuning_.reset();
    store_.set_gains(committed);
    spdlog::info("[Calibration] Widget {} gains committed x={:.2f} y={:.2f}", widget_,
                 committed.x, committed.y);
    emit_overlay(OverlayAction::TuneStop);
}

void CalibrationController::cancel_tuning() {
    if (!tuning_) {
        return;
    }
    tuning_.reset();
    emit_overlay(OverlayAction::TuneStop);
}

GainPair CalibrationController::tuning_gains() const {
    return tuning_ ? *tuning_ : store_.gains();
}

TuningOverlayData CalibrationController::tuning_overlay_data(std::optional<Vec2> cursor) const {
    TuningOverlayData data;
    data.gains = tuning_gains();
    data.center = store_.effective_center();
    if (!cursor) {
        return data;
    }
    Vec2 raw = *cursor - data.center;
    Vec2 corrected{raw.x * data.gains.x, raw.y * data.gains.y};
    data.raw_vector = raw;
    data.corrected_vector = corrected;
    data.raw_angle = vector_to_angle(raw.x, raw.y);
    data.corrected_angle = vector_to_angle(corrected.x, corrected.y);
    return data;
}

// ============================================================================
// Diagonals
// ============================================================================

std::optional<std::array<Vec2, 4>> CalibrationController::diagonal_handle_positions() const {
    auto diagonals = store_.diagonal_offsets();
    if (!diagonals) {
        return std::nullopt;
    }
    Vec2 c = store_.effective_center();
    std::array<Vec2, 4> handles{};
    for (Quadrant q : ALL_QUADRANTS) {
        const DiagonalOffset& d = diagonal_at(*diagonals, q);
        handles[static_cast<size_t>(q)] = {c.x + d.dx, c.y + d.dy};
    }
    return handles;
}

std::optional<DiagonalOffset> CalibrationController::diagonal_offset(Quadrant quadrant) const {
    auto diagonals = store_.diagonal_offsets();
    if (!diagonals) {
        return std::nullopt;
    }
    return diagonal_at(*diagonals, quadrant);
}

bool CalibrationController::update_diagonal_offset(Quadrant quadrant, double dx, double dy) {
    if (!store_.limits().has_diagonals || !store_.anchor_distances()) {
        return false;
    }
    store_.update_diagonal_from_drag(quadrant, dx, dy);
    return true;
}

bool CalibrationController::apply_diagonals(const std::array<json, 8>& values) {
    if (!store_.limits().has_diagonals || !store_.anchor_distances()) {
        return false;
    }
    int limit = store_.anchor_limit();
    DiagonalOffsets offsets{};
    for (Quadrant q : ALL_QUADRANTS) {
        size_t i = static_cast<size_t>(q) * 2;
        auto pair = sanitize_diagonal_pair(q, values[i], values[i + 1], limit);
        if (!pair) {
            spdlog::debug("[Calibration] Widget {} rejected diagonal {} input", widget_,
                          quadrant_key(q));
            return false;
        }
        offsets[static_cast<size_t>(q)] = *pair;
    }
    return store_.store_diagonal_offsets(offsets);
}

void CalibrationController::reset_diagonals() {
    store_.reset_diagonals();
    store_.ensure_diagonal_defaults();
}

void CalibrationController::abort_interaction() {
    cancel_capture();
    cancel_tuning();
}

bool handle_tuning_key(Tunable& tunable, std::string_view key, bool shift) {
    if (!tunable.is_tuning()) {
        return false;
    }
    if (key == "Escape") {
        tunable.cancel_tuning();
    } else if (key == "Return" || key == "Enter") {
        tunable.apply_tuning();
    } else if (key == "q" || key == "Q") {
        tunable.adjust_tuning(GainAxis::X, -1, shift);
    } else if (key == "a" || key == "A") {
        tunable.adjust_tuning(GainAxis::X, 1, shift);
    } else if (key == "w" || key == "W") {
        tunable.adjust_tuning(GainAxis::Y, -1, shift);
    } else if (key == "s" || key == "S") {
        tunable.adjust_tuning(GainAxis::Y, 1, shift);
    } else {
        return false;
    }
    return true;
}

} // namespace touchstick
