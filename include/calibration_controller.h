// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#pragma once

#include "calibration_store.h"
#include "event_bus.h"
#include "gesture_capabilities.h"
#include "pointer_mapper.h"

#include <optional>
#include <string_view>

namespace touchstick {

/**
 * @brief Calibration actions shared by the gesture widgets
 *
 * Implements click capture, text-field apply/reset, gain tuning and diagonal
 * editing on top of one widget's CalibrationStore. Overlay notifications go
 * out on the event bus: register/unregister for the controller lifetime,
 * start/stop around capture, tune_start/tune_stop around tuning, and refresh
 * on every user-originated calibration change. Restore-originated changes
 * never trigger a refresh.
 */
class CalibrationController : public Calibratable, public Tunable, public DiagonalEditable {
  public:
    static constexpr double TUNING_STEP = 0.01;
    static constexpr double TUNING_COARSE_STEP = 0.05;
    static constexpr int DIAGONAL_HANDLE_RADIUS = 12;

    CalibrationController(WidgetId widget, CalibrationStore& store, const PointerMapper& mapper,
                          EventBus& bus);
    ~CalibrationController() override;

    CalibrationController(const CalibrationController&) = delete;
    CalibrationController& operator=(const CalibrationController&) = delete;

    // ── Calibratable ─────────────────────────────────────────────────

    CaptureMode capture_mode() const override {
        return capture_mode_;
    }
    void begin_center_capture() override;
    void begin_anchor_capture(AnchorAxis axis) override;
    bool begin_diagonal_capture(Quadrant quadrant) override;
    void cancel_capture() override;
    bool handle_calibration_click(Vec2 position) override;

    Vec2 effective_center() const override {
        return store_.effective_center();
    }
    std::optional<Vec2> calibrated_center() const override {
        return store_.calibrated_center();
    }
    void reset_center() override;

    bool apply_center(const json& x, const json& y) override;
    bool apply_gains(const json& x, const json& y) override;
    bool apply_deadzone(const json& value) override;
    bool apply_anchors(const json& up, const json& down, const json& left,
                       const json& right) override;
    void reset_anchors() override;

    std::optional<AnchorOverlayData> anchor_overlay_data() const override;

    // ── Tunable ──────────────────────────────────────────────────────

    bool is_tuning() const override {
        return tuning_.has_value();
    }
    void start_tuning() override;
    void adjust_tuning(GainAxis axis, int steps, bool coarse = false) override;
    void apply_tuning() override;
    void cancel_tuning() override;
    GainPair tuning_gains() const override;
    TuningOverlayData tuning_overlay_data(std::optional<Vec2> cursor) const override;

    // ── DiagonalEditable ─────────────────────────────────────────────

    std::optional<std::array<Vec2, 4>> diagonal_handle_positions() const override;
    int diagonal_handle_radius() const override {
        return DIAGONAL_HANDLE_RADIUS;
    }
    std::optional<DiagonalOffset> diagonal_offset(Quadrant quadrant) const override;
    bool update_diagonal_offset(Quadrant quadrant, double dx, double dy) override;
    bool apply_diagonals(const std::array<json, 8>& values) override;
    void reset_diagonals() override;

    /// Cancel capture and tuning (mode switch, widget deletion)
    void abort_interaction();

  private:
    void emit_overlay(OverlayAction action);
    void end_capture();

    WidgetId widget_;
    CalibrationStore& store_;
    const PointerMapper& mapper_;
    EventBus& bus_;

    CaptureMode capture_mode_ = CaptureMode::None;
    AnchorAxis capture_axis_ = AnchorAxis::Up;
    Quadrant capture_quadrant_ = Quadrant::UpRight;

    std::optional<GainPair> tuning_;

    Subscription mask_sub_;
    ConfigStore::CallbackId config_cb_ = 0;
};

/**
 * @brief Keyboard shortcuts while tuning
 *
 * Escape cancels, Enter applies, q / a step X down / up, w / s step Y down /
 * up; shift selects the coarse step.
 *
 * @return true if the key was consumed
 */
bool handle_tuning_key(Tunable& tunable, std::string_view key, bool shift);

} // namespace touchstick
