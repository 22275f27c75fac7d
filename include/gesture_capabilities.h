// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#pragma once

#include "boundary_geometry.h"
#include "calibration_store.h"
#include "geometry_types.h"

#include <array>
#include <optional>
#include <vector>

namespace touchstick {

/// What the external renderer needs to draw the calibrated boundary
struct AnchorOverlayData {
    Vec2 center;
    /// Absolute anchor points, indexed by AnchorAxis (up, down, left, right)
    std::array<Vec2, 4> anchors;
    /// Closed boundary polyline (absolute coordinates)
    std::vector<Vec2> contour;
    /// Absolute diagonal handle positions, indexed by Quadrant
    std::optional<std::array<Vec2, 4>> diagonals;
};

/// Live readout while gains are being tuned
struct TuningOverlayData {
    GainPair gains;
    Vec2 center;
    std::optional<double> raw_angle;
    std::optional<double> corrected_angle;
    std::optional<Vec2> raw_vector;
    std::optional<Vec2> corrected_vector;
};

enum class GainAxis { X, Y };

/// Which calibration field the next mask click updates
enum class CaptureMode { None, Center, Anchor, Diagonal };

/**
 * @brief Widgets whose input center and boundary can be calibrated
 *
 * Click-to-calibrate: begin_*_capture() arms a capture mode, the next valid
 * mask click updates exactly one field and ends it. The apply_* entry points
 * take raw text-field values and return false without changing anything if
 * validation fails.
 */
class Calibratable {
  public:
    virtual ~Calibratable() = default;

    virtual CaptureMode capture_mode() const = 0;
    bool is_calibrating() const {
        return capture_mode() != CaptureMode::None;
    }

    virtual void begin_center_capture() = 0;
    virtual void begin_anchor_capture(AnchorAxis axis) = 0;
    /// @return false if anchors are incomplete (no diagonals without anchors)
    virtual bool begin_diagonal_capture(Quadrant quadrant) = 0;
    virtual void cancel_capture() = 0;

    /// @return true if the click was consumed and a field updated
    virtual bool handle_calibration_click(Vec2 position) = 0;

    virtual Vec2 effective_center() const = 0;
    virtual std::optional<Vec2> calibrated_center() const = 0;

    /// Clears the center and resets the gains
    virtual void reset_center() = 0;

    virtual bool apply_center(const json& x, const json& y) = 0;
    virtual bool apply_gains(const json& x, const json& y) = 0;
    virtual bool apply_deadzone(const json& value) = 0;
    virtual bool apply_anchors(const json& up, const json& down, const json& left,
                               const json& right) = 0;
    virtual void reset_anchors() = 0;

    /// nullopt until all four anchors are valid
    virtual std::optional<AnchorOverlayData> anchor_overlay_data() const = 0;
};

/**
 * @brief Widgets with interactive gain tuning
 *
 * Tuning works on a snapshot of the saved gains; apply commits it, cancel
 * discards it.
 */
class Tunable {
  public:
    virtual ~Tunable() = default;

    virtual bool is_tuning() const = 0;
    virtual void start_tuning() = 0;
    /// @param steps Signed number of steps (0.01 each, 0.05 when coarse)
    virtual void adjust_tuning(GainAxis axis, int steps, bool coarse = false) = 0;
    virtual void apply_tuning() = 0;
    virtual void cancel_tuning() = 0;
    virtual GainPair tuning_gains() const = 0;
    virtual TuningOverlayData tuning_overlay_data(std::optional<Vec2> cursor) const = 0;
};

/// Widgets whose boundary has draggable diagonal points
class DiagonalEditable {
  public:
    virtual ~DiagonalEditable() = default;

    virtual std::optional<std::array<Vec2, 4>> diagonal_handle_positions() const = 0;
    virtual int diagonal_handle_radius() const = 0;
    virtual std::optional<DiagonalOffset> diagonal_offset(Quadrant quadrant) const = 0;

    /// Drag-handle update, clamped into the quadrant; false without anchors
    virtual bool update_diagonal_offset(Quadrant quadrant, double dx, double dy) = 0;

    /// Text-field apply, eight raw values in UR, DR, DL, UL (dx, dy) order
    virtual bool apply_diagonals(const std::array<json, 8>& values) = 0;
    virtual void reset_diagonals() = 0;
};

} // namespace touchstick
