// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#pragma once

#include "angle_warp.h"
#include "boundary_geometry.h"
#include "config_store.h"
#include "geometry_types.h"

#include <optional>
#include <string>

namespace touchstick {

/// Config keys shared by every calibratable widget
namespace calibration_keys {
constexpr const char* CENTER_X = "calibrated_center_x";
constexpr const char* CENTER_Y = "calibrated_center_y";
constexpr const char* X_GAIN = "x_gain";
constexpr const char* Y_GAIN = "y_gain";
constexpr const char* GAIN_ENABLED = "gain_enabled";
constexpr const char* ANCHOR_UP = "anchor_up_dist_px";
constexpr const char* ANCHOR_DOWN = "anchor_down_dist_px";
constexpr const char* ANCHOR_LEFT = "anchor_left_dist_px";
constexpr const char* ANCHOR_RIGHT = "anchor_right_dist_px";
constexpr const char* DEADZONE = "deadzone";
constexpr const char* WARP_ENABLED = "angle_warp_enabled";
constexpr const char* WARP_BOUNDS = "angle_warp_bounds";

/// "diag_<quadrant>_dx" / "diag_<quadrant>_dy"
std::string diagonal_dx(Quadrant q);
std::string diagonal_dy(Quadrant q);
} // namespace calibration_keys

enum class AnchorAxis { Up, Down, Left, Right };

const char* anchor_axis_name(AnchorAxis axis);

struct GainPair {
    double x = 1.0;
    double y = 1.0;
};

/// Per-widget validation ranges
struct CalibrationLimits {
    double gain_min = 0.5;
    double gain_max = 2.0;
    double gain_default = 1.0;
    double deadzone_default = 0.0;
    double deadzone_max = 0.95;
    /// Anchor / diagonal magnitude limit as a multiple of max(width, height)
    int anchor_limit_factor = 4;
    /// Default diagonal = anchor * scale
    double diagonal_default_scale = 0.7;
    /// Widgets without a gain switch always apply the stored gains
    bool has_gain_switch = false;
    /// Widgets without diagonals never store or report diagonal offsets
    bool has_diagonals = true;
};

// ============================================================================
// Sanitizers: reject malformed input by returning nullopt, never throw
// ============================================================================

/**
 * @brief Read a finite number from a config value
 *
 * Accepts JSON numbers and numeric strings (surrounding whitespace allowed).
 * Booleans, empty strings and non-finite values yield nullopt.
 */
std::optional<double> parse_number(const json& raw);

/// Read an integer; non-integral numbers are rejected (1.0 is accepted)
std::optional<int> parse_integer(const json& raw);

/// Gain clamped into [min, max]; nullopt if not a number
std::optional<double> sanitize_gain(const json& raw, const CalibrationLimits& limits);

/// Deadzone clamped into [0, deadzone_max]
std::optional<double> sanitize_deadzone(const json& raw, const CalibrationLimits& limits);

/// Positive integer anchor distance not exceeding limit
std::optional<int> sanitize_anchor_distance(const json& raw, int limit);

/// Non-zero integer diagonal component with |value| <= limit
std::optional<int> sanitize_diagonal_value(const json& raw, int limit);

/// @return true if (dx, dy) has the sign pattern required by the quadrant
bool validate_diagonal_quadrant(Quadrant q, int dx, int dy);

/// Both components valid and in the right quadrant, otherwise nullopt
std::optional<DiagonalOffset> sanitize_diagonal_pair(Quadrant q, const json& dx, const json& dy,
                                                     int limit);

/**
 * @brief Clamp an interactively dragged diagonal into its quadrant
 *
 * Rounds each component, forces the quadrant sign, and keeps the magnitude
 * in [1, limit]. Used by the drag-handle path instead of rejecting.
 */
DiagonalOffset clamp_diagonal_offset(Quadrant q, double dx, double dy, int limit);

/// Diagonals derived from anchors: max(1, round(anchor * scale)) with quadrant sign
DiagonalOffsets default_diagonal_offsets(const AnchorDistances& anchors, double scale);

/**
 * @brief Typed calibration view over a widget's ConfigStore
 *
 * Owns no state of its own apart from the surface size used for range
 * checks. Every read goes through the sanitizers, so a stored garbage value
 * behaves as "unset".
 */
class CalibrationStore {
  public:
    CalibrationStore(ConfigStore& config, SurfaceSize surface, CalibrationLimits limits);

    ConfigStore& config() {
        return config_;
    }
    const ConfigStore& config() const {
        return config_;
    }

    void set_surface(SurfaceSize surface) {
        surface_ = surface;
    }
    SurfaceSize surface() const {
        return surface_;
    }
    const CalibrationLimits& limits() const {
        return limits_;
    }

    /// 4 * max(width, height), at least 1
    int anchor_limit() const;

    // ── Center ───────────────────────────────────────────────────────

    /// Stored center, if present and strictly inside the surface
    std::optional<Vec2> calibrated_center() const;

    /// Calibrated center, or the surface center when none is stored
    Vec2 effective_center() const;

    /// @return false (and nothing stored) if the point is outside the surface
    bool set_calibrated_center(double x, double y, ChangeOrigin origin = ChangeOrigin::User);

    void clear_calibrated_center(ChangeOrigin origin = ChangeOrigin::User);

    // ── Gain ─────────────────────────────────────────────────────────

    /// Stored gains (defaults when unset), ignoring the gain switch
    GainPair saved_gains() const;

    /// Gains to apply: saved gains, or 1.0/1.0 when the gain switch is off
    GainPair gains() const;

    bool gain_enabled() const;
    void set_gain_enabled(bool enabled, ChangeOrigin origin = ChangeOrigin::User);

    /// Clamps into the gain range before storing
    void set_gains(GainPair gains, ChangeOrigin origin = ChangeOrigin::User);

    void reset_gains(ChangeOrigin origin = ChangeOrigin::User);

    // ── Deadzone ─────────────────────────────────────────────────────

    double deadzone() const;
    void set_deadzone(double deadzone, ChangeOrigin origin = ChangeOrigin::User);

    // ── Anchors ──────────────────────────────────────────────────────

    PartialAnchors partial_anchors() const;

    /// All four anchors, or nullopt if any is missing or invalid
    std::optional<AnchorDistances> anchor_distances() const;

    /// @return false if the distance fails sanitization
    bool set_anchor(AnchorAxis axis, int distance, ChangeOrigin origin = ChangeOrigin::User);

    /// Stores all four and seeds diagonal defaults
    bool store_anchor_distances(const AnchorDistances& anchors,
                                ChangeOrigin origin = ChangeOrigin::User);

    void reset_anchors(ChangeOrigin origin = ChangeOrigin::User);

    // ── Diagonals ────────────────────────────────────────────────────

    /**
     * @brief Diagonal offsets usable for the boundary spline
     *
     * Requires valid anchors. Missing quadrants are filled from the anchor
     * defaults; a present but invalid quadrant makes the whole set unusable.
     */
    std::optional<DiagonalOffsets> diagonal_offsets() const;

    /// Stored offset for one quadrant, if valid
    std::optional<DiagonalOffset> diagonal_offset(Quadrant q) const;

    /// Store anchor-derived defaults for quadrants that have no value yet
    void ensure_diagonal_defaults(ChangeOrigin origin = ChangeOrigin::User);

    /// @return false if the pair is outside its quadrant or limit
    bool store_diagonal_offset(Quadrant q, DiagonalOffset offset,
                               ChangeOrigin origin = ChangeOrigin::User);

    bool store_diagonal_offsets(const DiagonalOffsets& offsets,
                                ChangeOrigin origin = ChangeOrigin::User);

    /// Drag-handle update: clamps instead of rejecting
    DiagonalOffset update_diagonal_from_drag(Quadrant q, double dx, double dy,
                                             ChangeOrigin origin = ChangeOrigin::User);

    void reset_diagonals(ChangeOrigin origin = ChangeOrigin::User);

    // ── Angle warp ───────────────────────────────────────────────────

    bool warp_enabled() const;
    void set_warp_enabled(bool enabled, ChangeOrigin origin = ChangeOrigin::User);

    /// Stored bounds, normalized; identity bounds when unset or malformed
    AngleWarpBounds warp_bounds() const;

    /// Normalizes before storing
    void set_warp_bounds(const AngleWarpBounds& bounds, ChangeOrigin origin = ChangeOrigin::User);

  private:
    const char* anchor_key(AnchorAxis axis) const;

    ConfigStore& config_;
    SurfaceSize surface_;
    CalibrationLimits limits_;
};

} // namespace touchstick
