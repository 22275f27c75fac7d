// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#pragma once

#include "geometry_types.h"

#include <optional>
#include <string>
#include <vector>

namespace touchstick {

enum class DistanceCurve { Linear, Gamma, Smoothstep };

const char* distance_curve_name(DistanceCurve curve);
/// "linear", "gamma", "smoothstep"; anything else is Linear
DistanceCurve parse_distance_curve(const std::string& name);

/// Normalized polar coordinates on the corrected circle (angle in radians)
struct PolarPoint {
    double angle = 0.0;
    double distance = 0.0;
};

/**
 * @brief Analytic perspective correction for a tilted circular indicator
 *
 * A circle drawn in perspective shows up as an axis-aligned ellipse whose
 * visual center is shifted by (dx_bias, dy_bias). Points are normalized by
 * the ellipse radii around the corrected center; the resulting distance
 * goes through deadzone, clamp, curve and scale.
 *
 * For radius_scale 1 and distances above the deadzone,
 * angle_distance_to_point() inverts point_to_angle_distance().
 */
struct PerspectiveEllipseModel {
    Vec2 center;
    double radius_x = 1.0;
    double radius_y = 1.0;
    double dx_bias = 0.0;
    double dy_bias = 0.0;
    double deadzone = 0.0;
    double max_radius_clamp = 1.0;
    DistanceCurve curve = DistanceCurve::Linear;
    double gamma = 1.0;
    double angle_bias_deg = 0.0;
    double radius_scale = 1.0;

    /// Radii and bias from the four cardinal points of the drawn circle
    static PerspectiveEllipseModel from_cardinals(Vec2 center, Vec2 north, Vec2 south,
                                                  Vec2 west, Vec2 east);

    Vec2 corrected_center() const {
        return {center.x + dx_bias, center.y + dy_bias};
    }
    bool is_valid() const {
        return radius_x > 0.0 && radius_y > 0.0;
    }

    PolarPoint point_to_angle_distance(Vec2 point) const;
    Vec2 angle_distance_to_point(double angle_rad, double distance) const;

    double apply_curve(double radius) const;
    double inverse_curve(double distance) const;
};

/// Tilt and radius measurement from a center and four axis offsets
struct TiltSummary {
    Vec2 center;
    Vec2 north, south, west, east;
    double radius_x = 0.0;
    double radius_y = 0.0;
    double dx_bias = 0.0;
    double dy_bias = 0.0;
    Vec2 corrected_center;
    /// radius_y / radius_x; empty when radius_x is 0
    std::optional<double> scale_ratio;
    std::vector<std::string> warnings;

    bool ok() const {
        return warnings.empty();
    }
};

constexpr double TILT_QUALITY_THRESHOLD = 5.0;
constexpr double TILT_MIN_RADIUS = 5.0;

/**
 * @brief Summarize a circle measurement
 *
 * Offsets are distances from the center to the circle edge along each axis.
 * Warns on a left/right or up/down mismatch above 5 px and on a radius
 * below 5 px.
 */
TiltSummary compute_tilt_summary(Vec2 center, double up, double down, double left,
                                 double right);

/// Multi-line human readable report
std::string format_tilt_summary(const TiltSummary& summary);

} // namespace touchstick
