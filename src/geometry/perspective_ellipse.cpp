// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#include "perspective_ellipse.h"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace touchstick {

const char* distance_curve_name(DistanceCurve curve) {
    switch (curve) {
    case DistanceCurve::Linear:
        return "linear";
    case DistanceCurve::Gamma:
        return "gamma";
    case DistanceCurve::Smoothstep:
        return "smoothstep";
    }
    return "linear";
}

DistanceCurve parse_distance_curve(const std::string& name) {
    if (name == "gamma") {
        return DistanceCurve::Gamma;
    }
    if (name == "smoothstep") {
        return DistanceCurve::Smoothstep;
    }
    return DistanceCurve::Linear;
}

PerspectiveEllipseModel PerspectiveEllipseModel::from_cardinals(Vec2 center, Vec2 north,
                                                                Vec2 south, Vec2 west,
                                                                Vec2 east) {
    PerspectiveEllipseModel model;
    model.center = center;
    model.radius_x = (east.x - west.x) / 2.0;
    model.radius_y = (south.y - north.y) / 2.0;
    model.dx_bias = (east.x + west.x) / 2.0 - center.x;
    model.dy_bias = (south.y + north.y) / 2.0 - center.y;
    return model;
}

double PerspectiveEllipseModel::apply_curve(double radius) const {
    switch (curve) {
    case DistanceCurve::Gamma:
        return std::pow(radius, std::max(gamma, 1e-6));
    case DistanceCurve::Smoothstep:
        return radius * radius * (3.0 - 2.0 * radius);
    case DistanceCurve::Linear:
        break;
    }
    return radius;
}

double PerspectiveEllipseModel::inverse_curve(double distance) const {
    switch (curve) {
    case DistanceCurve::Gamma:
        return std::pow(distance, 1.0 / std::max(gamma, 1e-6));
    case DistanceCurve::Smoothstep: {
        double d = std::clamp(distance, 0.0, 1.0);
        return 0.5 - std::sin(std::asin(1.0 - 2.0 * d) / 3.0);
    }
    case DistanceCurve::Linear:
        break;
    }
    return distance;
}

PolarPoint PerspectiveEllipseModel::point_to_angle_distance(Vec2 point) const {
    Vec2 cc = corrected_center();
    double u = (point.x - cc.x) / radius_x;
    double v = (point.y - cc.y) / radius_y;
    double raw_radius = std::hypot(u, v);
    double angle = std::atan2(v, u) + deg_to_rad(angle_bias_deg);

    if (raw_radius <= deadzone) {
        return {angle, 0.0};
    }
    double clamped = std::min(raw_radius, max_radius_clamp);
    double curved = clamped <= 1.0 ? apply_curve(clamped) : clamped;
    curved *= radius_scale;
    return {angle, std::clamp(curved, 0.0, max_radius_clamp)};
}

Vec2 PerspectiveEllipseModel::angle_distance_to_point(double angle_rad, double distance) const {
    distance = std::max(0.0, distance);
    if (radius_scale > 0.0) {
        distance /= radius_scale;
    }
    distance = std::min(distance, max_radius_clamp);
    double raw_radius = distance <= 1.0 ? inverse_curve(distance) : distance;

    Vec2 cc = corrected_center();
    double angle = angle_rad - deg_to_rad(angle_bias_deg);
    return {cc.x + radius_x * raw_radius * std::cos(angle),
            cc.y + radius_y * raw_radius * std::sin(angle)};
}

TiltSummary compute_tilt_summary(Vec2 center, double up, double down, double left,
                                 double right) {
    TiltSummary s;
    s.center = center;
    s.north = {center.x, center.y - up};
    s.south = {center.x, center.y + down};
    s.west = {center.x - left, center.y};
    s.east = {center.x + right, center.y};
    s.radius_x = (left + right) / 2.0;
    s.radius_y = (up + down) / 2.0;
    s.dx_bias = (right - left) / 2.0;
    s.dy_bias = (down - up) / 2.0;
    s.corrected_center = {center.x + s.dx_bias, center.y + s.dy_bias};
    if (s.radius_x != 0.0) {
        s.scale_ratio = s.radius_y / s.radius_x;
    }

    if (std::abs(left - right) > TILT_QUALITY_THRESHOLD) {
        s.warnings.push_back(fmt::format("Left/right mismatch > {:.1f}px", TILT_QUALITY_THRESHOLD));
    }
    if (std::abs(up - down) > TILT_QUALITY_THRESHOLD) {
        s.warnings.push_back(fmt::format("Up/down mismatch > {:.1f}px", TILT_QUALITY_THRESHOLD));
    }
    if (s.radius_x < TILT_MIN_RADIUS || s.radius_y < TILT_MIN_RADIUS) {
        s.warnings.push_back(fmt::format("Radius too small (min {:.1f}px)", TILT_MIN_RADIUS));
    }
    return s;
}

std::string format_tilt_summary(const TiltSummary& s) {
    std::string ratio = s.scale_ratio ? fmt::format("{:.4f}", *s.scale_ratio) : "inf";
    std::string out;
    out += fmt::format("Center: ({:.2f}, {:.2f})\n", s.center.x, s.center.y);
    out += fmt::format("N: ({:.2f}, {:.2f})\n", s.north.x, s.north.y);
    out += fmt::format("S: ({:.2f}, {:.2f})\n", s.south.x, s.south.y);
    out += fmt::format("W: ({:.2f}, {:.2f})\n", s.west.x, s.west.y);
    out += fmt::format("E: ({:.2f}, {:.2f})\n", s.east.x, s.east.y);
    out += fmt::format("r_x: {:.2f}\nr_y: {:.2f}\n", s.radius_x, s.radius_y);
    out += fmt::format("dx_bias: {:.2f}\ndy_bias: {:.2f}\n", s.dx_bias, s.dy_bias);
    out += fmt::format("scale ratio: {}\n", ratio);
    out += fmt::format("corrected center: ({:.2f}, {:.2f})\n", s.corrected_center.x,
                       s.corrected_center.y);
    out += "Quality checks:\n";
    if (s.warnings.empty()) {
        out += "- OK\n";
    }
    for (const auto& w : s.warnings) {
        out += "- " + w + "\n";
    }
    return out;
}

} // namespace touchstick
