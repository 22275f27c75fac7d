// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#pragma once

#include <cmath>

namespace touchstick {

/// 2D point / vector in surface pixels (floating point)
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    Vec2 operator+(const Vec2& o) const {
        return {x + o.x, y + o.y};
    }
    Vec2 operator-(const Vec2& o) const {
        return {x - o.x, y - o.y};
    }
    Vec2 operator*(double s) const {
        return {x * s, y * s};
    }
    bool operator==(const Vec2& o) const {
        return x == o.x && y == o.y;
    }

    double length() const {
        return std::hypot(x, y);
    }
};

/// Output surface (remote screen) dimensions in pixels
struct SurfaceSize {
    int width = 0;
    int height = 0;

    Vec2 center() const {
        return {width / 2.0, height / 2.0};
    }
    double diagonal() const {
        return std::hypot(static_cast<double>(width), static_cast<double>(height));
    }
    bool contains(double x, double y) const {
        return x >= 0.0 && y >= 0.0 && x < width && y < height;
    }
};

constexpr double PI = 3.14159265358979323846;

inline double deg_to_rad(double deg) {
    return deg * PI / 180.0;
}

inline double rad_to_deg(double rad) {
    return rad * 180.0 / PI;
}

/// Wrap an angle in degrees into [0, 360)
inline double normalize_angle(double deg) {
    double a = std::fmod(deg, 360.0);
    if (a < 0.0) {
        a += 360.0;
    }
    // fmod(-1e-15, 360) + 360 rounds to 360
    if (a >= 360.0) {
        a -= 360.0;
    }
    return a;
}

/// Wrap an angle delta in degrees into [-180, 180]
inline double normalize_angle_delta(double delta) {
    while (delta > 180.0) {
        delta -= 360.0;
    }
    while (delta < -180.0) {
        delta += 360.0;
    }
    return delta;
}

/// Screen-space angle of a vector in degrees, [0, 360), y pointing down
inline double vector_to_angle(double dx, double dy) {
    return normalize_angle(rad_to_deg(std::atan2(dy, dx)));
}

inline Vec2 unit_from_angle(double deg) {
    double r = deg_to_rad(deg);
    return {std::cos(r), std::sin(r)};
}

} // namespace touchstick
