// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#pragma once

#include "geometry_types.h"

#include <array>
#include <optional>
#include <vector>

namespace touchstick {

/// Calibrated axis distances from the center to the boundary (pixels, all > 0)
struct AnchorDistances {
    int up = 0;
    int down = 0;
    int left = 0;
    int right = 0;

    bool operator==(const AnchorDistances& o) const {
        return up == o.up && down == o.down && left == o.left && right == o.right;
    }
};

/// Anchors as stored: each axis may be unset independently
struct PartialAnchors {
    std::optional<int> up;
    std::optional<int> down;
    std::optional<int> left;
    std::optional<int> right;

    bool complete() const {
        return up && down && left && right;
    }
    bool any() const {
        return up || down || left || right;
    }
    std::optional<AnchorDistances> full() const {
        if (!complete()) {
            return std::nullopt;
        }
        return AnchorDistances{*up, *down, *left, *right};
    }
};

/// Diagonal quadrants, in contour order
enum class Quadrant { UpRight = 0, DownRight = 1, DownLeft = 2, UpLeft = 3 };

constexpr std::array<Quadrant, 4> ALL_QUADRANTS = {Quadrant::UpRight, Quadrant::DownRight,
                                                   Quadrant::DownLeft, Quadrant::UpLeft};

/// Sign of (dx, dy) required in each quadrant
struct QuadrantSigns {
    int x;
    int y;
};

inline QuadrantSigns quadrant_signs(Quadrant q) {
    switch (q) {
    case Quadrant::UpRight:
        return {1, -1};
    case Quadrant::DownRight:
        return {1, 1};
    case Quadrant::DownLeft:
        return {-1, 1};
    case Quadrant::UpLeft:
        return {-1, -1};
    }
    return {1, 1};
}

/// Short config-key name of a quadrant ("ur", "dr", "dl", "ul")
const char* quadrant_key(Quadrant q);

struct DiagonalOffset {
    int dx = 0;
    int dy = 0;

    bool operator==(const DiagonalOffset& o) const {
        return dx == o.dx && dy == o.dy;
    }
};

/// Diagonal boundary points relative to the center, indexed by Quadrant
using DiagonalOffsets = std::array<DiagonalOffset, 4>;

inline const DiagonalOffset& diagonal_at(const DiagonalOffsets& d, Quadrant q) {
    return d[static_cast<size_t>(q)];
}

/**
 * @brief Closed Catmull-Rom spline through the control points
 *
 * Produces max(samples, 4 * points.size()) samples split evenly across the
 * segments, with the first sample repeated at the end so the polyline closes.
 * Fewer than 4 control points are returned unchanged.
 */
std::vector<Vec2> catmull_rom_closed(const std::vector<Vec2>& points, int samples);

/**
 * @brief Nearest forward intersection of a ray with a polyline
 *
 * Segments nearly parallel to the ray (|det| < 1e-6) are skipped.
 *
 * @return Ray parameter t >= 0 of the closest hit (distance if direction is unit),
 *         or nullopt if the ray misses every segment
 */
std::optional<double> ray_intersection_distance(Vec2 origin, Vec2 direction,
                                                const std::vector<Vec2>& contour);

/**
 * @brief Sampled closed boundary through the 4 anchors and 4 diagonal points
 *
 * Control order: up, UR, right, DR, down, DL, left, UL.
 */
std::vector<Vec2> build_diagonal_contour(Vec2 center, const AnchorDistances& anchors,
                                         const DiagonalOffsets& diagonals, int samples = 256);

/// Per-quadrant ellipse radius through the anchors along a unit direction
double anchor_ellipse_radius(const AnchorDistances& anchors, Vec2 unit_dir);

/// Half-extents for the superellipse fallback
struct Extents {
    double up;
    double down;
    double left;
    double right;
};

/**
 * @brief Asymmetric superellipse radius along a unit direction
 *
 * Directional half-extents are blended with tanh(k * component) so the curve
 * stays smooth across the axes.
 *
 * @param p Hardness exponent, clamped to [2, 4]
 * @param k Blend sharpness, clamped to [1, 10]
 */
double superellipse_radius(const Extents& extents, Vec2 unit_dir, double p, double k);

/// Which model a BoundaryModel resolved to, most to least detailed
enum class BoundaryKind {
    Spline,        ///< Catmull-Rom through anchors and diagonals
    Superellipse,  ///< Smooth oval from (possibly partial) anchors
    AnchorEllipse, ///< Per-quadrant ellipse through the four anchors
    GainCircle,    ///< Fixed radius circle in gain-scaled space
    Saturating     ///< No radius at all: any offset is full deflection
};

const char* boundary_kind_name(BoundaryKind kind);

struct BoundaryOptions {
    /// Radius used when no anchors are available (GainCircle, superellipse gaps)
    double fallback_radius = 200.0;
    /// With no anchors, report Saturating instead of GainCircle
    bool saturate_without_anchors = false;
    /// Prefer the superellipse over the anchor ellipse / gain circle
    bool smooth_fallback = false;
    double superellipse_p = 2.2;
    double superellipse_k = 4.0;
    int spline_samples = 256;
};

/**
 * @brief Closed boundary around the calibrated center
 *
 * Resolves the most detailed model the calibration supports and answers
 * "how far is the boundary along this direction". All coordinates are
 * relative to the calibrated center.
 */
class BoundaryModel {
  public:
    static BoundaryModel build(const PartialAnchors& anchors,
                               const std::optional<DiagonalOffsets>& diagonals,
                               const BoundaryOptions& options);

    BoundaryKind kind() const {
        return kind_;
    }

    /**
     * @brief Distance from the center to the boundary along a direction
     *
     * A spline miss falls back to the anchor ellipse. Saturating models have
     * no finite boundary and return nullopt.
     *
     * @return 0 for a zero direction, nullopt if unbounded
     */
    std::optional<double> distance(Vec2 direction) const;

    /// Same as distance() for a screen angle in degrees
    std::optional<double> distance_at_angle(double angle_deg) const;

    /// Sample the boundary for overlay rendering (absolute coordinates)
    std::vector<Vec2> sample_contour(Vec2 center, int segments) const;

    /// Sampled spline, relative to the center (empty unless kind() == Spline)
    const std::vector<Vec2>& spline() const {
        return spline_;
    }

  private:
    BoundaryKind kind_ = BoundaryKind::Saturating;
    BoundaryOptions options_;
    std::optional<AnchorDistances> anchors_;
    Extents extents_{0.0, 0.0, 0.0, 0.0};
    std::vector<Vec2> spline_;
};

} // namespace touchstick
