// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#pragma once

#include <array>
#include <optional>
#include <vector>

namespace touchstick {

/// Number of sectors (and boundary angles) in an angle warp
constexpr int WARP_SECTOR_COUNT = 8;

/// Minimum spacing between consecutive boundary angles (degrees)
constexpr double WARP_EPSILON_DEG = 5.0;

/// Width of one ideal sector (degrees)
constexpr double WARP_IDEAL_SECTOR_DEG = 360.0 / WARP_SECTOR_COUNT;

/**
 * @brief Real-world boundary angles for the 8 warp sectors
 *
 * Indices 0, 2, 4, 6 are the screen axes and always hold 0/90/180/270.
 * Indices 1, 3, 5, 7 are the measured diagonal directions, adjustable inside
 * their enclosing axis pair.
 */
using AngleWarpBounds = std::array<double, WARP_SECTOR_COUNT>;

/// Result of warping one measured angle
struct WarpResult {
    double angle = 0.0;         ///< Ideal angle in degrees, [0, 360)
    std::optional<int> sector;  ///< Sector index, empty if bounds were unusable
    std::optional<double> t;    ///< Position inside the sector, [0, 1]
};

/// Identity bounds: 0, 45, 90, ... 315
AngleWarpBounds default_warp_bounds();

/**
 * @brief Re-impose the fixed axes and epsilon spacing on a bounds array
 *
 * Adjustable entries are clamped into [axis + epsilon, next_axis - epsilon].
 * Non-finite entries are replaced by the identity diagonal. Idempotent.
 */
AngleWarpBounds normalize_warp_bounds(const AngleWarpBounds& bounds);

/// @return true if bounds are strictly increasing with epsilon spacing and fixed axes
bool is_valid_warp_bounds(const AngleWarpBounds& bounds);

/**
 * @brief Map a measured angle onto evenly spaced ideal octants
 *
 * Piecewise linear: the measured sector [bounds[i], bounds[i+1]) maps onto
 * [i*45, (i+1)*45). The last sector wraps to 360.
 *
 * @param real_deg Measured angle in degrees (any range)
 * @param bounds Boundary angles; any length other than 8 returns the angle unchanged
 */
WarpResult warp_angle(double real_deg, const std::vector<double>& bounds);

/// Convenience overload for a fixed-size bounds array
WarpResult warp_angle(double real_deg, const AngleWarpBounds& bounds);

} // namespace touchstick
