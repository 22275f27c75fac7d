// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#include "angle_warp.h"

#include "geometry_types.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace touchstick {

AngleWarpBounds default_warp_bounds() {
    AngleWarpBounds bounds{};
    for (int i = 0; i < WARP_SECTOR_COUNT; ++i) {
        bounds[static_cast<size_t>(i)] = i * WARP_IDEAL_SECTOR_DEG;
    }
    return bounds;
}

AngleWarpBounds normalize_warp_bounds(const AngleWarpBounds& bounds) {
    AngleWarpBounds out = default_warp_bounds();
    for (size_t i = 1; i < out.size(); i += 2) {
        double axis_lo = out[i - 1];
        double axis_hi = axis_lo + 2.0 * WARP_IDEAL_SECTOR_DEG;
        double value = bounds[i];
        if (!std::isfinite(value)) {
            continue; // keep the identity diagonal
        }
        out[i] = std::clamp(value, axis_lo + WARP_EPSILON_DEG, axis_hi - WARP_EPSILON_DEG);
    }
    return out;
}

bool is_valid_warp_bounds(const AngleWarpBounds& bounds) {
    return normalize_warp_bounds(bounds) == bounds;
}

WarpResult warp_angle(double real_deg, const std::vector<double>& bounds) {
    double angle = normalize_angle(real_deg);
    if (bounds.size() != static_cast<size_t>(WARP_SECTOR_COUNT)) {
        spdlog::trace("[AngleWarp] Bounds size {} != {}, angle unchanged", bounds.size(),
                      WARP_SECTOR_COUNT);
        return {angle, std::nullopt, std::nullopt};
    }

    for (int i = 0; i < WARP_SECTOR_COUNT; ++i) {
        double start = bounds[static_cast<size_t>(i)];
        double end = (i + 1 < WARP_SECTOR_COUNT) ? bounds[static_cast<size_t>(i + 1)]
                                                 : bounds[0] + 360.0;

        double probe = angle;
        if (!(probe >= start && probe < end)) {
            probe = angle + 360.0;
            if (!(probe >= start && probe < end)) {
                continue;
            }
        }

        double t = (probe - start) / std::max(end - start, WARP_EPSILON_DEG);
        t = std::clamp(t, 0.0, 1.0);
        double ideal_start = i * WARP_IDEAL_SECTOR_DEG;
        double ideal = ideal_start + t * WARP_IDEAL_SECTOR_DEG;
        return {normalize_angle(ideal), i, t};
    }

    // Non-monotonic bounds leave gaps; treat as no warp
    return {angle, std::nullopt, std::nullopt};
}

WarpResult warp_angle(double real_deg, const AngleWarpBounds& bounds) {
    return warp_angle(real_deg, std::vector<double>(bounds.begin(), bounds.end()));
}

} // namespace touchstick
