// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#pragma once

#include "angle_warp.h"
#include "boundary_geometry.h"
#include "calibration_store.h"
#include "geometry_types.h"

#include <functional>
#include <optional>

namespace touchstick {

/// Optional correction applied to the gain-scaled offset (ideal calibration)
using VectorAdjuster = std::function<Vec2(Vec2)>;

/// Per-call inputs of the mapping algorithm
struct MappingParams {
    GainPair gain;
    double deadzone = 0.0;
    /// Angle warp bounds; empty when warping is disabled
    std::optional<AngleWarpBounds> warp;
    VectorAdjuster adjuster;
};

/// Mapping output plus the intermediate values (used by overlays and logs)
struct MappingResult {
    Vec2 target;
    double ratio = 0.0;
    double distance = 0.0;
    double theta_real = 0.0;
    double theta_ideal = 0.0;
    /// Boundary distance along theta_ideal; empty for a saturating boundary
    std::optional<double> max_distance;
};

/**
 * @brief Rescale a normalized length so deadzone -> 0 and 1 -> 1
 *
 * Lengths at or below the deadzone return 0. Result is clamped to [0, 1].
 */
double apply_deadzone(double length, double deadzone);

/**
 * @brief Project a pointer onto the output circle
 *
 * offset = (pointer - calibrated_center) * gain, then adjuster; the measured
 * angle is warped when bounds are given; the boundary is queried along the
 * ideal angle; target = widget_center + unit(theta_ideal) * ratio * radius.
 *
 * A zero offset or a non-positive boundary yields the widget center.
 */
MappingResult map_pointer(Vec2 pointer, Vec2 calibrated_center, const MappingParams& params,
                          const BoundaryModel& boundary, Vec2 widget_center,
                          double output_radius);

/**
 * @brief Anchor-normalized deflection vector for an offset
 *
 * nx = dx / rx, ny = dy / ry with per-quadrant anchor radii, length clamped
 * to 1, then the deadzone rescale. Equivalent to map_pointer() with an
 * AnchorEllipse boundary and no warp.
 *
 * @return Vector of length <= 1, or nullopt if an anchor is not positive
 */
std::optional<Vec2> anchor_normalized_vector(Vec2 offset, const AnchorDistances& anchors,
                                             double deadzone);

/**
 * @brief Stateful mapper bound to one widget's calibration
 *
 * Caches the boundary model and rebuilds it when any calibration key
 * changes.
 */
class PointerMapper {
  public:
    PointerMapper(CalibrationStore& store, BoundaryOptions options);
    ~PointerMapper();

    PointerMapper(const PointerMapper&) = delete;
    PointerMapper& operator=(const PointerMapper&) = delete;

    void set_boundary_options(const BoundaryOptions& options);
    const BoundaryOptions& boundary_options() const {
        return options_;
    }

    void set_adjuster(VectorAdjuster adjuster) {
        adjuster_ = std::move(adjuster);
    }

    /// Current boundary (rebuilt lazily after a calibration change)
    const BoundaryModel& boundary() const;

    /// Drop the cached boundary (surface size changes do not touch the config)
    void invalidate() {
        boundary_.reset();
    }

    /// Parameters assembled from the store: gains, deadzone, warp, adjuster
    MappingParams params() const;

    MappingResult map(Vec2 pointer, Vec2 widget_center, double output_radius) const;

  private:
    CalibrationStore& store_;
    BoundaryOptions options_;
    VectorAdjuster adjuster_;
    ConfigStore::CallbackId config_cb_ = 0;
    mutable std::optional<BoundaryModel> boundary_;
};

} // namespace touchstick
