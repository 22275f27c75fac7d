// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#include "pointer_mapper.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace touchstick {

double apply_deadzone(double length, double deadzone) {
    if (length <= deadzone) {
        return 0.0;
    }
    if (deadzone > 0.0) {
        return std::clamp((length - deadzone) / (1.0 - deadzone), 0.0, 1.0);
    }
    return std::clamp(length, 0.0, 1.0);
}

MappingResult map_pointer(Vec2 pointer, Vec2 calibrated_center, const MappingParams& params,
                          const BoundaryModel& boundary, Vec2 widget_center,
                          double output_radius) {
    MappingResult result;
    result.target = widget_center;

    Vec2 offset = pointer - calibrated_center;
    offset.x *= params.gain.x;
    offset.y *= params.gain.y;
    if (params.adjuster) {
        offset = params.adjuster(offset);
    }

    result.distance = offset.length();
    if (result.distance == 0.0) {
        return result;
    }

    result.theta_real = vector_to_angle(offset.x, offset.y);
    result.theta_ideal = result.theta_real;
    if (params.warp) {
        result.theta_ideal = warp_angle(result.theta_real, *params.warp).angle;
    }

    result.max_distance = boundary.distance_at_angle(result.theta_ideal);
    double ratio = 1.0;
    if (result.max_distance) {
        if (*result.max_distance <= 0.0) {
            spdlog::trace("[PointerMapper] No boundary along {:.1f} deg", result.theta_ideal);
            return result;
        }
        ratio = std::min(result.distance / *result.max_distance, 1.0);
    }
    result.ratio = apply_deadzone(ratio, params.deadzone);

    Vec2 unit = unit_from_angle(result.theta_ideal);
    result.target = widget_center + unit * (result.ratio * output_radius);
    return result;
}

std::optional<Vec2> anchor_normalized_vector(Vec2 offset, const AnchorDistances& anchors,
                                             double deadzone) {
    double rx = offset.x >= 0.0 ? anchors.right : anchors.left;
    double ry = offset.y >= 0.0 ? anchors.down : anchors.up;
    if (rx <= 0.0 || ry <= 0.0) {
        return std::nullopt;
    }
    Vec2 n{offset.x / rx, offset.y / ry};
    double length = n.length();
    if (length == 0.0) {
        return Vec2{0.0, 0.0};
    }
    if (length > 1.0) {
        n = n * (1.0 / length);
        length = 1.0;
    }
    double scaled = apply_deadzone(length, deadzone);
    if (scaled == 0.0) {
        return Vec2{0.0, 0.0};
    }
    return n * (scaled / length);
}

// ============================================================================
// PointerMapper
// ============================================================================

PointerMapper::PointerMapper(CalibrationStore& store, BoundaryOptions options)
    : store_(store), options_(options) {
    config_cb_ = store_.config().add_change_callback(
        "", [this](const std::string&, const json&, ChangeOrigin) { boundary_.reset(); });
}

PointerMapper::~PointerMapper() {
    store_.config().remove_change_callback(config_cb_);
}

void PointerMapper::set_boundary_options(const BoundaryOptions& options) {
    options_ = options;
    boundary_.reset();
}

const BoundaryModel& PointerMapper::boundary() const {
    if (!boundary_) {
        boundary_ = BoundaryModel::build(store_.partial_anchors(), store_.diagonal_offsets(),
                                         options_);
        spdlog::trace("[PointerMapper] Boundary rebuilt: {}", boundary_kind_name(boundary_->kind()));
    }
    return *boundary_;
}

MappingParams PointerMapper::params() const {
    MappingParams p;
    p.gain = store_.gains();
    p.deadzone = store_.deadzone();
    if (store_.warp_enabled()) {
        p.warp = store_.warp_bounds();
    }
    p.adjuster = adjuster_;
    return p;
}

MappingResult PointerMapper::map(Vec2 pointer, Vec2 widget_center, double output_radius) const {
    return map_pointer(pointer, store_.effective_center(), params(), boundary(), widget_center,
                       output_radius);
}

} // namespace touchstick
