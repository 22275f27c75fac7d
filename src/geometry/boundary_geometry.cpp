// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#include "boundary_geometry.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

namespace touchstick {

const char* quadrant_key(Quadrant q) {
    switch (q) {
    case Quadrant::UpRight:
        return "ur";
    case Quadrant::DownRight:
        return "dr";
    case Quadrant::DownLeft:
        return "dl";
    case Quadrant::UpLeft:
        return "ul";
    }
    return "??";
}

const char* boundary_kind_name(BoundaryKind kind) {
    switch (kind) {
    case BoundaryKind::Spline:
        return "Spline";
    case BoundaryKind::Superellipse:
        return "Superellipse";
    case BoundaryKind::AnchorEllipse:
        return "AnchorEllipse";
    case BoundaryKind::GainCircle:
        return "GainCircle";
    case BoundaryKind::Saturating:
        return "Saturating";
    }
    return "Unknown";
}

std::vector<Vec2> catmull_rom_closed(const std::vector<Vec2>& points, int samples) {
    const int count = static_cast<int>(points.size());
    if (count < 4) {
        return points;
    }

    int total_samples = std::max(samples, count * 4);
    int per_segment = std::max(1, total_samples / count);

    std::vector<Vec2> spline;
    spline.reserve(static_cast<size_t>(per_segment * count + 1));

    auto at = [&](int i) -> const Vec2& {
        return points[static_cast<size_t>(((i % count) + count) % count)];
    };

    for (int i = 0; i < count; ++i) {
        const Vec2& p0 = at(i - 1);
        const Vec2& p1 = at(i);
        const Vec2& p2 = at(i + 1);
        const Vec2& p3 = at(i + 2);
        for (int step = 0; step < per_segment; ++step) {
            double t = static_cast<double>(step) / per_segment;
            double t2 = t * t;
            double t3 = t2 * t;
            double x = 0.5 * (2.0 * p1.x + (-p0.x + p2.x) * t +
                              (2.0 * p0.x - 5.0 * p1.x + 4.0 * p2.x - p3.x) * t2 +
                              (-p0.x + 3.0 * p1.x - 3.0 * p2.x + p3.x) * t3);
            double y = 0.5 * (2.0 * p1.y + (-p0.y + p2.y) * t +
                              (2.0 * p0.y - 5.0 * p1.y + 4.0 * p2.y - p3.y) * t2 +
                              (-p0.y + 3.0 * p1.y - 3.0 * p2.y + p3.y) * t3);
            spline.push_back({x, y});
        }
    }

    if (!spline.empty() && !(spline.front() == spline.back())) {
        spline.push_back(spline.front());
    }
    return spline;
}

std::optional<double> ray_intersection_distance(Vec2 origin, Vec2 direction,
                                                const std::vector<Vec2>& contour) {
    if (contour.size() < 2) {
        return std::nullopt;
    }

    auto cross = [](double ax, double ay, double bx, double by) { return ax * by - ay * bx; };

    std::optional<double> min_t;
    for (size_t i = 0; i + 1 < contour.size(); ++i) {
        const Vec2& a = contour[i];
        const Vec2& b = contour[i + 1];
        double sx = b.x - a.x;
        double sy = b.y - a.y;
        double rxs = cross(direction.x, direction.y, sx, sy);
        if (std::abs(rxs) < 1e-6) {
            continue;
        }
        double qpx = a.x - origin.x;
        double qpy = a.y - origin.y;
        double t = cross(qpx, qpy, sx, sy) / rxs;
        double u = cross(qpx, qpy, direction.x, direction.y) / rxs;
        if (t >= 0.0 && u >= 0.0 && u <= 1.0) {
            if (!min_t || t < *min_t) {
                min_t = t;
            }
        }
    }
    return min_t;
}

std::vector<Vec2> build_diagonal_contour(Vec2 center, const AnchorDistances& anchors,
                                         const DiagonalOffsets& diagonals, int samples) {
    auto diag = [&](Quadrant q) {
        const DiagonalOffset& d = diagonal_at(diagonals, q);
        return Vec2{center.x + d.dx, center.y + d.dy};
    };

    std::vector<Vec2> points = {
        {center.x, center.y - anchors.up},   diag(Quadrant::UpRight),
        {center.x + anchors.right, center.y}, diag(Quadrant::DownRight),
        {center.x, center.y + anchors.down}, diag(Quadrant::DownLeft),
        {center.x - anchors.left, center.y},  diag(Quadrant::UpLeft),
    };
    return catmull_rom_closed(points, samples);
}

double anchor_ellipse_radius(const AnchorDistances& anchors, Vec2 unit_dir) {
    double rx = unit_dir.x >= 0.0 ? anchors.right : anchors.left;
    double ry = unit_dir.y >= 0.0 ? anchors.down : anchors.up;
    if (rx <= 0.0 || ry <= 0.0) {
        return 0.0;
    }
    double nx = std::abs(unit_dir.x) / rx;
    double ny = std::abs(unit_dir.y) / ry;
    double denom = nx * nx + ny * ny;
    if (denom <= 0.0) {
        return 0.0;
    }
    return 1.0 / std::sqrt(denom);
}

double superellipse_radius(const Extents& extents, Vec2 unit_dir, double p, double k) {
    p = std::clamp(p, 2.0, 4.0);
    k = std::clamp(k, 1.0, 10.0);

    auto lerp = [](double a, double b, double t) { return a + (b - a) * t; };

    double sx = 0.5 * (1.0 + std::tanh(k * unit_dir.x));
    double sy = 0.5 * (1.0 + std::tanh(k * unit_dir.y));
    double rx = lerp(extents.left, extents.right, sx);
    double ry = lerp(extents.up, extents.down, sy);
    if (rx <= 0.0 || ry <= 0.0) {
        return 0.0;
    }

    double denom = std::pow(std::abs(unit_dir.x) / rx, p) + std::pow(std::abs(unit_dir.y) / ry, p);
    if (denom <= 0.0) {
        return 0.0;
    }
    return 1.0 / std::pow(denom, 1.0 / p);
}

BoundaryModel BoundaryModel::build(const PartialAnchors& anchors,
                                   const std::optional<DiagonalOffsets>& diagonals,
                                   const BoundaryOptions& options) {
    BoundaryModel model;
    model.options_ = options;
    model.anchors_ = anchors.full();

    if (model.anchors_ && diagonals) {
        model.spline_ =
            build_diagonal_contour({0.0, 0.0}, *model.anchors_, *diagonals, options.spline_samples);
        if (model.spline_.size() >= 2) {
            model.kind_ = BoundaryKind::Spline;
            return model;
        }
        model.spline_.clear();
    }

    if (options.smooth_fallback && anchors.any()) {
        double r = options.fallback_radius;
        model.extents_ = {anchors.up ? static_cast<double>(*anchors.up) : r,
                          anchors.down ? static_cast<double>(*anchors.down) : r,
                          anchors.left ? static_cast<double>(*anchors.left) : r,
                          anchors.right ? static_cast<double>(*anchors.right) : r};
        model.kind_ = BoundaryKind::Superellipse;
        return model;
    }

    if (model.anchors_) {
        model.kind_ = BoundaryKind::AnchorEllipse;
        return model;
    }

    model.kind_ =
        options.saturate_without_anchors ? BoundaryKind::Saturating : BoundaryKind::GainCircle;
    return model;
}

std::optional<double> BoundaryModel::distance(Vec2 direction) const {
    double len = direction.length();
    if (len == 0.0) {
        return 0.0;
    }
    Vec2 unit{direction.x / len, direction.y / len};

    switch (kind_) {
    case BoundaryKind::Spline: {
        auto hit = ray_intersection_distance({0.0, 0.0}, unit, spline_);
        if (hit && *hit > 0.0) {
            return hit;
        }
        spdlog::trace("[BoundaryModel] Spline miss at ({:.3f}, {:.3f}), using anchor ellipse",
                      unit.x, unit.y);
        return anchor_ellipse_radius(*anchors_, unit);
    }
    case BoundaryKind::Superellipse:
        return superellipse_radius(extents_, unit, options_.superellipse_p,
                                   options_.superellipse_k);
    case BoundaryKind::AnchorEllipse:
        return anchor_ellipse_radius(*anchors_, unit);
    case BoundaryKind::GainCircle:
        return options_.fallback_radius;
    case BoundaryKind::Saturating:
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<double> BoundaryModel::distance_at_angle(double angle_deg) const {
    return distance(unit_from_angle(angle_deg));
}

std::vector<Vec2> BoundaryModel::sample_contour(Vec2 center, int segments) const {
    std::vector<Vec2> points;
    if (kind_ == BoundaryKind::Saturating) {
        return points;
    }
    if (kind_ == BoundaryKind::Spline) {
        points.reserve(spline_.size());
        for (const auto& p : spline_) {
            points.push_back(center + p);
        }
        return points;
    }

    segments = std::max(segments, 4);
    points.reserve(static_cast<size_t>(segments + 1));
    for (int i = 0; i <= segments; ++i) {
        double angle = 360.0 * i / segments;
        Vec2 unit = unit_from_angle(angle);
        double r = distance(unit).value_or(0.0);
        points.push_back(center + unit * r);
    }
    return points;
}

} // namespace touchstick
