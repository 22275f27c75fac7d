// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#include "calibration_store.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace touchstick {

namespace calibration_keys {
std::string diagonal_dx(Quadrant q) {
    return std::string("diag_") + quadrant_key(q) + "_dx";
}
std::string diagonal_dy(Quadrant q) {
    return std::string("diag_") + quadrant_key(q) + "_dy";
}
} // namespace calibration_keys

const char* anchor_axis_name(AnchorAxis axis) {
    switch (axis) {
    case AnchorAxis::Up:
        return "up";
    case AnchorAxis::Down:
        return "down";
    case AnchorAxis::Left:
        return "left";
    case AnchorAxis::Right:
        return "right";
    }
    return "?";
}

// ============================================================================
// Sanitizers
// ============================================================================

std::optional<double> parse_number(const json& raw) {
    if (raw.is_number()) {
        double v = raw.get<double>();
        if (!std::isfinite(v)) {
            return std::nullopt;
        }
        return v;
    }
    if (!raw.is_string()) {
        return std::nullopt;
    }

    const std::string& s = raw.get_ref<const std::string&>();
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::nullopt;
    }
    auto last = s.find_last_not_of(" \t\r\n");
    std::string trimmed = s.substr(first, last - first + 1);

    errno = 0;
    char* end = nullptr;
    double v = std::strtod(trimmed.c_str(), &end);
    if (errno != 0 || end != trimmed.c_str() + trimmed.size() || !std::isfinite(v)) {
        return std::nullopt;
    }
    return v;
}

std::optional<int> parse_integer(const json& raw) {
    auto v = parse_number(raw);
    if (!v) {
        return std::nullopt;
    }
    if (std::floor(*v) != *v) {
        return std::nullopt;
    }
    if (*v > 2147483647.0 || *v < -2147483648.0) {
        return std::nullopt;
    }
    return static_cast<int>(*v);
}

std::optional<double> sanitize_gain(const json& raw, const CalibrationLimits& limits) {
    auto v = parse_number(raw);
    if (!v) {
        return std::nullopt;
    }
    return std::clamp(*v, limits.gain_min, limits.gain_max);
}

std::optional<double> sanitize_deadzone(const json& raw, const CalibrationLimits& limits) {
    auto v = parse_number(raw);
    if (!v) {
        return std::nullopt;
    }
    return std::clamp(*v, 0.0, limits.deadzone_max);
}

std::optional<int> sanitize_anchor_distance(const json& raw, int limit) {
    auto v = parse_integer(raw);
    if (!v || *v <= 0 || *v > limit) {
        return std::nullopt;
    }
    return v;
}

std::optional<int> sanitize_diagonal_value(const json& raw, int limit) {
    auto v = parse_integer(raw);
    if (!v || *v == 0 || std::abs(*v) > limit) {
        return std::nullopt;
    }
    return v;
}

bool validate_diagonal_quadrant(Quadrant q, int dx, int dy) {
    QuadrantSigns s = quadrant_signs(q);
    return dx * s.x > 0 && dy * s.y > 0;
}

std::optional<DiagonalOffset> sanitize_diagonal_pair(Quadrant q, const json& dx, const json& dy,
                                                     int limit) {
    auto x = sanitize_diagonal_value(dx, limit);
    auto y = sanitize_diagonal_value(dy, limit);
    if (!x || !y) {
        return std::nullopt;
    }
    if (!validate_diagonal_quadrant(q, *x, *y)) {
        spdlog::debug("[Calibration] Diagonal {} ({}, {}) outside its quadrant", quadrant_key(q),
                      *x, *y);
        return std::nullopt;
    }
    return DiagonalOffset{*x, *y};
}

DiagonalOffset clamp_diagonal_offset(Quadrant q, double dx, double dy, int limit) {
    QuadrantSigns s = quadrant_signs(q);
    limit = std::max(limit, 1);
    // A handle dragged across an axis stops at 1 px inside its quadrant
    auto clamp_component = [limit](double v, int sign) {
        double bounded = std::isfinite(v) ? std::clamp(v, -1.0 * limit, 1.0 * limit) : sign;
        long value = std::lround(bounded);
        value = sign > 0 ? std::max<long>(value, 1) : std::min<long>(value, -1);
        return static_cast<int>(value);
    };
    return {clamp_component(dx, s.x), clamp_component(dy, s.y)};
}

DiagonalOffsets default_diagonal_offsets(const AnchorDistances& anchors, double scale) {
    auto scaled = [scale](int v) {
        return std::max(1, static_cast<int>(std::lround(v * scale)));
    };
    DiagonalOffsets out{};
    out[static_cast<size_t>(Quadrant::UpRight)] = {scaled(anchors.right), -scaled(anchors.up)};
    out[static_cast<size_t>(Quadrant::DownRight)] = {scaled(anchors.right), scaled(anchors.down)};
    out[static_cast<size_t>(Quadrant::DownLeft)] = {-scaled(anchors.left), scaled(anchors.down)};
    out[static_cast<size_t>(Quadrant::UpLeft)] = {-scaled(anchors.left), -scaled(anchors.up)};
    return out;
}

// ============================================================================
// CalibrationStore
// ============================================================================

CalibrationStore::CalibrationStore(ConfigStore& config, SurfaceSize surface,
                                   CalibrationLimits limits)
    : config_(config), surface_(surface), limits_(limits) {}

int CalibrationStore::anchor_limit() const {
    return std::max(1, limits_.anchor_limit_factor * std::max(surface_.width, surface_.height));
}

std::optional<Vec2> CalibrationStore::calibrated_center() const {
    auto x = parse_number(config_.get(calibration_keys::CENTER_X));
    auto y = parse_number(config_.get(calibration_keys::CENTER_Y));
    if (!x || !y) {
        return std::nullopt;
    }
    if (!surface_.contains(*x, *y)) {
        return std::nullopt;
    }
    return Vec2{*x, *y};
}

Vec2 CalibrationStore::effective_center() const {
    return calibrated_center().value_or(surface_.center());
}

bool CalibrationStore::set_calibrated_center(double x, double y, ChangeOrigin origin) {
    if (!std::isfinite(x) || !std::isfinite(y) || !surface_.contains(x, y)) {
        spdlog::debug("[Calibration] Rejected center ({}, {}) for {}x{} surface", x, y,
                      surface_.width, surface_.height);
        return false;
    }
    config_.set(calibration_keys::CENTER_X, x, origin);
    config_.set(calibration_keys::CENTER_Y, y, origin);
    spdlog::debug("[Calibration] Center set to ({:.1f}, {:.1f})", x, y);
    return true;
}

void CalibrationStore::clear_calibrated_center(ChangeOrigin origin) {
    config_.unset(calibration_keys::CENTER_X, origin);
    config_.unset(calibration_keys::CENTER_Y, origin);
}

GainPair CalibrationStore::saved_gains() const {
    return {sanitize_gain(config_.get(calibration_keys::X_GAIN), limits_)
                .value_or(limits_.gain_default),
            sanitize_gain(config_.get(calibration_keys::Y_GAIN), limits_)
                .value_or(limits_.gain_default)};
}

GainPair CalibrationStore::gains() const {
    if (!gain_enabled()) {
        return {1.0, 1.0};
    }
    return saved_gains();
}

bool CalibrationStore::gain_enabled() const {
    if (!limits_.has_gain_switch) {
        return true;
    }
    const json& v = config_.get(calibration_keys::GAIN_ENABLED);
    if (v.is_boolean()) {
        return v.get<bool>();
    }
    if (v.is_string()) {
        std::string s = v.get<std::string>();
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s == "1" || s == "true" || s == "yes" || s == "on";
    }
    if (v.is_number()) {
        return v.get<double>() != 0.0;
    }
    return true;
}

void CalibrationStore::set_gain_enabled(bool enabled, ChangeOrigin origin) {
    config_.set(calibration_keys::GAIN_ENABLED, enabled, origin);
}

void CalibrationStore::set_gains(GainPair gains, ChangeOrigin origin) {
    auto x = sanitize_gain(gains.x, limits_);
    auto y = sanitize_gain(gains.y, limits_);
    if (x) {
        config_.set(calibration_keys::X_GAIN, *x, origin);
    }
    if (y) {
        config_.set(calibration_keys::Y_GAIN, *y, origin);
    }
}

void CalibrationStore::reset_gains(ChangeOrigin origin) {
    config_.set(calibration_keys::X_GAIN, limits_.gain_default, origin);
    config_.set(calibration_keys::Y_GAIN, limits_.gain_default, origin);
}

double CalibrationStore::deadzone() const {
    return sanitize_deadzone(config_.get(calibration_keys::DEADZONE), limits_)
        .value_or(limits_.deadzone_default);
}

void CalibrationStore::set_deadzone(double deadzone, ChangeOrigin origin) {
    auto v = sanitize_deadzone(deadzone, limits_);
    if (v) {
        config_.set(calibration_keys::DEADZONE, *v, origin);
    }
}

const char* CalibrationStore::anchor_key(AnchorAxis axis) const {
    switch (axis) {
    case AnchorAxis::Up:
        return calibration_keys::ANCHOR_UP;
    case AnchorAxis::Down:
        return calibration_keys::ANCHOR_DOWN;
    case AnchorAxis::Left:
        return calibration_keys::ANCHOR_LEFT;
    case AnchorAxis::Right:
        return calibration_keys::ANCHOR_RIGHT;
    }
    return calibration_keys::ANCHOR_UP;
}

PartialAnchors CalibrationStore::partial_anchors() const {
    int limit = anchor_limit();
    PartialAnchors p;
    p.up = sanitize_anchor_distance(config_.get(calibration_keys::ANCHOR_UP), limit);
    p.down = sanitize_anchor_distance(config_.get(calibration_keys::ANCHOR_DOWN), limit);
    p.left = sanitize_anchor_distance(config_.get(calibration_keys::ANCHOR_LEFT), limit);
    p.right = sanitize_anchor_distance(config_.get(calibration_keys::ANCHOR_RIGHT), limit);
    return p;
}

std::optional<AnchorDistances> CalibrationStore::anchor_distances() const {
    return partial_anchors().full();
}

bool CalibrationStore::set_anchor(AnchorAxis axis, int distance, ChangeOrigin origin) {
    auto v = sanitize_anchor_distance(distance, anchor_limit());
    if (!v) {
        spdlog::debug("[Calibration] Rejected {} anchor {}", anchor_axis_name(axis), distance);
        return false;
    }
    config_.set(anchor_key(axis), *v, origin);
    if (anchor_distances()) {
        ensure_diagonal_defaults(origin);
    }
    return true;
}

bool CalibrationStore::store_anchor_distances(const AnchorDistances& anchors,
                                              ChangeOrigin origin) {
    int limit = anchor_limit();
    if (!sanitize_anchor_distance(anchors.up, limit) ||
        !sanitize_anchor_distance(anchors.down, limit) ||
        !sanitize_anchor_distance(anchors.left, limit) ||
        !sanitize_anchor_distance(anchors.right, limit)) {
        spdlog::debug("[Calibration] Rejected anchors up={} down={} left={} right={}", anchors.up,
                      anchors.down, anchors.left, anchors.right);
        return false;
    }
    config_.set(calibration_keys::ANCHOR_UP, anchors.up, origin);
    config_.set(calibration_keys::ANCHOR_DOWN, anchors.down, origin);
    config_.set(calibration_keys::ANCHOR_LEFT, anchors.left, origin);
    config_.set(calibration_keys::ANCHOR_RIGHT, anchors.right, origin);
    ensure_diagonal_defaults(origin);
    spdlog::debug("[Calibration] Anchors stored up={} down={} left={} right={}", anchors.up,
                  anchors.down, anchors.left, anchors.right);
    return true;
}

void CalibrationStore::reset_anchors(ChangeOrigin origin) {
    for (auto axis : {AnchorAxis::Up, AnchorAxis::Down, AnchorAxis::Left, AnchorAxis::Right}) {
        config_.unset(anchor_key(axis), origin);
    }
}

std::optional<DiagonalOffset> CalibrationStore::diagonal_offset(Quadrant q) const {
    return sanitize_diagonal_pair(q, config_.get(calibration_keys::diagonal_dx(q)),
                                  config_.get(calibration_keys::diagonal_dy(q)), anchor_limit());
}

std::optional<DiagonalOffsets> CalibrationStore::diagonal_offsets() const {
    if (!limits_.has_diagonals) {
        return std::nullopt;
    }
    auto anchors = anchor_distances();
    if (!anchors) {
        return std::nullopt;
    }
    DiagonalOffsets defaults = default_diagonal_offsets(*anchors, limits_.diagonal_default_scale);
    DiagonalOffsets out = defaults;
    for (Quadrant q : ALL_QUADRANTS) {
        bool present = config_.has(calibration_keys::diagonal_dx(q)) ||
                       config_.has(calibration_keys::diagonal_dy(q));
        if (!present) {
            continue;
        }
        auto stored = diagonal_offset(q);
        if (!stored) {
            return std::nullopt;
        }
        out[static_cast<size_t>(q)] = *stored;
    }
    return out;
}

void CalibrationStore::ensure_diagonal_defaults(ChangeOrigin origin) {
    if (!limits_.has_diagonals) {
        return;
    }
    auto anchors = anchor_distances();
    if (!anchors) {
        return;
    }
    DiagonalOffsets defaults = default_diagonal_offsets(*anchors, limits_.diagonal_default_scale);
    for (Quadrant q : ALL_QUADRANTS) {
        if (config_.has(calibration_keys::diagonal_dx(q)) ||
            config_.has(calibration_keys::diagonal_dy(q))) {
            continue;
        }
        const DiagonalOffset& d = diagonal_at(defaults, q);
        config_.set(calibration_keys::diagonal_dx(q), d.dx, origin);
        config_.set(calibration_keys::diagonal_dy(q), d.dy, origin);
    }
}

bool CalibrationStore::store_diagonal_offset(Quadrant q, DiagonalOffset offset,
                                             ChangeOrigin origin) {
    if (!sanitize_diagonal_pair(q, offset.dx, offset.dy, anchor_limit())) {
        return false;
    }
    config_.set(calibration_keys::diagonal_dx(q), offset.dx, origin);
    config_.set(calibration_keys::diagonal_dy(q), offset.dy, origin);
    return true;
}

bool CalibrationStore::store_diagonal_offsets(const DiagonalOffsets& offsets,
                                              ChangeOrigin origin) {
    int limit = anchor_limit();
    for (Quadrant q : ALL_QUADRANTS) {
        const DiagonalOffset& d = diagonal_at(offsets, q);
        if (!sanitize_diagonal_pair(q, d.dx, d.dy, limit)) {
            return false;
        }
    }
    for (Quadrant q : ALL_QUADRANTS) {
        store_diagonal_offset(q, diagonal_at(offsets, q), origin);
    }
    return true;
}

DiagonalOffset CalibrationStore::update_diagonal_from_drag(Quadrant q, double dx, double dy,
                                                           ChangeOrigin origin) {
    DiagonalOffset clamped = clamp_diagonal_offset(q, dx, dy, anchor_limit());
    config_.set(calibration_keys::diagonal_dx(q), clamped.dx, origin);
    config_.set(calibration_keys::diagonal_dy(q), clamped.dy, origin);
    spdlog::trace("[Calibration] Diagonal {} dragged to ({}, {})", quadrant_key(q), clamped.dx,
                  clamped.dy);
    return clamped;
}

void CalibrationStore::reset_diagonals(ChangeOrigin origin) {
    for (Quadrant q : ALL_QUADRANTS) {
        config_.unset(calibration_keys::diagonal_dx(q), origin);
        config_.unset(calibration_keys::diagonal_dy(q), origin);
    }
}

bool CalibrationStore::warp_enabled() const {
    return config_.get<bool>(calibration_keys::WARP_ENABLED, false);
}

void CalibrationStore::set_warp_enabled(bool enabled, ChangeOrigin origin) {
    config_.set(calibration_keys::WARP_ENABLED, enabled, origin);
}

AngleWarpBounds CalibrationStore::warp_bounds() const {
    const json& raw = config_.get(calibration_keys::WARP_BOUNDS);
    AngleWarpBounds bounds = default_warp_bounds();
    if (!raw.is_array() || raw.size() != bounds.size()) {
        return bounds;
    }
    for (size_t i = 0; i < bounds.size(); ++i) {
        auto v = parse_number(raw[i]);
        bounds[i] = v.value_or(bounds[i]);
    }
    return normalize_warp_bounds(bounds);
}

void CalibrationStore::set_warp_bounds(const AngleWarpBounds& bounds, ChangeOrigin origin) {
    AngleWarpBounds normalized = normalize_warp_bounds(bounds);
    config_.set(calibration_keys::WARP_BOUNDS, json(normalized), origin);
}

} // namespace touchstick
