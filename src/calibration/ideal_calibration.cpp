// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#include "ideal_calibration.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <map>

namespace touchstick {

namespace {

double clamp_scale(double scale) {
    return std::clamp(scale, IDEAL_SCALE_MIN, IDEAL_SCALE_MAX);
}

} // namespace

// ============================================================================
// IdealCalibrationMap
// ============================================================================

std::optional<IdealCalibrationMap>
IdealCalibrationMap::build(const std::vector<IdealSample>& samples) {
    if (samples.empty()) {
        return std::nullopt;
    }

    std::map<double, std::vector<const IdealSample*>> buckets;
    for (const auto& s : samples) {
        buckets[normalize_angle(s.target_angle)].push_back(&s);
    }

    IdealCalibrationMap map;
    for (const auto& [angle, entries] : buckets) {
        double offset_sum = 0.0;
        double scale_sum = 0.0;
        for (const IdealSample* s : entries) {
            offset_sum += normalize_angle_delta(s->cursor_angle - s->target_angle);
            double scale = s->target_radius > 0.0 ? s->cursor_radius / s->target_radius : 1.0;
            scale_sum += clamp_scale(scale);
        }
        double n = static_cast<double>(entries.size());
        map.angles_.push_back(angle);
        map.offsets_.push_back(offset_sum / n);
        map.scales_.push_back(scale_sum / n);
    }
    return map;
}

std::optional<IdealCalibrationMap> IdealCalibrationMap::from_json(const json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }
    auto angles = j.find("angles");
    auto offsets = j.find("angle_offsets");
    auto scales = j.find("radius_scales");
    if (angles == j.end() || offsets == j.end() || scales == j.end()) {
        return std::nullopt;
    }
    if (!angles->is_array() || !offsets->is_array() || !scales->is_array()) {
        return std::nullopt;
    }
    size_t n = angles->size();
    if (n == 0 || offsets->size() != n || scales->size() != n) {
        return std::nullopt;
    }

    std::vector<std::array<double, 3>> rows;
    rows.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        const json& a = (*angles)[i];
        const json& o = (*offsets)[i];
        const json& s = (*scales)[i];
        if (!a.is_number() || !o.is_number() || !s.is_number()) {
            return std::nullopt;
        }
        rows.push_back({normalize_angle(a.get<double>()), o.get<double>(), s.get<double>()});
    }
    std::sort(rows.begin(), rows.end(),
              [](const auto& lhs, const auto& rhs) { return lhs[0] < rhs[0]; });

    IdealCalibrationMap map;
    for (const auto& row : rows) {
        map.angles_.push_back(row[0]);
        map.offsets_.push_back(row[1]);
        map.scales_.push_back(row[2]);
    }
    return map;
}

json IdealCalibrationMap::to_json() const {
    return json{{"bins", angles_.size()},
                {"angles", angles_},
                {"angle_offsets", offsets_},
                {"radius_scales", scales_}};
}

IdealAdjustment IdealCalibrationMap::adjustment_at(double angle) const {
    if (angles_.empty()) {
        return {};
    }
    angle = normalize_angle(angle);
    size_t last = angles_.size() - 1;

    // Bracketing bins; the first and last bins wrap around through 360
    double prev_angle, next_angle;
    size_t prev, next;
    if (angle <= angles_.front()) {
        prev = last;
        next = 0;
        prev_angle = angles_[last] - 360.0;
        next_angle = angles_[0];
    } else if (angle >= angles_.back()) {
        prev = last;
        next = 0;
        prev_angle = angles_[last];
        next_angle = angles_[0] + 360.0;
    } else {
        auto it = std::upper_bound(angles_.begin(), angles_.end(), angle);
        next = static_cast<size_t>(it - angles_.begin());
        prev = next - 1;
        prev_angle = angles_[prev];
        next_angle = angles_[next];
    }

    double span = std::max(next_angle - prev_angle, 1e-6);
    double t = (angle - prev_angle) / span;
    return {offsets_[prev] + (offsets_[next] - offsets_[prev]) * t,
            scales_[prev] + (scales_[next] - scales_[prev]) * t};
}

Vec2 IdealCalibrationMap::apply(Vec2 offset) const {
    double radius = offset.length();
    if (radius == 0.0) {
        return {};
    }
    double angle = vector_to_angle(offset.x, offset.y);
    IdealAdjustment adj = adjustment_at(angle);
    return unit_from_angle(normalize_angle(angle + adj.angle_offset)) *
           (radius * clamp_scale(adj.radius_scale));
}

// ============================================================================
// Storage
// ============================================================================

json load_ideal_store(const ConfigStore& config) {
    const json& raw = config.get(IDEAL_CALIBRATION_KEY);
    if (raw.is_object()) {
        return raw;
    }
    if (raw.is_string()) {
        json parsed = json::parse(raw.get<std::string>(), nullptr, false);
        if (parsed.is_object()) {
            return parsed;
        }
        spdlog::debug("[IdealCalibration] Ignoring malformed stored data");
    }
    return json::object();
}

std::optional<IdealCalibrationMap> load_ideal_map(const ConfigStore& config,
                                                  const std::string& skill) {
    json store = load_ideal_store(config);
    auto it = store.find(skill);
    if (it == store.end()) {
        return std::nullopt;
    }
    return IdealCalibrationMap::from_json(*it);
}

void save_ideal_map(ConfigStore& config, const std::string& skill,
                    const IdealCalibrationMap& map) {
    json store = load_ideal_store(config);
    store[skill] = map.to_json();
    config.set(IDEAL_CALIBRATION_KEY, store);
    spdlog::info("[IdealCalibration] Saved {} bins for skill {}", map.bins(), skill);
}

bool clear_ideal_map(ConfigStore& config, const std::string& skill) {
    json store = load_ideal_store(config);
    if (store.erase(skill) == 0) {
        return false;
    }
    config.set(IDEAL_CALIBRATION_KEY, store);
    return true;
}

// ============================================================================
// IdealCalibrationSession
// ============================================================================

void IdealCalibrationSession::start(const std::string& skill, int samples) {
    if (samples != 16 && samples != 32) {
        samples = DEFAULT_SAMPLES;
    }
    active_ = true;
    skill_ = skill.empty() ? DEFAULT_SKILL : skill;
    targets_.clear();
    double step = 360.0 / samples;
    for (int i = 0; i < samples; ++i) {
        targets_.push_back(normalize_angle(i * step));
    }
    index_ = 0;
    samples_.clear();
    pending_.reset();
    spdlog::info("[IdealCalibration] Started for skill {} with {} targets", skill_, samples);
}

void IdealCalibrationSession::stop() {
    active_ = false;
    targets_.clear();
    index_ = 0;
    samples_.clear();
    pending_.reset();
}

std::optional<IdealTarget>
IdealCalibrationSession::current_target(Vec2 center, const RadiusFunction& radius) const {
    if (!active_ || index_ >= total()) {
        return std::nullopt;
    }
    IdealTarget target;
    target.angle = targets_[static_cast<size_t>(index_)];
    target.radius = radius(target.angle) * IDEAL_TARGET_RATIO;
    target.point = center + unit_from_angle(target.angle) * target.radius;
    return target;
}

bool IdealCalibrationSession::capture(Vec2 offset, Vec2 center, const RadiusFunction& radius) {
    if (!active_ || pending_) {
        return false;
    }
    auto target = current_target(center, radius);
    if (!target) {
        return false;
    }
    double cursor_radius = offset.length();
    if (cursor_radius == 0.0) {
        return false;
    }
    pending_ = IdealSample{target->angle, target->radius, vector_to_angle(offset.x, offset.y),
                           cursor_radius};
    spdlog::debug("[IdealCalibration] Sample {}/{}: target {:.1f} deg, cursor {:.1f} deg",
                  index_ + 1, total(), pending_->target_angle, pending_->cursor_angle);
    return true;
}

bool IdealCalibrationSession::confirm(SampleDecision decision) {
    if (!active_ || !pending_) {
        return false;
    }
    if (decision != SampleDecision::Yes) {
        pending_.reset();
        return false;
    }
    samples_.push_back(*pending_);
    pending_.reset();
    ++index_;
    return index_ >= total();
}

} // namespace touchstick
