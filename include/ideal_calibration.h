// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#pragma once

#include "config_store.h"
#include "geometry_types.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace touchstick {

constexpr double IDEAL_SCALE_MIN = 0.5;
constexpr double IDEAL_SCALE_MAX = 2.0;
/// Targets are placed at this fraction of the boundary radius
constexpr double IDEAL_TARGET_RATIO = 0.95;

/// Config key holding {skill name: map JSON}
constexpr const char* IDEAL_CALIBRATION_KEY = "ideal_calibration_data";

/// One confirmed cast: where the target was and where the gained cursor ended up
struct IdealSample {
    double target_angle = 0.0;
    double target_radius = 0.0;
    double cursor_angle = 0.0;
    double cursor_radius = 0.0;
};

/// Correction at one angle: degrees added to the angle, factor applied to the radius
struct IdealAdjustment {
    double angle_offset = 0.0;
    double radius_scale = 1.0;
};

/**
 * @brief Per-angle correction table built from calibration samples
 *
 * Samples are bucketed by target angle. Each bin stores the mean signed angle
 * error (cursor - target, wrapped into [-180, 180]) and the mean radius ratio
 * cursor / target clamped to [0.5, 2]. Lookups interpolate linearly between
 * neighbouring bins, wrapping around 360.
 */
class IdealCalibrationMap {
  public:
    /// @return nullopt when there are no samples
    static std::optional<IdealCalibrationMap> build(const std::vector<IdealSample>& samples);

    /**
     * @brief Parse {"bins", "angles", "angle_offsets", "radius_scales"}
     * @return nullopt if the arrays are missing, empty, non-numeric or of unequal length
     */
    static std::optional<IdealCalibrationMap> from_json(const json& j);
    json to_json() const;

    IdealAdjustment adjustment_at(double angle) const;

    /// Rotate and rescale a gain-scaled offset; a zero vector stays zero
    Vec2 apply(Vec2 offset) const;

    size_t bins() const {
        return angles_.size();
    }
    const std::vector<double>& angles() const {
        return angles_;
    }
    const std::vector<double>& angle_offsets() const {
        return offsets_;
    }
    const std::vector<double>& radius_scales() const {
        return scales_;
    }

  private:
    // Sorted by angle
    std::vector<double> angles_;
    std::vector<double> offsets_;
    std::vector<double> scales_;
};

/// Stored maps, always a JSON object (a string value is parsed, anything else is empty)
json load_ideal_store(const ConfigStore& config);
std::optional<IdealCalibrationMap> load_ideal_map(const ConfigStore& config,
                                                  const std::string& skill);
void save_ideal_map(ConfigStore& config, const std::string& skill,
                    const IdealCalibrationMap& map);
/// @return true if a map was stored for the skill
bool clear_ideal_map(ConfigStore& config, const std::string& skill);

enum class SampleDecision { Yes, No, Redo };

struct IdealTarget {
    double angle = 0.0;
    double radius = 0.0;
    Vec2 point;
};

/**
 * @brief Sampling wizard state
 *
 * start() lays out N evenly spaced target angles. A cast release captures a
 * pending sample which must be confirmed before the next one: Yes keeps it
 * and advances, No and Redo discard it and stay on the same target.
 */
class IdealCalibrationSession {
  public:
    static constexpr int DEFAULT_SAMPLES = 16;
    static constexpr const char* DEFAULT_SKILL = "Q";

    /// Boundary radius along an angle in degrees
    using RadiusFunction = std::function<double(double angle)>;

    /// Any sample count other than 16 or 32 falls back to 16
    void start(const std::string& skill, int samples);

    /// Drop all state; the caller decides whether to keep the samples first
    void stop();

    bool active() const {
        return active_;
    }
    bool awaiting_confirmation() const {
        return pending_.has_value();
    }
    const std::string& skill() const {
        return skill_;
    }
    int total() const {
        return static_cast<int>(targets_.size());
    }
    int index() const {
        return index_;
    }
    const std::vector<IdealSample>& samples() const {
        return samples_;
    }
    const std::optional<IdealSample>& pending() const {
        return pending_;
    }

    std::optional<IdealTarget> current_target(Vec2 center, const RadiusFunction& radius) const;

    /**
     * @brief Record a pending sample from a released cast
     * @param offset Gain-scaled cursor offset from the calibrated center
     * @return false when inactive, awaiting confirmation or the offset is zero
     */
    bool capture(Vec2 offset, Vec2 center, const RadiusFunction& radius);

    /**
     * @brief Resolve the pending sample
     * @return true when the last target was confirmed (session complete)
     */
    bool confirm(SampleDecision decision);

  private:
    bool active_ = false;
    std::string skill_ = DEFAULT_SKILL;
    std::vector<double> targets_;
    int index_ = 0;
    std::vector<IdealSample> samples_;
    std::optional<IdealSample> pending_;
};

} // namespace touchstick
