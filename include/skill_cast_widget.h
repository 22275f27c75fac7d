// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#pragma once

#include "calibration_controller.h"
#include "calibration_store.h"
#include "config_store.h"
#include "gesture_widget.h"
#include "ideal_calibration.h"
#include "pointer_mapper.h"
#include "skill_event_queue.h"
#include "task_scheduler.h"
#include "touch_event.h"

#include <cstdint>
#include <optional>
#include <string>

namespace touchstick {

enum class SkillState {
    Inactive,
    Moving,   ///< Interpolating from the widget center to the aim point
    Active,   ///< Aiming follows the pointer until the key is released
    Locked,   ///< Manual timing: aiming follows the pointer until the next press
    Canceling ///< Moving to the cancel button before lifting
};

/// When the skill is released after the touch reaches the aim point
enum class CastTiming {
    OnRelease, ///< On key release (default)
    Immediate, ///< As soon as the interpolation completes
    Manual     ///< On the next key press
};

const char* skill_state_name(SkillState state);
const char* cast_timing_name(CastTiming timing);

/// Accepts "on_release", "immediate", "manual"; anything else is nullopt
std::optional<CastTiming> parse_cast_timing(const json& value);

namespace skill_keys {
constexpr const char* CAST_TIMING = "cast_timing";
constexpr const char* SMOOTH_BOUNDARY = "smooth_boundary";
constexpr const char* IDEAL_SKILL = "ideal_calibration_skill";
} // namespace skill_keys

/**
 * @brief Skill-cast widget: press to aim, release to cast
 *
 * A press puts a finger down on the widget center and slides it to the
 * mapped aim point in 6 steps of 20 ms. What happens next depends on the
 * cast timing. A cancel-casting signal slides the finger to the cancel
 * button and lifts it.
 *
 * Input is queued and consumed by a drain task on the scheduler, so
 * handlers never block on the interpolation. Each interpolation run carries
 * a generation number; a superseded run's pending step is a no-op.
 */
class SkillCastWidget : public GestureWidget {
  public:
    static constexpr uint32_t STEP_INTERVAL_MS = 20;
    static constexpr int MOVE_STEPS = 6;
    static constexpr double DEFAULT_CAST_RADIUS = 200.0;

    static CalibrationLimits default_limits();

    SkillCastWidget(WidgetId id, WidgetGeometry geometry, WidgetContext& ctx);
    ~SkillCastWidget() override;

    const char* type_name() const override {
        return "skill_cast";
    }

    void press(Vec2 pointer) override;
    void release(Vec2 pointer) override;
    void motion(Vec2 pointer);
    /// Abort by sliding to the cancel button, then lifting
    void cancel_cast(Vec2 cancel_target);

    /// Immediate abort: lift where the finger is, drop queued input
    void cancel() override;

    bool is_active() const override {
        return state_ != SkillState::Inactive;
    }

    ConfigStore& config() override {
        return config_;
    }
    Calibratable* calibratable() override {
        return &calibration_;
    }
    Tunable* tunable() override {
        return &calibration_;
    }
    DiagonalEditable* diagonal_editable() override {
        return &calibration_;
    }

    CastTiming cast_timing() const;
    void set_cast_timing(CastTiming timing);

    SkillState state() const {
        return state_;
    }
    Vec2 current_position() const {
        return current_;
    }
    size_t queued_events() const {
        return queue_.size();
    }

    const PointerMapper& mapper() const {
        return mapper_;
    }

    // ── Ideal calibration ────────────────────────────────────────────

    /// Cancels click capture and gain tuning, then starts sampling
    void start_ideal_calibration(const std::string& skill, int samples);
    /// @param save_partial Build and store a map from the confirmed samples so far
    void stop_ideal_calibration(bool save_partial);
    void confirm_ideal_sample(SampleDecision decision);
    /// @return true if a stored map was removed
    bool reset_ideal_calibration(const std::string& skill);

    const IdealCalibrationSession& ideal_session() const {
        return session_;
    }
    std::optional<IdealTarget> ideal_target() const;

    /// Skill whose stored map corrects the mapping
    std::string ideal_skill() const;

  private:
    void enqueue(SkillEventType type, Vec2 position);
    void drain();
    void dispatch(const SkillEvent& event);

    void handle_press(Vec2 pointer);
    void handle_release();
    void handle_motion(Vec2 pointer);
    void handle_cancel(Vec2 cancel_target);

    Vec2 compute_target(Vec2 pointer) const;
    double boundary_radius_at(double angle) const;
    Vec2 adjust_offset(Vec2 offset) const;

    void start_run(Vec2 target, bool canceling);
    void run_step(uint64_t generation);
    void on_run_complete(bool canceling);
    void start_cancel_move();

    void finish(bool capture_sample);
    void reset();
    void capture_ideal_sample();
    void finalize_ideal_calibration();
    void emit(TouchAction action);
    void refresh_overlay();

    ConfigStore config_;
    CalibrationStore store_;
    PointerMapper mapper_;
    CalibrationController calibration_;
    IdealCalibrationSession session_;

    SkillState state_ = SkillState::Inactive;
    Vec2 current_;
    Vec2 mouse_;
    bool released_while_moving_ = false;
    std::optional<Vec2> cancel_target_;

    struct Run {
        Vec2 start;
        Vec2 target;
        int step = 0;
        bool canceling = false;
    };
    Run run_;
    uint64_t run_generation_ = 0;

    SkillEventQueue queue_;
    ScopedTimer drain_timer_;
    ScopedTimer step_timer_;

    // Stored map for ideal_skill(), reloaded after any config change
    mutable std::optional<IdealCalibrationMap> ideal_map_;
    mutable bool ideal_map_loaded_ = false;

    ConfigStore::CallbackId smooth_cb_ = 0;
    ConfigStore::CallbackId ideal_cb_ = 0;
    Subscription motion_sub_;
    Subscription cancel_sub_;
};

} // namespace touchstick
