// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file command_dispatcher.h
 * @brief JSON input commands shared by the replay and live drivers
 *
 * Pointer commands:
 *   {"type": "motion", "x": 100, "y": 200}
 *   {"type": "press", "widget": 1}            (x / y optional, default last motion)
 *   {"type": "release", "widget": 1}
 *   {"type": "cancel", "x": 1800, "y": 200}   (cancel-casting toward the button)
 *   {"type": "mask_click", "x": 960, "y": 540}
 *   {"type": "edit_mode"}                     (abort every gesture)
 *
 * Widget commands carry "widget" and one of: set, calibrate_center,
 * calibrate_anchor, calibrate_diagonal, cancel_capture, reset_center,
 * apply_center, apply_gains, apply_deadzone, apply_anchors, reset_anchors,
 * apply_diagonals, drag_diagonal, reset_diagonals, tune_start, tune_adjust,
 * tune_key, tune_apply, tune_cancel, ideal_start, ideal_confirm, ideal_stop,
 * ideal_reset.
 *
 * Tool commands: {"type": "tilt_summary", "x", "y", "up", "down", "left", "right"}
 */

#pragma once

#include "config_store.h"
#include "event_bus.h"
#include "geometry_types.h"

#include <cstdint>
#include <optional>
#include <string>

namespace touchstick {

class WidgetManager;
class GestureWidget;

class CommandDispatcher {
  public:
    CommandDispatcher(WidgetManager& widgets, EventBus& bus) : widgets_(widgets), bus_(bus) {}

    /// @return false if the command is malformed, targets no widget, or was refused
    bool dispatch(const json& command);

    /// Last known pointer position
    Vec2 pointer() const {
        return pointer_;
    }

    uint64_t dispatched_count() const {
        return dispatched_;
    }
    uint64_t rejected_count() const {
        return rejected_;
    }

  private:
    bool dispatch_command(const json& command);
    bool dispatch_widget_command(const std::string& type, GestureWidget& widget,
                                 const json& command);
    bool dispatch_calibration(const std::string& type, GestureWidget& widget,
                              const json& command);
    bool dispatch_ideal(const std::string& type, GestureWidget& widget, const json& command);

    WidgetManager& widgets_;
    EventBus& bus_;
    Vec2 pointer_;
    uint64_t dispatched_ = 0;
    uint64_t rejected_ = 0;
};

/// Read "x" / "y" (numbers or numeric strings)
std::optional<Vec2> read_point(const json& command);

} // namespace touchstick
