// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "command_dispatcher.h"

#include "calibration_controller.h"
#include "calibration_store.h"
#include "perspective_ellipse.h"
#include "skill_cast_widget.h"
#include "widget_manager.h"

#include <spdlog/spdlog.h>

#include <array>

namespace touchstick {

namespace {

std::optional<AnchorAxis> read_axis(const json& command) {
    if (!command.contains("axis") || !command["axis"].is_string()) {
        return std::nullopt;
    }
    const auto& name = command["axis"].get_ref<const std::string&>();
    for (AnchorAxis axis : {AnchorAxis::Up, AnchorAxis::Down, AnchorAxis::Left, AnchorAxis::Right}) {
        if (name == anchor_axis_name(axis)) {
            return axis;
        }
    }
    return std::nullopt;
}

std::optional<Quadrant> read_quadrant(const json& command) {
    if (!command.contains("quadrant") || !command["quadrant"].is_string()) {
        return std::nullopt;
    }
    const auto& name = command["quadrant"].get_ref<const std::string&>();
    for (Quadrant q : ALL_QUADRANTS) {
        if (name == quadrant_key(q)) {
            return q;
        }
    }
    return std::nullopt;
}

/// Missing fields read as null, which every sanitizer rejects
json field(const json& command, const char* key) {
    return command.value(key, json());
}

} // namespace

std::optional<Vec2> read_point(const json& command) {
    auto x = parse_number(field(command, "x"));
    auto y = parse_number(field(command, "y"));
    if (!x || !y) {
        return std::nullopt;
    }
    return Vec2{*x, *y};
}

bool CommandDispatcher::dispatch(const json& command) {
    bool ok = false;
    try {
        ok = dispatch_command(command);
    } catch (const json::exception& e) {
        // value() throws on a field of the wrong type
        spdlog::warn("[CommandDispatcher] Bad field in command: {}", e.what());
    }
    if (ok) {
        ++dispatched_;
    } else {
        ++rejected_;
        spdlog::debug("[CommandDispatcher] Rejected command: {}", command.dump());
    }
    return ok;
}

bool CommandDispatcher::dispatch_command(const json& command) {
    if (!command.is_object() || !command.contains("type") || !command["type"].is_string()) {
        return false;
    }
    const std::string type = command["type"].get<std::string>();

    if (type == "motion") {
        auto p = read_point(command);
        if (!p) {
            return false;
        }
        pointer_ = *p;
        bus_.publish(MouseMotionEvent{*p});
        return true;
    }
    if (type == "cancel") {
        auto p = read_point(command);
        if (!p) {
            return false;
        }
        bus_.publish(CancelCastingEvent{*p});
        return true;
    }
    if (type == "mask_click") {
        auto p = read_point(command);
        if (!p) {
            return false;
        }
        bus_.publish(MaskClickedEvent{*p});
        return true;
    }
    if (type == "edit_mode") {
        widgets_.cancel_all();
        return true;
    }
    if (type == "tilt_summary") {
        auto c = read_point(command);
        auto up = parse_number(field(command, "up"));
        auto down = parse_number(field(command, "down"));
        auto left = parse_number(field(command, "left"));
        auto right = parse_number(field(command, "right"));
        if (!c || !up || !down || !left || !right) {
            return false;
        }
        TiltSummary summary = compute_tilt_summary(*c, *up, *down, *left, *right);
        spdlog::info("[CommandDispatcher] Circle tilt summary\n{}", format_tilt_summary(summary));
        return true;
    }

    auto id = parse_integer(field(command, "widget"));
    if (!id) {
        return false;
    }
    GestureWidget* widget = widgets_.find(*id);
    if (!widget) {
        spdlog::debug("[CommandDispatcher] No widget {}", *id);
        return false;
    }
    return dispatch_widget_command(type, *widget, command);
}

bool CommandDispatcher::dispatch_widget_command(const std::string& type, GestureWidget& widget,
                                                const json& command) {
    if (type == "press" || type == "release") {
        if (auto p = read_point(command)) {
            pointer_ = *p;
        }
        if (type == "press") {
            widget.press(pointer_);
        } else {
            widget.release(pointer_);
        }
        return true;
    }
    if (type == "set") {
        if (!command.contains("key") || !command["key"].is_string()) {
            return false;
        }
        widget.config().set(command["key"].get<std::string>(), field(command, "value"));
        return true;
    }
    if (type.rfind("ideal_", 0) == 0) {
        return dispatch_ideal(type, widget, command);
    }
    return dispatch_calibration(type, widget, command);
}

bool CommandDispatcher::dispatch_calibration(const std::string& type, GestureWidget& widget,
                                             const json& command) {
    if (type.rfind("tune_", 0) == 0) {
        Tunable* tunable = widget.tunable();
        if (!tunable) {
            return false;
        }
        if (type == "tune_start") {
            tunable->start_tuning();
        } else if (type == "tune_adjust") {
            auto steps = parse_integer(field(command, "steps"));
            std::string axis = command.value("axis", std::string());
            if (!steps || (axis != "x" && axis != "y")) {
                return false;
            }
            tunable->adjust_tuning(axis == "x" ? GainAxis::X : GainAxis::Y, *steps,
                                   command.value("coarse", false));
        } else if (type == "tune_key") {
            return handle_tuning_key(*tunable, command.value("key", std::string()),
                                     command.value("shift", false));
        } else if (type == "tune_apply") {
            tunable->apply_tuning();
        } else if (type == "tune_cancel") {
            tunable->cancel_tuning();
        } else {
            return false;
        }
        return true;
    }

    if (type.find("diagonal") != std::string::npos) {
        DiagonalEditable* editable = widget.diagonal_editable();
        Calibratable* calibratable = widget.calibratable();
        if (!editable || !calibratable) {
            return false;
        }
        if (type == "calibrate_diagonal") {
            auto q = read_quadrant(command);
            return q && calibratable->begin_diagonal_capture(*q);
        }
        if (type == "drag_diagonal") {
            auto q = read_quadrant(command);
            auto dx = parse_number(field(command, "dx"));
            auto dy = parse_number(field(command, "dy"));
            return q && dx && dy && editable->update_diagonal_offset(*q, *dx, *dy);
        }
        if (type == "apply_diagonals") {
            const json& values = command.value("values", json());
            if (!values.is_array() || values.size() != 8) {
                return false;
            }
            std::array<json, 8> raw;
            for (size_t i = 0; i < raw.size(); ++i) {
                raw[i] = values[i];
            }
            return editable->apply_diagonals(raw);
        }
        if (type == "reset_diagonals") {
            editable->reset_diagonals();
            return true;
        }
        return false;
    }

    Calibratable* calibratable = widget.calibratable();
    if (!calibratable) {
        return false;
    }
    if (type == "calibrate_center") {
        calibratable->begin_center_capture();
        return true;
    }
    if (type == "calibrate_anchor") {
        auto axis = read_axis(command);
        if (!axis) {
            return false;
        }
        calibratable->begin_anchor_capture(*axis);
        return true;
    }
    if (type == "cancel_capture") {
        calibratable->cancel_capture();
        return true;
    }
    if (type == "reset_center") {
        calibratable->reset_center();
        return true;
    }
    if (type == "apply_center") {
        return calibratable->apply_center(field(command, "x"), field(command, "y"));
    }
    if (type == "apply_gains") {
        return calibratable->apply_gains(field(command, "x"), field(command, "y"));
    }
    if (type == "apply_deadzone") {
        return calibratable->apply_deadzone(field(command, "value"));
    }
    if (type == "apply_anchors") {
        return calibratable->apply_anchors(field(command, "up"), field(command, "down"),
                                           field(command, "left"), field(command, "right"));
    }
    if (type == "reset_anchors") {
        calibratable->reset_anchors();
        return true;
    }
    spdlog::debug("[CommandDispatcher] Unknown command type '{}'", type);
    return false;
}

bool CommandDispatcher::dispatch_ideal(const std::string& type, GestureWidget& widget,
                                       const json& command) {
    auto* skill = dynamic_cast<SkillCastWidget*>(&widget);
    if (!skill) {
        return false;
    }
    if (type == "ideal_start") {
        skill->start_ideal_calibration(
            command.value("skill", std::string(IdealCalibrationSession::DEFAULT_SKILL)),
            parse_integer(field(command, "samples")).value_or(IdealCalibrationSession::DEFAULT_SAMPLES));
        return true;
    }
    if (type == "ideal_confirm") {
        std::string decision = command.value("decision", std::string());
        if (decision == "yes") {
            skill->confirm_ideal_sample(SampleDecision::Yes);
        } else if (decision == "no") {
            skill->confirm_ideal_sample(SampleDecision::No);
        } else if (decision == "redo") {
            skill->confirm_ideal_sample(SampleDecision::Redo);
        } else {
            return false;
        }
        return true;
    }
    if (type == "ideal_stop") {
        skill->stop_ideal_calibration(command.value("save_partial", false));
        return true;
    }
    if (type == "ideal_reset") {
        return skill->reset_ideal_calibration(command.value("skill", skill->ideal_skill()));
    }
    return false;
}

} // namespace touchstick
