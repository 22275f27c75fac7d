// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#include "touch_event.h"

#include "pointer_id_allocator.h"

#include <spdlog/spdlog.h>

#include <ostream>

namespace touchstick {

const char* touch_action_name(TouchAction action) {
    switch (action) {
    case TouchAction::Down:
        return "DOWN";
    case TouchAction::Up:
        return "UP";
    case TouchAction::Move:
        return "MOVE";
    }
    return "UNKNOWN";
}

void to_json(json& j, const TouchEvent& e) {
    j = json{{"action", touch_action_name(e.action)},
             {"pointer_id", e.pointer_id},
             {"x", e.x},
             {"y", e.y},
             {"surface_width", e.surface_width},
             {"surface_height", e.surface_height},
             {"pressure", e.pressure},
             {"buttons", e.buttons},
             {"action_button", e.action_button}};
}

void JsonLinesTouchSink::send(const TouchEvent& event) {
    out_ << json(event).dump() << '\n';
    out_.flush();
}

bool TouchEmitter::emit(WidgetId owner, TouchAction action, Vec2 position) {
    auto pointer_id = ids_.allocated_id(owner);
    if (!pointer_id) {
        spdlog::debug("[TouchEmitter] Widget {} has no pointer id, dropping {}", owner,
                      touch_action_name(action));
        return false;
    }

    TouchEvent event;
    event.action = action;
    event.pointer_id = *pointer_id;
    event.x = static_cast<int>(position.x);
    event.y = static_cast<int>(position.y);
    event.surface_width = surface_.width;
    event.surface_height = surface_.height;
    bool up = action == TouchAction::Up;
    event.pressure = up ? 0.0f : 1.0f;
    event.buttons = up ? 0u : BUTTON_PRIMARY;
    event.action_button = BUTTON_PRIMARY;

    spdlog::trace("[TouchEmitter] {} id={} ({}, {})", touch_action_name(action), event.pointer_id,
                  event.x, event.y);
    sink_.send(event);
    ++emitted_;
    return true;
}

} // namespace touchstick
