// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "widget_manager.h"

#include "skill_cast_widget.h"
#include "walk_joystick_widget.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace touchstick {

const std::vector<GestureWidgetDef>& get_all_gesture_widget_defs() {
    static const std::vector<GestureWidgetDef> defs = {
        {"walk_joystick", "Click to walk",
         [](WidgetId id, WidgetGeometry geometry, WidgetContext& ctx) {
             return std::unique_ptr<GestureWidget>(
                 std::make_unique<WalkJoystickWidget>(id, geometry, ctx));
         }},
        {"skill_cast", "Skill casting",
         [](WidgetId id, WidgetGeometry geometry, WidgetContext& ctx) {
             return std::unique_ptr<GestureWidget>(
                 std::make_unique<SkillCastWidget>(id, geometry, ctx));
         }},
    };
    return defs;
}

const GestureWidgetDef* find_gesture_widget_def(std::string_view type) {
    const auto& defs = get_all_gesture_widget_defs();
    auto it = std::find_if(defs.begin(), defs.end(),
                           [type](const GestureWidgetDef& d) { return type == d.type; });
    return it != defs.end() ? &*it : nullptr;
}

WidgetManager::~WidgetManager() {
    // Widgets lift their fingers on destruction; do it in creation order
    while (!widgets_.empty()) {
        widgets_.erase(widgets_.begin());
    }
}

GestureWidget* WidgetManager::create(const WidgetProfileEntry& entry) {
    const GestureWidgetDef* def = find_gesture_widget_def(entry.type);
    if (!def) {
        spdlog::warn("[WidgetManager] Unknown widget type '{}' (id {})", entry.type, entry.id);
        return nullptr;
    }
    if (find(entry.id)) {
        spdlog::warn("[WidgetManager] Widget id {} already in use", entry.id);
        return nullptr;
    }

    auto widget = def->factory(entry.id, entry.geometry, ctx_);
    if (entry.config.is_object()) {
        size_t restored = widget->config().restore(entry.config);
        spdlog::debug("[WidgetManager] Restored {} values into {} {}", restored, def->type,
                      entry.id);
    }

    GestureWidget* raw = widget.get();
    widgets_.push_back(std::move(widget));
    spdlog::info("[WidgetManager] Created {} widget {} at ({:.0f}, {:.0f})", def->display_name,
                 entry.id, entry.geometry.center.x, entry.geometry.center.y);
    return raw;
}

bool WidgetManager::remove(WidgetId id) {
    auto it = std::find_if(widgets_.begin(), widgets_.end(),
                           [id](const auto& w) { return w->id() == id; });
    if (it == widgets_.end()) {
        return false;
    }
    (*it)->cancel();
    widgets_.erase(it);
    spdlog::debug("[WidgetManager] Removed widget {}", id);
    return true;
}

GestureWidget* WidgetManager::find(WidgetId id) const {
    auto it = std::find_if(widgets_.begin(), widgets_.end(),
                           [id](const auto& w) { return w->id() == id; });
    return it != widgets_.end() ? it->get() : nullptr;
}

size_t WidgetManager::load(const Profile& profile) {
    widgets_.clear();
    size_t created = 0;
    for (const auto& entry : profile.widgets) {
        if (create(entry)) {
            ++created;
        }
    }
    return created;
}

Profile WidgetManager::snapshot() const {
    Profile profile;
    profile.surface = ctx_.surface;
    for (const auto& w : widgets_) {
        WidgetProfileEntry entry;
        entry.id = w->id();
        entry.type = w->type_name();
        entry.geometry = w->geometry();
        entry.config = w->config().values();
        profile.widgets.push_back(std::move(entry));
    }
    return profile;
}

void WidgetManager::cancel_all() {
    for (auto& w : widgets_) {
        w->cancel();
        if (auto* c = w->calibratable()) {
            c->cancel_capture();
        }
        if (auto* t = w->tunable()) {
            t->cancel_tuning();
        }
    }
}

} // namespace touchstick
