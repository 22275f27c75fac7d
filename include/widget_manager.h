// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "gesture_widget.h"
#include "profile_config.h"

#include <functional>
#include <memory>
#include <string_view>
#include <vector>

namespace touchstick {

using GestureWidgetFactory =
    std::function<std::unique_ptr<GestureWidget>(WidgetId, WidgetGeometry, WidgetContext&)>;

struct GestureWidgetDef {
    const char* type;         // Stable string for profile JSON
    const char* display_name; // For logs and listings
    GestureWidgetFactory factory;
};

const std::vector<GestureWidgetDef>& get_all_gesture_widget_defs();
const GestureWidgetDef* find_gesture_widget_def(std::string_view type);

/**
 * @brief Owns the live widgets of one profile
 *
 * Creates widgets through the type registry and restores their stored
 * values with ChangeOrigin::Restore, so loading never triggers overlay
 * refreshes or other user-change side effects.
 */
class WidgetManager {
  public:
    explicit WidgetManager(WidgetContext& ctx) : ctx_(ctx) {}
    ~WidgetManager();

    WidgetManager(const WidgetManager&) = delete;
    WidgetManager& operator=(const WidgetManager&) = delete;

    /// @return nullptr for an unknown type or an id already in use
    GestureWidget* create(const WidgetProfileEntry& entry);

    /// Cancels any gesture in flight, then destroys the widget
    bool remove(WidgetId id);

    GestureWidget* find(WidgetId id) const;

    /// Replace all widgets with the profile's; returns the number created
    size_t load(const Profile& profile);

    /// Current layout and stored values
    Profile snapshot() const;

    /// Abort every gesture (switch to edit mode)
    void cancel_all();

    const std::vector<std::unique_ptr<GestureWidget>>& widgets() const {
        return widgets_;
    }

  private:
    WidgetContext& ctx_;
    std::vector<std::unique_ptr<GestureWidget>> widgets_;
};

} // namespace touchstick
