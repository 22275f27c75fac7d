// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "config_store.h"
#include "event_bus.h"
#include "gesture_widget.h"
#include "geometry_types.h"

#include <optional>
#include <string>
#include <vector>

namespace touchstick {

/// One placed widget and its stored calibration / settings values
struct WidgetProfileEntry {
    WidgetId id = 0;
    std::string type;
    WidgetGeometry geometry;
    /// Flat key/value object restored into the widget's ConfigStore
    json config = json::object();
};

/**
 * @brief Layout of the remote surface and its widgets
 *
 * @code{.json}
 * {
 *   "surface": {"width": 1920, "height": 1080},
 *   "widgets": [
 *     {"id": 1, "type": "skill_cast", "x": 1600, "y": 820, "radius": 75,
 *      "config": {"cast_timing": "immediate"}}
 *   ]
 * }
 * @endcode
 */
struct Profile {
    SurfaceSize surface{1920, 1080};
    std::vector<WidgetProfileEntry> widgets;
};

/**
 * @brief Read a profile document
 *
 * Malformed widget entries (missing id or type, non-numeric position,
 * duplicate id) are skipped with a debug log.
 *
 * @return nullopt if the root is not an object or the surface is invalid
 */
std::optional<Profile> parse_profile(const json& j);

json profile_to_json(const Profile& profile);

/// @return nullopt (and a warning) if the file can't be read or parsed
std::optional<Profile> load_profile(const std::string& path);

/// @return false (and a warning) if the file can't be written
bool save_profile(const std::string& path, const Profile& profile);

} // namespace touchstick
