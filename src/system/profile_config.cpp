// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "profile_config.h"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <set>

namespace touchstick {

std::optional<Profile> parse_profile(const json& j) {
    if (!j.is_object()) {
        spdlog::warn("[ProfileConfig] Profile root is not an object");
        return std::nullopt;
    }

    Profile profile;
    if (j.contains("surface")) {
        const json& surface = j["surface"];
        if (!surface.is_object() || !surface.value("width", json()).is_number_integer() ||
            !surface.value("height", json()).is_number_integer()) {
            spdlog::warn("[ProfileConfig] Invalid surface block");
            return std::nullopt;
        }
        profile.surface = {surface["width"].get<int>(), surface["height"].get<int>()};
    }
    if (profile.surface.width <= 0 || profile.surface.height <= 0) {
        spdlog::warn("[ProfileConfig] Surface size {}x{} is not positive", profile.surface.width,
                     profile.surface.height);
        return std::nullopt;
    }

    if (!j.contains("widgets")) {
        return profile;
    }
    if (!j["widgets"].is_array()) {
        spdlog::debug("[ProfileConfig] 'widgets' is not an array, ignoring");
        return profile;
    }

    std::set<WidgetId> seen_ids;
    for (const auto& item : j["widgets"]) {
        if (!item.is_object() || !item.contains("id") || !item.contains("type")) {
            continue;
        }
        if (!item["id"].is_number_integer() || !item["type"].is_string()) {
            spdlog::debug("[ProfileConfig] Skipping malformed widget entry (wrong field types)");
            continue;
        }

        WidgetProfileEntry entry;
        entry.id = item["id"].get<WidgetId>();
        entry.type = item["type"].get<std::string>();

        if (seen_ids.count(entry.id) > 0) {
            spdlog::debug("[ProfileConfig] Skipping duplicate widget ID: {}", entry.id);
            continue;
        }

        const json x = item.value("x", json());
        const json y = item.value("y", json());
        if (!x.is_number() || !y.is_number()) {
            spdlog::debug("[ProfileConfig] Skipping widget {} without a position", entry.id);
            continue;
        }
        entry.geometry.center = {x.get<double>(), y.get<double>()};
        if (item.contains("radius") && item["radius"].is_number() &&
            item["radius"].get<double>() > 0.0) {
            entry.geometry.radius = item["radius"].get<double>();
        }
        if (item.contains("config") && item["config"].is_object()) {
            entry.config = item["config"];
        }

        seen_ids.insert(entry.id);
        profile.widgets.push_back(std::move(entry));
    }
    return profile;
}

json profile_to_json(const Profile& profile) {
    json widgets = json::array();
    for (const auto& entry : profile.widgets) {
        json item = {{"id", entry.id},
                     {"type", entry.type},
                     {"x", entry.geometry.center.x},
                     {"y", entry.geometry.center.y},
                     {"radius", entry.geometry.radius}};
        if (!entry.config.empty()) {
            item["config"] = entry.config;
        }
        widgets.push_back(std::move(item));
    }
    json surface = {{"width", profile.surface.width}, {"height", profile.surface.height}};
    return json{{"surface", surface}, {"widgets", widgets}};
}

std::optional<Profile> load_profile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        spdlog::warn("[ProfileConfig] No profile at {}", path);
        return std::nullopt;
    }

    try {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            spdlog::warn("[ProfileConfig] Failed to open {}", path);
            return std::nullopt;
        }
        auto data = json::parse(ifs);
        auto profile = parse_profile(data);
        if (profile) {
            spdlog::info("[ProfileConfig] Loaded {} widgets from {}", profile->widgets.size(),
                         path);
        }
        return profile;
    } catch (const json::exception& e) {
        spdlog::warn("[ProfileConfig] Error parsing {}: {}", path, e.what());
        return std::nullopt;
    }
}

bool save_profile(const std::string& path, const Profile& profile) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        spdlog::warn("[ProfileConfig] Failed to open {} for writing", path);
        return false;
    }
    ofs << profile_to_json(profile).dump(2) << "\n";
    if (!ofs) {
        spdlog::warn("[ProfileConfig] Failed to write {}", path);
        return false;
    }
    spdlog::info("[ProfileConfig] Saved {} widgets to {}", profile.widgets.size(), path);
    return true;
}

} // namespace touchstick
