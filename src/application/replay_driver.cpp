// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "replay_driver.h"

#include "command_dispatcher.h"
#include "task_scheduler.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <vector>

namespace touchstick {

std::optional<ReplayStats> ReplayDriver::run(const json& script, uint64_t settle_ms) {
    const json* events = &script;
    if (script.is_object()) {
        auto it = script.find("events");
        if (it == script.end()) {
            spdlog::warn("[Replay] Script object has no 'events' array");
            return std::nullopt;
        }
        events = &*it;
    }
    if (!events->is_array()) {
        spdlog::warn("[Replay] Script events are not an array");
        return std::nullopt;
    }

    struct Timed {
        uint64_t t;
        const json* command;
    };
    std::vector<Timed> timeline;
    timeline.reserve(events->size());
    for (const auto& entry : *events) {
        if (!entry.is_object()) {
            spdlog::warn("[Replay] Script entry is not an object");
            return std::nullopt;
        }
        uint64_t t = 0;
        auto it = entry.find("t");
        if (it != entry.end()) {
            if (!it->is_number() || it->get<double>() < 0.0) {
                spdlog::warn("[Replay] Bad timestamp in {}", entry.dump());
                return std::nullopt;
            }
            t = static_cast<uint64_t>(it->get<double>());
        }
        timeline.push_back({t, &entry});
    }
    std::stable_sort(timeline.begin(), timeline.end(),
                     [](const Timed& a, const Timed& b) { return a.t < b.t; });

    const uint64_t start = scheduler_.now_ms();
    ReplayStats stats;
    for (const auto& item : timeline) {
        uint64_t due = start + item.t;
        if (due > scheduler_.now_ms()) {
            scheduler_.advance(due - scheduler_.now_ms());
        }
        ++stats.commands;
        if (!dispatcher_.dispatch(*item.command)) {
            ++stats.rejected;
        }
        // Let queue drains scheduled with zero delay run before the next command
        scheduler_.advance(0);
    }

    scheduler_.run_until_idle(settle_ms);
    stats.end_ms = scheduler_.now_ms() - start;
    spdlog::info("[Replay] {} commands ({} rejected) over {} ms", stats.commands, stats.rejected,
                 stats.end_ms);
    return stats;
}

std::optional<json> load_replay_script(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        spdlog::warn("[Replay] No script at {}", path);
        return std::nullopt;
    }
    try {
        std::ifstream ifs(path);
        if (!ifs.is_open()) {
            spdlog::warn("[Replay] Failed to open {}", path);
            return std::nullopt;
        }
        return json::parse(ifs);
    } catch (const json::exception& e) {
        spdlog::warn("[Replay] Error parsing {}: {}", path, e.what());
        return std::nullopt;
    }
}

} // namespace touchstick
