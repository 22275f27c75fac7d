// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file replay_driver.h
 * @brief Deterministic playback of a timestamped command script
 *
 * Script format: either a bare array or {"events": [...]}; every entry is a
 * command (see command_dispatcher.h) with an extra "t" field holding its
 * time in milliseconds from the start of the script. Entries are applied in
 * time order (ties keep file order) on a ManualScheduler, so the touch
 * output of a script is reproducible.
 */

#pragma once

#include "config_store.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace touchstick {

class CommandDispatcher;
class ManualScheduler;

struct ReplayStats {
    size_t commands = 0;
    size_t rejected = 0;
    uint64_t end_ms = 0;
};

class ReplayDriver {
  public:
    /// Time allowed after the last command for hold timers and runs to settle
    static constexpr uint64_t DEFAULT_SETTLE_MS = 6000;

    ReplayDriver(ManualScheduler& scheduler, CommandDispatcher& dispatcher)
        : scheduler_(scheduler), dispatcher_(dispatcher) {}

    /// @return nullopt if the script is not an array of command objects
    std::optional<ReplayStats> run(const json& script, uint64_t settle_ms = DEFAULT_SETTLE_MS);

  private:
    ManualScheduler& scheduler_;
    CommandDispatcher& dispatcher_;
};

/// @return nullopt (and a warning) if the file can't be read or parsed
std::optional<json> load_replay_script(const std::string& path);

} // namespace touchstick
