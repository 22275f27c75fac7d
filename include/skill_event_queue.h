// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#pragma once

#include "geometry_types.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>

namespace touchstick {

enum class SkillEventType { Press, Release, Motion, Cancel };

const char* skill_event_type_name(SkillEventType type);

/// Pointer position for press / release / motion, cancel button position for Cancel
struct SkillEvent {
    SkillEventType type;
    Vec2 position;
};

/**
 * @brief Bounded single-consumer FIFO between input handlers and the cast task
 *
 * Producers never block: when full, the new event is dropped and counted.
 */
class SkillEventQueue {
  public:
    static constexpr size_t DEFAULT_CAPACITY = 64;

    explicit SkillEventQueue(size_t capacity = DEFAULT_CAPACITY) : capacity_(capacity) {}

    /// @return false if the queue is full and the event was dropped
    bool try_push(const SkillEvent& event);

    std::optional<SkillEvent> pop();

    void clear() {
        events_.clear();
    }

    size_t size() const {
        return events_.size();
    }
    bool empty() const {
        return events_.empty();
    }
    size_t capacity() const {
        return capacity_;
    }
    uint64_t dropped_count() const {
        return dropped_;
    }

  private:
    size_t capacity_;
    std::deque<SkillEvent> events_;
    uint64_t dropped_ = 0;
};

} // namespace touchstick
