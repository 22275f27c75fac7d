// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#include "skill_event_queue.h"

#include <spdlog/spdlog.h>

namespace touchstick {

const char* skill_event_type_name(SkillEventType type) {
    switch (type) {
    case SkillEventType::Press:
        return "press";
    case SkillEventType::Release:
        return "release";
    case SkillEventType::Motion:
        return "motion";
    case SkillEventType::Cancel:
        return "cancel";
    }
    return "unknown";
}

bool SkillEventQueue::try_push(const SkillEvent& event) {
    if (events_.size() >= capacity_) {
        ++dropped_;
        spdlog::warn("[SkillEventQueue] Full ({} events), dropping {}", capacity_,
                     skill_event_type_name(event.type));
        return false;
    }
    events_.push_back(event);
    return true;
}

std::optional<SkillEvent> SkillEventQueue::pop() {
    if (events_.empty()) {
        return std::nullopt;
    }
    SkillEvent event = events_.front();
    events_.pop_front();
    return event;
}

} // namespace touchstick
