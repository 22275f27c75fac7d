// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#include "event_bus.h"

#include <algorithm>

namespace touchstick {

const char* overlay_action_name(OverlayAction action) {
    switch (action) {
    case OverlayAction::Register:
        return "register";
    case OverlayAction::Unregister:
        return "unregister";
    case OverlayAction::Start:
        return "start";
    case OverlayAction::Stop:
        return "stop";
    case OverlayAction::Refresh:
        return "refresh";
    case OverlayAction::TuneStart:
        return "tune_start";
    case OverlayAction::TuneStop:
        return "tune_stop";
    }
    return "unknown";
}

void Subscription::reset() {
    if (bus_) {
        bus_->unsubscribe(id_);
        bus_ = nullptr;
        id_ = 0;
    }
}

void EventBus::unsubscribe(int id) {
    for (auto& [kind, list] : handlers_) {
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [id](const Handler& h) { return h.id == id; }),
                   list.end());
    }
}

size_t EventBus::subscriber_count(EventKind kind) const {
    auto it = handlers_.find(kind);
    return it == handlers_.end() ? 0 : it->second.size();
}

bool EventBus::is_subscribed(int id) const {
    for (const auto& [kind, list] : handlers_) {
        for (const auto& h : list) {
            if (h.id == id) {
                return true;
            }
        }
    }
    return false;
}

} // namespace touchstick
