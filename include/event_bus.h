// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#pragma once

#include "geometry_types.h"

#include <functional>
#include <map>
#include <utility>
#include <vector>

namespace touchstick {

using WidgetId = int;

enum class EventKind {
    MouseMotion,   ///< Pointer moved (absolute surface coordinates)
    CancelCasting, ///< External "cancel the current skill cast" signal
    MaskClicked,   ///< Click on the capture mask while calibrating
    Overlay        ///< Calibration overlay notification for the renderer
};

struct MouseMotionEvent {
    static constexpr EventKind kind = EventKind::MouseMotion;
    Vec2 position;
};

/// Cancel the cast by moving the touch to target (the cancel button) before lifting
struct CancelCastingEvent {
    static constexpr EventKind kind = EventKind::CancelCasting;
    Vec2 target;
};

struct MaskClickedEvent {
    static constexpr EventKind kind = EventKind::MaskClicked;
    Vec2 position;
};

enum class OverlayAction { Register, Unregister, Start, Stop, Refresh, TuneStart, TuneStop };

const char* overlay_action_name(OverlayAction action);

struct OverlayEvent {
    static constexpr EventKind kind = EventKind::Overlay;
    OverlayAction action;
    WidgetId widget;
};

class EventBus;

/**
 * @brief RAII subscription handle
 *
 * Unsubscribes on destruction. Must not outlive the bus it came from.
 */
class Subscription {
  public:
    Subscription() = default;
    Subscription(EventBus* bus, int id) : bus_(bus), id_(id) {}
    ~Subscription() {
        reset();
    }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&& other) noexcept
        : bus_(std::exchange(other.bus_, nullptr)), id_(std::exchange(other.id_, 0)) {}
    Subscription& operator=(Subscription&& other) noexcept {
        if (this != &other) {
            reset();
            bus_ = std::exchange(other.bus_, nullptr);
            id_ = std::exchange(other.id_, 0);
        }
        return *this;
    }

    void reset();

    bool active() const {
        return bus_ != nullptr;
    }

  private:
    EventBus* bus_ = nullptr;
    int id_ = 0;
};

/**
 * @brief Typed publish/subscribe channel keyed by event kind
 *
 * Delivery is synchronous and in subscription order. Handlers may subscribe
 * or unsubscribe while an event is being delivered; changes take effect for
 * the next publish.
 *
 * @code
 * Subscription sub = bus.subscribe<MouseMotionEvent>(
 *     [this](const MouseMotionEvent& e) { on_motion(e.position); });
 * bus.publish(MouseMotionEvent{{120.0, 80.0}});
 * @endcode
 */
class EventBus {
  public:
    template <typename E>
    [[nodiscard]] Subscription subscribe(std::function<void(const E&)> handler) {
        int id = next_id_++;
        handlers_[E::kind].push_back(
            {id, [handler = std::move(handler)](const void* e) {
                 handler(*static_cast<const E*>(e));
             }});
        return Subscription(this, id);
    }

    template <typename E> void publish(const E& event) {
        auto it = handlers_.find(E::kind);
        if (it == handlers_.end()) {
            return;
        }
        // Copy: handlers may (un)subscribe during delivery
        auto handlers = it->second;
        for (const auto& h : handlers) {
            if (is_subscribed(h.id)) {
                h.fn(&event);
            }
        }
    }

    void unsubscribe(int id);

    size_t subscriber_count(EventKind kind) const;

  private:
    bool is_subscribed(int id) const;

    struct Handler {
        int id;
        std::function<void(const void*)> fn;
    };

    std::map<EventKind, std::vector<Handler>> handlers_;
    int next_id_ = 1;
};

} // namespace touchstick
