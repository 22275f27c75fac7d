// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#pragma once

#include "config_store.h"
#include "event_bus.h"
#include "geometry_types.h"

#include <cstdint>
#include <iosfwd>

namespace touchstick {

class PointerIdAllocator;

/// Motion action codes, numbered like the remote touch protocol
enum class TouchAction { Down = 0, Up = 1, Move = 2 };

const char* touch_action_name(TouchAction action);

constexpr uint32_t BUTTON_PRIMARY = 1;

/// One injected touch event
struct TouchEvent {
    TouchAction action = TouchAction::Down;
    int pointer_id = 0;
    int x = 0;
    int y = 0;
    int surface_width = 0;
    int surface_height = 0;
    float pressure = 1.0f;
    uint32_t buttons = BUTTON_PRIMARY;
    uint32_t action_button = BUTTON_PRIMARY;
};

void to_json(json& j, const TouchEvent& e);

/// External transport that delivers touch events to the remote device
class TouchSink {
  public:
    virtual ~TouchSink() = default;
    virtual void send(const TouchEvent& event) = 0;
};

/// Writes one compact JSON object per line
class JsonLinesTouchSink : public TouchSink {
  public:
    explicit JsonLinesTouchSink(std::ostream& out) : out_(out) {}
    void send(const TouchEvent& event) override;

  private:
    std::ostream& out_;
};

/**
 * @brief Formats gesture positions into touch events
 *
 * Looks up the owner's pointer id on every emit; an owner without an id
 * emits nothing. UP carries pressure 0 and no buttons. Coordinates are
 * truncated toward zero.
 */
class TouchEmitter {
  public:
    TouchEmitter(TouchSink& sink, const PointerIdAllocator& ids, SurfaceSize surface)
        : sink_(sink), ids_(ids), surface_(surface) {}

    /// @return false if the owner holds no pointer id
    bool emit(WidgetId owner, TouchAction action, Vec2 position);

    void set_surface(SurfaceSize surface) {
        surface_ = surface;
    }
    SurfaceSize surface() const {
        return surface_;
    }

    uint64_t emitted_count() const {
        return emitted_;
    }

  private:
    TouchSink& sink_;
    const PointerIdAllocator& ids_;
    SurfaceSize surface_;
    uint64_t emitted_ = 0;
};

} // namespace touchstick
