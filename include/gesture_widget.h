// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2025-2026 356C LLC

#pragma once

#include "config_store.h"
#include "event_bus.h"
#include "gesture_capabilities.h"
#include "geometry_types.h"

#include <string>

namespace touchstick {

class TaskScheduler;
class PointerIdAllocator;
class TouchEmitter;

/// Process-wide collaborators every gesture widget talks to
struct WidgetContext {
    TaskScheduler& scheduler;
    EventBus& bus;
    PointerIdAllocator& pointer_ids;
    TouchEmitter& emitter;
    SurfaceSize surface;
};

/// On-screen placement of the virtual control on the remote surface
struct WidgetGeometry {
    Vec2 center;
    /// Output circle radius (half the widget width)
    double radius = 75.0;
};

/**
 * @brief Base for interactive widgets that turn pointer input into touches
 *
 * One gesture in flight per widget. Capabilities are discovered through the
 * accessors below (nullptr when unsupported) rather than by probing.
 */
class GestureWidget {
  public:
    GestureWidget(WidgetId id, WidgetGeometry geometry, WidgetContext& ctx)
        : id_(id), geometry_(geometry), ctx_(ctx) {}
    virtual ~GestureWidget() = default;

    GestureWidget(const GestureWidget&) = delete;
    GestureWidget& operator=(const GestureWidget&) = delete;

    WidgetId id() const {
        return id_;
    }
    const WidgetGeometry& geometry() const {
        return geometry_;
    }
    void set_geometry(const WidgetGeometry& geometry) {
        geometry_ = geometry;
    }

    /// Profile type name ("walk_joystick", "skill_cast")
    virtual const char* type_name() const = 0;

    /// Bound key or button pressed; pointer is the current pointer position
    virtual void press(Vec2 pointer) = 0;
    virtual void release(Vec2 pointer) = 0;

    /// Abort any gesture: emit the final UP and release the pointer id
    virtual void cancel() = 0;

    /// @return true while a gesture holds a pointer id
    virtual bool is_active() const = 0;

    virtual ConfigStore& config() = 0;

    virtual Calibratable* calibratable() {
        return nullptr;
    }
    virtual Tunable* tunable() {
        return nullptr;
    }
    virtual DiagonalEditable* diagonal_editable() {
        return nullptr;
    }

  protected:
    WidgetContext& context() {
        return ctx_;
    }

  private:
    WidgetId id_;
    WidgetGeometry geometry_;
    WidgetContext& ctx_;
};

} // namespace touchstick
