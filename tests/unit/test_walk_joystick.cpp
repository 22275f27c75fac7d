// SPDX-License-Identifier: GPL-3.0-or-later

#include "walk_joystick_widget.h"

#include "../gesture_test_harness.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace touchstick;
using Catch::Approx;

namespace {

constexpr WidgetId kWalkId = 1;
const WidgetGeometry kGeometry{{320.0, 800.0}, 120.0};
const Vec2 kSurfaceCenter{960.0, 540.0};

/// Pointer 300 px right of the surface center
const Vec2 kRightPointer{1260.0, 540.0};

uint64_t hold_ms(double distance) {
    return static_cast<uint64_t>(
        hold_duration_seconds(distance, GestureTestHarness::surface()) * 1000.0);
}

} // namespace

// ============================================================================
// Hold duration
// ============================================================================

TEST_CASE("WalkJoystick: hold duration is clamped to [0.5, 5] seconds", "[walk]") {
    SurfaceSize surface{1920, 1080};
    REQUIRE(hold_duration_seconds(0.0, surface) == Approx(0.5));
    REQUIRE(hold_duration_seconds(10.0, surface) == Approx(0.5));
    REQUIRE(hold_duration_seconds(surface.diagonal() / 2.0, surface) == Approx(5.0));
    REQUIRE(hold_duration_seconds(1e6, surface) == Approx(5.0));
    REQUIRE(hold_duration_seconds(100.0, SurfaceSize{0, 0}) == Approx(0.5));
}

TEST_CASE("WalkJoystick: hold duration grows with distance", "[walk]") {
    SurfaceSize surface{1920, 1080};
    double previous = 0.0;
    for (int d = 0; d <= 1500; d += 10) {
        double s = hold_duration_seconds(d, surface);
        REQUIRE(s >= previous);
        previous = s;
    }
    double half = surface.diagonal() / 2.0;
    REQUIRE(hold_duration_seconds(half * 0.5, surface) == Approx(2.5));
}

// ============================================================================
// Click to walk
// ============================================================================

TEST_CASE("WalkJoystick: click presses at the widget center and glides out", "[walk]") {
    GestureTestHarness h;
    WalkJoystickWidget walk(kWalkId, kGeometry, h.ctx);

    walk.press(kRightPointer);
    REQUIRE(walk.state() == WalkState::Moving);
    REQUIRE(h.sink.events.size() == 1);
    REQUIRE(h.sink.last().action == TouchAction::Down);
    REQUIRE(h.sink.last().x == 320);
    REQUIRE(h.sink.last().y == 800);
    REQUIRE(h.pointer_ids.allocated_id(kWalkId) == 1);

    // No anchors: any direction is full deflection
    REQUIRE(walk.target_position().x == Approx(440.0));
    REQUIRE(walk.target_position().y == Approx(800.0));

    h.scheduler.advance(20);
    REQUIRE(h.sink.last().action == TouchAction::Move);
    REQUIRE(h.sink.last().x == 340);

    h.scheduler.advance(100);
    REQUIRE(h.sink.count(TouchAction::Move) == WalkJoystickWidget::MOVE_STEPS);
    REQUIRE(h.sink.last().x == 440);

    h.scheduler.advance(20);
    REQUIRE(walk.state() == WalkState::Holding);
}

TEST_CASE("WalkJoystick: short click auto-releases after the hold time", "[walk]") {
    GestureTestHarness h;
    WalkJoystickWidget walk(kWalkId, kGeometry, h.ctx);

    walk.press(kRightPointer);
    h.scheduler.advance(50);
    walk.release(kRightPointer);
    REQUIRE(walk.state() == WalkState::Moving);

    h.scheduler.advance(90);
    REQUIRE(walk.state() == WalkState::Holding);
    REQUIRE(walk.hold_timer_active());

    uint64_t hold = hold_ms(300.0);
    h.scheduler.advance(hold - 1);
    REQUIRE(walk.is_active());

    h.scheduler.advance(1);
    REQUIRE_FALSE(walk.is_active());
    REQUIRE(h.sink.last().action == TouchAction::Up);
    REQUIRE(h.sink.count(TouchAction::Down) == 1);
    REQUIRE(h.sink.count(TouchAction::Up) == 1);
    REQUIRE_FALSE(h.pointer_ids.allocated_id(kWalkId));
}

TEST_CASE("WalkJoystick: release while holding starts the hold timer", "[walk]") {
    GestureTestHarness h;
    WalkJoystickWidget walk(kWalkId, kGeometry, h.ctx);

    walk.press(kRightPointer);
    h.scheduler.advance(200);
    REQUIRE(walk.state() == WalkState::Holding);
    REQUIRE_FALSE(walk.hold_timer_active());

    walk.release(kRightPointer);
    REQUIRE(walk.hold_timer_active());
    h.scheduler.advance(hold_ms(300.0));
    REQUIRE_FALSE(walk.is_active());
}

TEST_CASE("WalkJoystick: long press follows the pointer until release", "[walk]") {
    GestureTestHarness h;
    WalkJoystickWidget walk(kWalkId, kGeometry, h.ctx);

    walk.press(kRightPointer);
    h.scheduler.advance(400);
    REQUIRE(walk.state() == WalkState::Holding);

    // Pointer moves straight below the calibrated center
    h.bus.publish(MouseMotionEvent{{960.0, 900.0}});
    REQUIRE(h.sink.last().action == TouchAction::Move);
    REQUIRE(h.sink.last().x == 320);
    REQUIRE(h.sink.last().y == 920);

    walk.release({960.0, 900.0});
    REQUIRE_FALSE(walk.is_active());
    REQUIRE(h.sink.last().action == TouchAction::Up);
    REQUIRE(h.sink.last().y == 920);
}

TEST_CASE("WalkJoystick: short hold keeps the locked direction", "[walk]") {
    GestureTestHarness h;
    WalkJoystickWidget walk(kWalkId, kGeometry, h.ctx);

    walk.press(kRightPointer);
    h.scheduler.advance(160);
    REQUIRE(walk.state() == WalkState::Holding);

    walk.motion({960.0, 900.0});
    REQUIRE(walk.target_position().x == Approx(440.0));
    REQUIRE(h.sink.last().x == 440);
}

TEST_CASE("WalkJoystick: a new click while holding redirects without a new DOWN", "[walk]") {
    GestureTestHarness h;
    WalkJoystickWidget walk(kWalkId, kGeometry, h.ctx);

    walk.press(kRightPointer);
    walk.release(kRightPointer);
    h.scheduler.advance(200);
    REQUIRE(walk.hold_timer_active());

    walk.press({660.0, 540.0});
    REQUIRE_FALSE(walk.hold_timer_active());
    REQUIRE(h.sink.last().action == TouchAction::Move);
    REQUIRE(h.sink.last().x == 200);
    REQUIRE(h.sink.count(TouchAction::Down) == 1);

    walk.release({660.0, 540.0});
    REQUIRE(walk.hold_timer_active());
    h.scheduler.advance(hold_ms(300.0));
    REQUIRE_FALSE(walk.is_active());
    REQUIRE(h.sink.count(TouchAction::Up) == 1);
}

TEST_CASE("WalkJoystick: a new click while moving retargets the glide", "[walk]") {
    GestureTestHarness h;
    WalkJoystickWidget walk(kWalkId, kGeometry, h.ctx);

    walk.press(kRightPointer);
    h.scheduler.advance(40);
    walk.press({960.0, 200.0});
    REQUIRE(walk.target_position().y == Approx(680.0));

    h.scheduler.advance(100);
    REQUIRE(h.sink.count(TouchAction::Down) == 1);
    REQUIRE(walk.current_position().x == Approx(320.0));
    REQUIRE(walk.current_position().y == Approx(680.0));
    REQUIRE(walk.state() == WalkState::Holding);
}

TEST_CASE("WalkJoystick: cancel lifts the finger and frees the pointer id", "[walk]") {
    GestureTestHarness h;
    WalkJoystickWidget walk(kWalkId, kGeometry, h.ctx);

    walk.press(kRightPointer);
    h.scheduler.advance(40);
    walk.cancel();

    REQUIRE_FALSE(walk.is_active());
    REQUIRE(h.sink.last().action == TouchAction::Up);
    REQUIRE(h.pointer_ids.in_use() == 0);

    // Pending steps were cancelled with the gesture
    h.scheduler.advance(1000);
    REQUIRE(h.sink.events.size() == 4);

    walk.cancel();
    REQUIRE(h.sink.events.size() == 4);
}

TEST_CASE("WalkJoystick: no free pointer id ignores the click", "[walk]") {
    GestureTestHarness h(1);
    REQUIRE(h.pointer_ids.allocate(99));
    WalkJoystickWidget walk(kWalkId, kGeometry, h.ctx);

    walk.press(kRightPointer);
    REQUIRE_FALSE(walk.is_active());
    REQUIRE(h.sink.events.empty());
    h.scheduler.advance(1000);
    REQUIRE(h.sink.events.empty());
}

TEST_CASE("WalkJoystick: repeated clicks keep DOWN and UP paired", "[walk]") {
    GestureTestHarness h;
    WalkJoystickWidget walk(kWalkId, kGeometry, h.ctx);

    for (int i = 0; i < 5; ++i) {
        walk.press(kRightPointer);
        h.scheduler.advance(30);
        walk.release(kRightPointer);
        h.scheduler.run_until_idle();
        REQUIRE_FALSE(walk.is_active());
    }
    REQUIRE(h.sink.count(TouchAction::Down) == 5);
    REQUIRE(h.sink.count(TouchAction::Up) == 5);
    REQUIRE(h.pointer_ids.total_allocations() == h.pointer_ids.total_releases());
}

TEST_CASE("WalkJoystick: destruction mid-gesture releases the pointer", "[walk]") {
    GestureTestHarness h;
    {
        WalkJoystickWidget walk(kWalkId, kGeometry, h.ctx);
        walk.press(kRightPointer);
        h.scheduler.advance(40);
    }
    REQUIRE(h.pointer_ids.in_use() == 0);
    REQUIRE(h.sink.last().action == TouchAction::Up);
    REQUIRE(h.bus.subscriber_count(EventKind::MouseMotion) == 0);
}

TEST_CASE("WalkJoystick: calibrated anchors limit the deflection", "[walk]") {
    GestureTestHarness h;
    WalkJoystickWidget walk(kWalkId, kGeometry, h.ctx);
    REQUIRE(walk.calibratable()->apply_anchors(400, 400, 400, 400));
    REQUIRE(walk.calibratable()->apply_deadzone(0));

    walk.press({1160.0, 540.0});
    REQUIRE(walk.target_position().x == Approx(380.0));
}
