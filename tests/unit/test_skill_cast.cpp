// SPDX-License-Identifier: GPL-3.0-or-later

#include "skill_cast_widget.h"

#include "../gesture_test_harness.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace touchstick;
using Catch::Approx;

namespace {

constexpr WidgetId kSkillId = 2;
const WidgetGeometry kGeometry{{1600.0, 820.0}, 75.0};

/// 200 px right of the surface center: full deflection on the default 200 px circle
const Vec2 kFullRight{1160.0, 540.0};
/// 110 px right: ratio 0.55, half deflection after the 0.1 deadzone
const Vec2 kHalfRight{1070.0, 540.0};
const Vec2 kCancelButton{1800.0, 600.0};

/// Press and let the drain task pick it up
void press_now(GestureTestHarness& h, SkillCastWidget& skill, Vec2 pointer) {
    skill.press(pointer);
    h.scheduler.advance(0);
}

} // namespace

TEST_CASE("SkillCast: cast timing parsing", "[skill]") {
    REQUIRE(parse_cast_timing("manual") == CastTiming::Manual);
    REQUIRE(parse_cast_timing("immediate") == CastTiming::Immediate);
    REQUIRE(parse_cast_timing("on_release") == CastTiming::OnRelease);
    REQUIRE_FALSE(parse_cast_timing("later"));
    REQUIRE_FALSE(parse_cast_timing(3));

    GestureTestHarness h;
    SkillCastWidget skill(kSkillId, kGeometry, h.ctx);
    REQUIRE(skill.cast_timing() == CastTiming::OnRelease);
    skill.config().set(skill_keys::CAST_TIMING, "bogus");
    REQUIRE(skill.cast_timing() == CastTiming::OnRelease);
}

TEST_CASE("SkillCast: input is queued until the drain task runs", "[skill]") {
    GestureTestHarness h;
    SkillCastWidget skill(kSkillId, kGeometry, h.ctx);

    skill.press(kFullRight);
    REQUIRE(skill.queued_events() == 1);
    REQUIRE(h.sink.events.empty());

    h.scheduler.advance(0);
    REQUIRE(skill.queued_events() == 0);
    REQUIRE(skill.state() == SkillState::Moving);
    REQUIRE(h.sink.count(TouchAction::Down) == 1);
}

TEST_CASE("SkillCast: immediate cast is DOWN, six MOVEs and UP", "[skill]") {
    GestureTestHarness h;
    SkillCastWidget skill(kSkillId, kGeometry, h.ctx);
    skill.set_cast_timing(CastTiming::Immediate);

    press_now(h, skill, kFullRight);
    REQUIRE(h.sink.events.size() == 2);
    REQUIRE(h.sink.events[0].action == TouchAction::Down);
    REQUIRE(h.sink.events[0].x == 1600);
    REQUIRE(h.sink.events[0].y == 820);

    h.scheduler.advance(100);
    REQUIRE(h.sink.count(TouchAction::Move) == 6);
    REQUIRE(skill.state() == SkillState::Moving);
    REQUIRE(h.sink.last().x == 1675);

    h.scheduler.advance(20);
    REQUIRE(h.sink.events.size() == 8);
    REQUIRE(h.sink.last().action == TouchAction::Up);
    REQUIRE(h.sink.last().x == 1675);
    REQUIRE_FALSE(skill.is_active());
    REQUIRE(h.pointer_ids.in_use() == 0);
}

TEST_CASE("SkillCast: interpolation is linear from the widget center", "[skill]") {
    GestureTestHarness h;
    SkillCastWidget skill(kSkillId, kGeometry, h.ctx);

    press_now(h, skill, kFullRight);
    h.scheduler.advance(100);
    REQUIRE(h.sink.count(TouchAction::Move) == 6);
    for (int i = 1; i <= 6; ++i) {
        REQUIRE(h.sink.events[static_cast<size_t>(i)].x == Approx(1600.0 + 12.5 * i).margin(1.0));
    }
}

TEST_CASE("SkillCast: on-release cast follows the pointer until release", "[skill]") {
    GestureTestHarness h;
    SkillCastWidget skill(kSkillId, kGeometry, h.ctx);

    press_now(h, skill, kHalfRight);
    h.scheduler.advance(120);
    REQUIRE(skill.state() == SkillState::Active);
    REQUIRE(skill.current_position().x == Approx(1637.5));

    h.bus.publish(MouseMotionEvent{kFullRight});
    h.scheduler.advance(0);
    REQUIRE(h.sink.last().action == TouchAction::Move);
    REQUIRE(h.sink.last().x == 1675);

    skill.release(kFullRight);
    h.scheduler.advance(0);
    REQUIRE(h.sink.last().action == TouchAction::Up);
    REQUIRE_FALSE(skill.is_active());
}

TEST_CASE("SkillCast: release during the move casts when the move completes", "[skill]") {
    GestureTestHarness h;
    SkillCastWidget skill(kSkillId, kGeometry, h.ctx);

    press_now(h, skill, kFullRight);
    h.scheduler.advance(30);
    skill.release(kFullRight);
    h.scheduler.advance(0);
    REQUIRE(skill.state() == SkillState::Moving);

    h.scheduler.advance(90);
    REQUIRE_FALSE(skill.is_active());
    REQUIRE(h.sink.count(TouchAction::Move) == 6);
    REQUIRE(h.sink.last().action == TouchAction::Up);
}

TEST_CASE("SkillCast: manual cast locks until the next press", "[skill]") {
    GestureTestHarness h;
    SkillCastWidget skill(kSkillId, kGeometry, h.ctx);
    skill.set_cast_timing(CastTiming::Manual);

    press_now(h, skill, kFullRight);
    h.scheduler.advance(120);
    REQUIRE(skill.state() == SkillState::Locked);

    skill.release(kFullRight);
    h.scheduler.advance(0);
    REQUIRE(skill.state() == SkillState::Locked);

    skill.motion(kHalfRight);
    h.scheduler.advance(0);
    REQUIRE(h.sink.last().x == 1637);

    press_now(h, skill, kHalfRight);
    REQUIRE_FALSE(skill.is_active());
    REQUIRE(h.sink.last().action == TouchAction::Up);
    REQUIRE(h.sink.count(TouchAction::Down) == 1);
}

TEST_CASE("SkillCast: presses during a cast are ignored", "[skill]") {
    GestureTestHarness h;
    SkillCastWidget skill(kSkillId, kGeometry, h.ctx);

    press_now(h, skill, kFullRight);
    press_now(h, skill, kHalfRight);
    h.scheduler.advance(200);
    REQUIRE(skill.state() == SkillState::Active);
    press_now(h, skill, kHalfRight);
    REQUIRE(skill.state() == SkillState::Active);
    REQUIRE(h.sink.count(TouchAction::Down) == 1);
}

// ============================================================================
// Cancel casting
// ============================================================================

TEST_CASE("SkillCast: cancel while moving finishes the move, then slides to cancel",
          "[skill]") {
    GestureTestHarness h;
    SkillCastWidget skill(kSkillId, kGeometry, h.ctx);

    press_now(h, skill, kFullRight);
    h.scheduler.advance(40);
    h.bus.publish(CancelCastingEvent{kCancelButton});
    h.scheduler.advance(0);
    REQUIRE(skill.state() == SkillState::Moving);

    h.scheduler.advance(80);
    REQUIRE(skill.state() == SkillState::Canceling);

    h.scheduler.run_until_idle();
    REQUIRE_FALSE(skill.is_active());
    REQUIRE(h.sink.count(TouchAction::Move) == 12);
    REQUIRE(h.sink.count(TouchAction::Up) == 1);
    REQUIRE(h.sink.last().x == 1800);
    REQUIRE(h.sink.last().y == 600);
}

TEST_CASE("SkillCast: cancel while active slides to cancel immediately", "[skill]") {
    GestureTestHarness h;
    SkillCastWidget skill(kSkillId, kGeometry, h.ctx);

    press_now(h, skill, kFullRight);
    h.scheduler.advance(120);
    REQUIRE(skill.state() == SkillState::Active);

    skill.cancel_cast(kCancelButton);
    h.scheduler.advance(0);
    REQUIRE(skill.state() == SkillState::Canceling);

    SECTION("release and motion do not interrupt the cancel") {
        skill.release(kFullRight);
        skill.motion(kHalfRight);
        h.scheduler.advance(0);
        REQUIRE(skill.state() == SkillState::Canceling);
    }

    h.scheduler.run_until_idle();
    REQUIRE_FALSE(skill.is_active());
    REQUIRE(h.sink.last().action == TouchAction::Up);
    REQUIRE(h.sink.last().x == 1800);
}

TEST_CASE("SkillCast: a second cancel retargets without lifting", "[skill]") {
    GestureTestHarness h;
    SkillCastWidget skill(kSkillId, kGeometry, h.ctx);

    press_now(h, skill, kFullRight);
    h.scheduler.advance(120);
    skill.cancel_cast(kCancelButton);
    h.scheduler.advance(40);
    skill.cancel_cast({1700.0, 400.0});
    h.scheduler.advance(0);
    REQUIRE(h.sink.count(TouchAction::Up) == 0);

    h.scheduler.run_until_idle();
    REQUIRE(h.sink.count(TouchAction::Up) == 1);
    REQUIRE(h.sink.last().x == 1700);
    REQUIRE(h.sink.last().y == 400);
}

TEST_CASE("SkillCast: cancel with no cast in flight does nothing", "[skill]") {
    GestureTestHarness h;
    SkillCastWidget skill(kSkillId, kGeometry, h.ctx);

    h.bus.publish(CancelCastingEvent{kCancelButton});
    h.scheduler.run_until_idle();
    REQUIRE(h.sink.events.empty());
    REQUIRE(skill.state() == SkillState::Inactive);
}

TEST_CASE("SkillCast: hard cancel lifts in place and drops queued input", "[skill]") {
    GestureTestHarness h;
    SkillCastWidget skill(kSkillId, kGeometry, h.ctx);

    press_now(h, skill, kFullRight);
    h.scheduler.advance(40);
    skill.release(kFullRight);
    skill.cancel();

    REQUIRE_FALSE(skill.is_active());
    REQUIRE(skill.queued_events() == 0);
    REQUIRE(h.sink.last().action == TouchAction::Up);
    REQUIRE(h.pointer_ids.in_use() == 0);

    size_t before = h.sink.events.size();
    h.scheduler.run_until_idle();
    REQUIRE(h.sink.events.size() == before);
}

TEST_CASE("SkillCast: no free pointer id ignores the press", "[skill]") {
    GestureTestHarness h(1);
    REQUIRE(h.pointer_ids.allocate(99));
    SkillCastWidget skill(kSkillId, kGeometry, h.ctx);

    press_now(h, skill, kFullRight);
    h.scheduler.run_until_idle();
    REQUIRE_FALSE(skill.is_active());
    REQUIRE(h.sink.events.empty());
}

TEST_CASE("SkillCast: two widgets hold distinct pointer ids", "[skill]") {
    GestureTestHarness h;
    SkillCastWidget a(2, kGeometry, h.ctx);
    SkillCastWidget b(3, {{1400.0, 900.0}, 75.0}, h.ctx);

    a.press(kFullRight);
    b.press(kFullRight);
    h.scheduler.advance(0);
    REQUIRE(h.pointer_ids.allocated_id(2) == 1);
    REQUIRE(h.pointer_ids.allocated_id(3) == 2);

    a.release(kFullRight);
    b.release(kFullRight);
    h.scheduler.run_until_idle();
    REQUIRE(h.sink.count(TouchAction::Up) == 2);
    REQUIRE(h.pointer_ids.in_use() == 0);
}

TEST_CASE("SkillCast: smooth boundary option switches the fallback shape", "[skill]") {
    GestureTestHarness h;
    SkillCastWidget skill(kSkillId, kGeometry, h.ctx);
    skill.config().set(calibration_keys::ANCHOR_UP, 100);
    REQUIRE(skill.mapper().boundary().kind() == BoundaryKind::GainCircle);

    skill.config().set(skill_keys::SMOOTH_BOUNDARY, true);
    REQUIRE(skill.mapper().boundary().kind() == BoundaryKind::Superellipse);

    skill.config().set(skill_keys::SMOOTH_BOUNDARY, "0");
    REQUIRE(skill.mapper().boundary().kind() == BoundaryKind::GainCircle);
}

// ============================================================================
// Ideal calibration
// ============================================================================

TEST_CASE("SkillCast: ideal calibration samples each target in turn", "[skill][ideal]") {
    GestureTestHarness h;
    SkillCastWidget skill(kSkillId, kGeometry, h.ctx);
    skill.set_cast_timing(CastTiming::Immediate);

    skill.start_ideal_calibration("E", 16);
    REQUIRE(skill.ideal_session().active());
    REQUIRE(skill.ideal_skill() == "E");

    auto target = skill.ideal_target();
    REQUIRE(target);
    REQUIRE(target->angle == Approx(0.0));
    REQUIRE(target->radius == Approx(200.0 * IDEAL_TARGET_RATIO));

    // Cast slightly past the target
    press_now(h, skill, {960.0 + 209.0, 540.0});
    h.scheduler.run_until_idle();
    REQUIRE(skill.ideal_session().awaiting_confirmation());

    SECTION("redo discards the sample") {
        skill.confirm_ideal_sample(SampleDecision::Redo);
        REQUIRE_FALSE(skill.ideal_session().awaiting_confirmation());
        REQUIRE(skill.ideal_session().index() == 0);
    }

    SECTION("yes advances and a partial stop saves a map") {
        skill.confirm_ideal_sample(SampleDecision::Yes);
        REQUIRE(skill.ideal_session().index() == 1);
        REQUIRE(skill.ideal_target()->angle == Approx(22.5));

        skill.stop_ideal_calibration(true);
        REQUIRE_FALSE(skill.ideal_session().active());
        auto map = load_ideal_map(skill.config(), "E");
        REQUIRE(map);
        REQUIRE(map->bins() == 1);
        REQUIRE(map->radius_scales()[0] == Approx(209.0 / 190.0));

        REQUIRE(skill.reset_ideal_calibration("E"));
        REQUIRE_FALSE(load_ideal_map(skill.config(), "E"));
    }
}

TEST_CASE("SkillCast: cancelled casts are not sampled", "[skill][ideal]") {
    GestureTestHarness h;
    SkillCastWidget skill(kSkillId, kGeometry, h.ctx);
    skill.start_ideal_calibration("Q", 16);

    press_now(h, skill, kFullRight);
    h.scheduler.advance(120);
    skill.cancel();
    REQUIRE_FALSE(skill.ideal_session().awaiting_confirmation());
}

TEST_CASE("SkillCast: a stored map corrects the aim", "[skill][ideal]") {
    GestureTestHarness h;
    SkillCastWidget skill(kSkillId, kGeometry, h.ctx);
    skill.config().set(calibration_keys::DEADZONE, 0);

    // Every direction is rotated by +90 degrees and halved
    json entry = {{"bins", 2},
                  {"angles", {0.0, 180.0}},
                  {"angle_offsets", {90.0, 90.0}},
                  {"radius_scales", {0.5, 0.5}}};
    skill.config().set(IDEAL_CALIBRATION_KEY, json{{"Q", entry}});

    press_now(h, skill, kFullRight);
    h.scheduler.advance(120);
    REQUIRE(skill.current_position().x == Approx(1600.0).margin(1e-6));
    REQUIRE(skill.current_position().y == Approx(820.0 + 37.5));

    SECTION("sampling disables the correction") {
        skill.cancel();
        skill.start_ideal_calibration("Q", 16);
        press_now(h, skill, kFullRight);
        h.scheduler.advance(120);
        REQUIRE(skill.current_position().x == Approx(1675.0));
    }

    SECTION("clearing the stored map drops the correction") {
        skill.cancel();
        REQUIRE(skill.reset_ideal_calibration("Q"));
        press_now(h, skill, kFullRight);
        h.scheduler.advance(120);
        REQUIRE(skill.current_position().x == Approx(1675.0));
        REQUIRE(skill.current_position().y == Approx(820.0).margin(1e-6));
    }

    SECTION("a replaced map takes effect on the next press") {
        skill.cancel();
        json flipped = {{"bins", 2},
                        {"angles", {0.0, 180.0}},
                        {"angle_offsets", {180.0, 180.0}},
                        {"radius_scales", {1.0, 1.0}}};
        skill.config().set(IDEAL_CALIBRATION_KEY, json{{"Q", flipped}});
        press_now(h, skill, kFullRight);
        h.scheduler.advance(120);
        REQUIRE(skill.current_position().x == Approx(1525.0));
        REQUIRE(skill.current_position().y == Approx(820.0).margin(1e-6));
    }
}
