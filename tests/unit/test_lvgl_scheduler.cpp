// SPDX-License-Identifier: GPL-3.0-or-later

#include "lvgl_scheduler.h"

#include "../lvgl_test_fixture.h"

#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace touchstick;

TEST_CASE_METHOD(LVGLTestFixture, "LvglScheduler: one-shot timers fire once", "[lvgl_scheduler]") {
    LvglScheduler scheduler;
    int fired = 0;
    TimerId id = scheduler.schedule(50, [&] { ++fired; });
    REQUIRE(scheduler.pending(id));

    process_lvgl(40);
    REQUIRE(fired == 0);

    process_lvgl(20);
    REQUIRE(fired == 1);
    REQUIRE_FALSE(scheduler.pending(id));
    REQUIRE(scheduler.pending_count() == 0);

    process_lvgl(200);
    REQUIRE(fired == 1);
}

TEST_CASE_METHOD(LVGLTestFixture, "LvglScheduler: zero delay fires on the next pass",
                 "[lvgl_scheduler]") {
    LvglScheduler scheduler;
    bool fired = false;
    scheduler.schedule(0, [&] { fired = true; });
    process_lvgl(2);
    REQUIRE(fired);
}

TEST_CASE_METHOD(LVGLTestFixture, "LvglScheduler: cancelled timers never fire",
                 "[lvgl_scheduler]") {
    LvglScheduler scheduler;
    bool fired = false;
    TimerId id = scheduler.schedule(20, [&] { fired = true; });
    REQUIRE(scheduler.cancel(id));
    REQUIRE_FALSE(scheduler.cancel(id));
    process_lvgl(50);
    REQUIRE_FALSE(fired);
}

TEST_CASE_METHOD(LVGLTestFixture, "LvglScheduler: callbacks can schedule the next step",
                 "[lvgl_scheduler]") {
    LvglScheduler scheduler;
    std::vector<uint64_t> times;
    std::function<void()> step = [&] {
        times.push_back(scheduler.now_ms());
        if (times.size() < 3) {
            scheduler.schedule(20, step);
        }
    };
    scheduler.schedule(20, step);

    process_lvgl(100);
    REQUIRE(times.size() == 3);
    REQUIRE(times[1] - times[0] >= 20);
    REQUIRE(times[2] - times[1] >= 20);
}

TEST_CASE_METHOD(LVGLTestFixture, "LvglScheduler: destruction deletes pending timers",
                 "[lvgl_scheduler]") {
    bool fired = false;
    {
        LvglScheduler scheduler;
        scheduler.schedule(10, [&] { fired = true; });
    }
    process_lvgl(30);
    REQUIRE_FALSE(fired);
}

TEST_CASE_METHOD(LVGLTestFixture, "LvglScheduler: now_ms follows the LVGL tick",
                 "[lvgl_scheduler]") {
    LvglScheduler scheduler;
    uint64_t before = scheduler.now_ms();
    process_lvgl(15);
    REQUIRE(scheduler.now_ms() - before == 15);
}
