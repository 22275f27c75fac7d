// SPDX-License-Identifier: GPL-3.0-or-later

#include "angle_warp.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <limits>

using namespace touchstick;
using Catch::Approx;

TEST_CASE("AngleWarp: default bounds are the identity", "[angle_warp]") {
    auto bounds = default_warp_bounds();
    REQUIRE(bounds[0] == 0.0);
    REQUIRE(bounds[7] == 315.0);
    REQUIRE(is_valid_warp_bounds(bounds));

    for (double a : {0.0, 12.5, 45.0, 170.0, 359.0}) {
        auto r = warp_angle(a, bounds);
        REQUIRE(r.angle == Approx(a));
        REQUIRE(r.sector.has_value());
    }
}

TEST_CASE("AngleWarp: moved diagonal remaps both neighbouring sectors", "[angle_warp]") {
    auto bounds = default_warp_bounds();
    bounds[1] = 60.0;

    auto low = warp_angle(30.0, bounds);
    REQUIRE(low.sector == 0);
    REQUIRE(*low.t == Approx(0.5));
    REQUIRE(low.angle == Approx(22.5));

    REQUIRE(warp_angle(60.0, bounds).angle == Approx(45.0));

    auto high = warp_angle(75.0, bounds);
    REQUIRE(high.sector == 1);
    REQUIRE(high.angle == Approx(67.5));
}

TEST_CASE("AngleWarp: last sector wraps through 360", "[angle_warp]") {
    auto bounds = default_warp_bounds();
    bounds[7] = 300.0;

    auto r = warp_angle(330.0, bounds);
    REQUIRE(r.sector == 7);
    REQUIRE(r.angle == Approx(337.5));

    REQUIRE(warp_angle(-30.0, bounds).angle == Approx(337.5));
}

TEST_CASE("AngleWarp: normalization clamps diagonals inside their sector", "[angle_warp]") {
    auto bounds = default_warp_bounds();
    bounds[1] = 0.0;
    bounds[3] = 500.0;
    bounds[5] = std::numeric_limits<double>::quiet_NaN();
    bounds[2] = 7.0; // axes are fixed

    auto n = normalize_warp_bounds(bounds);
    REQUIRE(n[1] == Approx(WARP_EPSILON_DEG));
    REQUIRE(n[3] == Approx(180.0 - WARP_EPSILON_DEG));
    REQUIRE(n[5] == Approx(225.0));
    REQUIRE(n[2] == Approx(90.0));
    REQUIRE_FALSE(is_valid_warp_bounds(bounds));
}

TEST_CASE("AngleWarp: normalization is idempotent", "[angle_warp]") {
    auto bounds = default_warp_bounds();
    bounds[1] = 80.0;
    bounds[3] = 100.0;
    bounds[7] = 350.0;

    auto once = normalize_warp_bounds(bounds);
    auto twice = normalize_warp_bounds(once);
    REQUIRE(once == twice);
    REQUIRE(is_valid_warp_bounds(once));
}

TEST_CASE("AngleWarp: warping is continuous at sector edges", "[angle_warp]") {
    auto bounds = default_warp_bounds();
    bounds[1] = 30.0;
    bounds[3] = 150.0;
    bounds[5] = 200.0;
    bounds[7] = 340.0;

    double previous = warp_angle(0.0, bounds).angle;
    for (int i = 1; i < 3600; ++i) {
        double a = warp_angle(i / 10.0, bounds).angle;
        REQUIRE(a >= previous);
        previous = a;
    }
}

TEST_CASE("AngleWarp: wrong bound count leaves the angle unchanged", "[angle_warp]") {
    std::vector<double> short_bounds = {0.0, 45.0, 90.0};
    auto r = warp_angle(400.0, short_bounds);
    REQUIRE(r.angle == Approx(40.0));
    REQUIRE_FALSE(r.sector.has_value());
}
