// SPDX-License-Identifier: GPL-3.0-or-later

#include "perspective_ellipse.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace touchstick;
using Catch::Approx;

namespace {

PerspectiveEllipseModel tilted_model() {
    // Circle drawn squashed vertically and shifted right
    return PerspectiveEllipseModel::from_cardinals({500, 500}, {510, 420}, {510, 560},
                                                   {400, 500}, {620, 500});
}

} // namespace

TEST_CASE("PerspectiveEllipse: cardinals give radii and bias", "[perspective]") {
    auto m = tilted_model();
    REQUIRE(m.radius_x == Approx(110.0));
    REQUIRE(m.radius_y == Approx(70.0));
    REQUIRE(m.dx_bias == Approx(10.0));
    REQUIRE(m.dy_bias == Approx(-10.0));
    REQUIRE(m.corrected_center().x == Approx(510.0));
    REQUIRE(m.corrected_center().y == Approx(490.0));
    REQUIRE(m.is_valid());

    PerspectiveEllipseModel flat;
    flat.radius_y = 0.0;
    REQUIRE_FALSE(flat.is_valid());
}

TEST_CASE("PerspectiveEllipse: edge of the ellipse is distance 1", "[perspective]") {
    auto m = tilted_model();
    auto east = m.point_to_angle_distance({620.0, 490.0});
    REQUIRE(east.distance == Approx(1.0));
    REQUIRE(east.angle == Approx(0.0).margin(1e-9));

    auto south = m.point_to_angle_distance({510.0, 560.0});
    REQUIRE(south.distance == Approx(1.0));
    REQUIRE(south.angle == Approx(PI / 2.0));
}

TEST_CASE("PerspectiveEllipse: deadzone and clamp", "[perspective]") {
    auto m = tilted_model();
    m.deadzone = 0.2;
    REQUIRE(m.point_to_angle_distance({520.0, 490.0}).distance == 0.0);
    REQUIRE(m.point_to_angle_distance({2000.0, 490.0}).distance == Approx(1.0));
}

TEST_CASE("PerspectiveEllipse: point and polar round trip for every curve", "[perspective]") {
    for (auto curve : {DistanceCurve::Linear, DistanceCurve::Gamma, DistanceCurve::Smoothstep}) {
        auto m = tilted_model();
        m.curve = curve;
        m.gamma = 1.8;
        m.angle_bias_deg = 7.0;

        for (double deg = 0.0; deg < 360.0; deg += 30.0) {
            for (double d : {0.25, 0.5, 0.9}) {
                Vec2 p = m.angle_distance_to_point(deg_to_rad(deg), d);
                auto back = m.point_to_angle_distance(p);
                REQUIRE(back.distance == Approx(d).margin(1e-6));
                Vec2 again = m.angle_distance_to_point(back.angle, back.distance);
                REQUIRE(again.x == Approx(p.x).margin(1e-6));
                REQUIRE(again.y == Approx(p.y).margin(1e-6));
            }
        }
    }
}

TEST_CASE("PerspectiveEllipse: curve helpers", "[perspective]") {
    PerspectiveEllipseModel m;
    m.curve = DistanceCurve::Smoothstep;
    REQUIRE(m.apply_curve(0.5) == Approx(0.5));
    REQUIRE(m.apply_curve(1.0) == Approx(1.0));
    REQUIRE(m.inverse_curve(m.apply_curve(0.3)) == Approx(0.3));

    m.curve = DistanceCurve::Gamma;
    m.gamma = 2.0;
    REQUIRE(m.apply_curve(0.5) == Approx(0.25));
    REQUIRE(m.inverse_curve(0.25) == Approx(0.5));

    REQUIRE(parse_distance_curve("smoothstep") == DistanceCurve::Smoothstep);
    REQUIRE(parse_distance_curve("cubic") == DistanceCurve::Linear);
    REQUIRE(std::string(distance_curve_name(DistanceCurve::Gamma)) == "gamma");
}

TEST_CASE("TiltSummary: symmetric circle passes the quality checks", "[perspective]") {
    auto s = compute_tilt_summary({960, 540}, 100, 102, 99, 101);
    REQUIRE(s.ok());
    REQUIRE(s.radius_x == Approx(100.0));
    REQUIRE(s.radius_y == Approx(101.0));
    REQUIRE(s.dx_bias == Approx(1.0));
    REQUIRE(s.dy_bias == Approx(1.0));
    REQUIRE(*s.scale_ratio == Approx(1.01));
    REQUIRE(s.north.y == Approx(440.0));

    auto text = format_tilt_summary(s);
    REQUIRE(text.find("r_x: 100.00") != std::string::npos);
    REQUIRE(text.find("- OK") != std::string::npos);
}

TEST_CASE("TiltSummary: tilt and tiny radii are reported", "[perspective]") {
    auto tilted = compute_tilt_summary({960, 540}, 80, 120, 100, 100);
    REQUIRE_FALSE(tilted.ok());
    REQUIRE(tilted.warnings.size() == 1);
    REQUIRE(tilted.corrected_center.y == Approx(560.0));

    auto tiny = compute_tilt_summary({960, 540}, 2, 2, 0, 0);
    REQUIRE_FALSE(tiny.scale_ratio);
    REQUIRE(tiny.warnings.size() == 1);
    REQUIRE(format_tilt_summary(tiny).find("scale ratio: inf") != std::string::npos);
}
