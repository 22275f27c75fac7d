// SPDX-License-Identifier: GPL-3.0-or-later

#include "calibration_store.h"
#include "config_store.h"
#include "pointer_mapper.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <vector>

using namespace touchstick;
using Catch::Approx;

namespace {

const Vec2 kCenter{960.0, 540.0};
const Vec2 kWidget{300.0, 800.0};
constexpr double kRadius = 100.0;

AnchorDistances test_anchors() {
    return {100, 120, 90, 110};
}

BoundaryModel anchor_boundary() {
    PartialAnchors p{100, 120, 90, 110};
    return BoundaryModel::build(p, std::nullopt, BoundaryOptions{});
}

} // namespace

// ============================================================================
// apply_deadzone
// ============================================================================

TEST_CASE("Deadzone: inside the deadzone maps to zero", "[pointer_mapper]") {
    REQUIRE(apply_deadzone(0.05, 0.1) == 0.0);
    REQUIRE(apply_deadzone(0.1, 0.1) == 0.0);
}

TEST_CASE("Deadzone: remaining range is rescaled to [0, 1]", "[pointer_mapper]") {
    REQUIRE(apply_deadzone(0.55, 0.1) == Approx(0.5));
    REQUIRE(apply_deadzone(1.0, 0.1) == Approx(1.0));
    REQUIRE(apply_deadzone(2.0, 0.1) == Approx(1.0));
    REQUIRE(apply_deadzone(0.3, 0.0) == Approx(0.3));
}

TEST_CASE("Deadzone: output never decreases as input grows", "[pointer_mapper]") {
    for (double dz : {0.0, 0.08, 0.1, 0.5, 0.95}) {
        double previous = 0.0;
        for (int i = 0; i <= 200; ++i) {
            double value = apply_deadzone(i / 100.0, dz);
            REQUIRE(value >= previous);
            REQUIRE(value <= 1.0);
            previous = value;
        }
    }
}

// ============================================================================
// map_pointer
// ============================================================================

TEST_CASE("Mapper: pointer on the calibrated center maps to the widget center",
          "[pointer_mapper]") {
    MappingParams params;
    auto boundary = anchor_boundary();
    auto result = map_pointer(kCenter, kCenter, params, boundary, kWidget, kRadius);
    REQUIRE(result.target == kWidget);
    REQUIRE(result.ratio == 0.0);
}

TEST_CASE("Mapper: halfway to an anchor gives half deflection", "[pointer_mapper]") {
    MappingParams params;
    auto boundary = anchor_boundary();

    SECTION("right anchor 110") {
        auto r = map_pointer(kCenter + Vec2{55.0, 0.0}, kCenter, params, boundary, kWidget,
                             kRadius);
        REQUIRE(r.ratio == Approx(0.5));
        REQUIRE(r.target.x == Approx(kWidget.x + 50.0));
        REQUIRE(r.target.y == Approx(kWidget.y).margin(1e-9));
    }

    SECTION("down anchor 120") {
        auto r = map_pointer(kCenter + Vec2{0.0, 60.0}, kCenter, params, boundary, kWidget,
                             kRadius);
        REQUIRE(r.ratio == Approx(0.5));
        REQUIRE(r.target.y == Approx(kWidget.y + 50.0));
    }

    SECTION("up anchor 100") {
        auto r = map_pointer(kCenter + Vec2{0.0, -50.0}, kCenter, params, boundary, kWidget,
                             kRadius);
        REQUIRE(r.ratio == Approx(0.5));
        REQUIRE(r.target.y == Approx(kWidget.y - 50.0));
    }

    SECTION("left anchor 90") {
        auto r = map_pointer(kCenter + Vec2{-45.0, 0.0}, kCenter, params, boundary, kWidget,
                             kRadius);
        REQUIRE(r.ratio == Approx(0.5));
        REQUIRE(r.target.x == Approx(kWidget.x - 50.0));
    }
}

TEST_CASE("Mapper: beyond the boundary saturates at the output radius", "[pointer_mapper]") {
    MappingParams params;
    auto boundary = anchor_boundary();
    auto r = map_pointer(kCenter + Vec2{800.0, 0.0}, kCenter, params, boundary, kWidget, kRadius);
    REQUIRE(r.ratio == Approx(1.0));
    REQUIRE((r.target - kWidget).length() == Approx(kRadius));
}

TEST_CASE("Mapper: saturating boundary gives full deflection for any offset",
          "[pointer_mapper]") {
    BoundaryOptions options;
    options.saturate_without_anchors = true;
    auto boundary = BoundaryModel::build(PartialAnchors{}, std::nullopt, options);
    REQUIRE(boundary.kind() == BoundaryKind::Saturating);

    MappingParams params;
    auto r = map_pointer(kCenter + Vec2{3.0, 4.0}, kCenter, params, boundary, kWidget, kRadius);
    REQUIRE(r.ratio == Approx(1.0));
    REQUIRE(r.target.x == Approx(kWidget.x + 60.0));
    REQUIRE(r.target.y == Approx(kWidget.y + 80.0));
}

TEST_CASE("Mapper: gain scales the offset before the boundary lookup", "[pointer_mapper]") {
    auto boundary = BoundaryModel::build(PartialAnchors{}, std::nullopt, BoundaryOptions{});
    REQUIRE(boundary.kind() == BoundaryKind::GainCircle);

    MappingParams params;
    params.gain = {2.0, 1.0};
    auto r = map_pointer(kCenter + Vec2{50.0, 0.0}, kCenter, params, boundary, kWidget, kRadius);
    REQUIRE(r.distance == Approx(100.0));
    REQUIRE(r.ratio == Approx(0.5));
}

TEST_CASE("Mapper: output direction follows the warped angle", "[pointer_mapper]") {
    AngleWarpBounds bounds = default_warp_bounds();
    bounds[1] = 60.0;

    MappingParams params;
    params.warp = bounds;
    BoundaryOptions options;
    options.saturate_without_anchors = true;
    auto boundary = BoundaryModel::build(PartialAnchors{}, std::nullopt, options);

    Vec2 offset = unit_from_angle(60.0) * 100.0;
    auto r = map_pointer(kCenter + offset, kCenter, params, boundary, kWidget, kRadius);
    REQUIRE(r.theta_real == Approx(60.0));
    REQUIRE(r.theta_ideal == Approx(45.0));
    Vec2 expected = kWidget + unit_from_angle(45.0) * kRadius;
    REQUIRE(r.target.x == Approx(expected.x));
    REQUIRE(r.target.y == Approx(expected.y));
}

TEST_CASE("Mapper: adjuster sees the gain-scaled offset", "[pointer_mapper]") {
    auto boundary = BoundaryModel::build(PartialAnchors{}, std::nullopt, BoundaryOptions{});
    MappingParams params;
    params.gain = {2.0, 2.0};
    Vec2 seen;
    params.adjuster = [&seen](Vec2 v) {
        seen = v;
        return v * 0.5;
    };
    auto r = map_pointer(kCenter + Vec2{0.0, 50.0}, kCenter, params, boundary, kWidget, kRadius);
    REQUIRE(seen.y == Approx(100.0));
    REQUIRE(r.distance == Approx(50.0));
}

TEST_CASE("Mapper: anchor-normalized vector", "[pointer_mapper]") {
    auto v = anchor_normalized_vector({55.0, 0.0}, test_anchors(), 0.0);
    REQUIRE(v.has_value());
    REQUIRE(v->x == Approx(0.5));

    auto clipped = anchor_normalized_vector({0.0, -400.0}, test_anchors(), 0.0);
    REQUIRE(clipped->y == Approx(-1.0));

    auto zero = anchor_normalized_vector({5.0, 0.0}, test_anchors(), 0.1);
    REQUIRE(zero->x == 0.0);

    REQUIRE_FALSE(anchor_normalized_vector({1.0, 1.0}, AnchorDistances{0, 0, 0, 0}, 0.0));
}

TEST_CASE("Mapper: anchor-normalized vector agrees with the anchor ellipse path",
          "[pointer_mapper]") {
    MappingParams params;
    params.deadzone = 0.1;

    SECTION("deflection length matches for any anchors") {
        auto boundary = anchor_boundary();
        for (int deg = 0; deg < 360; ++deg) {
            for (double d : {30.0, 80.0, 400.0}) {
                Vec2 offset = unit_from_angle(deg) * d;
                auto v = anchor_normalized_vector(offset, test_anchors(), params.deadzone);
                REQUIRE(v.has_value());
                auto r = map_pointer(kCenter + offset, kCenter, params, boundary, {0.0, 0.0}, 1.0);
                REQUIRE(v->length() == Approx(r.ratio).margin(1e-9));
            }
        }
    }

    SECTION("vectors are identical for symmetric anchors") {
        AnchorDistances round{100, 100, 100, 100};
        PartialAnchors partial{100, 100, 100, 100};
        auto boundary = BoundaryModel::build(partial, std::nullopt, BoundaryOptions{});
        REQUIRE(boundary.kind() == BoundaryKind::AnchorEllipse);
        for (int deg = 0; deg < 360; ++deg) {
            for (double d : {5.0, 55.0, 250.0}) {
                Vec2 offset = unit_from_angle(deg) * d;
                auto v = anchor_normalized_vector(offset, round, params.deadzone);
                REQUIRE(v.has_value());
                auto r = map_pointer(kCenter + offset, kCenter, params, boundary, {0.0, 0.0}, 1.0);
                REQUIRE(v->x == Approx(r.target.x).margin(1e-9));
                REQUIRE(v->y == Approx(r.target.y).margin(1e-9));
            }
        }
    }
}

TEST_CASE("Mapper: a pointer on or past the boundary saturates in every direction",
          "[pointer_mapper]") {
    PartialAnchors partial{100, 120, 90, 110};
    BoundaryOptions smooth;
    smooth.smooth_fallback = true;

    std::vector<BoundaryModel> boundaries{
        BoundaryModel::build(partial, default_diagonal_offsets(test_anchors(), 0.7),
                             BoundaryOptions{}),
        BoundaryModel::build(partial, std::nullopt, smooth),
        anchor_boundary(),
    };
    REQUIRE(boundaries[0].kind() == BoundaryKind::Spline);
    REQUIRE(boundaries[1].kind() == BoundaryKind::Superellipse);
    REQUIRE(boundaries[2].kind() == BoundaryKind::AnchorEllipse);

    MappingParams params;
    for (const auto& boundary : boundaries) {
        for (int deg = 0; deg < 360; ++deg) {
            auto edge = boundary.distance_at_angle(deg);
            REQUIRE(edge.has_value());
            REQUIRE(*edge > 0.0);
            for (double scale : {1.0, 1.5, 10.0}) {
                Vec2 pointer = kCenter + unit_from_angle(deg) * (*edge * scale);
                auto r = map_pointer(pointer, kCenter, params, boundary, kWidget, kRadius);
                REQUIRE(r.ratio == Approx(1.0));
                REQUIRE((r.target - kWidget).length() == Approx(kRadius));
            }
        }
    }
}

// ============================================================================
// PointerMapper
// ============================================================================

TEST_CASE("PointerMapper: boundary follows calibration changes", "[pointer_mapper]") {
    ConfigStore config;
    CalibrationLimits limits;
    limits.has_diagonals = false;
    CalibrationStore store(config, {1920, 1080}, limits);
    PointerMapper mapper(store, BoundaryOptions{});

    REQUIRE(mapper.boundary().kind() == BoundaryKind::GainCircle);

    REQUIRE(store.store_anchor_distances(test_anchors()));
    REQUIRE(mapper.boundary().kind() == BoundaryKind::AnchorEllipse);

    auto r = mapper.map(store.effective_center() + Vec2{55.0, 0.0}, kWidget, kRadius);
    REQUIRE(r.ratio == Approx(0.5));

    store.reset_anchors();
    REQUIRE(mapper.boundary().kind() == BoundaryKind::GainCircle);
}

TEST_CASE("PointerMapper: diagonals produce a spline boundary", "[pointer_mapper]") {
    ConfigStore config;
    CalibrationStore store(config, {1920, 1080}, CalibrationLimits{});
    PointerMapper mapper(store, BoundaryOptions{});

    REQUIRE(store.store_anchor_distances(test_anchors()));
    REQUIRE(mapper.boundary().kind() == BoundaryKind::Spline);
}

TEST_CASE("PointerMapper: params reflect the store", "[pointer_mapper]") {
    ConfigStore config;
    CalibrationStore store(config, {1920, 1080}, CalibrationLimits{});
    PointerMapper mapper(store, BoundaryOptions{});

    store.set_gains({1.5, 0.75});
    store.set_deadzone(0.2);
    store.set_warp_enabled(true);

    auto params = mapper.params();
    REQUIRE(params.gain.x == Approx(1.5));
    REQUIRE(params.gain.y == Approx(0.75));
    REQUIRE(params.deadzone == Approx(0.2));
    REQUIRE(params.warp.has_value());
}

TEST_CASE("PointerMapper: uses the calibrated center", "[pointer_mapper]") {
    ConfigStore config;
    CalibrationStore store(config, {1920, 1080}, CalibrationLimits{});
    PointerMapper mapper(store, BoundaryOptions{});

    REQUIRE(store.set_calibrated_center(1000.0, 500.0));
    auto r = mapper.map({1000.0, 500.0}, kWidget, kRadius);
    REQUIRE(r.target == kWidget);
}
