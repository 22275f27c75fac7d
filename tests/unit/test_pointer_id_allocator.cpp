// SPDX-License-Identifier: GPL-3.0-or-later

#include "pointer_id_allocator.h"

#include <catch2/catch_test_macros.hpp>

using namespace touchstick;

TEST_CASE("PointerIdAllocator: hands out the lowest free id", "[pointer_ids]") {
    PointerIdAllocator ids(10, 1);
    REQUIRE(ids.allocate(100) == 1);
    REQUIRE(ids.allocate(200) == 2);
    REQUIRE(ids.allocate(300) == 3);

    REQUIRE(ids.release(200));
    REQUIRE(ids.allocate(400) == 2);
    REQUIRE(ids.in_use() == 3);
}

TEST_CASE("PointerIdAllocator: one id per owner", "[pointer_ids]") {
    PointerIdAllocator ids;
    auto first = ids.allocate(5);
    auto again = ids.allocate(5);
    REQUIRE(first == again);
    REQUIRE(ids.in_use() == 1);
    REQUIRE(ids.total_allocations() == 1);
}

TEST_CASE("PointerIdAllocator: exhaustion returns nothing", "[pointer_ids]") {
    PointerIdAllocator ids(2, 0);
    REQUIRE(ids.allocate(1) == 0);
    REQUIRE(ids.allocate(2) == 1);
    REQUIRE_FALSE(ids.allocate(3));
    REQUIRE_FALSE(ids.allocated_id(3));

    ids.release(1);
    REQUIRE(ids.allocate(3) == 0);
}

TEST_CASE("PointerIdAllocator: release is idempotent", "[pointer_ids]") {
    PointerIdAllocator ids;
    ids.allocate(1);
    REQUIRE(ids.release(1));
    REQUIRE_FALSE(ids.release(1));
    REQUIRE_FALSE(ids.release(42));
    REQUIRE(ids.total_releases() == 1);
    REQUIRE(ids.in_use() == 0);
}
