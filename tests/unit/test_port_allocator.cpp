// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "port_allocator.h"

#include <catch2/catch_test_macros.hpp>

#include <set>
#include <stdexcept>

using namespace printdeck;

TEST_CASE("PortAllocator: default range", "[port_allocator]") {
    PortAllocator ports;

    REQUIRE(ports.start_port() == 8181);
    REQUIRE(ports.end_port() == 8191);
    REQUIRE(ports.available_count() == 11);
    REQUIRE(ports.allocate() == 8181);
    REQUIRE(ports.allocate() == 8182);
    REQUIRE(ports.allocated_count() == 2);
}

TEST_CASE("PortAllocator: rejects bad ranges", "[port_allocator]") {
    REQUIRE_THROWS_AS(PortAllocator(9000, 8999), std::invalid_argument);
    REQUIRE_THROWS_AS(PortAllocator(0, 10), std::invalid_argument);
    REQUIRE_THROWS_AS(PortAllocator(65000, 70000), std::invalid_argument);
    REQUIRE_NOTHROW(PortAllocator(9000, 9000));
}

TEST_CASE("PortAllocator: never hands out a port twice", "[port_allocator]") {
    PortAllocator ports(9000, 9004);
    std::set<int> seen;

    for (int i = 0; i < 5; ++i) {
        auto port = ports.allocate();
        REQUIRE(port.has_value());
        REQUIRE(seen.insert(*port).second);
    }

    SECTION("exhausted range returns nullopt") {
        REQUIRE_FALSE(ports.allocate().has_value());
        REQUIRE(ports.available_count() == 0);
    }

    SECTION("released port becomes available again") {
        ports.release(9002);
        REQUIRE_FALSE(ports.is_allocated(9002));
        REQUIRE(ports.allocate() == 9002);
        REQUIRE_FALSE(ports.allocate().has_value());
    }
}

TEST_CASE("PortAllocator: scans forward past a just-released port", "[port_allocator]") {
    PortAllocator ports(9000, 9003);

    REQUIRE(ports.allocate() == 9000);
    REQUIRE(ports.allocate() == 9001);
    ports.release(9000);

    REQUIRE(ports.allocate() == 9002);
    REQUIRE(ports.allocate() == 9003);
    // Wraps to the start
    REQUIRE(ports.allocate() == 9000);
}

TEST_CASE("PortAllocator: release of unknown port is a no-op", "[port_allocator]") {
    PortAllocator ports(9000, 9001);
    ports.allocate();

    ports.release(12345);
    ports.release(9001);

    REQUIRE(ports.allocated_count() == 1);
    REQUIRE(ports.is_allocated(9000));
}

TEST_CASE("PortAllocator: reset releases everything", "[port_allocator]") {
    PortAllocator ports(9000, 9002);
    ports.allocate();
    ports.allocate();

    ports.reset();

    REQUIRE(ports.allocated_count() == 0);
    REQUIRE(ports.allocate() == 9000);
}
