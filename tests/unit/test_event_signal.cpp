// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "event_signal.h"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <vector>

using namespace printdeck;

TEST_CASE("Signal: slots run in subscription order", "[event_signal]") {
    Signal<std::string, int> signal;
    std::vector<std::string> calls;

    signal.connect([&](const std::string& s, int n) { calls.push_back("a:" + s + std::to_string(n)); });
    signal.connect([&](const std::string& s, int n) { calls.push_back("b:" + s + std::to_string(n)); });

    signal.emit("x", 1);

    REQUIRE(calls == std::vector<std::string>{"a:x1", "b:x1"});
    REQUIRE(signal.slot_count() == 2);
}

TEST_CASE("Signal: disconnect by id", "[event_signal]") {
    Signal<> signal;
    int count = 0;
    SubscriptionId id = signal.connect([&]() { count++; });

    REQUIRE(id != INVALID_SUBSCRIPTION_ID);
    REQUIRE(signal.disconnect(id));
    REQUIRE_FALSE(signal.disconnect(id));

    signal.emit();
    REQUIRE(count == 0);
}

TEST_CASE("Signal: slot disconnected during emit is not called", "[event_signal]") {
    Signal<> signal;
    SubscriptionId second = INVALID_SUBSCRIPTION_ID;
    bool second_called = false;

    signal.connect([&]() { signal.disconnect(second); });
    second = signal.connect([&]() { second_called = true; });

    signal.emit();
    REQUIRE_FALSE(second_called);
}

TEST_CASE("Signal: slot may disconnect itself", "[event_signal]") {
    Signal<int> signal;
    SubscriptionId self = INVALID_SUBSCRIPTION_ID;
    int seen = 0;

    self = signal.connect([&](int v) {
        seen = v;
        signal.disconnect(self);
    });

    signal.emit(7);
    signal.emit(8);
    REQUIRE(seen == 7);
    REQUIRE(signal.slot_count() == 0);
}

TEST_CASE("Signal: slot connected during emit waits for the next emit", "[event_signal]") {
    Signal<> signal;
    int late = 0;

    signal.connect([&]() {
        if (signal.slot_count() == 1) {
            signal.connect([&]() { late++; });
        }
    });

    signal.emit();
    REQUIRE(late == 0);
    signal.emit();
    REQUIRE(late == 1);
}

TEST_CASE("SignalConnection: disconnects on destruction", "[event_signal]") {
    Signal<> signal;
    int count = 0;

    {
        SignalConnection conn = signal.connect_scoped([&]() { count++; });
        REQUIRE(conn);
        signal.emit();
    }
    signal.emit();

    REQUIRE(count == 1);
    REQUIRE(signal.slot_count() == 0);
}

TEST_CASE("SignalConnection: move transfers ownership", "[event_signal]") {
    Signal<> signal;
    SignalConnection outer;

    {
        SignalConnection inner = signal.connect_scoped([]() {});
        outer = std::move(inner);
        REQUIRE_FALSE(inner);
    }
    REQUIRE(signal.slot_count() == 1);

    outer.reset();
    REQUIRE(signal.slot_count() == 0);
}

TEST_CASE("SignalConnection: release keeps the slot", "[event_signal]") {
    Signal<> signal;
    {
        SignalConnection conn = signal.connect_scoped([]() {});
        conn.release();
    }
    REQUIRE(signal.slot_count() == 1);
}

TEST_CASE("SignalConnection: outliving the signal is harmless", "[event_signal]") {
    SignalConnection conn;
    {
        auto signal = std::make_unique<Signal<int>>();
        conn = signal->connect_scoped([](int) {});
    }
    REQUIRE_NOTHROW(conn.reset());
    REQUIRE_FALSE(conn);
}

TEST_CASE("Signal: owner destroyed from inside a slot", "[event_signal]") {
    struct Owner {
        Signal<> done;
    };
    auto owner = std::make_unique<Owner>();
    bool after = false;

    owner->done.connect([&]() { owner.reset(); });
    owner->done.connect([&]() { after = true; });

    owner->done.emit();

    REQUIRE(owner == nullptr);
    // Slot table outlives the owner for the rest of the emit
    REQUIRE(after);
}
