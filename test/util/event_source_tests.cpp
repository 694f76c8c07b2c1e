// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/event_source.hpp"
#include <string>
#include <vector>

using namespace natforward::util;

TEST_CASE("EventSource: subscribers receive notifications", "[util][events]") {
    EventSource<int, std::string> source;
    std::vector<std::string> seen;

    auto sub = source.Subscribe([&](int n, std::string s) {
        seen.push_back(std::to_string(n) + s);
    });

    source.Notify(1, "a");
    source.Notify(2, "b");

    REQUIRE(seen == std::vector<std::string>{"1a", "2b"});
    REQUIRE(source.SubscriberCount() == 1);
}

TEST_CASE("EventSource: subscription lifetime", "[util][events]") {
    EventSource<> source;
    int calls = 0;

    SECTION("Destroying the subscription unsubscribes") {
        {
            auto sub = source.Subscribe([&]() { calls++; });
            source.Notify();
        }
        source.Notify();
        REQUIRE(calls == 1);
        REQUIRE(source.SubscriberCount() == 0);
    }

    SECTION("Explicit Unsubscribe is idempotent") {
        auto sub = source.Subscribe([&]() { calls++; });
        REQUIRE(sub.IsActive());
        sub.Unsubscribe();
        sub.Unsubscribe();
        REQUIRE(!sub.IsActive());
        source.Notify();
        REQUIRE(calls == 0);
    }

    SECTION("Moved-from subscription no longer owns the callback") {
        Subscription outer;
        {
            auto sub = source.Subscribe([&]() { calls++; });
            outer = std::move(sub);
            REQUIRE(!sub.IsActive());
        }
        source.Notify();
        REQUIRE(calls == 1);
        REQUIRE(outer.IsActive());
    }

    SECTION("Move assignment releases the previous subscription") {
        int other_calls = 0;
        auto first = source.Subscribe([&]() { calls++; });
        first = source.Subscribe([&]() { other_calls++; });
        source.Notify();
        REQUIRE(calls == 0);
        REQUIRE(other_calls == 1);
        REQUIRE(source.SubscriberCount() == 1);
    }
}

TEST_CASE("EventSource: independent sources", "[util][events]") {
    EventSource<> a;
    EventSource<> b;
    int a_calls = 0;
    int b_calls = 0;

    auto sub_a = a.Subscribe([&]() { a_calls++; });
    auto sub_b = b.Subscribe([&]() { b_calls++; });

    a.Notify();
    REQUIRE(a_calls == 1);
    REQUIRE(b_calls == 0);
}
