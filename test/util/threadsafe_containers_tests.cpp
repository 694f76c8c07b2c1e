// Copyright (c) 2024 NatForward
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "util/threadsafe_containers.hpp"
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace natforward::util;

// ============================================================================
// ThreadSafeSet Tests
// ============================================================================

TEST_CASE("ThreadSafeSet: Basic operations", "[util][threadsafe][set]") {
    ThreadSafeSet<std::string> set;

    SECTION("TryInsert only succeeds once") {
        REQUIRE(set.TryInsert("a"));
        REQUIRE(!set.TryInsert("a"));
        REQUIRE(set.Size() == 1);
    }

    SECTION("Contains") {
        set.TryInsert("a");
        REQUIRE(set.Contains("a"));
        REQUIRE(!set.Contains("b"));
    }

    SECTION("Erase") {
        set.TryInsert("a");
        REQUIRE(set.Erase("a"));
        REQUIRE(!set.Contains("a"));
        REQUIRE(!set.Erase("a"));  // Second erase returns false
    }

    SECTION("Clear makes values insertable again") {
        set.TryInsert("a");
        set.TryInsert("b");
        set.Clear();
        REQUIRE(set.Empty());
        REQUIRE(set.Size() == 0);
        REQUIRE(set.TryInsert("a"));
    }

    SECTION("GetValues is sorted") {
        set.TryInsert("c");
        set.TryInsert("a");
        set.TryInsert("b");
        auto values = set.GetValues();
        REQUIRE(values == std::vector<std::string>{"a", "b", "c"});
    }
}

TEST_CASE("ThreadSafeSet: Concurrent TryInsert has exactly one winner",
          "[util][threadsafe][set]") {
    ThreadSafeSet<int> set;
    std::atomic<int> winners{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            for (int key = 0; key < 100; ++key) {
                if (set.TryInsert(key)) {
                    winners++;
                }
            }
        });
    }

    go = true;
    for (auto &t : threads) {
        t.join();
    }

    REQUIRE(winners.load() == 100);
    REQUIRE(set.Size() == 100);
}

TEST_CASE("ThreadSafeSet: Clear races with inserts", "[util][threadsafe][set]") {
    ThreadSafeSet<int> set;
    std::atomic<bool> done{false};

    std::thread clearer([&]() {
        while (!done.load()) {
            set.Clear();
            std::this_thread::yield();
        }
    });

    for (int i = 0; i < 10000; ++i) {
        set.TryInsert(i % 50);
    }
    done = true;
    clearer.join();

    REQUIRE(set.Size() <= 50);
}
