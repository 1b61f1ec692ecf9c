#include <catch2/catch_test_macros.hpp>

#include <agent_relay/agent/busy_registry.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace agent_relay;

TEST_CASE("BusyRegistry: second acquire is rejected", "[busy]") {
    BusyRegistry registry;
    CHECK(registry.TryAcquire("conv-1"));
    CHECK(registry.IsBusy("conv-1"));
    CHECK_FALSE(registry.TryAcquire("conv-1"));
    CHECK(registry.TryAcquire("conv-2"));

    registry.Release("conv-1");
    CHECK_FALSE(registry.IsBusy("conv-1"));
    CHECK(registry.TryAcquire("conv-1"));
}

TEST_CASE("BusyGuard: releases on scope exit", "[busy]") {
    BusyRegistry registry;
    REQUIRE(registry.TryAcquire("conv-1"));
    {
        BusyGuard guard(registry, "conv-1");
        CHECK(registry.IsBusy("conv-1"));
    }
    CHECK_FALSE(registry.IsBusy("conv-1"));
}

TEST_CASE("BusyRegistry: exactly one winner under contention", "[busy]") {
    BusyRegistry registry;
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            if (registry.TryAcquire("conv-1")) ++winners;
        });
    }
    for (auto& t : threads) t.join();
    CHECK(winners == 1);
}
