/**
 * @file test_bounded_pool.cpp
 * @brief Unit tests for the bounded parallel-for and its thread group
 */

#include <gtest/gtest.h>
#include <camfleet/utils/bounded_pool.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

using namespace camfleet::utils;

// =============================================================================
// ThreadGroup
// =============================================================================

TEST(ThreadGroupTest, JoinsWhileUnwinding) {
    std::atomic<int> finished{0};
    try {
        ThreadGroup group;
        for (int i = 0; i < 3; ++i) {
            group.spawn([&finished] {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
                ++finished;
            });
        }
        throw std::runtime_error("no more threads");
    } catch (const std::runtime_error&) {
    }
    EXPECT_EQ(finished.load(), 3);
}

TEST(ThreadGroupTest, JoinAllEmptiesGroup) {
    ThreadGroup group;
    group.spawn([] {});
    group.spawn([] {});
    EXPECT_EQ(group.size(), 2u);

    group.joinAll();
    EXPECT_EQ(group.size(), 0u);
    group.joinAll();
}

// =============================================================================
// parallelFor
// =============================================================================

TEST(ParallelForTest, VisitsEveryIndexOnce) {
    std::mutex mutex;
    std::multiset<size_t> seen;
    parallelFor(100, 8, [&](size_t i) {
        std::lock_guard<std::mutex> lock(mutex);
        seen.insert(i);
    });

    ASSERT_EQ(seen.size(), 100u);
    for (size_t i = 0; i < 100; ++i) {
        EXPECT_EQ(seen.count(i), 1u) << i;
    }
}

TEST(ParallelForTest, NeverExceedsInFlightCap) {
    std::atomic<int> inFlight{0};
    std::atomic<int> peak{0};
    parallelFor(40, 4, [&](size_t) {
        int now = ++inFlight;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        --inFlight;
    });
    EXPECT_LE(peak.load(), 4);
    EXPECT_GE(peak.load(), 1);
}

TEST(ParallelForTest, FailingItemDoesNotStopOthers) {
    std::atomic<int> done{0};
    parallelFor(10, 3, [&](size_t i) {
        if (i == 4) {
            throw std::runtime_error("bad host");
        }
        ++done;
    });
    EXPECT_EQ(done.load(), 9);
}

TEST(ParallelForTest, StoppedFlagSkipsRemainingItems) {
    std::atomic<bool> running{false};
    std::atomic<int> done{0};
    parallelFor(10, 3, [&](size_t) { ++done; }, "Test", &running);
    EXPECT_EQ(done.load(), 0);
}

TEST(ParallelForTest, ZeroCountIsANoOp) {
    bool called = false;
    parallelFor(0, 4, [&](size_t) { called = true; });
    EXPECT_FALSE(called);
}
