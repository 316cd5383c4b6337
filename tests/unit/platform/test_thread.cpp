/**
 * @file test_thread.cpp
 * @brief Unit tests for Platform/Thread.h
 */

#include <VxTrace/Platform/Thread.h>
#include <gtest/gtest.h>

#include <atomic>
#include <numeric>
#include <stdexcept>
#include <vector>

using namespace Vx::Trace::Platform;

class ThreadTest : public ::testing::Test {
protected:
    ThreadPool pool_{4};
};

// ============================================================================
// System Information Tests
// ============================================================================

TEST_F(ThreadTest, GetNumCoresReturnsPositive) {
    EXPECT_GE(GetNumCores(), 1u);
}

TEST_F(ThreadTest, GetRecommendedThreadCountReturnsPositive) {
    size_t threads = GetRecommendedThreadCount();
    EXPECT_GE(threads, 1u);
    EXPECT_LE(threads, GetNumCores());
}

// ============================================================================
// Thread Pool Tests
// ============================================================================

TEST_F(ThreadTest, PoolHasRequestedWorkers) {
    EXPECT_EQ(pool_.Size(), 4u);
    EXPECT_TRUE(pool_.IsRunning());
}

TEST_F(ThreadTest, SubmitReturnsFuture) {
    auto future = pool_.Submit([](int a, int b) { return a * b; }, 6, 7);
    EXPECT_EQ(future.get(), 42);
}

TEST_F(ThreadTest, SubmitPropagatesException) {
    auto future = pool_.Submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST_F(ThreadTest, WaitAllDrainsQueue) {
    std::atomic<int> counter{0};
    for (int i = 0; i < 100; ++i) {
        pool_.Execute([&counter]() { counter.fetch_add(1); });
    }
    pool_.WaitAll();
    EXPECT_EQ(counter.load(), 100);
    EXPECT_EQ(pool_.PendingTasks(), 0u);
}

// ============================================================================
// Parallel For Tests
// ============================================================================

TEST_F(ThreadTest, ParallelForVisitsEveryIndexOnce) {
    std::vector<std::atomic<int>> hits(1000);
    ParallelFor(&pool_, 0, hits.size(), [&hits](size_t i) { hits[i].fetch_add(1); });
    for (const auto& h : hits) {
        EXPECT_EQ(h.load(), 1);
    }
}

TEST_F(ThreadTest, ParallelForWithoutPoolRunsSerially) {
    std::vector<size_t> order;
    ParallelFor(nullptr, 3, 8, [&order](size_t i) { order.push_back(i); });
    EXPECT_EQ(order, (std::vector<size_t>{3, 4, 5, 6, 7}));
}

TEST_F(ThreadTest, ParallelForRethrowsFirstError) {
    EXPECT_THROW(ParallelFor(&pool_, 0, 64, [](size_t i) {
        if (i == 17) throw std::runtime_error("bad index");
    }, 4), std::runtime_error);
}

TEST_F(ThreadTest, ParallelForRangeCoversRange) {
    std::atomic<size_t> total{0};
    ParallelForRange(&pool_, 0, 1001, [&total](size_t b, size_t e) {
        size_t local = 0;
        for (size_t i = b; i < e; ++i) local += i;
        total.fetch_add(local);
    });
    EXPECT_EQ(total.load(), 1000u * 1001u / 2u);
}

TEST_F(ThreadTest, GrainSizeIsPositive) {
    EXPECT_GE(CalculateGrainSize(0, 4), 1u);
    EXPECT_GE(CalculateGrainSize(10000, 8), 1u);
    EXPECT_LE(CalculateGrainSize(10000, 8), 10000u);
}
