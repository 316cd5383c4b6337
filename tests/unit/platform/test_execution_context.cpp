/**
 * @file test_execution_context.cpp
 * @brief Unit tests for Platform/ExecutionContext.h and Platform/WorkDistributor.h
 */

#include <VxTrace/Platform/ExecutionContext.h>
#include <VxTrace/Core/Exception.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cmath>
#include <string>
#include <thread>
#include <vector>

using namespace Vx::Trace;
using namespace Vx::Trace::Platform;

// ============================================================================
// WorkDistributor
// ============================================================================

TEST(WorkDistributorTest, UnknownOperationSplitsEvenly) {
    WorkDistributor dist;
    EXPECT_FALSE(dist.AverageItemMs("rows").has_value());
    // 4 workers * 4 tasks
    EXPECT_EQ(dist.ChunkSize("rows", 1600, 4), 100u);
    EXPECT_EQ(dist.ChunkSize("rows", 1600, 1), 1600u);
}

TEST(WorkDistributorTest, MeasuredCostDrivesChunkSize) {
    WorkDistributor dist;
    dist.Record("rows", 8, 1.0);   // 0.125 ms per item
    ASSERT_TRUE(dist.AverageItemMs("rows").has_value());
    EXPECT_NEAR(*dist.AverageItemMs("rows"), 0.125, 1e-12);
    // 2 ms target -> 16 items
    EXPECT_EQ(dist.ChunkSize("rows", 1000, 4), 16u);
}

TEST(WorkDistributorTest, ChunkNeverExceedsEvenSplit) {
    WorkDistributor dist;
    dist.Record("cheap", 1000000, 1.0);
    EXPECT_EQ(dist.ChunkSize("cheap", 100, 4), 25u);
}

TEST(WorkDistributorTest, EmaSmoothing) {
    WorkDistributor::Options opts;
    opts.smoothing = 0.5;
    WorkDistributor dist(opts);
    dist.Record("op", 1, 2.0);
    dist.Record("op", 1, 4.0);
    EXPECT_NEAR(*dist.AverageItemMs("op"), 3.0, 1e-12);
    dist.Reset();
    EXPECT_FALSE(dist.AverageItemMs("op").has_value());
}

TEST(WorkDistributorTest, SmallJobsStaySerial) {
    WorkDistributor dist;
    EXPECT_EQ(dist.ThreadCount(10, 8), 1u);
    EXPECT_EQ(dist.ThreadCount(64, 8), 4u);
    EXPECT_EQ(dist.ThreadCount(100000, 8), 8u);
    EXPECT_EQ(dist.ThreadCount(100000, 1), 1u);
}

// ============================================================================
// ExecutionContext
// ============================================================================

TEST(ExecutionContextTest, SingleThreadHasNoPool) {
    ExecutionOptions opts;
    opts.numThreads = 1;
    ExecutionContext ctx(opts);
    EXPECT_EQ(ctx.Pool(), nullptr);
    EXPECT_EQ(ctx.Workers(), 1u);
}

TEST(ExecutionContextTest, UnlimitedBudgetNeverExpires) {
    ExecutionContext ctx;
    ctx.StartBudget(0.0);
    EXPECT_FALSE(ctx.HasDeadline());
    EXPECT_TRUE(std::isinf(ctx.RemainingMs()));
    EXPECT_FALSE(ctx.BudgetFractionUsed(0.0));
    EXPECT_NO_THROW(ctx.CheckDeadline("anything"));
}

TEST(ExecutionContextTest, ExpiredBudgetThrowsWithStage) {
    ExecutionOptions opts;
    opts.numThreads = 1;
    ExecutionContext ctx(opts);
    ctx.StartBudget(1.0);
    std::this_thread::sleep_for(std::chrono::milliseconds(5));

    EXPECT_TRUE(ctx.DeadlineExceeded());
    EXPECT_DOUBLE_EQ(ctx.RemainingMs(), 0.0);
    try {
        ctx.CheckDeadline("edge");
        FAIL() << "expected TimeBudgetException";
    } catch (const TimeBudgetException& e) {
        EXPECT_EQ(e.Stage(), "edge");
    }
}

TEST(ExecutionContextTest, ProgressIsClamped) {
    std::vector<double> seen;
    ExecutionOptions opts;
    opts.numThreads = 1;
    opts.progress = [&seen](double pct, const std::string&) { seen.push_back(pct); };
    ExecutionContext ctx(opts);

    ctx.ReportProgress(-5.0, "a");
    ctx.ReportProgress(50.0, "b");
    ctx.ReportProgress(150.0, "c");
    EXPECT_EQ(seen, (std::vector<double>{0.0, 50.0, 100.0}));
}

TEST(ExecutionContextTest, ParallelForAdaptiveRecordsCost) {
    ExecutionOptions opts;
    opts.numThreads = 4;
    ExecutionContext ctx(opts);

    std::atomic<size_t> sum{0};
    ParallelForAdaptive(ctx, "sum", 0, 1000, [&sum](size_t i) { sum.fetch_add(i); });
    EXPECT_EQ(sum.load(), 999u * 1000u / 2u);
    EXPECT_TRUE(ctx.Distributor().AverageItemMs("sum").has_value());
}

TEST(ExecutionContextTest, SnapshotMemoryRecordsPools) {
    ExecutionContext ctx;
    {
        auto h = ctx.FloatPool().Acquire(64);
    }
    ctx.SnapshotMemory("test");
    auto stats = ctx.GetProfiler().Memory("test.float");
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->acquisitions, 1u);
    EXPECT_TRUE(ctx.GetProfiler().Memory("test.dot").has_value());
}
