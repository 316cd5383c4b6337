/**
 * @file test_flow_trace.cpp
 * @brief Unit tests for Internal/FlowTrace.h
 */

#include <VxTrace/Internal/FlowTrace.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <vector>

using namespace Vx::Trace;
using namespace Vx::Trace::Internal;

namespace {

FlowField UniformFlow(int32_t w, int32_t h, float tx, float ty) {
    FlowField flow;
    flow.width = w;
    flow.height = h;
    const size_t n = static_cast<size_t>(w) * h;
    flow.tx.assign(n, tx);
    flow.ty.assign(n, ty);
    flow.coherency.assign(n, 1.0f);
    return flow;
}

void SetTangent(FlowField& flow, int32_t x, int32_t y, float tx, float ty) {
    const size_t i = static_cast<size_t>(y) * flow.width + x;
    flow.tx[i] = tx;
    flow.ty[i] = ty;
}

BinaryMap HorizontalRun(int32_t w, int32_t h, int32_t y, int32_t x0, int32_t x1) {
    BinaryMap edges(w, h);
    for (int32_t x = x0; x <= x1; ++x) edges.Set(x, y, true);
    return edges;
}

} // namespace

TEST(FlowTraceTest, FollowsStraightRun) {
    BinaryMap edges = HorizontalRun(50, 20, 10, 5, 44);
    FlowField flow = UniformFlow(50, 20, 1.0f, 0.0f);

    FlowTraceStats stats;
    auto paths = TraceFlowPolylines(edges, flow, nullptr, FlowTraceParams(), &stats);

    ASSERT_EQ(paths.size(), 1u);
    EXPECT_EQ(stats.traces, 1u);
    EXPECT_EQ(stats.seeds, 40u);
    const VPath& path = paths[0];
    EXPECT_FALSE(path.IsClosed());
    EXPECT_NEAR(std::min(path.Front().x, path.Back().x), 5.0, 1.0);
    EXPECT_NEAR(std::max(path.Front().x, path.Back().x), 44.0, 1.0);
    for (size_t i = 0; i < path.Size(); ++i) {
        EXPECT_DOUBLE_EQ(path[i].y, 10.0);
        if (i > 0) EXPECT_GE(path[i].DistanceTo(path[i - 1]), 1.0 - 1e-9);
    }
}

TEST(FlowTraceTest, BridgesShortGap) {
    // Pixels 21 and 22 missing: four half-pixel steps without support
    BinaryMap edges = HorizontalRun(50, 20, 10, 5, 40);
    edges.Set(21, 10, false);
    edges.Set(22, 10, false);
    FlowField flow = UniformFlow(50, 20, 1.0f, 0.0f);

    auto bridged = TraceFlowPolylines(edges, flow, nullptr, FlowTraceParams());
    ASSERT_EQ(bridged.size(), 1u);
    EXPECT_GT(bridged[0].Length(), 33.0);

    FlowTraceParams strict;
    strict.maxGap = 2;
    auto split = TraceFlowPolylines(edges, flow, nullptr, strict);
    EXPECT_EQ(split.size(), 2u);
}

TEST(FlowTraceTest, StopsAtSharpTurn) {
    // L shape turning down at (25, 10), 45 degrees per step through the corner
    BinaryMap edges = HorizontalRun(40, 40, 10, 5, 25);
    FlowField flow = UniformFlow(40, 40, 1.0f, 0.0f);
    SetTangent(flow, 25, 10, 0.70710678f, 0.70710678f);
    for (int32_t y = 11; y <= 30; ++y) {
        edges.Set(25, y, true);
        SetTangent(flow, 25, y, 0.0f, 1.0f);
    }

    auto paths = TraceFlowPolylines(edges, flow, nullptr, FlowTraceParams());
    ASSERT_EQ(paths.size(), 2u);

    FlowTraceParams loose;
    loose.maxAngleDeg = 95.0;
    auto joined = TraceFlowPolylines(edges, flow, nullptr, loose);
    EXPECT_EQ(joined.size(), 1u);
}

TEST(FlowTraceTest, LowCoherencyGivesNoSeeds) {
    BinaryMap edges = HorizontalRun(50, 20, 10, 5, 44);
    FlowField flow = UniformFlow(50, 20, 1.0f, 0.0f);
    std::fill(flow.coherency.begin(), flow.coherency.end(), 0.05f);

    FlowTraceStats stats;
    auto paths = TraceFlowPolylines(edges, flow, nullptr, FlowTraceParams(), &stats);
    EXPECT_TRUE(paths.empty());
    EXPECT_EQ(stats.seeds, 0u);
}

TEST(FlowTraceTest, WeakResponseIsNotSeeded) {
    // Two runs, the lower one at 2% of the peak response
    BinaryMap edges = HorizontalRun(50, 30, 8, 5, 44);
    for (int32_t x = 5; x <= 44; ++x) edges.Set(x, 20, true);
    FlowField flow = UniformFlow(50, 30, 1.0f, 0.0f);
    std::vector<float> response(50 * 30, 0.0f);
    for (int32_t x = 5; x <= 44; ++x) {
        response[8 * 50 + x] = 1.0f;
        response[20 * 50 + x] = 0.02f;
    }

    auto paths = TraceFlowPolylines(edges, flow, response.data(), FlowTraceParams());
    ASSERT_EQ(paths.size(), 1u);
    for (const auto& p : paths[0].Points()) EXPECT_DOUBLE_EQ(p.y, 8.0);
}

TEST(FlowTraceTest, FollowsCurvedBand) {
    const int32_t size = 40;
    const double c = 20.0, r = 12.0;
    BinaryMap edges(size, size);
    FlowField flow = UniformFlow(size, size, 1.0f, 0.0f);
    std::vector<float> response(static_cast<size_t>(size) * size, 0.0f);
    for (int32_t y = 0; y < size; ++y) {
        for (int32_t x = 0; x < size; ++x) {
            const double dx = x - c, dy = y - c;
            const double d = std::hypot(dx, dy);
            if (d < 1e-9) continue;
            SetTangent(flow, x, y, static_cast<float>(-dy / d), static_cast<float>(dx / d));
            if (std::abs(d - r) <= 2.5) {
                edges.Set(x, y, true);
                response[static_cast<size_t>(y) * size + x] =
                    static_cast<float>(1.0 - std::abs(d - r) / 3.0);
            }
        }
    }

    auto paths = TraceFlowPolylines(edges, flow, response.data(), FlowTraceParams());
    ASSERT_FALSE(paths.empty());
    double longest = 0.0;
    for (const auto& path : paths) {
        longest = std::max(longest, path.Length());
        for (const auto& p : path.Points()) {
            EXPECT_NEAR(std::hypot(p.x - c, p.y - c), r, 3.0);
        }
    }
    EXPECT_GT(longest, 0.75 * 2.0 * 3.14159265 * r);
}

TEST(FlowTraceTest, EmptyOrMismatchedInput) {
    BinaryMap edges(10, 10);
    FlowField flow;
    EXPECT_TRUE(TraceFlowPolylines(edges, flow, nullptr, FlowTraceParams()).empty());
    EXPECT_TRUE(TraceFlowPolylines(BinaryMap(), FlowField(), nullptr, FlowTraceParams()).empty());
}
