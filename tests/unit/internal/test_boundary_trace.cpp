/**
 * @file test_boundary_trace.cpp
 * @brief Unit tests for Internal/BoundaryTrace.h
 */

#include <VxTrace/Internal/BoundaryTrace.h>
#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace Vx::Trace;
using namespace Vx::Trace::Internal;

namespace {

BinaryMap MakeSquare(int32_t size, int32_t x0, int32_t x1) {
    BinaryMap map(size, size);
    for (int32_t y = x0; y <= x1; ++y)
        for (int32_t x = x0; x <= x1; ++x)
            map.Set(x, y, true);
    return map;
}

// Rectangular spiral of one pixel wide arms separated by one pixel gaps
BinaryMap MakeSpiral(int32_t size) {
    BinaryMap map(size, size);
    int32_t x0 = 1, y0 = 1, x1 = size - 2, y1 = size - 2;
    while (x0 < x1 && y0 < y1) {
        for (int32_t x = x0; x <= x1; ++x) map.Set(x, y0, true);
        for (int32_t y = y0; y <= y1; ++y) map.Set(x1, y, true);
        for (int32_t x = x0; x <= x1; ++x) map.Set(x, y1, true);
        for (int32_t y = y0 + 2; y <= y1; ++y) map.Set(x0, y, true);
        if (x0 + 2 <= x1) map.Set(x0 + 1, y0 + 2, true);
        x0 += 2;
        y0 += 2;
        x1 -= 2;
        y1 -= 2;
    }
    return map;
}

} // namespace

// ============================================================================
// Single boundary
// ============================================================================

TEST(BoundaryTraceTest, SquareClosesOnItsPerimeter) {
    BinaryMap map = MakeSquare(20, 5, 14);
    BoundaryTraceResult result = TraceBoundary(map, Point2i(5, 5));

    ASSERT_EQ(result.status, TraceStatus::Closed);
    EXPECT_EQ(result.contour.size(), 36u);
    for (const auto& p : result.contour) {
        const bool onEdge = p.x == 5 || p.x == 14 || p.y == 5 || p.y == 14;
        EXPECT_TRUE(onEdge) << p.x << "," << p.y;
    }
}

TEST(BoundaryTraceTest, SinglePixelIsIsolated) {
    BinaryMap map(7, 7);
    map.Set(3, 3, true);
    BoundaryTraceResult result = TraceBoundary(map, Point2i(3, 3));
    EXPECT_EQ(result.status, TraceStatus::Isolated);
    ASSERT_EQ(result.contour.size(), 1u);
    EXPECT_EQ(result.contour[0], Point2i(3, 3));
}

TEST(BoundaryTraceTest, BackgroundStartIsAbandoned) {
    BinaryMap map = MakeSquare(20, 5, 14);
    BoundaryTraceResult result = TraceBoundary(map, Point2i(0, 0));
    EXPECT_EQ(result.status, TraceStatus::Abandoned);
    EXPECT_TRUE(result.contour.empty());
}

TEST(BoundaryTraceTest, TinyBudgetIsAbandoned) {
    BinaryMap map = MakeSquare(20, 5, 14);
    BoundaryTraceResult result = TraceBoundary(map, Point2i(5, 5), 3);
    EXPECT_EQ(result.status, TraceStatus::Abandoned);
    EXPECT_EQ(result.steps, 3);
}

TEST(BoundaryTraceTest, CheckerboardTerminates) {
    // Diagonal contacts only: every pixel joins one 8-connected component
    BinaryMap map(24, 24);
    for (int32_t y = 0; y < 24; ++y)
        for (int32_t x = 0; x < 24; ++x)
            if ((x + y) % 2 == 0) map.Set(x, y, true);

    BoundaryTraceResult result = TraceBoundary(map, Point2i(0, 0));
    EXPECT_EQ(result.status, TraceStatus::Closed);
    EXPECT_LE(result.steps, DefaultTraceBudget(24, 24));
}

TEST(BoundaryTraceTest, SpiralTerminates) {
    BinaryMap map = MakeSpiral(41);
    BoundaryTraceResult result = TraceBoundary(map, Point2i(1, 1));
    EXPECT_EQ(result.status, TraceStatus::Closed);
    EXPECT_GT(result.contour.size(), 100u);
    EXPECT_LE(result.steps, DefaultTraceBudget(41, 41));
}

TEST(BoundaryTraceTest, DefaultBudgetScalesWithArea) {
    EXPECT_EQ(DefaultTraceBudget(10, 10), 4 * 20 + 4 * 100);
    EXPECT_GT(DefaultTraceBudget(100, 100), DefaultTraceBudget(10, 10));
}

// ============================================================================
// Region boundaries
// ============================================================================

class RegionBoundaryTest : public ::testing::Test {
protected:
    void SetUp() override {
        labels_ = LabelMap(30, 30);
        labels_.numLabels = 2;
        for (int32_t y = 0; y < 30; ++y) {
            for (int32_t x = 0; x < 30; ++x) {
                const bool inSquare = x >= 5 && x <= 24 && y >= 5 && y <= 24;
                const bool inHole = x >= 12 && x <= 16 && y >= 12 && y <= 16;
                labels_.labels[static_cast<size_t>(y) * 30 + x] =
                    (inSquare && !inHole) ? 1 : 0;
            }
        }
    }

    LabelMap labels_;
};

TEST_F(RegionBoundaryTest, OuterRingThenHole) {
    RegionBoundary region = TraceAllBoundaries(labels_, 1);
    EXPECT_EQ(region.abandoned, 0);
    ASSERT_EQ(region.rings.size(), 2u);

    const VPath& outer = region.rings[0];
    EXPECT_TRUE(outer.IsClosed());
    Rect2d box = outer.BoundingBox();
    EXPECT_DOUBLE_EQ(box.minX, 5.0);
    EXPECT_DOUBLE_EQ(box.minY, 5.0);
    EXPECT_DOUBLE_EQ(box.maxX, 24.0);
    EXPECT_DOUBLE_EQ(box.maxY, 24.0);

    const VPath& hole = region.rings[1];
    EXPECT_TRUE(hole.IsClosed());
    Rect2d holeBox = hole.BoundingBox();
    EXPECT_GE(holeBox.minX, 10.0);
    EXPECT_LE(holeBox.minX, 11.0);
    EXPECT_GE(holeBox.maxX, 17.0);
    EXPECT_LE(holeBox.maxX, 18.0);
    EXPECT_LT(hole.Area(), outer.Area());
}

TEST_F(RegionBoundaryTest, MissingLabelGivesNoRings) {
    RegionBoundary region = TraceAllBoundaries(labels_, 7);
    EXPECT_TRUE(region.rings.empty());
    EXPECT_EQ(region.abandoned, 0);
}

TEST_F(RegionBoundaryTest, BackgroundLabelSurroundsSquare) {
    // Label 0 holds the frame and the hole; the frame is the larger part
    RegionBoundary region = TraceAllBoundaries(labels_, 0);
    ASSERT_FALSE(region.rings.empty());
    Rect2d box = region.rings[0].BoundingBox();
    EXPECT_DOUBLE_EQ(box.minX, 0.0);
    EXPECT_DOUBLE_EQ(box.maxX, 29.0);
}
