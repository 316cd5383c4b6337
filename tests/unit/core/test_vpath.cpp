/**
 * @file test_vpath.cpp
 * @brief Unit tests for Core/VPath.h
 */

#include <VxTrace/Core/VPath.h>
#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace Vx::Trace;

namespace {

VPath MakeSquare(double x0, double y0, double side) {
    return VPath({{x0, y0}, {x0 + side, y0}, {x0 + side, y0 + side}, {x0, y0 + side}}, true);
}

} // namespace

class VPathTest : public ::testing::Test {
protected:
    VPath square_ = MakeSquare(10.0, 20.0, 4.0);
};

TEST_F(VPathTest, LengthIncludesClosingSegment) {
    EXPECT_DOUBLE_EQ(square_.Length(), 16.0);

    VPath open(square_.Points(), false);
    EXPECT_DOUBLE_EQ(open.Length(), 12.0);
}

TEST_F(VPathTest, AreaAndCentroid) {
    EXPECT_DOUBLE_EQ(square_.Area(), 16.0);
    EXPECT_GT(square_.SignedArea(), 0.0);

    Point2d c = square_.Centroid();
    EXPECT_NEAR(c.x, 12.0, 1e-12);
    EXPECT_NEAR(c.y, 22.0, 1e-12);
}

TEST_F(VPathTest, ReversedRingFlipsSign) {
    std::vector<Point2d> pts(square_.Points().rbegin(), square_.Points().rend());
    VPath reversed(pts, true);
    EXPECT_DOUBLE_EQ(reversed.SignedArea(), -square_.SignedArea());
}

TEST_F(VPathTest, BoundingBox) {
    Rect2d box = square_.BoundingBox();
    EXPECT_DOUBLE_EQ(box.minX, 10.0);
    EXPECT_DOUBLE_EQ(box.maxY, 24.0);
    EXPECT_TRUE(VPath().BoundingBox().IsEmpty());
}

TEST_F(VPathTest, DegenerateCentroidFallsBackToMean) {
    VPath line({{0, 0}, {1, 0}, {2, 0}}, true);
    Point2d c = line.Centroid();
    EXPECT_DOUBLE_EQ(c.x, 1.0);
    EXPECT_DOUBLE_EQ(c.y, 0.0);
}

TEST_F(VPathTest, RemoveConsecutiveDuplicates) {
    VPath path({{0, 0}, {0, 0}, {1, 0}, {1, 0.0000001}, {2, 0}, {0, 0}}, true);
    path.RemoveConsecutiveDuplicates(1e-3);
    ASSERT_EQ(path.Size(), 3u);
    EXPECT_EQ(path.Back(), Point2d(2, 0));
}

TEST_F(VPathTest, ScaleAndTranslate) {
    square_.Scale(0.5, 2.0);
    EXPECT_DOUBLE_EQ(square_[2].x, 7.0);
    EXPECT_DOUBLE_EQ(square_[2].y, 48.0);

    square_.Translate(-7.0, 2.0);
    EXPECT_DOUBLE_EQ(square_[2].x, 0.0);
    EXPECT_DOUBLE_EQ(square_[2].y, 50.0);
}

// ============================================================================
// CubicBezier
// ============================================================================

TEST(CubicBezierTest, LineEvaluatesLinearly) {
    CubicBezier line = CubicBezier::Line({0, 0}, {9, 3});
    Point2d mid = line.Evaluate(0.5);
    EXPECT_NEAR(mid.x, 4.5, 1e-12);
    EXPECT_NEAR(mid.y, 1.5, 1e-12);

    Point2d d = line.Derivative(0.3);
    EXPECT_NEAR(d.x, 9.0, 1e-12);
    EXPECT_NEAR(d.y, 3.0, 1e-12);
    EXPECT_NEAR(line.SecondDerivative(0.7).Norm(), 0.0, 1e-12);
}

TEST(CubicBezierTest, EndpointsInterpolate) {
    CubicBezier c({0, 0}, {1, 5}, {4, 5}, {5, 0});
    EXPECT_EQ(c.Evaluate(0.0), Point2d(0, 0));
    EXPECT_EQ(c.Evaluate(1.0), Point2d(5, 0));
    EXPECT_NEAR(c.Evaluate(0.5).x, 2.5, 1e-12);
}
