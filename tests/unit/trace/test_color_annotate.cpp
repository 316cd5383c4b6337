/**
 * @file test_color_annotate.cpp
 * @brief Unit tests for Trace/ColorAnnotate.h
 */

#include <VxTrace/Trace/ColorAnnotate.h>
#include <gtest/gtest.h>

#include <vector>

using namespace Vx::Trace;

namespace {

const Color RED(255, 0, 0);
const Color BLUE(0, 0, 255);

// Red for x < 20, blue otherwise
VImage MakeSplitImage() {
    VImage image(40, 10, ChannelType::RGB);
    for (int32_t y = 0; y < 10; ++y)
        for (int32_t x = 0; x < 40; ++x)
            image.SetPixelColor(x, y, x < 20 ? RED : BLUE);
    return image;
}

StrokePrimitive HorizontalStroke() {
    StrokePrimitive s;
    s.path = VPath(std::vector<Point2d>{{0, 5}, {39, 5}});
    return s;
}

DotPrimitive MakeDot(const Color& color) {
    DotPrimitive d;
    d.center = Point2d(5, 5);
    d.color = color;
    return d;
}

} // namespace

// ============================================================================
// Clustering
// ============================================================================

TEST(ClusterPathColorsTest, TwoColoursLargestFirst) {
    auto clusters = ClusterPathColors(HorizontalStroke().path, MakeSplitImage(), 0.15);
    ASSERT_EQ(clusters.size(), 2u);

    // 21 samples: x = 0, 2, ..., 38 and the end point
    EXPECT_EQ(clusters[0].color, BLUE);
    EXPECT_EQ(clusters[0].members, 11u);
    EXPECT_NEAR(clusters[0].meanOffset, 0.75, 1e-9);

    EXPECT_EQ(clusters[1].color, RED);
    EXPECT_EQ(clusters[1].members, 10u);
    EXPECT_NEAR(clusters[1].meanOffset, 0.225, 1e-9);
}

TEST(ClusterPathColorsTest, WideToleranceMergesEverything) {
    auto clusters = ClusterPathColors(HorizontalStroke().path, MakeSplitImage(), 2.0);
    ASSERT_EQ(clusters.size(), 1u);
    EXPECT_EQ(clusters[0].members, 21u);
    EXPECT_GT(clusters[0].color.r, 0);
    EXPECT_GT(clusters[0].color.b, 0);
}

TEST(ClusterPathColorsTest, DegenerateInputs) {
    EXPECT_TRUE(ClusterPathColors(VPath(), MakeSplitImage(), 0.15).empty());
    EXPECT_TRUE(ClusterPathColors(HorizontalStroke().path, VImage(), 0.15).empty());

    VPath single;
    single.AddPoint(30, 2);
    auto clusters = ClusterPathColors(single, MakeSplitImage(), 0.15);
    ASSERT_EQ(clusters.size(), 1u);
    EXPECT_EQ(clusters[0].color, BLUE);
}

TEST(ClusterPathColorsTest, PointsOutsideImageAreClamped) {
    VPath path(std::vector<Point2d>{{-10, -10}, {-5, -10}});
    auto clusters = ClusterPathColors(path, MakeSplitImage(), 0.15);
    ASSERT_EQ(clusters.size(), 1u);
    EXPECT_EQ(clusters[0].color, RED);
}

// ============================================================================
// Annotation
// ============================================================================

class AnnotateColorsTest : public ::testing::Test {
protected:
    VImage image_ = MakeSplitImage();
    ColorConfig config_;
};

TEST_F(AnnotateColorsTest, StrokeGetsDominantColourAndStops) {
    std::vector<Primitive> prims{HorizontalStroke()};
    EXPECT_EQ(AnnotateColors(prims, image_, config_), 1u);

    const auto& stroke = std::get<StrokePrimitive>(prims[0]);
    ASSERT_TRUE(stroke.color.has_value());
    EXPECT_EQ(*stroke.color, BLUE);
    ASSERT_EQ(stroke.gradient.size(), 2u);
    // Ordered along the path
    EXPECT_EQ(stroke.gradient[0].color, RED);
    EXPECT_EQ(stroke.gradient[1].color, BLUE);
    EXPECT_LT(stroke.gradient[0].offset, stroke.gradient[1].offset);
}

TEST_F(AnnotateColorsTest, SingleColourLimitSkipsGradient) {
    config_.maxColorsPerPath = 1;
    std::vector<Primitive> prims{HorizontalStroke()};
    EXPECT_EQ(AnnotateColors(prims, image_, config_), 0u);

    const auto& stroke = std::get<StrokePrimitive>(prims[0]);
    EXPECT_EQ(*stroke.color, BLUE);
    EXPECT_TRUE(stroke.gradient.empty());
}

TEST_F(AnnotateColorsTest, UniformStrokeHasNoGradient) {
    StrokePrimitive s;
    s.path = VPath(std::vector<Point2d>{{0, 1}, {15, 1}});
    s.gradient.push_back(GradientStop());
    std::vector<Primitive> prims{s};

    EXPECT_EQ(AnnotateColors(prims, image_, config_), 0u);
    const auto& stroke = std::get<StrokePrimitive>(prims[0]);
    EXPECT_EQ(*stroke.color, RED);
    EXPECT_TRUE(stroke.gradient.empty());
}

TEST_F(AnnotateColorsTest, FillsAndDotsKeepTheirColours) {
    FillPrimitive fill;
    fill.rings.push_back(VPath(std::vector<Point2d>{{0, 0}, {39, 0}, {39, 9}}, true));
    fill.color = Color(10, 200, 10);
    std::vector<Primitive> prims{fill, MakeDot(Color(1, 2, 3))};

    EXPECT_EQ(AnnotateColors(prims, image_, config_), 0u);
    EXPECT_EQ(*std::get<FillPrimitive>(prims[0]).color, Color(10, 200, 10));
    EXPECT_EQ(std::get<DotPrimitive>(prims[1]).color, Color(1, 2, 3));
}

// ============================================================================
// Palette reduction
// ============================================================================

TEST(ReducePaletteTest, GroupsSimilarColours) {
    std::vector<Primitive> prims{
        MakeDot(Color(250, 0, 0)), MakeDot(Color(250, 0, 0)), MakeDot(Color(250, 0, 0)),
        MakeDot(Color(235, 15, 10)),
        MakeDot(Color(0, 0, 250)), MakeDot(Color(10, 10, 240)),
    };

    auto palette = ReducePalette(prims, 2);
    ASSERT_EQ(palette.size(), 2u);

    const Color red = std::get<DotPrimitive>(prims[0]).color;
    const Color blue = std::get<DotPrimitive>(prims[4]).color;
    EXPECT_FALSE(red == blue);
    for (size_t i = 0; i < 4; ++i) EXPECT_EQ(std::get<DotPrimitive>(prims[i]).color, red);
    EXPECT_EQ(std::get<DotPrimitive>(prims[5]).color, blue);
    EXPECT_GT(red.r, red.b);
    EXPECT_GT(blue.b, blue.r);
}

TEST(ReducePaletteTest, KeepsAlpha) {
    std::vector<Primitive> prims{MakeDot(Color(200, 0, 0, 128)), MakeDot(Color(0, 200, 0))};
    ReducePalette(prims, 1);
    const Color a = std::get<DotPrimitive>(prims[0]).color;
    const Color b = std::get<DotPrimitive>(prims[1]).color;
    EXPECT_EQ(a.a, 128);
    EXPECT_EQ(b.a, 255);
    EXPECT_EQ(a.r, b.r);
    EXPECT_EQ(a.g, b.g);
}

TEST(ReducePaletteTest, PaletteNeverExceedsDistinctColours) {
    StrokePrimitive s;
    s.path = VPath(std::vector<Point2d>{{0, 0}, {5, 0}});
    s.color = Color(30, 60, 90);
    std::vector<Primitive> prims{s, MakeDot(Color(200, 100, 50))};

    EXPECT_EQ(ReducePalette(prims, 16).size(), 2u);
}

TEST(ReducePaletteTest, NothingToReduce) {
    std::vector<Primitive> prims{MakeDot(Color(5, 5, 5))};
    EXPECT_TRUE(ReducePalette(prims, 0).empty());
    EXPECT_EQ(std::get<DotPrimitive>(prims[0]).color, Color(5, 5, 5));

    std::vector<Primitive> none;
    EXPECT_TRUE(ReducePalette(none, 8).empty());
}
