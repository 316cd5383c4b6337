/**
 * @file test_directional.cpp
 * @brief Unit tests for Trace/Directional.h
 */

#include <VxTrace/Trace/Directional.h>
#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <utility>
#include <vector>

using namespace Vx::Trace;
using Backend::PassDirection;

namespace {

constexpr double PI = 3.14159265358979323846;
constexpr int32_t SIZE = 100;

std::vector<uint8_t> Flat(uint8_t value) {
    return std::vector<uint8_t>(static_cast<size_t>(SIZE) * SIZE, value);
}

// Brightness rising left to right (or top to bottom)
std::vector<uint8_t> Ramp(bool horizontal, bool rising) {
    std::vector<uint8_t> gray(static_cast<size_t>(SIZE) * SIZE);
    for (int32_t y = 0; y < SIZE; ++y) {
        for (int32_t x = 0; x < SIZE; ++x) {
            int32_t t = horizontal ? x : y;
            if (!rising) t = SIZE - 1 - t;
            gray[static_cast<size_t>(y) * SIZE + x] = static_cast<uint8_t>(t * 255 / (SIZE - 1));
        }
    }
    return gray;
}

// Smooth stripes whose gradient points along (1, 2)
std::vector<uint8_t> SlantedStripes() {
    std::vector<uint8_t> gray(static_cast<size_t>(SIZE) * SIZE);
    for (int32_t y = 0; y < SIZE; ++y) {
        for (int32_t x = 0; x < SIZE; ++x) {
            const double v = 128.0 + 100.0 * std::sin(2.0 * PI * (x + 2.0 * y) / 20.0);
            gray[static_cast<size_t>(y) * SIZE + x] = static_cast<uint8_t>(std::lround(v));
        }
    }
    return gray;
}

Primitive Stroke(std::vector<Point2d> points) {
    StrokePrimitive s;
    s.path = VPath(std::move(points));
    return s;
}

std::vector<Primitive> StraightStrokes(int32_t count) {
    std::vector<Primitive> strokes;
    for (int32_t i = 0; i < count; ++i) {
        const double y = 10.0 * i;
        strokes.push_back(Stroke({{0, y}, {20, y}, {40, y + 0.5}, {60, y}}));
    }
    return strokes;
}

} // namespace

// ============================================================================
// Lighting
// ============================================================================

TEST(LightingDirectionTest, BrighterRightIsReverse) {
    auto dir = DetectLightingDirection(Ramp(true, true), SIZE, SIZE);
    ASSERT_TRUE(dir.has_value());
    EXPECT_EQ(*dir, PassDirection::Reverse);
}

TEST(LightingDirectionTest, BrighterLeftIsStandard) {
    auto dir = DetectLightingDirection(Ramp(true, false), SIZE, SIZE);
    ASSERT_TRUE(dir.has_value());
    EXPECT_EQ(*dir, PassDirection::Standard);
}

TEST(LightingDirectionTest, BrighterBottomIsReverse) {
    auto dir = DetectLightingDirection(Ramp(false, true), SIZE, SIZE);
    ASSERT_TRUE(dir.has_value());
    EXPECT_EQ(*dir, PassDirection::Reverse);
}

TEST(LightingDirectionTest, NoBias) {
    EXPECT_FALSE(DetectLightingDirection(Flat(90), SIZE, SIZE).has_value());
    std::vector<uint8_t> tiny(9, 0);
    EXPECT_FALSE(DetectLightingDirection(tiny, 3, 3).has_value());
}

// ============================================================================
// Architectural elements
// ============================================================================

TEST(ArchitecturalTest, NeedsThreeLongStraightStrokes) {
    EXPECT_TRUE(HasArchitecturalElements(StraightStrokes(3)));
    EXPECT_FALSE(HasArchitecturalElements(StraightStrokes(2)));
    EXPECT_FALSE(HasArchitecturalElements({}));
}

TEST(ArchitecturalTest, IgnoresShortCurvedAndSparseStrokes) {
    std::vector<Primitive> prims;
    // Too short
    for (int32_t i = 0; i < 3; ++i) prims.push_back(Stroke({{0, 0}, {10, 0}, {20, 0}, {30, 0}}));
    // Folded back on itself
    for (int32_t i = 0; i < 3; ++i) prims.push_back(Stroke({{0, 0}, {40, 0}, {40, 5}, {0, 5}}));
    // Two points only
    for (int32_t i = 0; i < 3; ++i) prims.push_back(Stroke({{0, 0}, {100, 0}}));
    EXPECT_FALSE(HasArchitecturalElements(prims));
}

// ============================================================================
// Analysis
// ============================================================================

TEST(DirectionalAnalysisTest, FlatImageBaseline) {
    DirectionalAnalysis a = AnalyzeDirections(Flat(128), SIZE, SIZE, {});
    EXPECT_EQ(a.strongGradients, 0u);
    EXPECT_FALSE(a.hasDiagonalContent);
    EXPECT_FALSE(a.lighting.has_value());
    EXPECT_DOUBLE_EQ(a.Benefit(PassDirection::Standard), 1.0);
    EXPECT_DOUBLE_EQ(a.Benefit(PassDirection::Reverse), 0.4);
    EXPECT_DOUBLE_EQ(a.Benefit(PassDirection::DiagonalNW), 0.3);
    EXPECT_DOUBLE_EQ(a.Benefit(PassDirection::DiagonalNE), 0.3);
}

TEST(DirectionalAnalysisTest, ArchitectureBoostsDiagonals) {
    DirectionalAnalysis a = AnalyzeDirections(Flat(128), SIZE, SIZE, StraightStrokes(4));
    EXPECT_TRUE(a.hasArchitecturalElements);
    EXPECT_NEAR(a.Benefit(PassDirection::DiagonalNW), 0.36, 1e-9);
    EXPECT_NEAR(a.Benefit(PassDirection::DiagonalNE), 0.36, 1e-9);
}

TEST(DirectionalAnalysisTest, LightingRaisesReverseBenefit) {
    DirectionalAnalysis a = AnalyzeDirections(Ramp(true, true), SIZE, SIZE, {});
    ASSERT_TRUE(a.lighting.has_value());
    EXPECT_GT(a.Benefit(PassDirection::Reverse), 0.4 * 0.7);
}

TEST(DirectionalAnalysisTest, SlantedStripesAreDiagonal) {
    DirectionalAnalysis a = AnalyzeDirections(SlantedStripes(), SIZE, SIZE, {});
    EXPECT_GT(a.strongGradients, 100u);
    EXPECT_TRUE(a.hasDiagonalContent);
    // Two opposite bins dominate
    EXPECT_GT(a.textureDirectionality, 0.6);
    EXPECT_NEAR(a.Benefit(PassDirection::DiagonalNW), 0.9 * 0.7, 1e-9);
    EXPECT_GT(a.Benefit(PassDirection::DiagonalNW), a.Benefit(PassDirection::Reverse));
    EXPECT_DOUBLE_EQ(a.Benefit(PassDirection::Standard), 1.0);
}

// ============================================================================
// Scheduling
// ============================================================================

class ScheduleTest : public ::testing::Test {
protected:
    void SetUp() override {
        analysis_.benefits = {{1.0, 0.8, 0.9, 0.9}};
        config_.reversePass = true;
        config_.diagonalPass = true;
        config_.directionalStrengthThreshold = 0.3;
    }

    DirectionalAnalysis analysis_;
    TraceConfig config_;
    const double unlimited_ = std::numeric_limits<double>::infinity();
};

TEST_F(ScheduleTest, BestFirst) {
    auto passes = ScheduleDirectionalPasses(analysis_, config_, unlimited_);
    ASSERT_EQ(passes.size(), 3u);
    EXPECT_EQ(passes[0], PassDirection::DiagonalNW);
    EXPECT_EQ(passes[1], PassDirection::DiagonalNE);
    EXPECT_EQ(passes[2], PassDirection::Reverse);
}

TEST_F(ScheduleTest, ThresholdFilters) {
    config_.directionalStrengthThreshold = 0.85;
    auto passes = ScheduleDirectionalPasses(analysis_, config_, unlimited_);
    ASSERT_EQ(passes.size(), 2u);
    EXPECT_EQ(passes[0], PassDirection::DiagonalNW);
}

TEST_F(ScheduleTest, DisabledPassesNeverRun) {
    config_.diagonalPass = false;
    auto passes = ScheduleDirectionalPasses(analysis_, config_, unlimited_);
    ASSERT_EQ(passes.size(), 1u);
    EXPECT_EQ(passes[0], PassDirection::Reverse);

    config_.reversePass = false;
    EXPECT_TRUE(ScheduleDirectionalPasses(analysis_, config_, unlimited_).empty());
}

TEST_F(ScheduleTest, BudgetLimitsPassCount) {
    EXPECT_EQ(ScheduleDirectionalPasses(analysis_, config_, 1000.0).size(), 3u);
    EXPECT_EQ(ScheduleDirectionalPasses(analysis_, config_, 100.0).size(), 2u);
    EXPECT_TRUE(ScheduleDirectionalPasses(analysis_, config_, 40.0).empty());
    EXPECT_TRUE(ScheduleDirectionalPasses(analysis_, config_, 0.0).empty());
}
