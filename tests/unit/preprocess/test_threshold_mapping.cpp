/**
 * @file test_threshold_mapping.cpp
 * @brief Unit tests for Preprocess/ThresholdMapping.h
 */

#include <VxTrace/Preprocess/ThresholdMapping.h>
#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace Vx::Trace;
using namespace Vx::Trace::Preprocess;

TEST(ThresholdMappingTest, HigherDetailLowersThresholds) {
    ThresholdMapping sparse = ThresholdMapping::FromDetail(0.1, 800, 600);
    ThresholdMapping dense = ThresholdMapping::FromDetail(0.9, 800, 600);

    EXPECT_GT(sparse.cannyHighRatio, dense.cannyHighRatio);
    EXPECT_GT(sparse.cannyLowRatio, dense.cannyLowRatio);
    EXPECT_GT(sparse.minStrokeLengthPx, dense.minStrokeLengthPx);
    EXPECT_GT(sparse.dpEpsilonPx, dense.dpEpsilonPx);
    EXPECT_LT(sparse.minCenterlineBranchPx, dense.minCenterlineBranchPx);
}

TEST(ThresholdMappingTest, EndpointValues) {
    ThresholdMapping m0 = ThresholdMapping::FromDetail(0.0, 300, 400);
    EXPECT_DOUBLE_EQ(m0.imageDiagonalPx, 500.0);
    EXPECT_NEAR(m0.dpEpsilonPx, 0.015 * 500.0, 1e-9);
    EXPECT_DOUBLE_EQ(m0.minStrokeLengthPx, 50.0);
    EXPECT_DOUBLE_EQ(m0.cannyHighRatio, 0.5);
    EXPECT_DOUBLE_EQ(m0.cannyLowRatio, 0.2);
    EXPECT_DOUBLE_EQ(m0.minCenterlineBranchPx, 12.0);

    ThresholdMapping m1 = ThresholdMapping::FromDetail(1.0, 300, 400);
    EXPECT_NEAR(m1.dpEpsilonPx, 0.003 * 500.0, 1e-9);
    EXPECT_DOUBLE_EQ(m1.minStrokeLengthPx, 10.0);
    EXPECT_DOUBLE_EQ(m1.cannyHighRatio, 0.1);
    EXPECT_DOUBLE_EQ(m1.minCenterlineBranchPx, 48.0);
    EXPECT_DOUBLE_EQ(m1.slicCellSizePx, 3000.0);
}

TEST(ThresholdMappingTest, InputsAreClamped) {
    ThresholdMapping low = ThresholdMapping::FromDetail(-2.0, 0, -5);
    ThresholdMapping zero = ThresholdMapping::FromDetail(0.0, 1, 1);
    EXPECT_DOUBLE_EQ(low.cannyHighRatio, zero.cannyHighRatio);
    EXPECT_DOUBLE_EQ(low.imageDiagonalPx, zero.imageDiagonalPx);
    EXPECT_GT(low.dpEpsilonPx, 0.0);

    ThresholdMapping high = ThresholdMapping::FromDetail(7.0, 100, 100);
    ThresholdMapping one = ThresholdMapping::FromDetail(1.0, 100, 100);
    EXPECT_DOUBLE_EQ(high.minStrokeLengthPx, one.minStrokeLengthPx);
}

// ============================================================================
// Binarization
// ============================================================================

TEST(BinarizeInkTest, OtsuMarksDarkInk) {
    const int32_t w = 40, h = 20;
    std::vector<uint8_t> gray(w * h, 240);
    for (int32_t x = 5; x < 35; ++x) gray[10 * w + x] = 15;

    BinaryMap ink = BinarizeInk(gray, w, h, BinarizeMethod::Otsu, 15, 0.4);
    EXPECT_EQ(ink.CountSet(), 30u);
    EXPECT_TRUE(ink.At(20, 10));
}

TEST(BinarizeInkTest, SauvolaForcesOddWindow) {
    const int32_t w = 40, h = 20;
    std::vector<uint8_t> gray(w * h, 240);
    for (int32_t x = 5; x < 35; ++x) gray[10 * w + x] = 15;

    BinaryMap even = BinarizeInk(gray, w, h, BinarizeMethod::Sauvola, 14, 0.4);
    BinaryMap odd = BinarizeInk(gray, w, h, BinarizeMethod::Sauvola, 15, 0.4);
    EXPECT_EQ(even.data, odd.data);
    EXPECT_TRUE(odd.At(20, 10));
    EXPECT_FALSE(odd.At(20, 3));
}

TEST(BinarizeInkTest, EmptyInput) {
    EXPECT_TRUE(BinarizeInk({}, 0, 0, BinarizeMethod::Otsu, 15, 0.4).Empty());
}

TEST(ThresholdResponseTest, InclusiveThreshold) {
    std::vector<float> response{0.1f, 0.5f, 0.49f, 0.9f};
    BinaryMap map = ThresholdResponse(response, 2, 2, 0.5f);
    EXPECT_FALSE(map.At(0, 0));
    EXPECT_TRUE(map.At(1, 0));
    EXPECT_FALSE(map.At(0, 1));
    EXPECT_TRUE(map.At(1, 1));
}
