/**
 * @file test_background.cpp
 * @brief Unit tests for Preprocess/Background.h
 */

#include <VxTrace/Preprocess/Background.h>
#include <VxTrace/Platform/Thread.h>
#include <gtest/gtest.h>

#include <string>

using namespace Vx::Trace;
using namespace Vx::Trace::Preprocess;

namespace {

// Flat background with a square of another colour in the middle
VImage MakeFramedSquare(int32_t size, const Color& background, const Color& square,
                        int32_t x0, int32_t x1) {
    VImage image(size, size, ChannelType::RGB);
    for (int32_t y = 0; y < size; ++y) {
        for (int32_t x = 0; x < size; ++x) {
            const bool inside = x >= x0 && x <= x1 && y >= x0 && y <= x1;
            image.SetPixelColor(x, y, inside ? square : background);
        }
    }
    return image;
}

} // namespace

class BackgroundTest : public ::testing::Test {
protected:
    BackgroundOptions options_;
};

// ============================================================================
// Estimation
// ============================================================================

TEST_F(BackgroundTest, EstimateFindsBorderColour) {
    VImage image = MakeFramedSquare(100, Color(255, 255, 255), Color(220, 30, 30), 30, 69);
    BackgroundEstimate est = EstimateBackground(image, 0.1);

    ASSERT_EQ(est.colors.size(), 1u);
    EXPECT_NEAR(est.colors[0].L, 100.0, 0.5);
    EXPECT_DOUBLE_EQ(est.weights[0], 1.0);
    EXPECT_NEAR(est.borderLuminance, 255.0, 1e-6);
    EXPECT_GT(est.samples, 0u);
}

TEST_F(BackgroundTest, EstimateOrdersByFrequency) {
    // Top band grey, the rest of the border white
    VImage image = MakeFramedSquare(100, Color(255, 255, 255), Color(0, 0, 0), 40, 59);
    for (int32_t y = 0; y < 10; ++y)
        for (int32_t x = 0; x < 100; ++x)
            image.SetPixelColor(x, y, Color(128, 128, 128));

    BackgroundEstimate est = EstimateBackground(image, 0.1);
    ASSERT_GE(est.colors.size(), 2u);
    EXPECT_GT(est.weights[0], est.weights[1]);
    EXPECT_GT(est.colors[0].L, est.colors[1].L);
}

TEST_F(BackgroundTest, EstimateOfEmptyImage) {
    BackgroundEstimate est = EstimateBackground(VImage(), 0.1);
    EXPECT_TRUE(est.colors.empty());
    EXPECT_EQ(est.samples, 0u);
}

// ============================================================================
// Masks
// ============================================================================

TEST_F(BackgroundTest, AutoMaskSeparatesColours) {
    VImage image = MakeFramedSquare(100, Color(255, 255, 255), Color(220, 30, 30), 30, 69);
    BinaryMap mask = DetectBackgroundMask(image, options_);
    EXPECT_TRUE(mask.At(5, 5));
    EXPECT_TRUE(mask.At(95, 50));
    EXPECT_FALSE(mask.At(50, 50));
    EXPECT_EQ(mask.CountSet(), 100u * 100u - 40u * 40u);
}

TEST_F(BackgroundTest, OtsuMaskFollowsBorderSide) {
    // Dark page, light square: the dark side is background
    VImage image = MakeFramedSquare(80, Color(30, 30, 30), Color(240, 240, 240), 20, 59);
    options_.algorithm = BackgroundAlgorithm::Otsu;
    BinaryMap mask = DetectBackgroundMask(image, options_);
    EXPECT_TRUE(mask.At(2, 2));
    EXPECT_FALSE(mask.At(40, 40));
}

TEST_F(BackgroundTest, AdaptiveMaskKeepsInk) {
    VImage image = MakeFramedSquare(80, Color(230, 230, 230), Color(230, 230, 230), 0, -1);
    for (int32_t y = 38; y <= 41; ++y)
        for (int32_t x = 10; x < 70; ++x)
            image.SetPixelColor(x, y, Color(20, 20, 20));

    options_.algorithm = BackgroundAlgorithm::Adaptive;
    Platform::ThreadPool pool(2);
    BinaryMap mask = DetectBackgroundMask(image, options_, &pool);
    EXPECT_TRUE(mask.At(40, 10));
    EXPECT_FALSE(mask.At(40, 39));
}

// ============================================================================
// Removal
// ============================================================================

TEST_F(BackgroundTest, RemovalBlendsTowardWhite) {
    VImage image = MakeFramedSquare(100, Color(200, 200, 200), Color(40, 40, 40), 30, 69);
    options_.strength = 1.0;
    BackgroundResult result = RemoveBackground(image, options_);

    ASSERT_TRUE(result.applied);
    EXPECT_TRUE(result.diagnostic.empty());
    EXPECT_NEAR(result.coverage, 0.84, 1e-9);
    EXPECT_FALSE(result.coversImage);
    EXPECT_EQ(result.image.PixelColor(5, 5), Color(255, 255, 255));
    EXPECT_EQ(result.image.PixelColor(50, 50), Color(40, 40, 40));
    // The input is never modified
    EXPECT_EQ(image.PixelColor(5, 5), Color(200, 200, 200));
}

TEST_F(BackgroundTest, HalfStrengthBlend) {
    VImage image = MakeFramedSquare(60, Color(100, 100, 100), Color(0, 0, 0), 20, 39);
    options_.strength = 0.5;
    BackgroundResult result = RemoveBackground(image, options_);
    ASSERT_TRUE(result.applied);
    const Color c = result.image.PixelColor(1, 1);
    EXPECT_NEAR(c.r, 178, 1);
}

TEST_F(BackgroundTest, FullCoverageFallsBack) {
    VImage image(64, 64, ChannelType::RGB);
    for (int32_t y = 0; y < 64; ++y)
        for (int32_t x = 0; x < 64; ++x)
            image.SetPixelColor(x, y, Color(90, 160, 200));

    BackgroundResult result = RemoveBackground(image, options_);
    EXPECT_FALSE(result.applied);
    EXPECT_TRUE(result.coversImage);
    EXPECT_DOUBLE_EQ(result.coverage, 1.0);
    EXPECT_EQ(result.diagnostic, "background covers entire image");
    EXPECT_TRUE(result.mask.Empty());
    EXPECT_EQ(result.image.PixelColor(10, 10), Color(90, 160, 200));
}

TEST_F(BackgroundTest, OptionsFromConfig) {
    BackgroundConfig config;
    config.algorithm = BackgroundAlgorithm::Otsu;
    config.tolerance = 0.25;
    config.strength = 0.9;
    config.maxCoverage = 0.9;
    config.sampleRatio = 0.05;

    BackgroundOptions opts = BackgroundOptions::FromConfig(config);
    EXPECT_EQ(opts.algorithm, BackgroundAlgorithm::Otsu);
    EXPECT_DOUBLE_EQ(opts.tolerance, 0.25);
    EXPECT_DOUBLE_EQ(opts.strength, 0.9);
    EXPECT_DOUBLE_EQ(opts.maxCoverage, 0.9);
    EXPECT_DOUBLE_EQ(opts.sampleRatio, 0.05);
}
