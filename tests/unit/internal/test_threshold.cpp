/**
 * @file test_threshold.cpp
 * @brief Unit tests for Internal/Threshold.h
 */

#include <VxTrace/Internal/Threshold.h>
#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace Vx::Trace;
using namespace Vx::Trace::Internal;

class ThresholdTest : public ::testing::Test {
protected:
    static std::vector<uint8_t> Bimodal(size_t n, uint8_t dark, uint8_t light) {
        std::vector<uint8_t> data(n);
        for (size_t i = 0; i < n; ++i) data[i] = (i % 2 == 0) ? dark : light;
        return data;
    }
};

// ============================================================================
// Otsu
// ============================================================================

TEST_F(ThresholdTest, HistogramCounts) {
    std::vector<uint8_t> data{0, 0, 5, 255};
    auto hist = ComputeHistogram(data.data(), data.size());
    ASSERT_EQ(hist.size(), 256u);
    EXPECT_EQ(hist[0], 2u);
    EXPECT_EQ(hist[5], 1u);
    EXPECT_EQ(hist[255], 1u);
}

TEST_F(ThresholdTest, OtsuSplitsBimodal) {
    auto data = Bimodal(1000, 40, 200);
    int32_t t = OtsuThreshold(data.data(), data.size());
    EXPECT_GE(t, 40);
    EXPECT_LT(t, 200);
}

TEST_F(ThresholdTest, OtsuOfEmptyHistogramIsMidGray) {
    std::vector<uint64_t> hist(256, 0);
    EXPECT_EQ(OtsuThreshold(hist), 128);
}

TEST_F(ThresholdTest, GlobalMarksDarkAsInk) {
    std::vector<uint8_t> gray{10, 100, 101, 250};
    BinaryMap map = ThresholdGlobal(gray.data(), 4, 1, 100);
    EXPECT_TRUE(map.At(0, 0));
    EXPECT_TRUE(map.At(1, 0));
    EXPECT_FALSE(map.At(2, 0));
    EXPECT_FALSE(map.At(3, 0));
}

// ============================================================================
// Local statistics / Sauvola
// ============================================================================

TEST_F(ThresholdTest, LocalMeanStdOfConstantImage) {
    const int32_t w = 20, h = 10;
    std::vector<uint8_t> gray(w * h, 77);
    std::vector<float> mean(w * h), stddev(w * h);
    LocalMeanStd(gray.data(), w, h, 5, mean.data(), stddev.data());
    for (size_t i = 0; i < gray.size(); ++i) {
        EXPECT_NEAR(mean[i], 77.0f, 1e-4f);
        EXPECT_NEAR(stddev[i], 0.0f, 1e-3f);
    }
}

TEST_F(ThresholdTest, LocalMeanStdOfCheckerboard) {
    const int32_t w = 16, h = 16;
    std::vector<uint8_t> gray(w * h);
    for (int32_t y = 0; y < h; ++y)
        for (int32_t x = 0; x < w; ++x)
            gray[y * w + x] = ((x + y) % 2 == 0) ? 0 : 200;

    std::vector<float> mean(w * h), stddev(w * h);
    LocalMeanStd(gray.data(), w, h, 3, mean.data(), stddev.data());
    // Interior 3x3 window holds 5 of one value and 4 of the other
    const size_t idx = 8 * w + 8;
    EXPECT_NEAR(mean[idx], 800.0f / 9.0f, 1e-3f);
    EXPECT_NEAR(stddev[idx], 200.0f * std::sqrt(20.0f) / 9.0f, 1e-2f);
}

TEST_F(ThresholdTest, SauvolaIgnoresBlankPage) {
    const int32_t w = 40, h = 40;
    std::vector<uint8_t> gray(w * h, 255);
    BinaryMap map = ThresholdSauvola(gray.data(), w, h, 15, DEFAULT_SAUVOLA_K);
    EXPECT_EQ(map.CountSet(), 0u);
}

TEST_F(ThresholdTest, SauvolaFindsStrokeUnderGradientLighting) {
    const int32_t w = 80, h = 40;
    std::vector<uint8_t> gray(w * h);
    for (int32_t y = 0; y < h; ++y) {
        for (int32_t x = 0; x < w; ++x) {
            // Paper brightness falls from 250 to 130 across the page
            gray[y * w + x] = static_cast<uint8_t>(250 - (120 * x) / (w - 1));
        }
    }
    for (int32_t x = 5; x < 75; ++x) {
        gray[20 * w + x] = static_cast<uint8_t>(gray[20 * w + x] / 4);
        gray[21 * w + x] = static_cast<uint8_t>(gray[21 * w + x] / 4);
    }

    BinaryMap map = ThresholdSauvola(gray.data(), w, h, 15, DEFAULT_SAUVOLA_K);
    for (int32_t x = 10; x < 70; ++x) {
        EXPECT_TRUE(map.At(x, 20)) << "x " << x;
        EXPECT_FALSE(map.At(x, 5)) << "x " << x;
    }
}
