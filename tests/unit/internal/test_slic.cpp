/**
 * @file test_slic.cpp
 * @brief Unit tests for Internal/Slic.h
 */

#include <VxTrace/Internal/Slic.h>
#include <VxTrace/Platform/Random.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <numeric>
#include <set>
#include <vector>

using namespace Vx::Trace;
using namespace Vx::Trace::Internal;

namespace {

// Number of 4-connected components carrying label
int32_t ComponentsOfLabel(const LabelMap& map, int32_t label) {
    std::vector<uint8_t> seen(map.labels.size(), 0);
    int32_t count = 0;
    std::vector<int32_t> stack;
    for (int32_t i = 0; i < static_cast<int32_t>(map.labels.size()); ++i) {
        if (map.labels[i] != label || seen[i]) continue;
        ++count;
        seen[i] = 1;
        stack.assign(1, i);
        while (!stack.empty()) {
            int32_t cur = stack.back();
            stack.pop_back();
            int32_t x = cur % map.width, y = cur / map.width;
            const int32_t nb[4][2] = {{x + 1, y}, {x - 1, y}, {x, y + 1}, {x, y - 1}};
            for (const auto& n : nb) {
                if (n[0] < 0 || n[1] < 0 || n[0] >= map.width || n[1] >= map.height) continue;
                int32_t idx = n[1] * map.width + n[0];
                if (map.labels[idx] == label && !seen[idx]) {
                    seen[idx] = 1;
                    stack.push_back(idx);
                }
            }
        }
    }
    return count;
}

VImage MakeNoisyImage(int32_t w, int32_t h, uint64_t seed) {
    VImage image(w, h, ChannelType::RGB);
    Platform::Random rng(seed);
    for (int32_t y = 0; y < h; ++y) {
        for (int32_t x = 0; x < w; ++x) {
            image.SetPixelColor(x, y, Color(static_cast<uint8_t>(rng.Int(0, 255)),
                                            static_cast<uint8_t>((x * 255) / w),
                                            static_cast<uint8_t>((y * 255) / h)));
        }
    }
    return image;
}

} // namespace

// ============================================================================
// Seeds
// ============================================================================

TEST(SlicSeedTest, NeverMoreThanRequested) {
    for (SeedPattern pattern : {SeedPattern::Square, SeedPattern::Hexagonal, SeedPattern::Poisson}) {
        for (int32_t count : {1, 7, 50, 150}) {
            auto seeds = GenerateSeeds(200, 120, count, pattern, 42);
            EXPECT_GE(seeds.size(), 1u);
            EXPECT_LE(static_cast<int32_t>(seeds.size()), count);
            for (const auto& s : seeds) {
                EXPECT_GE(s.x, 0.0);
                EXPECT_GE(s.y, 0.0);
                EXPECT_LE(s.x, 200.0);
                EXPECT_LE(s.y, 120.0);
            }
        }
    }
}

TEST(SlicSeedTest, SquareGridLayout) {
    auto seeds = GenerateSeeds(100, 100, 4, SeedPattern::Square, 0);
    ASSERT_EQ(seeds.size(), 4u);
    EXPECT_DOUBLE_EQ(seeds[0].x, 25.0);
    EXPECT_DOUBLE_EQ(seeds[0].y, 25.0);
    EXPECT_DOUBLE_EQ(seeds[3].x, 75.0);
    EXPECT_DOUBLE_EQ(seeds[3].y, 75.0);
}

TEST(SlicSeedTest, PoissonIsDeterministic) {
    auto a = GenerateSeeds(160, 90, 40, SeedPattern::Poisson, 7);
    auto b = GenerateSeeds(160, 90, 40, SeedPattern::Poisson, 7);
    EXPECT_EQ(a, b);
}

TEST(SlicSeedTest, EmptyRaster) {
    EXPECT_TRUE(GenerateSeeds(0, 10, 5, SeedPattern::Square, 0).empty());
}

// ============================================================================
// SLIC
// ============================================================================

TEST(SlicTest, LabelsAreConnectedAndBounded) {
    VImage image = MakeNoisyImage(200, 200, 3);
    SlicParams params;
    params.numSuperpixels = 50;

    SlicResult result = ComputeSlic(image, params);
    const int32_t n = result.labels.numLabels;
    ASSERT_GE(n, 1);
    EXPECT_LE(n, 50);
    EXPECT_LE(result.seedCount, 50);

    ASSERT_EQ(result.area.size(), static_cast<size_t>(n));
    ASSERT_EQ(result.meanColor.size(), static_cast<size_t>(n));
    ASSERT_EQ(result.meanLab.size(), static_cast<size_t>(n));
    EXPECT_EQ(std::accumulate(result.area.begin(), result.area.end(), 0), 200 * 200);

    for (int32_t v : result.labels.labels) {
        ASSERT_GE(v, 0);
        ASSERT_LT(v, n);
    }
    for (int32_t label = 0; label < n; ++label) {
        EXPECT_EQ(ComponentsOfLabel(result.labels, label), 1) << "label " << label;
    }
}

TEST(SlicTest, RegionsFollowColourBoundary) {
    VImage image(100, 100, ChannelType::RGB);
    for (int32_t y = 0; y < 100; ++y)
        for (int32_t x = 0; x < 100; ++x)
            image.SetPixelColor(x, y, x < 50 ? Color(230, 20, 20) : Color(20, 20, 230));

    SlicParams params;
    params.numSuperpixels = 4;
    params.pattern = SeedPattern::Square;
    SlicResult result = ComputeSlic(image, params);

    const Color left = result.meanColor[result.labels.At(10, 50)];
    const Color right = result.meanColor[result.labels.At(90, 50)];
    EXPECT_GT(left.r, 200);
    EXPECT_LT(left.b, 50);
    EXPECT_GT(right.b, 200);
    EXPECT_LT(right.r, 50);
}

TEST(SlicTest, ParallelMatchesSerial) {
    VImage image = MakeNoisyImage(120, 90, 11);
    SlicParams params;
    params.numSuperpixels = 30;
    Platform::ThreadPool pool(4);

    SlicResult serial = ComputeSlic(image, params);
    SlicResult parallel = ComputeSlic(image, params, &pool);
    EXPECT_EQ(serial.labels.labels, parallel.labels.labels);
}

TEST(SlicTest, EmptyImage) {
    SlicResult result = ComputeSlic(VImage(), SlicParams());
    EXPECT_EQ(result.labels.numLabels, 0);
    EXPECT_TRUE(result.area.empty());
}

// ============================================================================
// Connectivity
// ============================================================================

TEST(EnforceConnectivityTest, SplitLabelIsMerged) {
    // Label 0 left and right, label 1 in the middle column band
    LabelMap map(30, 10);
    for (int32_t y = 0; y < 10; ++y)
        for (int32_t x = 0; x < 30; ++x)
            map.labels[y * 30 + x] = (x >= 10 && x < 20) ? 1 : 0;
    map.numLabels = 2;

    int32_t n = EnforceConnectivity(map, 1);
    EXPECT_LE(n, 2);
    for (int32_t label = 0; label < n; ++label) {
        EXPECT_EQ(ComponentsOfLabel(map, label), 1);
    }
}

TEST(EnforceConnectivityTest, TinyFragmentsAbsorbed) {
    LabelMap map(20, 20);
    std::fill(map.labels.begin(), map.labels.end(), 0);
    map.labels[5 * 20 + 5] = 1;
    map.labels[15 * 20 + 15] = 2;
    map.numLabels = 3;

    int32_t n = EnforceConnectivity(map, 4);
    EXPECT_EQ(n, 1);
    EXPECT_EQ(map.At(5, 5), 0);
    EXPECT_EQ(map.At(15, 15), 0);
}
