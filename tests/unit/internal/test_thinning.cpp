/**
 * @file test_thinning.cpp
 * @brief Unit tests for Internal/Thinning.h, Internal/DistanceTransform.h and Internal/Morphology.h
 */

#include <VxTrace/Internal/Thinning.h>
#include <VxTrace/Internal/DistanceTransform.h>
#include <VxTrace/Internal/Morphology.h>
#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace Vx::Trace;
using namespace Vx::Trace::Internal;

namespace {

BinaryMap MakeBar(int32_t w, int32_t h, int32_t x0, int32_t x1, int32_t y0, int32_t y1) {
    BinaryMap map(w, h);
    for (int32_t y = y0; y <= y1; ++y)
        for (int32_t x = x0; x <= x1; ++x)
            map.Set(x, y, true);
    return map;
}

BinaryMap MakeRing(int32_t size, double cx, double cy, double rIn, double rOut) {
    BinaryMap map(size, size);
    for (int32_t y = 0; y < size; ++y) {
        for (int32_t x = 0; x < size; ++x) {
            double r = std::hypot(x - cx, y - cy);
            if (r >= rIn && r <= rOut) map.Set(x, y, true);
        }
    }
    return map;
}

// 8-connected component count
int32_t CountComponents(const BinaryMap& map) {
    std::vector<uint8_t> seen(map.data.size(), 0);
    int32_t components = 0;
    std::vector<int32_t> stack;
    for (int32_t y = 0; y < map.height; ++y) {
        for (int32_t x = 0; x < map.width; ++x) {
            size_t idx = static_cast<size_t>(y) * map.width + x;
            if (!map.At(x, y) || seen[idx]) continue;
            ++components;
            seen[idx] = 1;
            stack.push_back(static_cast<int32_t>(idx));
            while (!stack.empty()) {
                int32_t cur = stack.back();
                stack.pop_back();
                int32_t cx = cur % map.width;
                int32_t cy = cur / map.width;
                for (int32_t dy = -1; dy <= 1; ++dy) {
                    for (int32_t dx = -1; dx <= 1; ++dx) {
                        int32_t nx = cx + dx, ny = cy + dy;
                        if (nx < 0 || ny < 0 || nx >= map.width || ny >= map.height) continue;
                        size_t nidx = static_cast<size_t>(ny) * map.width + nx;
                        if (map.At(nx, ny) && !seen[nidx]) {
                            seen[nidx] = 1;
                            stack.push_back(static_cast<int32_t>(nidx));
                        }
                    }
                }
            }
        }
    }
    return components;
}

} // namespace

// ============================================================================
// Guo-Hall
// ============================================================================

TEST(ThinningTest, BarThinsToSingleLine) {
    BinaryMap map = MakeBar(50, 25, 5, 44, 10, 14);
    GuoHallThin(map);

    for (int32_t x = 10; x <= 39; ++x) {
        int32_t count = 0;
        for (int32_t y = 0; y < map.height; ++y) {
            if (map.At(x, y)) {
                ++count;
                EXPECT_GE(y, 10);
                EXPECT_LE(y, 14);
            }
        }
        EXPECT_EQ(count, 1) << "column " << x;
    }
    EXPECT_EQ(CountComponents(map), 1);
}

TEST(ThinningTest, RingKeepsLoop) {
    BinaryMap map = MakeRing(60, 30.0, 30.0, 12.0, 17.0);
    GuoHallThin(map);

    EXPECT_EQ(CountComponents(map), 1);
    EXPECT_FALSE(map.At(30, 30));
    EXPECT_LT(map.CountSet(), 200u);

    // The loop still crosses every axis ray from the centre
    const int32_t dirs[4][2] = {{1, 0}, {-1, 0}, {0, 1}, {0, -1}};
    for (const auto& d : dirs) {
        bool hit = false;
        for (int32_t r = 11; r <= 18 && !hit; ++r) {
            hit = map.At(30 + d[0] * r, 30 + d[1] * r);
        }
        EXPECT_TRUE(hit);
    }
}

TEST(ThinningTest, SinglePixelSurvives) {
    BinaryMap map(5, 5);
    map.Set(2, 2, true);
    GuoHallThin(map);
    EXPECT_EQ(map.CountSet(), 1u);
}

TEST(ThinningTest, ConnectivityNumber) {
    BinaryMap line = MakeBar(5, 3, 0, 4, 1, 1);
    EXPECT_EQ(ConnectivityNumber8(line, 2, 1), 2);   // interior of a line
    EXPECT_EQ(ConnectivityNumber8(line, 0, 1), 1);   // endpoint
    EXPECT_EQ(CountNeighbors8(line, 2, 1), 2);
    EXPECT_EQ(CountNeighbors8(line, 0, 1), 1);
}

// ============================================================================
// Distance-ordered thinning
// ============================================================================

TEST(ThinningTest, DistanceOrderedKeepsMedialAxis) {
    BinaryMap map = MakeBar(50, 25, 5, 44, 8, 16);
    std::vector<float> dist = DistanceTransformL2(map);
    DistanceOrderedThin(map, dist);

    EXPECT_EQ(CountComponents(map), 1);
    for (int32_t x = 14; x <= 35; ++x) {
        int32_t count = 0;
        for (int32_t y = 0; y < map.height; ++y) {
            if (map.At(x, y)) {
                ++count;
                EXPECT_NEAR(y, 12, 1);
            }
        }
        EXPECT_EQ(count, 1) << "column " << x;
    }
}

TEST(ThinningTest, DistanceOrderedPeelsBothSidesEvenly) {
    // Horizontal and vertical 9-pixel bars: the skeleton sits on the middle row or column
    BinaryMap horizontal = MakeBar(120, 60, 10, 109, 26, 34);
    DistanceOrderedThin(horizontal, DistanceTransformL2(horizontal));
    for (int32_t x = 20; x <= 99; ++x) {
        for (int32_t y = 0; y < horizontal.height; ++y) {
            if (horizontal.At(x, y)) EXPECT_EQ(y, 30) << "column " << x;
        }
        EXPECT_TRUE(horizontal.At(x, 30)) << "column " << x;
    }

    BinaryMap vertical = MakeBar(60, 120, 26, 34, 10, 109);
    DistanceOrderedThin(vertical, DistanceTransformL2(vertical));
    for (int32_t y = 20; y <= 99; ++y) {
        for (int32_t x = 0; x < vertical.width; ++x) {
            if (vertical.At(x, y)) EXPECT_EQ(x, 30) << "row " << y;
        }
        EXPECT_TRUE(vertical.At(30, y)) << "row " << y;
    }
}

TEST(ThinningTest, DistanceOrderedKeepsLoop) {
    BinaryMap map = MakeRing(80, 40.0, 40.0, 16.0, 24.0);
    DistanceOrderedThin(map, DistanceTransformL2(map));

    EXPECT_EQ(CountComponents(map), 1);
    // Circumference of the medial circle is about 126 pixels
    EXPECT_GT(map.CountSet(), 90u);
    for (int32_t y = 0; y < map.height; ++y) {
        for (int32_t x = 0; x < map.width; ++x) {
            if (map.At(x, y)) {
                EXPECT_NEAR(std::hypot(x - 40.0, y - 40.0), 20.0, 2.5);
            }
        }
    }
}

// ============================================================================
// Distance transform
// ============================================================================

TEST(DistanceTransformTest, DistanceToNearestBackground) {
    BinaryMap map = MakeBar(21, 21, 5, 15, 5, 15);
    std::vector<float> dist = DistanceTransformL2(map);

    EXPECT_FLOAT_EQ(dist[0], 0.0f);
    EXPECT_FLOAT_EQ(dist[5 * 21 + 5], 1.0f);
    EXPECT_FLOAT_EQ(dist[10 * 21 + 10], 6.0f);
    EXPECT_FLOAT_EQ(dist[10 * 21 + 7], 3.0f);
}

TEST(DistanceTransformTest, ExactEuclideanOnDiagonal) {
    BinaryMap map(41, 41, 255);
    map.Set(20, 20, false);
    std::vector<float> dist = DistanceTransformL2(map);
    EXPECT_NEAR(dist[24 * 41 + 23], 5.0f, 1e-5f);
    EXPECT_NEAR(dist[21 * 41 + 21], std::sqrt(2.0f), 1e-5f);
}

TEST(DistanceTransformTest, BorderCountsAsBackground) {
    BinaryMap map(9, 9, 255);
    std::vector<float> dist = DistanceTransformL2(map);
    EXPECT_FLOAT_EQ(dist[0], 1.0f);
    EXPECT_FLOAT_EQ(dist[4 * 9 + 4], 5.0f);
}

// ============================================================================
// Morphology
// ============================================================================

TEST(MorphologyTest, OpenRemovesSpecks) {
    BinaryMap map = MakeBar(20, 20, 5, 14, 5, 14);
    map.Set(1, 1, true);
    BinaryMap opened = Open3x3(map);
    EXPECT_FALSE(opened.At(1, 1));
    EXPECT_TRUE(opened.At(10, 10));
    EXPECT_EQ(opened.CountSet(), 100u);
}

TEST(MorphologyTest, CloseFillsPinholes) {
    BinaryMap map = MakeBar(20, 20, 5, 14, 5, 14);
    map.Set(9, 9, false);
    BinaryMap closed = Close3x3(map);
    EXPECT_TRUE(closed.At(9, 9));
}

TEST(MorphologyTest, RemoveSmallComponents) {
    BinaryMap map = MakeBar(30, 30, 2, 12, 2, 12);
    map.Set(25, 25, true);
    map.Set(26, 25, true);
    int32_t removed = RemoveSmallComponents(map, 5);
    EXPECT_EQ(removed, 1);
    EXPECT_FALSE(map.At(25, 25));
    EXPECT_TRUE(map.At(5, 5));
}
