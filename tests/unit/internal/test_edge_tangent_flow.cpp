/**
 * @file test_edge_tangent_flow.cpp
 * @brief Unit tests for Internal/EdgeTangentFlow.h
 */

#include <VxTrace/Internal/EdgeTangentFlow.h>
#include <VxTrace/Internal/Canny.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <vector>

using namespace Vx::Trace;
using namespace Vx::Trace::Internal;

namespace {

std::vector<float> MakeVerticalStep(int32_t w, int32_t h, int32_t edgeX) {
    std::vector<float> img(static_cast<size_t>(w) * h, 0.0f);
    for (int32_t y = 0; y < h; ++y) {
        for (int32_t x = edgeX; x < w; ++x) {
            img[static_cast<size_t>(y) * w + x] = 255.0f;
        }
    }
    return img;
}

} // namespace

class EdgeTangentFlowTest : public ::testing::Test {
protected:
    EtfParams etf_;
    FdogParams fdog_;
};

TEST_F(EdgeTangentFlowTest, TangentRunsAlongStep) {
    const int32_t w = 48, h = 32;
    auto img = MakeVerticalStep(w, h, 24);
    FlowField flow = ComputeEdgeTangentFlow(img.data(), w, h, etf_);

    ASSERT_FALSE(flow.Empty());
    for (int32_t y = 4; y < h - 4; ++y) {
        const size_t idx = static_cast<size_t>(y) * w + 23;
        EXPECT_NEAR(std::abs(flow.ty[idx]), 1.0f, 1e-3f) << "row " << y;
        EXPECT_NEAR(flow.tx[idx], 0.0f, 1e-3f);
        EXPECT_GT(flow.coherency[idx], 0.5f);
    }
}

TEST_F(EdgeTangentFlowTest, TangentsAreUnitLength) {
    const int32_t w = 40, h = 40;
    std::vector<float> img(static_cast<size_t>(w) * h);
    for (int32_t y = 0; y < h; ++y) {
        for (int32_t x = 0; x < w; ++x) {
            img[static_cast<size_t>(y) * w + x] = (x + y < 40) ? 20.0f : 230.0f;
        }
    }
    FlowField flow = ComputeEdgeTangentFlow(img.data(), w, h, etf_);
    for (size_t i = 0; i < flow.tx.size(); ++i) {
        EXPECT_NEAR(std::hypot(flow.tx[i], flow.ty[i]), 1.0, 1e-4);
    }
}

TEST_F(EdgeTangentFlowTest, FlatImageHasNoResponse) {
    std::vector<float> img(32 * 32, 255.0f);
    FlowField flow = ComputeEdgeTangentFlow(img.data(), 32, 32, etf_);
    auto response = ComputeFdog(img.data(), 32, 32, flow, fdog_);
    for (float v : response) {
        EXPECT_EQ(v, 0.0f);
    }

    BinaryMap edges = DetectFlowEdges(img.data(), 32, 32, etf_, fdog_, 0.04, 0.08);
    EXPECT_EQ(edges.CountSet(), 0u);
}

TEST_F(EdgeTangentFlowTest, DiskEdgesStayNearBoundary) {
    const int32_t w = 100, h = 100;
    std::vector<float> img(static_cast<size_t>(w) * h, 255.0f);
    for (int32_t y = 0; y < h; ++y) {
        for (int32_t x = 0; x < w; ++x) {
            if (std::hypot(x - 50.0, y - 50.0) <= 20.0) img[static_cast<size_t>(y) * w + x] = 0.0f;
        }
    }

    EdgeResponse response;
    BinaryMap edges = DetectFlowEdges(img.data(), w, h, etf_, fdog_, 0.04, 0.08,
                                      nullptr, &response);
    EXPECT_GT(edges.CountSet(), 50u);
    EXPECT_GT(response.maxMagnitude, 0.0f);

    for (int32_t y = 0; y < h; ++y) {
        for (int32_t x = 0; x < w; ++x) {
            if (edges.At(x, y)) {
                EXPECT_NEAR(std::hypot(x - 50.0, y - 50.0), 20.0, 4.0);
            }
        }
    }
}

TEST_F(EdgeTangentFlowTest, MultiDirectionHasPlanePerOrientation) {
    const int32_t w = 48, h = 32;
    auto img = MakeVerticalStep(w, h, 24);
    FlowField flow = ComputeEdgeTangentFlow(img.data(), w, h, etf_);

    const std::vector<double> orientations{0.0, 0.7853981633974483, 1.5707963267948966};
    MultiDirectionResponse multi =
        ComputeMultiDirectionFdog(img.data(), w, h, flow, orientations, fdog_);
    ASSERT_EQ(multi.responses.size(), 3u);
    ASSERT_EQ(multi.combined.size(), static_cast<size_t>(w * h));
    for (size_t i = 0; i < multi.combined.size(); ++i) {
        float expected = std::max({multi.responses[0][i], multi.responses[1][i],
                                   multi.responses[2][i]});
        EXPECT_FLOAT_EQ(multi.combined[i], expected);
    }
}

TEST_F(EdgeTangentFlowTest, SingleOrientationMatchesPlainFdog) {
    const int32_t w = 48, h = 32;
    auto img = MakeVerticalStep(w, h, 24);
    FlowField flow = ComputeEdgeTangentFlow(img.data(), w, h, etf_);

    auto plain = ComputeFdog(img.data(), w, h, flow, fdog_);
    MultiDirectionResponse multi = ComputeMultiDirectionFdog(img.data(), w, h, flow, {0.0}, fdog_);
    ASSERT_EQ(multi.combined.size(), plain.size());
    for (size_t i = 0; i < plain.size(); ++i) {
        EXPECT_FLOAT_EQ(multi.combined[i], plain[i]);
        EXPECT_EQ(multi.dominant[i], 0.0f);
    }
}

TEST_F(EdgeTangentFlowTest, ThresholdScaleOnlyRemovesEdges) {
    const int32_t w = 64, h = 64;
    std::vector<float> img(static_cast<size_t>(w) * h, 255.0f);
    for (int32_t y = 0; y < h; ++y) {
        for (int32_t x = 0; x < w; ++x) {
            const size_t idx = static_cast<size_t>(y) * w + x;
            if (std::hypot(x - 32.0, y - 32.0) <= 14.0) img[idx] = 0.0f;
            // Faint second step on the right
            if (x >= 56) img[idx] = 215.0f;
        }
    }
    FlowField flow = ComputeEdgeTangentFlow(img.data(), w, h, etf_);
    auto response = ComputeFdog(img.data(), w, h, flow, fdog_);

    BinaryMap base = EdgesFromFlowResponse(response.data(), flow.tx.data(), flow.ty.data(),
                                           w, h, 0.04, 0.08, 1.0);
    BinaryMap strict = EdgesFromFlowResponse(response.data(), flow.tx.data(), flow.ty.data(),
                                             w, h, 0.04, 0.08, 2.0);
    EXPECT_GT(base.CountSet(), 0u);
    EXPECT_GT(strict.CountSet(), 0u);
    EXPECT_LE(strict.CountSet(), base.CountSet());
    for (int32_t y = 0; y < h; ++y) {
        for (int32_t x = 0; x < w; ++x) {
            if (strict.At(x, y)) {
                EXPECT_TRUE(base.At(x, y)) << x << "," << y;
            }
        }
    }
}

TEST_F(EdgeTangentFlowTest, EmptyResponseGivesEmptyMap) {
    BinaryMap edges = EdgesFromFlowResponse(nullptr, nullptr, nullptr, 0, 0, 0.04, 0.08);
    EXPECT_EQ(edges.CountSet(), 0u);
}
