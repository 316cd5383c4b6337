/**
 * @file test_edgelinking.cpp
 * @brief Unit tests for Internal/EdgeLinking.h
 */

#include <VxTrace/Internal/EdgeLinking.h>
#include <gtest/gtest.h>

#include <cstdlib>
#include <vector>

using namespace Vx::Trace;
using namespace Vx::Trace::Internal;

class EdgeLinkingTest : public ::testing::Test {
protected:
    BinaryMap map_{40, 40};
    EdgeLinkParams params_;
};

TEST_F(EdgeLinkingTest, LineBecomesOneOpenChain) {
    for (int32_t x = 5; x <= 30; ++x) map_.Set(x, 12, true);

    auto chains = LinkEdgePixels(map_, params_);
    ASSERT_EQ(chains.size(), 1u);
    EXPECT_FALSE(chains[0].IsClosed());
    EXPECT_EQ(chains[0].Size(), 26u);
    EXPECT_DOUBLE_EQ(chains[0].Front().x, 5.0);
    EXPECT_DOUBLE_EQ(chains[0].Back().x, 30.0);
}

TEST_F(EdgeLinkingTest, ReverseScanStartsFromOtherEnd) {
    for (int32_t x = 5; x <= 30; ++x) map_.Set(x, 12, true);
    params_.reverseScan = true;

    auto chains = LinkEdgePixels(map_, params_);
    ASSERT_EQ(chains.size(), 1u);
    EXPECT_DOUBLE_EQ(chains[0].Front().x, 30.0);
    EXPECT_DOUBLE_EQ(chains[0].Back().x, 5.0);
}

TEST_F(EdgeLinkingTest, DiamondLoopCloses) {
    for (int32_t y = 0; y < 40; ++y)
        for (int32_t x = 0; x < 40; ++x)
            if (std::abs(x - 20) + std::abs(y - 20) == 10) map_.Set(x, y, true);

    auto chains = LinkEdgePixels(map_, params_);
    ASSERT_EQ(chains.size(), 1u);
    EXPECT_TRUE(chains[0].IsClosed());
    EXPECT_EQ(chains[0].Size(), 40u);
}

TEST_F(EdgeLinkingTest, SmallBlobStaysOpen) {
    map_.Set(10, 10, true);
    map_.Set(11, 10, true);
    map_.Set(10, 11, true);
    map_.Set(11, 11, true);

    auto chains = LinkEdgePixels(map_, params_);
    ASSERT_EQ(chains.size(), 1u);
    EXPECT_EQ(chains[0].Size(), 4u);
    EXPECT_FALSE(chains[0].IsClosed());
}

TEST_F(EdgeLinkingTest, IsolatedPixelsAreDropped) {
    map_.Set(3, 3, true);
    map_.Set(30, 30, true);
    EXPECT_TRUE(LinkEdgePixels(map_, params_).empty());
}

TEST_F(EdgeLinkingTest, EveryPixelConsumedOnce) {
    // T junction
    for (int32_t x = 5; x <= 35; ++x) map_.Set(x, 8, true);
    for (int32_t y = 9; y <= 30; ++y) map_.Set(20, y, true);

    auto chains = LinkEdgePixels(map_, params_);
    EXPECT_GE(chains.size(), 2u);

    size_t total = 0;
    for (const auto& c : chains) total += c.Size();
    EXPECT_EQ(total, map_.CountSet());
}

TEST_F(EdgeLinkingTest, EmptyMap) {
    EXPECT_TRUE(LinkEdgePixels(BinaryMap(), params_).empty());
    EXPECT_TRUE(LinkEdgePixels(map_, params_).empty());
}
