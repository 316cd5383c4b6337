/**
 * @file test_memory.cpp
 * @brief Unit tests for Platform/Memory.h
 */

#include <VxTrace/Platform/Memory.h>
#include <gtest/gtest.h>

#include <utility>

using namespace Vx::Trace::Platform;

TEST(AlignedMemoryTest, AllocationIsAligned) {
    auto buf = AllocateAligned<float>(1000);
    ASSERT_NE(buf.get(), nullptr);
    EXPECT_TRUE(IsAligned(buf.get()));
    EXPECT_EQ(AlignedSize(1, 64), 64u);
    EXPECT_EQ(AlignedSize(64, 64), 64u);
    EXPECT_EQ(AlignedSize(65, 64), 128u);
}

class BufferPoolTest : public ::testing::Test {
protected:
    BufferPool<float> pool_{4};
};

TEST_F(BufferPoolTest, AcquireZeroFills) {
    auto h = pool_.Acquire(16);
    ASSERT_TRUE(h.Valid());
    ASSERT_EQ(h.Size(), 16u);
    for (size_t i = 0; i < h.Size(); ++i) {
        EXPECT_EQ(h[i], 0.0f);
    }
}

TEST_F(BufferPoolTest, ReleasedBufferIsReused) {
    {
        auto h = pool_.Acquire(256);
        h[0] = 5.0f;
    }
    EXPECT_EQ(pool_.FreeCount(), 1u);

    auto h2 = pool_.Acquire(128);
    EXPECT_EQ(h2[0], 0.0f);

    PoolStats stats = pool_.Stats();
    EXPECT_EQ(stats.acquisitions, 2u);
    EXPECT_EQ(stats.reuses, 1u);
    EXPECT_EQ(stats.allocations, 1u);
    EXPECT_EQ(pool_.FreeCount(), 0u);
}

TEST_F(BufferPoolTest, TooSmallBufferIsNotReused) {
    { auto h = pool_.Acquire(8); }
    auto big = pool_.Acquire(4096);
    EXPECT_EQ(pool_.Stats().allocations, 2u);
    EXPECT_EQ(pool_.FreeCount(), 1u);
}

TEST_F(BufferPoolTest, PeakTracksOutstandingBytes) {
    auto a = pool_.Acquire(100);
    auto b = pool_.Acquire(100);
    PoolStats during = pool_.Stats();
    EXPECT_GE(during.bytesOutstanding, 200 * sizeof(float));

    a.Reset();
    b.Reset();
    PoolStats after = pool_.Stats();
    EXPECT_EQ(after.bytesOutstanding, 0u);
    EXPECT_EQ(after.peakBytes, during.peakBytes);
}

TEST_F(BufferPoolTest, MoveTransfersOwnership) {
    auto a = pool_.Acquire(10);
    auto b = std::move(a);
    EXPECT_FALSE(a.Valid());
    EXPECT_TRUE(b.Valid());
    b.Reset();
    EXPECT_EQ(pool_.FreeCount(), 1u);
}

TEST_F(BufferPoolTest, FreeListIsBounded) {
    {
        auto h1 = pool_.Acquire(1);
        auto h2 = pool_.Acquire(1);
        auto h3 = pool_.Acquire(1);
        auto h4 = pool_.Acquire(1);
        auto h5 = pool_.Acquire(1);
        auto h6 = pool_.Acquire(1);
    }
    EXPECT_EQ(pool_.FreeCount(), 4u);
    pool_.Trim();
    EXPECT_EQ(pool_.FreeCount(), 0u);
}
