#include <gtest/gtest.h>

#include "utils/BufferPool.hpp"

using namespace tiercache::utils;

TEST(BufferPoolTest, Acquire_EmptyPool_ReturnsEmptyBuffer) {
    BufferPool pool;

    auto buf = pool.acquire();

    EXPECT_TRUE(buf.empty());
    EXPECT_EQ(pool.pooled(), 0u);
}

TEST(BufferPoolTest, Release_ReturnsBufferCleared) {
    BufferPool pool;
    auto buf = pool.acquire();
    buf.assign(100, 'x');

    pool.release(std::move(buf));
    EXPECT_EQ(pool.pooled(), 1u);

    auto again = pool.acquire();
    EXPECT_TRUE(again.empty());
    EXPECT_GE(again.capacity(), 100u);
    EXPECT_EQ(pool.pooled(), 0u);
}

TEST(BufferPoolTest, Release_OversizedBuffer_Dropped) {
    BufferPool pool(4, 16);
    std::string big(64, 'x');

    pool.release(std::move(big));

    EXPECT_EQ(pool.pooled(), 0u);
}

TEST(BufferPoolTest, Release_BeyondMaxPooled_Dropped) {
    BufferPool pool(2);

    pool.release(std::string("a"));
    pool.release(std::string("b"));
    pool.release(std::string("c"));

    EXPECT_EQ(pool.pooled(), 2u);
}

TEST(BufferPoolTest, UpdateLength_PresizesNewBuffers) {
    BufferPool pool;

    pool.updateLength(256);
    auto buf = pool.acquire();

    EXPECT_EQ(pool.typicalLength(), 256u);
    EXPECT_GE(buf.capacity(), 256u);
}
