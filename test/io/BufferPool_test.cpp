/**
 * This file tests the buffer pools.
 *
 *   @file: BufferPool_test.cpp
 *
 *    Copyright 2021 University Corporation for Atmospheric Research
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#include "config.h"

#include "BufferPool.h"
#include "CountingPool.h"
#include "RunPar.h"

#include <gtest/gtest.h>
#include <thread>
#include <vector>

namespace {

using namespace chanio;

/// The fixture for testing the buffer pools
class BufferPoolTest : public ::testing::Test
{
protected:
    TempBufPool pool;

    BufferPoolTest()
        : pool(2, 1024)
    {}
};

// Tests acquiring a new buffer
TEST_F(BufferPoolTest, AcquireNew)
{
    ByteBuf buf = pool.acquire(100);
    EXPECT_LE(100, buf.capacity());
    EXPECT_EQ(0, buf.position());
    EXPECT_EQ(100, buf.limit());
    EXPECT_EQ(0, pool.size());
}

// Tests that a released buffer is reused
TEST_F(BufferPoolTest, Reuse)
{
    ByteBuf buf = pool.acquire(512);
    const char* array = buf.array();
    buf.position(10);
    pool.release(std::move(buf));
    EXPECT_EQ(1, pool.size());

    ByteBuf buf2 = pool.acquire(256);
    EXPECT_EQ(array, buf2.array());
    EXPECT_EQ(0, buf2.position());
    EXPECT_EQ(256, buf2.limit());
    EXPECT_EQ(0, pool.size());
}

// Tests that a cached buffer that's too small isn't used
TEST_F(BufferPoolTest, TooSmall)
{
    pool.release(pool.acquire(64));
    ByteBuf buf = pool.acquire(128);
    EXPECT_EQ(128, buf.capacity());
    EXPECT_EQ(1, pool.size());
}

// Tests that large buffers aren't cached
TEST_F(BufferPoolTest, LargeNotCached)
{
    pool.release(pool.acquire(2048));
    EXPECT_EQ(0, pool.size());
}

// Tests the limit on the number of cached buffers
TEST_F(BufferPoolTest, MaxCount)
{
    pool.release(pool.acquire(100));
    pool.release(pool.acquire(200));
    EXPECT_EQ(2, pool.size());

    ByteBuf small(50);
    pool.release(std::move(small));
    EXPECT_EQ(2, pool.size());

    // Replaces the 100-byte buffer
    pool.release(ByteBuf(300));
    EXPECT_EQ(2, pool.size());
    ByteBuf buf = pool.acquire(250);
    EXPECT_EQ(300, buf.capacity());
    buf = pool.acquire(150);
    EXPECT_EQ(200, buf.capacity());
}

// Tests a pool that caches nothing
TEST_F(BufferPoolTest, ZeroCount)
{
    TempBufPool pool(0, 1024);
    pool.release(pool.acquire(10));
    EXPECT_EQ(0, pool.size());
}

// Tests changing the limits
TEST_F(BufferPoolTest, SetLimits)
{
    pool.release(ByteBuf(100));
    pool.release(ByteBuf(600));
    EXPECT_EQ(2, pool.size());

    pool.setLimits(2, 500);
    EXPECT_EQ(1, pool.size());
    pool.release(ByteBuf(600));
    EXPECT_EQ(1, pool.size());

    pool.setLimits(3, 500);
    pool.release(ByteBuf(200));
    pool.release(ByteBuf(300));
    EXPECT_EQ(3, pool.size());

    pool.setLimits(1, 500);
    ASSERT_EQ(1, pool.size());
    EXPECT_EQ(300, pool.acquire(1).capacity());
}

// Tests the RAII lease
TEST_F(BufferPoolTest, ScratchBuf)
{
    CountingPool counter;
    {
        ScratchBuf buf(counter, 8192);
        EXPECT_EQ(8192, buf->limit());
        EXPECT_EQ(1, counter.outstanding());
    }
    EXPECT_EQ(1, counter.acquires);
    EXPECT_EQ(0, counter.outstanding());
}

// Tests concurrent use
TEST_F(BufferPoolTest, Concurrent)
{
    TempBufPool              pool(4, 4096);
    std::vector<std::thread> threads;

    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&pool]{
            for (int j = 0; j < 1000; ++j) {
                ScratchBuf buf(pool, 1 + j % 4096);
                buf->put("x", 1);
            }
        });
    }
    for (auto& thread : threads)
        thread.join();

    EXPECT_GE(4, pool.size());
}

// Tests the default pool
TEST_F(BufferPoolTest, Default)
{
    EXPECT_EQ(&BufferPool::getDefault(), &BufferPool::getDefault());
}

// Tests that the default pool follows the runtime parameters
TEST_F(BufferPoolTest, DefaultFollowsRunPar)
{
    RunPar::init();
    auto pool = dynamic_cast<TempBufPool*>(&BufferPool::getDefault());
    ASSERT_NE(nullptr, pool);

    RunPar::poolMaxCount = 1;
    RunPar::poolMaxBufSize = 100;
    EXPECT_EQ(pool, &BufferPool::getDefault());
    pool->release(ByteBuf(200));
    EXPECT_EQ(0, pool->size());
    pool->release(ByteBuf(50));
    pool->release(ByteBuf(60));
    EXPECT_EQ(1, pool->size());

    RunPar::init();
    BufferPool::getDefault();
    pool->release(ByteBuf(200));
    EXPECT_EQ(2, pool->size());
}

}  // namespace

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
