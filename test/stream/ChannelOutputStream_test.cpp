/**
 * This file tests class `ChannelOutputStream`.
 *
 *   @file: ChannelOutputStream_test.cpp
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

#include "ChannelOutputStream.h"

#include "error.h"
#include "MemChannel.h"

#include <gtest/gtest.h>
#include <vector>

namespace {

using namespace chanio;

/// The fixture for testing class `ChannelOutputStream`
class ChannelOutputStreamTest : public ::testing::Test
{
protected:
    std::vector<char> data;

    ChannelOutputStreamTest()
        : data(MemChannel::pattern(100))
    {}
};

// Tests that writes are drained fully
TEST_F(ChannelOutputStreamTest, PartialWrites)
{
    MemChannel          chan(MemChannel::GENERIC);
    ChannelOutputStream out(chan);

    chan.writeChunk = 7;
    out.write(data.data(), data.size());
    EXPECT_EQ(data, chan.data);
    EXPECT_EQ(15, chan.writes);
}

// Tests writing a subrange and a single byte
TEST_F(ChannelOutputStreamTest, SubrangeAndByte)
{
    MemChannel          chan(MemChannel::GENERIC);
    ChannelOutputStream out(chan);

    out.write(data.data(), data.size(), 10, 5);
    out.write(0x1ff);
    ASSERT_EQ(6, chan.data.size());
    EXPECT_EQ(data[10], chan.data[0]);
    EXPECT_EQ(data[14], chan.data[4]);
    EXPECT_EQ('\xff', chan.data[5]);
}

// Tests out-of-bounds and empty writes
TEST_F(ChannelOutputStreamTest, Bounds)
{
    MemChannel          chan(MemChannel::GENERIC);
    ChannelOutputStream out(chan);

    EXPECT_THROW(out.write(data.data(), data.size(), 90, 11), OutOfRange);
    out.write(data.data(), data.size(), 100, 0);
    EXPECT_EQ(0, chan.writes);
}

// Tests writing to a non-blocking channel
TEST_F(ChannelOutputStreamTest, NonBlocking)
{
    MemChannel          chan(MemChannel::SELECTABLE);
    ChannelOutputStream out(chan);

    chan.blocking = false;
    EXPECT_THROW(out.write(data.data(), data.size()), IllegalBlockingMode);
    EXPECT_EQ(0, chan.writes);
    EXPECT_TRUE(chan.getBlockingLock().try_lock());
    chan.getBlockingLock().unlock();

    chan.blocking = true;
    out.write(data.data(), data.size());
    EXPECT_EQ(data, chan.data);
}

// Tests a write failure
TEST_F(ChannelOutputStreamTest, Failure)
{
    MemChannel          chan(MemChannel::GENERIC);
    ChannelOutputStream out(chan);

    chan.writeChunk = 10;
    chan.failWrite = 3;
    EXPECT_THROW(out.write(data.data(), data.size()), SystemError);
    EXPECT_EQ(20, chan.data.size());
}

// Tests the channel accessor and closing
TEST_F(ChannelOutputStreamTest, ChannelAndClose)
{
    MemChannel          chan(MemChannel::GENERIC);
    ChannelOutputStream out(chan);

    EXPECT_EQ(&chan, out.getChannel());
    out.flush();
    out.close();
    EXPECT_EQ(1, chan.closes);
}

}  // namespace

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
