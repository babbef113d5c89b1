/**
 * This file tests the default behavior of class `InputStream`.
 *
 *   @file: InputStream_test.cpp
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

#include "InputStream.h"

#include "ByteBuf.h"
#include "OutputStream.h"
#include "RunPar.h"

#include <algorithm>
#include <gtest/gtest.h>
#include <vector>

namespace {

using namespace chanio;

/// An input stream over a vector that returns at most 100 bytes per read
class VectorInputStream : public InputStream
{
public:
    std::vector<char>   bytes;
    size_t              next = 0;
    std::vector<size_t> lens; ///< Requested lengths

    using InputStream::read;

    explicit VectorInputStream(const size_t size)
        : bytes(size)
    {
        for (size_t i = 0; i < size; ++i)
            bytes[i] = static_cast<char>(i);
    }

    int read() override {
        return (next < bytes.size())
                ? static_cast<unsigned char>(bytes[next++])
                : EOS;
    }

    ssize_t read(
            char*        data,
            const size_t size,
            const size_t off,
            const size_t len) override {
        ByteBuf::vetRange(off, len, size);
        lens.push_back(len);
        if (len == 0)
            return 0;
        if (next >= bytes.size())
            return EOS;
        const size_t n = std::min(std::min(len, static_cast<size_t>(100)), bytes.size() - next);
        std::copy(bytes.begin() + next, bytes.begin() + next + n, data + off);
        next += n;
        return static_cast<ssize_t>(n);
    }
};

/// An output stream over a vector
class VectorOutputStream : public OutputStream
{
public:
    std::vector<char> bytes;

    using OutputStream::write;

    void write(
            const char*  data,
            const size_t size,
            const size_t off,
            const size_t len) override {
        ByteBuf::vetRange(off, len, size);
        bytes.insert(bytes.end(), data + off, data + off + len);
    }
};

/// The fixture for testing class `InputStream`
class InputStreamTest : public ::testing::Test
{
protected:
    InputStreamTest()
    {
        RunPar::init();
    }

    ~InputStreamTest() noexcept
    {
        RunPar::init();
    }
};

// Tests the default number of available bytes
TEST_F(InputStreamTest, Available)
{
    VectorInputStream in(10);
    EXPECT_EQ(0, in.available());
}

// Tests the generic skip
TEST_F(InputStreamTest, Skip)
{
    VectorInputStream in(1000);

    EXPECT_EQ(0, in.skip(0));
    EXPECT_EQ(0, in.skip(-1));
    EXPECT_TRUE(in.lens.empty());

    EXPECT_EQ(250, in.skip(250));
    EXPECT_EQ(250, in.read());
    EXPECT_EQ(749, in.skip(1000));
    EXPECT_EQ(0, in.skip(1));
}

// Tests that the discard buffer is bounded
TEST_F(InputStreamTest, SkipBufferSize)
{
    VectorInputStream in(10000);

    RunPar::skipBufSize = 64;
    EXPECT_EQ(5000, in.skip(5000));
    for (auto len : in.lens)
        EXPECT_GE(64, len);
}

// Tests the generic transfer
TEST_F(InputStreamTest, TransferTo)
{
    VectorInputStream  in(1234);
    VectorOutputStream out;

    EXPECT_EQ(1234, in.transferTo(out));
    EXPECT_EQ(in.bytes, out.bytes);
    EXPECT_EQ(0, in.transferTo(out));
}

// Tests the convenience overloads
TEST_F(InputStreamTest, Convenience)
{
    VectorInputStream  in(5);
    VectorOutputStream out;
    char               bytes[5];

    EXPECT_EQ(5, in.read(bytes, sizeof(bytes)));
    out.write(bytes, sizeof(bytes));
    out.write(0x141);
    EXPECT_EQ(6, out.bytes.size());
    EXPECT_EQ('\x41', out.bytes[5]);
    EXPECT_EQ(nullptr, out.getChannel());
}

}  // namespace

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
