/**
 * This file tests the `logging` module
 *
 *   @file: logging_test.cpp
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

#include "logging.h"

#include "error.h"

#include <cstdio>
#include <exception>
#include <gtest/gtest.h>
#include <string>

namespace {

using namespace chanio;

// The fixture for testing module `logging`.
class LoggingTest : public ::testing::Test
{
protected:
    FILE* stream;

    LoggingTest()
        : stream(::tmpfile())
    {
        log_setOutput(stream);
        log_setLevel(LogLevel::NOTE);
    }

    ~LoggingTest() noexcept
    {
        log_setOutput(stderr);
        log_setLevel(LogLevel::NOTE);
        if (stream)
            ::fclose(stream);
    }

    /// Returns everything logged so far
    std::string logged() {
        std::string text;
        ::rewind(stream);
        for (int c = ::fgetc(stream); c != EOF; c = ::fgetc(stream))
            text += static_cast<char>(c);
        return text;
    }
};

// Tests simple logging
TEST_F(LoggingTest, SimpleLogging)
{
    ASSERT_NE(nullptr, stream);
    log_setLevel(LogLevel::DEBUG);
    LOG_TRACE("Trace message");
    LOG_DEBUG("Debug message %d", 1);
    LOG_ERROR("Error message %d", 5);

    const auto text = logged();
    EXPECT_EQ(std::string::npos, text.find("Trace message"));
    EXPECT_NE(std::string::npos, text.find("DEBUG"));
    EXPECT_NE(std::string::npos, text.find("Debug message 1"));
    EXPECT_NE(std::string::npos, text.find("Error message 5"));
    EXPECT_NE(std::string::npos, text.find("logging_test.cpp:"));
    EXPECT_NE(std::string::npos, text.find(PACKAGE_NAME ":"));
}

// Tests the default threshold
TEST_F(LoggingTest, DefaultThreshold)
{
    ASSERT_NE(nullptr, stream);
    EXPECT_EQ(LogLevel::NOTE, log_getLevel());
    LOG_DEBUG("Debug message");
    LOG_ERROR("Error message");
    const auto text = logged();
    EXPECT_EQ(std::string::npos, text.find("Debug message"));
    EXPECT_NE(std::string::npos, text.find("Error message"));
}

// Tests exception logging
TEST_F(LoggingTest, ExceptionLogging)
{
    ASSERT_NE(nullptr, stream);
    try {
        try {
            throw SYSTEM_ERROR("Inner exception", 1);
        }
        catch (const std::exception& e) {
            std::throw_with_nested(RUNTIME_ERROR("Outer exception"));
        }
    }
    catch (const std::exception& e) {
        LOG_ERROR(e, "Context %d", 7);
    }

    const auto text = logged();
    const auto inner = text.find("Inner exception");
    const auto outer = text.find("Outer exception");
    const auto context = text.find("Context 7");
    ASSERT_NE(std::string::npos, inner);
    ASSERT_NE(std::string::npos, outer);
    ASSERT_NE(std::string::npos, context);
    EXPECT_LT(inner, outer);
    EXPECT_LT(outer, context);
}

// Tests setting the level by name
TEST_F(LoggingTest, LevelByName)
{
    log_setLevel("debug");
    EXPECT_EQ(LogLevel::DEBUG, log_getLevel());
    log_setLevel("WA");
    EXPECT_EQ(LogLevel::WARN, log_getLevel());
    log_setLevel("t");
    EXPECT_EQ(LogLevel::TRACE, log_getLevel());
    EXPECT_THROW(log_setLevel("verbose"), InvalidArgument);
    EXPECT_THROW(log_setLevel(""), InvalidArgument);
    EXPECT_EQ(LogLevel::TRACE, log_getLevel());
}

}  // namespace

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
