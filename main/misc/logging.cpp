/**
 * This file implements logging.
 *
 *   @file: logging.cpp
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

#include "error.h"

#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <libgen.h>
#include <mutex>
#include <sstream>
#include <string>
#include <sys/time.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace chanio {

static const int LOC_WIDTH = 32;

/// Destination of log records. `nullptr` means the standard error stream.
static std::atomic<FILE*> output{nullptr};

/// Serializes the writing of log records
static std::recursive_mutex outputMutex;

static const std::string progName{PACKAGE_NAME};

static FILE* getOutput() noexcept
{
    FILE* stream = output.load();
    return stream ? stream : stderr;
}

/// Keeps the lines of a log record together
class StreamGuard
{
    std::lock_guard<std::recursive_mutex> guard;
    FILE*                                 stream;

public:
    /**
     * Constructs.
     * @param[in] stream  Underlying stream to be guarded
     */
    explicit StreamGuard(FILE* stream)
        : guard(outputMutex)
        , stream{stream}
    {
        ::flockfile(stream);
    }

    StreamGuard(const StreamGuard& guard) =delete;
    StreamGuard& operator=(const StreamGuard& rhs) =delete;

    ~StreamGuard() {
        ::funlockfile(stream);
    }
};

static void timeStamp(FILE* stream)
{
    struct timeval now;
    ::gettimeofday(&now, nullptr);
    struct tm tm;
    ::gmtime_r(&now.tv_sec, &tm);
    ::fprintf(stream,
            "%04d%02d%02dT%02d%02d%02d.%06ldZ",
            tm.tm_year+1900, tm.tm_mon+1, tm.tm_mday, tm.tm_hour, tm.tm_min,
            tm.tm_sec, static_cast<long>(now.tv_usec));
}

static void procStamp(FILE* stream)
{
    char               progField[80];
    std::ostringstream threadId;

    threadId << std::this_thread::get_id();
    ::snprintf(progField, sizeof(progField), "%s:%d:%s", progName.c_str(),
            static_cast<int>(::getpid()), threadId.str().c_str());

    ::fprintf(stream, "%-35s", progField);
}

static std::string codeStamp(
        const char* const file,
        const int         line,
        const char* const func)
{
    std::vector<char> name(file, file + ::strlen(file) + 1);
    return std::string(::basename(name.data())) + ":" + std::to_string(line) + ":" + func;
}

/**
 * Writes everything of a log record that precedes the message.
 */
static void logHeader(
        FILE*             stream,
        const LogLevel    level)
{
    timeStamp(stream);
    ::fputc(' ', stream);
    procStamp(stream);
    ::fprintf(stream, " %-5s ", level.to_string().data());
}

const LogLevel LogLevel::TRACE{0};
const LogLevel LogLevel::DEBUG{1};
const LogLevel LogLevel::INFO{2};
const LogLevel LogLevel::NOTE{3};
const LogLevel LogLevel::WARN{4};
const LogLevel LogLevel::ERROR{5};
const LogLevel LogLevel::FATAL{6};

LogThreshold logThreshold(LogLevel::NOTE); ///< The current logging threshold

void log_setOutput(FILE* stream) noexcept {
    output.store(stream);
}

void log_setLevel(const std::string& name)
{
    // Otherwise, every entry would match
    if (name.empty())
        throw INVALID_ARGUMENT("Empty string");

    static const struct Entry {
        std::string     id;
        const LogLevel& level;
    } entries[] = {
        {"TRACE", LogLevel::TRACE},
        {"DEBUG", LogLevel::DEBUG},
        {"INFO",  LogLevel::INFO },
        {"NOTE",  LogLevel::NOTE },
        {"WARN",  LogLevel::WARN },
        {"ERROR", LogLevel::ERROR},
        {"FATAL", LogLevel::FATAL}
    };

    std::string upperName = name;
    for (auto& c : upperName)
        c = ::toupper(c);

    for (const auto& entry : entries) {
        if (entry.id.find(upperName) == 0) {
            log_setLevel(entry.level);
            return;
        }
    }

    throw INVALID_ARGUMENT("Invalid logging-level name: \"" + name + "\"");
}

LogLevel log_getLevel() noexcept {
    return logThreshold.load();
}

void log_setLevel(const LogLevel level) noexcept {
    logThreshold.store(level);
}

std::string makeWhat(
        const char*        file,
        const int          line,
        const char* const  func,
        const std::string& msg)
{
    auto what = codeStamp(file, line, func);

    for (int n = what.size(); n < LOC_WIDTH; ++n)
        what += ' ';

    what += ' ' + msg;

    return what;
}

/**
 * Logs a message.
 * @param[in] level    The logging level to use
 * @param[in] file     The name of the file
 * @param[in] line     The line number in the file
 * @param[in] func     The name of the function
 * @param[in] fmt      The format of the log message
 * @param[in] argList  The argument list for `fmt`
 */
static void vlog(
        const LogLevel    level,
        const char* const file,
        const int         line,
        const char* const func,
        const char* const fmt,
        va_list           argList)
{
    FILE*       stream = getOutput();
    StreamGuard guard(stream);

    logHeader(stream, level);
    ::fprintf(stream, "%-*s ", LOC_WIDTH, codeStamp(file, line, func).c_str());
    ::vfprintf(stream, fmt, argList);
    ::fputc('\n', stream);
    ::fflush(stream);
}

/**
 * Logs an exception. Nested exceptions are logged first.
 * @param[in] level  The logging level to use
 * @param[in] ex     The exception to log
 */
static void logException(
        const LogLevel        level,
        const std::exception& ex)
{
    FILE*       stream = getOutput();
    StreamGuard guard(stream);

    try {
        std::rethrow_if_nested(ex);
    }
    catch (const std::exception& inner) {
        logException(level, inner);
    }

    // `what()` already contains the code location
    logHeader(stream, level);
    ::fprintf(stream, "%s\n", ex.what());
    ::fflush(stream);
}

void log(
        const LogLevel    level,
        const char* const file,
        const int         line,
        const char* const func,
        const char* const fmt,
        ...)
{
    va_list argList;

    va_start(argList, fmt);
    vlog(level, file, line, func, fmt, argList);
    va_end(argList);
}

void log(
        const LogLevel        level,
        const char*           file,
        const int             line,
        const char* const     func,
        const std::exception& ex,
        const char*           fmt,
        ...)
{
    StreamGuard guard(getOutput());
    va_list     argList;

    logException(level, ex);

    va_start(argList, fmt);
    vlog(level, file, line, func, fmt, argList);
    va_end(argList);
}

} // namespace
