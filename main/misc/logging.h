/**
 * This file declares the API for logging.
 *
 *   @file: logging.h
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

#ifndef MAIN_MISC_LOGGING_H_
#define MAIN_MISC_LOGGING_H_

#include <atomic>
#include <cstdio>
#include <exception>
#include <string>

namespace chanio {

/// Logging level
class LogLevel
{
    int level;

    constexpr LogLevel(const int level) noexcept
        : level{level}
    {}

public:
    static const LogLevel TRACE; ///< Lowest priority logging level
    static const LogLevel DEBUG; ///< Logging level for debug messages
    static const LogLevel INFO;  ///< Logging level for informational messages
    static const LogLevel NOTE;  ///< Logging level to notices
    static const LogLevel WARN;  ///< Logging level for warnings
    static const LogLevel ERROR; ///< Logging level for errors
    static const LogLevel FATAL; ///< Logging level for fatal errors

    constexpr LogLevel() noexcept
        : LogLevel(0)
    {}

    /**
     * Casts this instance to an integer.
     * @return The integer representation of this instance
     */
    operator int() const noexcept {
        return level;
    }

    /**
     * Indicates if the current logging level includes a given one.
     * @param[in] arg  The given logging level to be examined
     * @retval    true     The current logging level includes the given one
     * @retval    false    The current logging level does not include the given one
     */
    bool includes(const LogLevel& arg) const noexcept {
        return arg.level >= level;
    }

    /**
     * Returns the string representation of this instance.
     * @return The string representation of this instance
     */
    const std::string& to_string() const noexcept {
        static const std::string strings[] = {
                "TRACE", "DEBUG", "INFO", "NOTE", "WARN", "ERROR", "FATAL"
        };
        return strings[level];
    }
};

typedef std::atomic<LogLevel> LogThreshold; ///< Type of the logging threshold
extern LogThreshold           logThreshold; ///< The logging threshold

/**
 * Sets the destination of log records. The default is the standard error stream.
 *
 * @param[in] stream  Destination of log records. Must remain open while used.
 */
void log_setOutput(FILE* stream) noexcept;

/**
 * Returns the current logging level.
 *
 * @return  Current logging level
 */
LogLevel log_getLevel() noexcept;

/**
 * Sets the logging level.
 * @param[in] level  Logging level
 */
void log_setLevel(const LogLevel level) noexcept;

/**
 * Sets the logging level. Useful in decoding configuration-files.
 *
 * @param[in] name               Name of the logging level. One of "trace",
 *                               "debug", "info", "note", "warn", "error", or
 *                               "fatal". Fewer characters can be used. Matching
 *                               is case independent.
 * @throw std::invalid_argument  Name isn't one of the allowed names
 */
void log_setLevel(const std::string& name);

inline bool log_enabled(const LogLevel& level) noexcept {
    return logThreshold.load().includes(level);
}

void log(
        const LogLevel level,
        const char*    file,
        const int      line,
        const char*    func,
        const char*    fmt,
        ...);
void log(
        const LogLevel        level,
        const char*           file,
        const int             line,
        const char*           func,
        const std::exception& ex,
        const char*           fmt,
        ...);

/// Macro for logging a message at the trace level
#define LOG_TRACE(...) \
    do \
        if (chanio::log_enabled(chanio::LogLevel::TRACE)) \
            chanio::log(chanio::LogLevel::TRACE, __FILE__, __LINE__, __func__, __VA_ARGS__); \
    while(false)

/// Macro for logging a message at the debug level
#define LOG_DEBUG(...) \
    do \
        if (chanio::log_enabled(chanio::LogLevel::DEBUG)) \
            chanio::log(chanio::LogLevel::DEBUG, __FILE__, __LINE__, __func__, __VA_ARGS__); \
    while(false)

/// Macro for logging a message at the error level
#define LOG_ERROR(...) \
    do \
        if (chanio::log_enabled(chanio::LogLevel::ERROR)) \
            chanio::log(chanio::LogLevel::ERROR, __FILE__, __LINE__, __func__, __VA_ARGS__); \
    while(false)

} // namespace

#endif /* MAIN_MISC_LOGGING_H_ */
