/**
 * @file: CommonTypes.h
 * @brief: Common types used in the code.
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

#ifndef MAIN_MISC_COMMONTYPES_H_
#define MAIN_MISC_COMMONTYPES_H_

#include <cstdint>
#include <limits>
#include <mutex>
#include <string>

namespace chanio {

/// Convenience types
using Mutex        = std::mutex;                 ///< A mutex
using Guard        = std::lock_guard<Mutex>;     ///< A guard lock
using Lock         = std::unique_lock<Mutex>;    ///< A unique lock
using String       = std::string;                ///< A string
using Offset       = int64_t;                    ///< Byte position, size, or count in a channel

/// Largest possible byte count
constexpr Offset OFFSET_MAX = std::numeric_limits<Offset>::max();

/// Value returned by a read when the end of the data has been reached
constexpr int EOS = -1;

} // namespace

#endif /* MAIN_MISC_COMMONTYPES_H_ */
