/**
 * This file implements the module for handling errors.
 *
 *   @file: error.cpp
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

namespace chanio {

InvalidArgument::InvalidArgument(
        const char*       file,
        const int         line,
        const char*       func,
        const std::string msg)
    : std::invalid_argument{makeWhat(file, line, func, msg)}
{}

LogicError::LogicError(
        const char*       file,
        const int         line,
        const char*       func,
        const std::string msg)
    : std::logic_error{makeWhat(file, line, func, msg)}
{}

IllegalBlockingMode::IllegalBlockingMode(
        const char*       file,
        const int         line,
        const char*       func,
        const std::string msg)
    : LogicError{file, line, func, msg}
{}

OutOfRange::OutOfRange(
        const char*       file,
        const int         line,
        const char*       func,
        const std::string msg)
    : std::out_of_range{makeWhat(file, line, func, msg)}
{}

RuntimeError::RuntimeError(
        const char*       file,
        const int         line,
        const char*       func,
        const std::string msg)
    : std::runtime_error{makeWhat(file, line, func, msg)}
{}

SystemError::SystemError(
        const char*       file,
        const int         line,
        const char*       func,
        const std::string msg,
        const int         errnum)
    : std::system_error{errnum, std::generic_category(),
            makeWhat(file, line, func, msg)}
{}

} // namespace
