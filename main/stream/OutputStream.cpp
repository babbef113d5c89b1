/**
 * Abstract, sequential sink of bytes.
 *
 *        File: OutputStream.cpp
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

#include "OutputStream.h"

namespace chanio {

OutputStream::~OutputStream() noexcept
{}

void OutputStream::write(const int byte) {
    const char b1 = static_cast<char>(byte & 0xff);
    write(&b1, 1, 0, 1);
}

void OutputStream::flush() {
}

void OutputStream::close() {
}

Channel* OutputStream::getChannel() noexcept {
    return nullptr;
}

} // namespace
