/**
 * Abstract, sequential source of bytes.
 *
 *        File: InputStream.cpp
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

#include "logging.h"
#include "OutputStream.h"
#include "RunPar.h"

#include <algorithm>
#include <vector>

namespace chanio {

InputStream::~InputStream() noexcept
{}

int InputStream::available() {
    return 0;
}

Offset InputStream::skip(const Offset n) {
    if (n <= 0)
        return 0;

    Offset            remaining = n;
    const size_t      size = static_cast<size_t>(
            std::min<Offset>(static_cast<Offset>(RunPar::skipBufSize), remaining));
    std::vector<char> discard(size);

    while (remaining > 0) {
        const auto len = static_cast<size_t>(std::min<Offset>(static_cast<Offset>(size), remaining));
        const auto nread = read(discard.data(), size, 0, len);
        if (nread < 0)
            break;
        remaining -= nread;
    }

    return n - remaining;
}

Offset InputStream::transferTo(OutputStream& out) {
    const size_t      size = RunPar::transferSize;
    std::vector<char> buf(size);
    Offset            transferred = 0;

    for (auto nread = read(buf.data(), size, 0, size); nread >= 0;
            nread = read(buf.data(), size, 0, size)) {
        out.write(buf.data(), size, 0, static_cast<size_t>(nread));
        transferred += nread;
    }

    LOG_DEBUG("Copied %lld bytes between streams", static_cast<long long>(transferred));
    return transferred;
}

void InputStream::close() {
}

} // namespace
