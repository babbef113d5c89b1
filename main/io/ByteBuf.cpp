/**
 * A view of a contiguous sequence of bytes with a position and a limit.
 *
 *        File: ByteBuf.cpp
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

#include "ByteBuf.h"

#include "error.h"

#include <cstring>
#include <utility>

namespace chanio {

ByteBuf::ByteBuf(char* bytes, size_t capacity) noexcept
    : storage()
    , bytes(bytes)
    , cap(capacity)
    , pos(0)
    , lim(capacity)
{}

ByteBuf::ByteBuf() noexcept
    : ByteBuf(nullptr, 0)
{}

ByteBuf::ByteBuf(size_t capacity)
    : storage(new char[capacity])
    , bytes(storage.get())
    , cap(capacity)
    , pos(0)
    , lim(capacity)
{}

ByteBuf::ByteBuf(ByteBuf&& other) noexcept
    : storage(std::move(other.storage))
    , bytes(other.bytes)
    , cap(other.cap)
    , pos(other.pos)
    , lim(other.lim)
{
    other.bytes = nullptr;
    other.cap = other.pos = other.lim = 0;
}

ByteBuf& ByteBuf::operator=(ByteBuf&& rhs) noexcept {
    if (this != &rhs) {
        storage = std::move(rhs.storage);
        bytes = rhs.bytes;
        cap = rhs.cap;
        pos = rhs.pos;
        lim = rhs.lim;

        rhs.bytes = nullptr;
        rhs.cap = rhs.pos = rhs.lim = 0;
    }
    return *this;
}

ByteBuf ByteBuf::wrap(char* bytes, size_t size) noexcept {
    return ByteBuf(bytes, size);
}

void ByteBuf::vetRange(
        const size_t off,
        const size_t len,
        const size_t size) {
    // `off + len` might overflow
    if (off > size || len > size - off)
        throw OUT_OF_RANGE("Range [" + std::to_string(off) + ", " + std::to_string(off) + "+" +
                std::to_string(len) + ") is out of bounds for length " + std::to_string(size));
}

ByteBuf& ByteBuf::position(const size_t newPos) {
    if (newPos > lim)
        throw OUT_OF_RANGE("New position " + std::to_string(newPos) + " is greater than limit " +
                "of buffer " + to_string());
    pos = newPos;
    return *this;
}

ByteBuf& ByteBuf::limit(const size_t newLim) {
    if (newLim > cap)
        throw OUT_OF_RANGE("New limit " + std::to_string(newLim) + " is greater than capacity " +
                "of buffer " + to_string());
    lim = newLim;
    if (pos > lim)
        pos = lim;
    return *this;
}

ByteBuf& ByteBuf::advance(const size_t nbytes) {
    if (nbytes > remaining())
        throw OUT_OF_RANGE("Can't advance buffer " + to_string() + " by " +
                std::to_string(nbytes) + " bytes");
    pos += nbytes;
    return *this;
}

ByteBuf& ByteBuf::flip() noexcept {
    lim = pos;
    pos = 0;
    return *this;
}

ByteBuf& ByteBuf::clear() noexcept {
    pos = 0;
    lim = cap;
    return *this;
}

ByteBuf& ByteBuf::put(const void* data, const size_t nbytes) {
    if (nbytes > remaining())
        throw OUT_OF_RANGE("Can't put " + std::to_string(nbytes) + " bytes into buffer " +
                to_string());
    if (nbytes)
        ::memcpy(bytes + pos, data, nbytes);
    pos += nbytes;
    return *this;
}

ByteBuf& ByteBuf::get(void* data, const size_t nbytes) {
    if (nbytes > remaining())
        throw OUT_OF_RANGE("Can't get " + std::to_string(nbytes) + " bytes from buffer " +
                to_string());
    if (nbytes)
        ::memcpy(data, bytes + pos, nbytes);
    pos += nbytes;
    return *this;
}

String ByteBuf::to_string() const {
    return "{cap=" + std::to_string(cap) + ", pos=" + std::to_string(pos) + ", lim=" +
            std::to_string(lim) + "}";
}

} // namespace
