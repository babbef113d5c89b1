/**
 * A view of a contiguous sequence of bytes with a position and a limit.
 *
 *        File: ByteBuf.h
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

#ifndef MAIN_IO_BYTEBUF_H_
#define MAIN_IO_BYTEBUF_H_

#include "CommonTypes.h"

#include <cstddef>
#include <memory>

namespace chanio {

/**
 * A byte buffer. Either owns its bytes or wraps a caller's array. Maintains
 * `0 <= position() <= limit() <= capacity()`. Bytes are read from, or written into, the region
 * `[position(), limit())`.
 *
 * Instances are movable but not copyable.
 */
class ByteBuf
{
    std::unique_ptr<char[]> storage; ///< Owned bytes. Empty if the bytes are wrapped.
    char*                   bytes;   ///< Start of the bytes
    size_t                  cap;     ///< Capacity in bytes
    size_t                  pos;     ///< Position
    size_t                  lim;     ///< Limit

    ByteBuf(char* bytes, size_t capacity) noexcept;

public:
    /**
     * Default constructs. The capacity will be zero.
     */
    ByteBuf() noexcept;

    /**
     * Constructs a buffer that owns its bytes. The position will be zero and the limit will equal
     * the capacity.
     *
     * @param[in] capacity  Capacity in bytes
     */
    explicit ByteBuf(size_t capacity);

    ByteBuf(const ByteBuf& other) =delete;
    ByteBuf& operator=(const ByteBuf& rhs) =delete;

    ByteBuf(ByteBuf&& other) noexcept;
    ByteBuf& operator=(ByteBuf&& rhs) noexcept;

    /**
     * Returns a buffer that wraps an array. The array must outlive the buffer. The position will be
     * zero and the limit will equal the capacity.
     *
     * @param[in] bytes  The array
     * @param[in] size   Number of bytes in the array
     * @return           A buffer that views the array
     */
    static ByteBuf wrap(char* bytes, size_t size) noexcept;

    /**
     * Vets a subrange of an array.
     *
     * @param[in] off         Offset of the subrange in bytes
     * @param[in] len         Length of the subrange in bytes
     * @param[in] size        Size of the array in bytes
     * @throw     OutOfRange  `[off, off+len)` isn't within `[0, size)`
     */
    static void vetRange(size_t off, size_t len, size_t size);

    /**
     * Indicates if this instance views a given array.
     *
     * @param[in] bytes  Start of the array
     * @param[in] size   Number of bytes in the array
     * @retval    true   This instance wraps the array
     * @retval    false  This instance doesn't wrap the array
     */
    bool wraps(const char* bytes, size_t size) const noexcept {
        return !storage && this->bytes == bytes && cap == size;
    }

    /// Returns the start of the bytes, irrespective of position.
    char* array() const noexcept {
        return bytes;
    }

    size_t capacity() const noexcept {
        return cap;
    }

    size_t position() const noexcept {
        return pos;
    }

    /**
     * Sets the position.
     *
     * @param[in] newPos      New position
     * @return                Reference to this instance
     * @throw     OutOfRange  `newPos > limit()`
     */
    ByteBuf& position(size_t newPos);

    size_t limit() const noexcept {
        return lim;
    }

    /**
     * Sets the limit. If the position is greater than the new limit, then it's set to the limit.
     *
     * @param[in] newLim      New limit
     * @return                Reference to this instance
     * @throw     OutOfRange  `newLim > capacity()`
     */
    ByteBuf& limit(size_t newLim);

    /// Returns the number of bytes between the position and the limit.
    size_t remaining() const noexcept {
        return lim - pos;
    }

    bool hasRemaining() const noexcept {
        return pos < lim;
    }

    /// Returns a pointer to the byte at the position.
    char* current() const noexcept {
        return bytes + pos;
    }

    /**
     * Advances the position.
     *
     * @param[in] nbytes      Number of bytes by which to advance the position
     * @return                Reference to this instance
     * @throw     OutOfRange  `nbytes > remaining()`
     */
    ByteBuf& advance(size_t nbytes);

    /**
     * Prepares for draining what was just filled: the limit is set to the position and the position
     * is set to zero.
     *
     * @return Reference to this instance
     */
    ByteBuf& flip() noexcept;

    /**
     * Prepares for filling: the position is set to zero and the limit to the capacity.
     *
     * @return Reference to this instance
     */
    ByteBuf& clear() noexcept;

    /**
     * Copies bytes into this instance at its position and advances the position.
     *
     * @param[in] data        Bytes to be copied
     * @param[in] nbytes      Number of bytes to copy
     * @return                Reference to this instance
     * @throw     OutOfRange  `nbytes > remaining()`
     */
    ByteBuf& put(const void* data, size_t nbytes);

    /**
     * Copies bytes out of this instance from its position and advances the position.
     *
     * @param[out] data        Destination of the bytes
     * @param[in]  nbytes      Number of bytes to copy
     * @return                 Reference to this instance
     * @throw      OutOfRange  `nbytes > remaining()`
     */
    ByteBuf& get(void* data, size_t nbytes);

    /**
     * Returns the string representation of this instance.
     * @return The string representation of this instance
     */
    String to_string() const;
};

} // namespace

#endif /* MAIN_IO_BYTEBUF_H_ */
