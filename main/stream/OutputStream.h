/**
 * Abstract, sequential sink of bytes.
 *
 *        File: OutputStream.h
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

#ifndef MAIN_STREAM_OUTPUTSTREAM_H_
#define MAIN_STREAM_OUTPUTSTREAM_H_

#include <cstddef>

namespace chanio {

class Channel;

/// Abstract output stream. Writes block until every byte has been written.
class OutputStream
{
public:
    virtual ~OutputStream() noexcept;

    /**
     * Writes one byte.
     *
     * @param[in] byte         The byte to write. Only the low-order 8 bits are used.
     * @throw     SystemError  I/O failure
     */
    virtual void write(int byte);

    /**
     * Writes a subrange of an array.
     *
     * @param[in] bytes        The array
     * @param[in] size         Number of bytes in the array
     * @param[in] off          Offset in the array of the first byte to write
     * @param[in] len          Number of bytes to write
     * @throw     OutOfRange   `[off, off+len)` isn't within the array. Nothing was written.
     * @throw     SystemError  I/O failure
     */
    virtual void write(
            const char* bytes,
            size_t      size,
            size_t      off,
            size_t      len) =0;

    /**
     * Writes an array.
     *
     * @param[in] bytes        The array
     * @param[in] size         Number of bytes in the array
     * @throw     SystemError  I/O failure
     */
    void write(
            const char* bytes,
            size_t      size) {
        write(bytes, size, 0, size);
    }

    /**
     * Flushes buffered bytes. This implementation does nothing.
     *
     * @throw SystemError  I/O failure
     */
    virtual void flush();

    /**
     * Closes this instance. This implementation does nothing.
     *
     * @throw SystemError  I/O failure
     */
    virtual void close();

    /**
     * Returns the channel that this instance writes to, if any. A non-null channel allows a
     * channel-backed input stream to transfer bytes directly. This implementation returns
     * `nullptr`.
     *
     * @return  Underlying channel or `nullptr`
     */
    virtual Channel* getChannel() noexcept;
};

} // namespace

#endif /* MAIN_STREAM_OUTPUTSTREAM_H_ */
