/**
 * Abstract, sequential source of bytes.
 *
 *        File: InputStream.h
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

#ifndef MAIN_STREAM_INPUTSTREAM_H_
#define MAIN_STREAM_INPUTSTREAM_H_

#include "CommonTypes.h"

#include <cstddef>
#include <sys/types.h>

namespace chanio {

class OutputStream;

/**
 * Abstract input stream. Reads block until at least one byte is available, the end of the data is
 * reached, or an error occurs.
 */
class InputStream
{
public:
    virtual ~InputStream() noexcept;

    /**
     * Reads one byte.
     *
     * @return              The byte as a value in [0, 255] or `EOS` if there are no more bytes
     * @throw  SystemError  I/O failure
     */
    virtual int read() =0;

    /**
     * Reads bytes into a subrange of an array.
     *
     * @param[out] bytes        The array
     * @param[in]  size         Number of bytes in the array
     * @param[in]  off          Offset in the array at which to store the first byte
     * @param[in]  len          Maximum number of bytes to read
     * @return                  Number of bytes read, `EOS` if there are no more bytes, or 0 if
     *                          `len == 0`
     * @throw      OutOfRange   `[off, off+len)` isn't within the array. Nothing was read.
     * @throw      SystemError  I/O failure
     */
    virtual ssize_t read(
            char*  bytes,
            size_t size,
            size_t off,
            size_t len) =0;

    /**
     * Reads bytes into an array.
     *
     * @param[out] bytes        The array
     * @param[in]  size         Number of bytes in the array
     * @return                  Number of bytes read, `EOS` if there are no more bytes, or 0 if
     *                          `size == 0`
     * @throw      SystemError  I/O failure
     */
    ssize_t read(
            char*  bytes,
            size_t size) {
        return read(bytes, size, 0, size);
    }

    /**
     * Returns an estimate of the number of bytes that can be read without blocking. This
     * implementation returns 0.
     *
     * @return Estimated number of bytes
     */
    virtual int available();

    /**
     * Skips over and discards bytes. This implementation reads into a buffer of at most
     * `RunPar::skipBufSize` bytes until `n` bytes have been discarded or there are no more bytes.
     *
     * @param[in] n            Number of bytes to skip
     * @return                 Number of bytes actually skipped. 0 if `n <= 0`.
     * @throw     SystemError  I/O failure
     */
    virtual Offset skip(Offset n);

    /**
     * Reads every remaining byte and writes it to an output stream. This implementation copies
     * through a buffer of `RunPar::transferSize` bytes.
     *
     * @param[in] out          Output stream
     * @return                 Number of bytes transferred
     * @throw     SystemError  I/O failure
     */
    virtual Offset transferTo(OutputStream& out);

    /**
     * Closes this instance. This implementation does nothing.
     *
     * @throw SystemError  I/O failure
     */
    virtual void close();
};

} // namespace

#endif /* MAIN_STREAM_INPUTSTREAM_H_ */
