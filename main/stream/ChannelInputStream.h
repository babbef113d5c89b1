/**
 * An input stream that reads from a channel.
 *
 *        File: ChannelInputStream.h
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

#ifndef MAIN_STREAM_CHANNELINPUTSTREAM_H_
#define MAIN_STREAM_CHANNELINPUTSTREAM_H_

#include "BufferPool.h"
#include "ByteBuf.h"
#include "Channel.h"
#include "InputStream.h"

#include <memory>

namespace chanio {

/**
 * A blocking, sequential input stream over a readable channel. The channel is referenced, not
 * owned. Reads are serialized.
 */
class ChannelInputStream : public InputStream
{
    Channel&                chan;  ///< Underlying channel
    BufferPool&             pool;  ///< Source of scratch buffers for transfers
    Mutex                   mutex; ///< Serializes reads
    ByteBuf                 view;  ///< View of the caller's array from the previous read
    std::unique_ptr<char[]> b1;    ///< Array for single-byte reads. Allocated on first use.

    /**
     * Reads into a subrange of an array.
     *
     * @pre  `mutex` is locked
     */
    ssize_t readLocked(
            char*  bytes,
            size_t size,
            size_t off,
            size_t len);

protected:
    /**
     * Reads from the channel into a buffer, blocking if necessary. Called by `read()` and
     * `read(char*, size_t, size_t, size_t)`.
     *
     * @param[in,out] buf                  Buffer
     * @return                             Number of bytes read or `EOS`
     * @throw         IllegalBlockingMode  Channel is in non-blocking mode
     * @throw         SystemError          I/O failure
     */
    virtual ssize_t readChannel(ByteBuf& buf);

public:
    /**
     * Reads from a channel into a buffer. If the channel is selectable, then its blocking lock is
     * held for the duration of the read, the blocking mode is set to `block` for the read, and the
     * previous mode is restored afterwards -- even if the read fails.
     *
     * @param[in]     chan                 Readable channel
     * @param[in,out] buf                  Buffer
     * @param[in]     block                Whether or not the read should block
     * @return                             Number of bytes read or `EOS`
     * @throw         IllegalBlockingMode  The channel is selectable and in non-blocking mode
     * @throw         SystemError          I/O failure
     */
    static ssize_t read(
            Channel& chan,
            ByteBuf& buf,
            bool     block);

    /**
     * Constructs.
     *
     * @param[in] chan  Readable channel. Must outlive this instance.
     * @param[in] pool  Pool of scratch buffers for `transferTo()`. Must outlive this instance.
     */
    explicit ChannelInputStream(
            Channel&    chan,
            BufferPool& pool = BufferPool::getDefault());

    ChannelInputStream(const ChannelInputStream& other) =delete;
    ChannelInputStream& operator=(const ChannelInputStream& rhs) =delete;

    using InputStream::read;

    int read() override;

    /**
     * Reads into a subrange of an array. If the array is the same one as in the previous call,
     * then the view of it is reused.
     *
     * @param[out] bytes                The array
     * @param[in]  size                 Number of bytes in the array
     * @param[in]  off                  Offset in the array at which to store the first byte
     * @param[in]  len                  Maximum number of bytes to read
     * @return                          Number of bytes read, `EOS` if there are no more bytes, or
     *                                  0 if `len == 0`
     * @throw      OutOfRange           `[off, off+len)` isn't within the array. Nothing was read.
     * @throw      IllegalBlockingMode  Channel is in non-blocking mode
     * @throw      SystemError          I/O failure
     */
    ssize_t read(
            char*  bytes,
            size_t size,
            size_t off,
            size_t len) override;

    /**
     * Returns the number of bytes between the position and the end of a seekable channel, capped at
     * `INT_MAX`. Returns 0 for other channels.
     *
     * @return             Number of remaining bytes
     * @throw SystemError  I/O failure
     */
    int available() override;

    /**
     * Skips bytes. A seekable channel is repositioned: for `n > 0` to `min(pos+n, size)`; otherwise
     * to `max(pos+n, 0)`. Other channels are read and the bytes discarded.
     *
     * @param[in] n            Number of bytes to skip. May be negative for a seekable channel.
     * @return                 Change in position. May be negative.
     * @throw     SystemError  I/O failure
     */
    Offset skip(Offset n) override;

    /**
     * Transfers every remaining byte to an output stream. If the output stream is backed by a
     * channel, then the bytes are transferred channel-to-channel by `Transfer::transfer()`.
     *
     * @param[in] out          Output stream
     * @return                 Number of bytes transferred
     * @throw     SystemError  I/O failure
     */
    Offset transferTo(OutputStream& out) override;

    /**
     * Closes the channel.
     *
     * @throw SystemError  I/O failure
     */
    void close() override;

    /**
     * Returns the underlying channel.
     * @return The underlying channel
     */
    Channel& getChannel() const noexcept {
        return chan;
    }
};

} // namespace

#endif /* MAIN_STREAM_CHANNELINPUTSTREAM_H_ */
