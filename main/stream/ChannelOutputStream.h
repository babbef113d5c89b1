/**
 * An output stream that writes to a channel.
 *
 *        File: ChannelOutputStream.h
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

#ifndef MAIN_STREAM_CHANNELOUTPUTSTREAM_H_
#define MAIN_STREAM_CHANNELOUTPUTSTREAM_H_

#include "ByteBuf.h"
#include "Channel.h"
#include "OutputStream.h"

namespace chanio {

/// A blocking output stream over a writable channel. The channel is referenced, not owned.
class ChannelOutputStream : public OutputStream
{
    Channel& chan;
    Mutex    mutex; ///< Serializes writes

    /**
     * Writes every remaining byte of a buffer.
     *
     * @pre  `mutex` is locked
     */
    void drain(ByteBuf& buf);

public:
    /**
     * Constructs.
     *
     * @param[in] chan  Writable channel. Must outlive this instance.
     */
    explicit ChannelOutputStream(Channel& chan);

    ChannelOutputStream(const ChannelOutputStream& other) =delete;
    ChannelOutputStream& operator=(const ChannelOutputStream& rhs) =delete;

    using OutputStream::write;

    /**
     * Writes a subrange of an array. Returns only after every byte has been written. If the
     * channel is selectable, then its blocking lock is held for the duration.
     *
     * @param[in] bytes                The array
     * @param[in] size                 Number of bytes in the array
     * @param[in] off                  Offset in the array of the first byte to write
     * @param[in] len                  Number of bytes to write
     * @throw     OutOfRange           `[off, off+len)` isn't within the array. Nothing was
     *                                 written.
     * @throw     IllegalBlockingMode  Channel is in non-blocking mode
     * @throw     SystemError          I/O failure
     */
    void write(
            const char* bytes,
            size_t      size,
            size_t      off,
            size_t      len) override;

    /**
     * Closes the channel.
     *
     * @throw SystemError  I/O failure
     */
    void close() override;

    Channel* getChannel() noexcept override {
        return &chan;
    }
};

} // namespace

#endif /* MAIN_STREAM_CHANNELOUTPUTSTREAM_H_ */
