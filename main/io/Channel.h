/**
 * Interface to an open source or sink of bytes.
 *
 *        File: Channel.h
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

#ifndef MAIN_IO_CHANNEL_H_
#define MAIN_IO_CHANNEL_H_

#include "ByteBuf.h"
#include "CommonTypes.h"

#include <sys/types.h>

namespace chanio {

/**
 * An open channel. Concrete channels are provided by the user of this package. What a channel can
 * do is given by its capabilities; the default implementation of every operation that depends on a
 * capability throws a `LogicError`.
 *
 * A channel is owned by whoever opened it. Streams only reference it.
 */
class Channel
{
public:
    /// Capabilities of a channel. Each is independent of the others except as noted.
    struct Caps {
        bool readable;    ///< `read(ByteBuf&)` is supported
        bool writable;    ///< `write(ByteBuf&)` is supported
        bool seekable;    ///< Position and size are supported
        bool selectable;  ///< Blocking-mode can be queried and changed
        bool descriptor;  ///< Descriptor-backed: positional I/O and direct transfers. Implies
                          ///< `seekable`.

        String to_string() const;
    };

    /// Kind of channel as far as bulk transfers are concerned
    enum class Kind {
        GENERIC,    ///< Neither seekable nor descriptor-backed
        SEEKABLE,   ///< Seekable but not descriptor-backed
        DESCRIPTOR  ///< Descriptor-backed
    };

    /**
     * Returns the kind of channel corresponding to a set of capabilities.
     *
     * @param[in] caps  Channel capabilities
     * @return          Corresponding kind of channel
     */
    static Kind kindOf(const Caps& caps) noexcept;

    virtual ~Channel() noexcept;

    /**
     * Returns the capabilities of this instance. They don't change.
     *
     * @return Capabilities of this instance
     */
    virtual Caps getCaps() const noexcept =0;

    /**
     * Indicates if this instance is open.
     *
     * @retval true   This instance is open
     * @retval false  This instance is closed
     */
    virtual bool isOpen() const noexcept =0;

    /**
     * Closes this instance. Idempotence is the responsibility of the implementation.
     *
     * @throw SystemError  I/O failure
     */
    virtual void close() =0;

    /**
     * Reads bytes into a buffer, starting at its position, and advances the buffer's position.
     * Advances the position of a seekable instance.
     *
     * @param[in,out] buf          Buffer
     * @return                     Number of bytes read or `EOS` if there are no more bytes. Might
     *                             be zero if the buffer is full or this instance is non-blocking.
     * @throw         LogicError   Instance isn't readable
     * @throw         SystemError  I/O failure
     */
    virtual ssize_t read(ByteBuf& buf);

    /**
     * Writes bytes from a buffer, starting at its position, and advances the buffer's position.
     * Advances the position of a seekable instance. Might not write every remaining byte.
     *
     * @param[in,out] buf          Buffer
     * @return                     Number of bytes written
     * @throw         LogicError   Instance isn't writable
     * @throw         SystemError  I/O failure
     */
    virtual size_t write(ByteBuf& buf);

    /**
     * Writes bytes from a buffer at a given position in this instance. Advances the buffer's
     * position but not this instance's.
     *
     * @param[in,out] buf          Buffer
     * @param[in]     pos          Position in this instance at which to start writing
     * @return                     Number of bytes written
     * @throw         LogicError   Instance isn't descriptor-backed
     * @throw         SystemError  I/O failure
     */
    virtual size_t write(ByteBuf& buf, Offset pos);

    /**
     * Returns the position of this instance.
     *
     * @return                    Position in bytes from the start
     * @throw     LogicError      Instance isn't seekable
     * @throw     SystemError     I/O failure
     */
    virtual Offset getPosition() const;

    /**
     * Sets the position of this instance. The position may exceed the size.
     *
     * @param[in] pos             New position in bytes from the start
     * @throw     LogicError      Instance isn't seekable
     * @throw     SystemError     I/O failure
     */
    virtual void setPosition(Offset pos);

    /**
     * Returns the size of this instance.
     *
     * @return                    Size in bytes
     * @throw     LogicError      Instance isn't seekable
     * @throw     SystemError     I/O failure
     */
    virtual Offset getSize() const;

    /**
     * Indicates if this instance is in blocking mode.
     *
     * @retval    true            Instance is in blocking mode
     * @retval    false           Instance is in non-blocking mode
     * @throw     LogicError      Instance isn't selectable
     */
    virtual bool isBlocking() const;

    /**
     * Sets the blocking mode of this instance. The caller should hold the blocking lock.
     *
     * @param[in] block           Whether or not the instance should block
     * @throw     LogicError      Instance isn't selectable
     * @throw     SystemError     I/O failure
     * @see       getBlockingLock()
     */
    virtual void setBlocking(bool block);

    /**
     * Returns the mutex that guards the blocking mode of this instance. It is owned by this
     * instance.
     *
     * @return                    Blocking-mode mutex
     * @throw     LogicError      Instance isn't selectable
     */
    virtual Mutex& getBlockingLock();

    /**
     * Writes bytes of this instance, starting at a given position, into another channel. Neither
     * this instance's position nor its size is modified. The destination is written at its
     * position, which advances if it's seekable.
     *
     * @param[in] pos             Position in this instance of the first byte to transfer
     * @param[in] count           Maximum number of bytes to transfer
     * @param[in] dst             Destination channel
     * @return                    Number of bytes transferred. Zero if `pos >= getSize()`.
     * @throw     LogicError      Instance isn't descriptor-backed
     * @throw     SystemError     I/O failure
     */
    virtual Offset transferTo(Offset pos, Offset count, Channel& dst);

    /**
     * Reads bytes from another channel and writes them into this instance starting at a given
     * position. This instance's position is not modified. The source is read at its position,
     * which advances if it's seekable.
     *
     * @param[in] src             Source channel
     * @param[in] pos             Position in this instance at which to start writing
     * @param[in] count           Maximum number of bytes to transfer
     * @return                    Number of bytes transferred
     * @throw     LogicError      Instance isn't descriptor-backed
     * @throw     SystemError     I/O failure
     */
    virtual Offset transferFrom(Channel& src, Offset pos, Offset count);

    /**
     * Returns the string representation of this instance.
     * @return The string representation of this instance
     */
    virtual String to_string() const;
};

} // namespace

#endif /* MAIN_IO_CHANNEL_H_ */
