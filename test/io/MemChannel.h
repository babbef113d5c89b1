/**
 * In-memory channel for testing.
 *
 *        File: MemChannel.h
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

#ifndef TEST_IO_MEMCHANNEL_H_
#define TEST_IO_MEMCHANNEL_H_

#include "Channel.h"

#include <vector>

namespace chanio {

/**
 * A channel whose bytes are in memory. Capabilities are set on construction; operations outside
 * them fall through to `Channel`, which throws `LogicError`. Every operation is counted and can
 * be made to fail with a `SystemError` on its n-th call (1-based; 0 means never).
 */
class MemChannel : public Channel
{
    Caps  caps;
    Mutex blockingLock;

    void vetFailure(int count, int failAt, const char* what) const;
    void putAt(Offset pos, const char* bytes, size_t nbytes);

public:
    static const Caps GENERIC;    ///< Readable and writable only
    static const Caps SEEKABLE;   ///< Also seekable
    static const Caps DESCRIPTOR; ///< Also descriptor-backed
    static const Caps SELECTABLE; ///< Readable, writable, and selectable

    std::vector<char> data;             ///< Contents
    Offset            pos = 0;          ///< Position
    bool              open = true;
    bool              blocking = true;
    size_t            readChunk;        ///< Maximum bytes per read
    size_t            writeChunk;       ///< Maximum bytes per write
    Offset            pushChunk;        ///< Maximum bytes per `transferTo()`
    Offset            pullChunk;        ///< Maximum bytes per `transferFrom()`

    int  failRead = 0;
    int  failWrite = 0;
    int  failPush = 0;
    int  failPull = 0;
    bool failSetPosition = false;

    int               reads = 0;
    int               writes = 0;
    int               pushes = 0;
    int               pulls = 0;
    int               modeChanges = 0;
    int               closes = 0;
    std::vector<bool> readModes;        ///< Blocking mode during each read of a selectable channel

    /**
     * Returns bytes with a recognizable, non-repeating-at-power-of-two pattern.
     *
     * @param[in] nbytes  Number of bytes
     * @return            The bytes
     */
    static std::vector<char> pattern(size_t nbytes);

    explicit MemChannel(
            const Caps&       caps,
            std::vector<char> data = std::vector<char>());

    MemChannel(const MemChannel& other) =delete;
    MemChannel& operator=(const MemChannel& rhs) =delete;

    Caps getCaps() const noexcept override;
    bool isOpen() const noexcept override;
    void close() override;

    ssize_t read(ByteBuf& buf) override;
    size_t  write(ByteBuf& buf) override;
    size_t  write(ByteBuf& buf, Offset pos) override;

    Offset getPosition() const override;
    void   setPosition(Offset pos) override;
    Offset getSize() const override;

    bool   isBlocking() const override;
    void   setBlocking(bool block) override;
    Mutex& getBlockingLock() override;

    Offset transferTo(Offset pos, Offset count, Channel& dst) override;
    Offset transferFrom(Channel& src, Offset pos, Offset count) override;
};

} // namespace

#endif /* TEST_IO_MEMCHANNEL_H_ */
