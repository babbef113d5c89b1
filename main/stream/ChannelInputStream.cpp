/**
 * An input stream that reads from a channel.
 *
 *        File: ChannelInputStream.cpp
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

#include "ChannelInputStream.h"

#include "error.h"
#include "logging.h"
#include "OutputStream.h"
#include "Transfer.h"

#include <algorithm>
#include <climits>

namespace chanio {

ssize_t ChannelInputStream::read(
        Channel&   chan,
        ByteBuf&   buf,
        const bool block) {
    if (!chan.getCaps().selectable)
        return chan.read(buf);

    Guard      guard{chan.getBlockingLock()};
    const bool wasBlocking = chan.isBlocking();

    if (!wasBlocking)
        throw ILLEGAL_BLOCKING_MODE("Channel " + chan.to_string() + " is in non-blocking mode");
    if (block == wasBlocking)
        return chan.read(buf);

    chan.setBlocking(block);
    ssize_t nread;
    try {
        nread = chan.read(buf);
    }
    catch (...) {
        try {
            chan.setBlocking(wasBlocking);
        }
        catch (const std::exception& ex) {
            LOG_ERROR(ex, "Couldn't restore blocking mode of channel %s",
                    chan.to_string().data());
        }
        throw;
    }
    chan.setBlocking(wasBlocking);

    return nread;
}

ChannelInputStream::ChannelInputStream(
        Channel&    chan,
        BufferPool& pool)
    : chan(chan)
    , pool(pool)
    , mutex()
    , view()
    , b1()
{}

ssize_t ChannelInputStream::readChannel(ByteBuf& buf) {
    return read(chan, buf, true);
}

ssize_t ChannelInputStream::readLocked(
        char*        bytes,
        const size_t size,
        const size_t off,
        const size_t len) {
    ByteBuf::vetRange(off, len, size);
    if (len == 0)
        return 0;

    if (!view.wraps(bytes, size))
        view = ByteBuf::wrap(bytes, size);
    view.limit(std::min(off + len, view.capacity()));
    view.position(off);

    return readChannel(view);
}

int ChannelInputStream::read() {
    Guard guard{mutex};

    if (!b1)
        b1.reset(new char[1]);

    return (readLocked(b1.get(), 1, 0, 1) == 1)
            ? static_cast<unsigned char>(b1[0])
            : EOS;
}

ssize_t ChannelInputStream::read(
        char*        bytes,
        const size_t size,
        const size_t off,
        const size_t len) {
    Guard guard{mutex};
    return readLocked(bytes, size, off, len);
}

int ChannelInputStream::available() {
    if (!chan.getCaps().seekable)
        return 0;

    const Offset rem = std::max<Offset>(0, chan.getSize() - chan.getPosition());
    return (rem > INT_MAX) ? INT_MAX : static_cast<int>(rem);
}

Offset ChannelInputStream::skip(const Offset n) {
    if (!chan.getCaps().seekable)
        return InputStream::skip(n);

    Guard        guard{mutex};
    const Offset pos = chan.getPosition();
    Offset       newPos;

    if (n > 0) {
        const Offset size = chan.getSize();
        newPos = (n > OFFSET_MAX - pos || pos + n > size)
                ? size
                : pos + n;
    }
    else {
        newPos = std::max<Offset>(pos + n, 0);
    }

    chan.setPosition(newPos);
    return newPos - pos;
}

Offset ChannelInputStream::transferTo(OutputStream& out) {
    Channel* const dst = out.getChannel();

    if (dst == nullptr) {
        LOG_TRACE("Output stream has no channel. Copying via stream.");
        return InputStream::transferTo(out);
    }

    return Transfer::transfer(chan, *dst, pool);
}

void ChannelInputStream::close() {
    chan.close();
}

} // namespace
