/**
 * An output stream that writes to a channel.
 *
 *        File: ChannelOutputStream.cpp
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

#include "ChannelOutputStream.h"

#include "error.h"

namespace chanio {

ChannelOutputStream::ChannelOutputStream(Channel& chan)
    : chan(chan)
    , mutex()
{}

void ChannelOutputStream::drain(ByteBuf& buf) {
    while (buf.hasRemaining())
        chan.write(buf);
}

void ChannelOutputStream::write(
        const char*  bytes,
        const size_t size,
        const size_t off,
        const size_t len) {
    ByteBuf::vetRange(off, len, size);
    if (len == 0)
        return;

    // The channel doesn't modify the bytes it writes
    ByteBuf buf = ByteBuf::wrap(const_cast<char*>(bytes), size);
    buf.limit(off + len);
    buf.position(off);

    Guard guard{mutex};

    if (!chan.getCaps().selectable) {
        drain(buf);
    }
    else {
        Guard blockingGuard{chan.getBlockingLock()};
        if (!chan.isBlocking())
            throw ILLEGAL_BLOCKING_MODE("Channel " + chan.to_string() +
                    " is in non-blocking mode");
        drain(buf);
    }
}

void ChannelOutputStream::close() {
    chan.close();
}

} // namespace
