/**
 * Transfers every remaining byte from one channel to another.
 *
 *        File: Transfer.cpp
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

#include "Transfer.h"

#include "error.h"
#include "logging.h"
#include "RunPar.h"

namespace chanio {

namespace {

using Strategy = Transfer::Strategy;

/**
 * Sets the position of a seekable channel to its starting position plus a byte count when the
 * transfer ends. The normal path calls `settle()`, which propagates failure; otherwise the
 * destructor sets the position and logs failure.
 */
class PositionKeeper
{
    Channel*      chan;    ///< Channel or `nullptr` if it isn't seekable
    const Offset  start;   ///< Starting position
    const Offset& count;   ///< Number of bytes transferred
    bool          settled;

public:
    PositionKeeper(
            Channel&      chan,
            const Offset& count)
        : chan((chan.getCaps().seekable || chan.getCaps().descriptor) ? &chan : nullptr)
        , start(this->chan ? chan.getPosition() : 0)
        , count(count)
        , settled(false)
    {}

    PositionKeeper(const PositionKeeper& other) =delete;
    PositionKeeper& operator=(const PositionKeeper& rhs) =delete;

    ~PositionKeeper() noexcept {
        if (chan && !settled) {
            try {
                chan->setPosition(start + count);
            }
            catch (const std::exception& ex) {
                LOG_ERROR(ex, "Couldn't set position of channel %s to %lld",
                        chan->to_string().data(), static_cast<long long>(start + count));
            }
        }
    }

    Offset getStart() const noexcept {
        return start;
    }

    void settle() {
        settled = true;
        if (chan)
            chan->setPosition(start + count);
    }
};

/// Drains a flipped scratch buffer into a channel at the channel's position.
void drain(
        ByteBuf&  buf,
        Channel&  dst,
        Offset&   bytes) {
    while (buf.hasRemaining())
        bytes += static_cast<Offset>(dst.write(buf));
}

/// Drains a flipped scratch buffer into a channel at the given starting position.
void drain(
        ByteBuf&     buf,
        Channel&     dst,
        const Offset dstStart,
        Offset&      bytes) {
    while (buf.hasRemaining())
        bytes += static_cast<Offset>(dst.write(buf, dstStart + bytes));
}

void descriptorPush(
        Channel& src,
        Channel& dst,
        Offset&  bytes) {
    PositionKeeper srcKeeper(src, bytes);
    PositionKeeper dstKeeper(dst, bytes);
    const Offset   srcStart = srcKeeper.getStart();
    const Offset   srcSize = src.getSize();

    while (srcStart + bytes < srcSize) {
        const Offset n = src.transferTo(srcStart + bytes, OFFSET_MAX, dst);
        if (n <= 0) {
            LOG_DEBUG("Source %s stopped short at position %lld", src.to_string().data(),
                    static_cast<long long>(srcStart + bytes));
            break;
        }
        bytes += n;
    }

    dstKeeper.settle();
    srcKeeper.settle();
}

void descriptorPull(
        Channel& src,
        Channel& dst,
        Offset&  bytes) {
    PositionKeeper srcKeeper(src, bytes);
    PositionKeeper dstKeeper(dst, bytes);
    const Offset   srcStart = srcKeeper.getStart();
    const Offset   dstStart = dstKeeper.getStart();
    const Offset   srcSize = src.getSize();

    while (srcStart + bytes < srcSize) {
        const Offset n = dst.transferFrom(src, dstStart + bytes, OFFSET_MAX);
        if (n <= 0) {
            LOG_DEBUG("Source %s stopped short at position %lld", src.to_string().data(),
                    static_cast<long long>(srcStart + bytes));
            break;
        }
        bytes += n;
    }

    dstKeeper.settle();
    srcKeeper.settle();
}

void stagedToDescriptor(
        Channel&    src,
        Channel&    dst,
        BufferPool& pool,
        Offset&     bytes) {
    ScratchBuf     buf(pool, RunPar::transferSize);
    PositionKeeper dstKeeper(dst, bytes);
    const Offset   dstStart = dstKeeper.getStart();

    for (;;) {
        bytes += dst.transferFrom(src, dstStart + bytes, OFFSET_MAX);

        if (src.read(*buf) < 0)
            break;
        buf->flip();
        drain(*buf, dst, dstStart, bytes);
        buf->clear().limit(RunPar::transferSize);
    }

    dstKeeper.settle();
}

void staged(
        Channel&    src,
        Channel&    dst,
        BufferPool& pool,
        Offset&     bytes) {
    ScratchBuf     buf(pool, RunPar::transferSize);
    PositionKeeper srcKeeper(src, bytes);
    PositionKeeper dstKeeper(dst, bytes);

    while (src.read(*buf) >= 0) {
        buf->flip();
        drain(*buf, dst, bytes);
        buf->clear().limit(RunPar::transferSize);
    }

    dstKeeper.settle();
    srcKeeper.settle();
}

} // namespace

Transfer::Strategy Transfer::select(
        const Channel::Caps& srcCaps,
        const Channel::Caps& dstCaps) noexcept {
    // Indexed by source kind then destination kind
    static const Strategy strategies[3][3] = {
        {Strategy::STAGED,          Strategy::STAGED,          Strategy::STAGED_TO_DESCRIPTOR},
        {Strategy::STAGED,          Strategy::STAGED,          Strategy::DESCRIPTOR_PULL},
        {Strategy::DESCRIPTOR_PUSH, Strategy::DESCRIPTOR_PUSH, Strategy::DESCRIPTOR_PUSH}
    };

    return strategies[static_cast<int>(Channel::kindOf(srcCaps))]
                     [static_cast<int>(Channel::kindOf(dstCaps))];
}

Offset Transfer::transfer(
        Channel&    src,
        Channel&    dst,
        BufferPool& pool) {
    const Strategy strategy = select(src.getCaps(), dst.getCaps());
    Offset         bytes = 0;

    LOG_DEBUG("Transferring from %s to %s by %s", src.to_string().data(),
            dst.to_string().data(), to_string(strategy).data());

    try {
        switch (strategy) {
        case Strategy::DESCRIPTOR_PUSH:
            descriptorPush(src, dst, bytes);
            break;
        case Strategy::DESCRIPTOR_PULL:
            descriptorPull(src, dst, bytes);
            break;
        case Strategy::STAGED_TO_DESCRIPTOR:
            stagedToDescriptor(src, dst, pool, bytes);
            break;
        case Strategy::STAGED:
            staged(src, dst, pool, bytes);
            break;
        }
    }
    catch (const std::exception& ex) {
        LOG_DEBUG(ex, "%s transfer failed after %lld bytes", to_string(strategy).data(),
                static_cast<long long>(bytes));
        throw;
    }

    LOG_DEBUG("Transferred %lld bytes by %s", static_cast<long long>(bytes),
            to_string(strategy).data());
    return bytes;
}

String Transfer::to_string(const Strategy strategy) {
    switch (strategy) {
    case Strategy::DESCRIPTOR_PUSH:      return "DESCRIPTOR_PUSH";
    case Strategy::DESCRIPTOR_PULL:      return "DESCRIPTOR_PULL";
    case Strategy::STAGED_TO_DESCRIPTOR: return "STAGED_TO_DESCRIPTOR";
    case Strategy::STAGED:               return "STAGED";
    }
    throw INVALID_ARGUMENT("Unknown transfer strategy " +
            std::to_string(static_cast<int>(strategy)));
}

} // namespace
