/**
 * Transfers every remaining byte from one channel to another.
 *
 *        File: Transfer.h
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

#ifndef MAIN_TRANSFER_TRANSFER_H_
#define MAIN_TRANSFER_TRANSFER_H_

#include "BufferPool.h"
#include "Channel.h"

namespace chanio {

/**
 * Channel-to-channel transfer. The strategy is chosen from the capabilities of the two channels.
 * Whether a transfer succeeds or fails, the position of a seekable destination is left at its
 * starting position plus the number of bytes written and so is the position of a seekable source.
 */
class Transfer
{
public:
    /// Transfer strategies
    enum class Strategy {
        DESCRIPTOR_PUSH,      ///< Source transfers directly to the destination
        DESCRIPTOR_PULL,      ///< Destination transfers directly from the seekable source
        STAGED_TO_DESCRIPTOR, ///< Direct pulls by the destination interleaved with staged chunks
        STAGED                ///< Read into a scratch buffer and write from it
    };

    /**
     * Returns the strategy for a pair of channels.
     *
     * @param[in] srcCaps  Capabilities of the source channel
     * @param[in] dstCaps  Capabilities of the destination channel
     * @return             Strategy for transferring from the source to the destination
     */
    static Strategy select(
            const Channel::Caps& srcCaps,
            const Channel::Caps& dstCaps) noexcept;

    /**
     * Transfers every remaining byte of a channel to another channel.
     *
     * @param[in] src          Readable source channel
     * @param[in] dst          Writable destination channel
     * @param[in] pool         Pool of scratch buffers for the staged strategies
     * @return                 Number of bytes written to the destination
     * @throw     SystemError  I/O failure. Positions have been set as described above.
     */
    static Offset transfer(
            Channel&    src,
            Channel&    dst,
            BufferPool& pool = BufferPool::getDefault());

    /**
     * Returns the name of a strategy.
     *
     * @param[in] strategy  The strategy
     * @return              The name of the strategy
     */
    static String to_string(Strategy strategy);
};

} // namespace

#endif /* MAIN_TRANSFER_TRANSFER_H_ */
