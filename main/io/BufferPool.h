/**
 * Pools of scratch buffers.
 *
 *        File: BufferPool.h
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

#ifndef MAIN_IO_BUFFERPOOL_H_
#define MAIN_IO_BUFFERPOOL_H_

#include "ByteBuf.h"

#include <memory>

namespace chanio {

/// Interface for a pool of scratch buffers
class BufferPool
{
public:
    virtual ~BufferPool() noexcept;

    /**
     * Returns a scratch buffer. Its capacity will be at least `size`, its position zero, and its
     * limit `size`.
     *
     * @param[in] size  Minimum capacity in bytes
     * @return          Scratch buffer
     */
    virtual ByteBuf acquire(size_t size) =0;

    /**
     * Returns a scratch buffer to this instance.
     *
     * @param[in] buf  Buffer previously returned by `acquire()`
     */
    virtual void release(ByteBuf&& buf) noexcept =0;

    /**
     * Returns the process-wide pool. Its limits are the current values of the runtime parameters
     * `RunPar::poolMaxCount` and `RunPar::poolMaxBufSize`, so a pool obtained after
     * `RunPar::setFromYaml()` uses the configured limits.
     *
     * @return  Process-wide pool
     * @threadsafety Safe
     */
    static BufferPool& getDefault();
};

/**
 * A thread-safe pool that caches a limited number of buffers.
 */
class TempBufPool final : public BufferPool
{
    class Impl;

    std::shared_ptr<Impl> pImpl;

public:
    /**
     * Constructs.
     *
     * @param[in] maxCount    Maximum number of cached buffers
     * @param[in] maxBufSize  Buffers with more bytes than this aren't cached
     */
    TempBufPool(
            size_t maxCount,
            size_t maxBufSize);

    ByteBuf acquire(size_t size) override;

    void release(ByteBuf&& buf) noexcept override;

    /**
     * Sets the limits of this instance. Cached buffers that exceed the new limits are freed.
     *
     * @param[in] maxCount    Maximum number of cached buffers
     * @param[in] maxBufSize  Buffers with more bytes than this aren't cached
     */
    void setLimits(
            size_t maxCount,
            size_t maxBufSize);

    /**
     * Returns the number of cached buffers.
     * @return The number of cached buffers
     */
    size_t size() const;
};

/**
 * RAII lease of a scratch buffer. The buffer is acquired on construction and returned to its pool on
 * destruction.
 */
class ScratchBuf final
{
    BufferPool& pool;
    ByteBuf     buf;

public:
    /**
     * Constructs.
     *
     * @param[in] pool  Pool from which to acquire the buffer. Must outlive this instance.
     * @param[in] size  Minimum capacity of the buffer in bytes
     */
    ScratchBuf(
            BufferPool&  pool,
            const size_t size)
        : pool(pool)
        , buf(pool.acquire(size))
    {}

    ScratchBuf(const ScratchBuf& other) =delete;
    ScratchBuf& operator=(const ScratchBuf& rhs) =delete;

    ~ScratchBuf() noexcept {
        pool.release(std::move(buf));
    }

    ByteBuf& operator*() noexcept {
        return buf;
    }

    ByteBuf* operator->() noexcept {
        return &buf;
    }
};

} // namespace

#endif /* MAIN_IO_BUFFERPOOL_H_ */
