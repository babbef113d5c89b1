/**
 * Pools of scratch buffers.
 *
 *        File: BufferPool.cpp
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

#include "BufferPool.h"

#include "error.h"
#include "logging.h"
#include "RunPar.h"

#include <iterator>
#include <vector>

namespace chanio {

BufferPool::~BufferPool() noexcept
{}

BufferPool& BufferPool::getDefault() {
    static TempBufPool pool(RunPar::poolMaxCount, RunPar::poolMaxBufSize);
    pool.setLimits(RunPar::poolMaxCount, RunPar::poolMaxBufSize);
    return pool;
}

/**************************************************************************************************/

/// Implementation of a pool that caches a limited number of buffers
class TempBufPool::Impl
{
    mutable Mutex        mutex;      ///< Guards the cache
    std::vector<ByteBuf> cache;      ///< Cached buffers. Most recently released at the back.
    size_t               maxCount;   ///< Maximum number of cached buffers
    size_t               maxBufSize; ///< Largest buffer that will be cached

public:
    Impl(   const size_t maxCount,
            const size_t maxBufSize)
        : mutex()
        , cache()
        , maxCount(maxCount)
        , maxBufSize(maxBufSize)
    {
        cache.reserve(maxCount); // So that `release()` never allocates
    }

    ByteBuf acquire(const size_t size) {
        {
            Guard guard{mutex};

            for (auto iter = cache.rbegin(); iter != cache.rend(); ++iter) {
                if (iter->capacity() >= size) {
                    ByteBuf buf(std::move(*iter));
                    cache.erase(std::next(iter).base());
                    buf.clear().limit(size);
                    return buf;
                }
            }
        }

        LOG_TRACE("Allocating %zu-byte scratch buffer", size);
        return ByteBuf(size);
    }

    void release(ByteBuf&& buf) noexcept {
        Guard guard{mutex};
        if (maxCount == 0 || buf.capacity() == 0 || buf.capacity() > maxBufSize)
            return; // Buffer is freed

        if (cache.size() < maxCount) {
            cache.push_back(std::move(buf));
        }
        else {
            // Replace the smallest cached buffer if it's smaller
            auto smallest = cache.begin();
            for (auto iter = cache.begin(); iter != cache.end(); ++iter)
                if (iter->capacity() < smallest->capacity())
                    smallest = iter;
            if (smallest->capacity() < buf.capacity())
                *smallest = std::move(buf);
        }
    }

    void setLimits(
            const size_t maxCount,
            const size_t maxBufSize) {
        Guard guard{mutex};

        if (maxCount == this->maxCount && maxBufSize == this->maxBufSize)
            return;

        for (auto iter = cache.begin(); iter != cache.end(); ) {
            if (iter->capacity() > maxBufSize) {
                iter = cache.erase(iter);
            }
            else {
                ++iter;
            }
        }
        if (cache.size() > maxCount)
            cache.erase(cache.begin(), cache.begin() + (cache.size() - maxCount)); // Oldest first
        cache.reserve(maxCount);

        this->maxCount = maxCount;
        this->maxBufSize = maxBufSize;
    }

    size_t size() const {
        Guard guard{mutex};
        return cache.size();
    }
};

TempBufPool::TempBufPool(
        const size_t maxCount,
        const size_t maxBufSize)
    : pImpl(std::make_shared<Impl>(maxCount, maxBufSize))
{}

ByteBuf TempBufPool::acquire(const size_t size) {
    return pImpl->acquire(size);
}

void TempBufPool::release(ByteBuf&& buf) noexcept {
    pImpl->release(std::move(buf));
}

void TempBufPool::setLimits(
        const size_t maxCount,
        const size_t maxBufSize) {
    pImpl->setLimits(maxCount, maxBufSize);
}

size_t TempBufPool::size() const {
    return pImpl->size();
}

} // namespace
