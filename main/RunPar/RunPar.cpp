/**
 * Runtime parameters of the library.
 *
 *        File: RunPar.cpp
 *
 *    Copyright 2023 University Corporation for Atmospheric Research
 *
 * Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except
 * in compliance with the License. You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software distributed under the License
 * is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express
 * or implied. See the License for the specific language governing permissions and limitations under
 * the License.
 */

#include "config.h"

#include "RunPar.h"

#include "error.h"
#include "logging.h"
#include "Parser.h"

#include <exception>
#include <yaml-cpp/yaml.h>

namespace chanio {
namespace RunPar {

static const char*  DEF_LOG_LEVEL       = "NOTE";
static const size_t DEF_TRANSFER_SIZE   = 8192;
static const size_t DEF_SKIP_BUF_SIZE   = 2048;
static const size_t DEF_POOL_MAX_COUNT  = 16;
static const size_t DEF_POOL_MAX_BUFSIZ = 1048576;

String logLevel{DEF_LOG_LEVEL};
size_t transferSize   = DEF_TRANSFER_SIZE;
size_t skipBufSize    = DEF_SKIP_BUF_SIZE;
size_t poolMaxCount   = DEF_POOL_MAX_COUNT;
size_t poolMaxBufSize = DEF_POOL_MAX_BUFSIZ;

void init()
{
    logLevel = DEF_LOG_LEVEL;
    log_setLevel(logLevel);
    transferSize = DEF_TRANSFER_SIZE;
    skipBufSize = DEF_SKIP_BUF_SIZE;
    poolMaxCount = DEF_POOL_MAX_COUNT;
    poolMaxBufSize = DEF_POOL_MAX_BUFSIZ;
}

void setFromYaml(const String& pathname)
{
    try {
        auto node0 = YAML::LoadFile(pathname);

        String level;
        if (Parser::tryDecode<String>(node0, "logLevel", level)) {
            log_setLevel(level);
            logLevel = level;
        }

        auto node1 = node0["transfer"];
        if (node1) {
            Parser::tryDecodeSize(node1, "chunkSize", transferSize);
            Parser::tryDecodeSize(node1, "skipBufSize", skipBufSize);
        }

        node1 = node0["bufferPool"];
        if (node1) {
            Parser::tryDecodeSize(node1, "maxCount", poolMaxCount);
            Parser::tryDecodeSize(node1, "maxBufSize", poolMaxBufSize);
        }

        LOG_DEBUG("Loaded runtime parameters from \"%s\": {transferSize=%zu, skipBufSize=%zu, "
                "poolMaxCount=%zu, poolMaxBufSize=%zu}", pathname.data(), transferSize,
                skipBufSize, poolMaxCount, poolMaxBufSize);
    }
    catch (const std::exception& ex) {
        std::throw_with_nested(RUNTIME_ERROR("Couldn't parse YAML file \"" + pathname + "\""));
    }
}

void vet()
{
    if (transferSize == 0)
        throw INVALID_ARGUMENT("Transfer size is zero");

    if (skipBufSize == 0)
        throw INVALID_ARGUMENT("Size of skip buffer is zero");

    if (poolMaxBufSize < transferSize)
        throw INVALID_ARGUMENT("Largest cached buffer, " + std::to_string(poolMaxBufSize) +
                " bytes, is smaller than the transfer size, " + std::to_string(transferSize) +
                " bytes");
}

} // `RunPar` namespace
} // `chanio` namespace
