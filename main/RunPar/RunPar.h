/**
 * Runtime parameters of the library.
 *
 *        File: RunPar.h
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

#ifndef MAIN_RUNPAR_RUNPAR_H_
#define MAIN_RUNPAR_RUNPAR_H_

#include "CommonTypes.h"

#include <cstddef>

namespace chanio {

/// Namespace for accessing runtime parameters. Each has a usable default.
namespace RunPar {

extern String logLevel;       ///< Logging level
extern size_t transferSize;   ///< Size of the scratch buffer of a staged transfer in bytes
extern size_t skipBufSize;    ///< Maximum size of the discard buffer of a generic skip in bytes
extern size_t poolMaxCount;   ///< Maximum number of buffers cached by the default pool
extern size_t poolMaxBufSize; ///< Buffers larger than this aren't cached by the default pool

/**
 * Sets the runtime parameters to their default values and the logging level accordingly.
 */
void init();

/**
 * Sets runtime parameters from a YAML configuration-file. Parameters not in the file are
 * unchanged. An example file:
 *
 *     logLevel: DEBUG
 *     transfer:
 *       chunkSize: 8192
 *       skipBufSize: 2048
 *     bufferPool:
 *       maxCount: 16
 *       maxBufSize: 1048576
 *
 * @param[in] pathname  Pathname of the configuration-file
 * @throw RuntimeError  Couldn't load or parse the file. The cause is nested.
 */
void setFromYaml(const String& pathname);

/**
 * Vets the runtime parameters.
 * @throw InvalidArgument  A runtime parameter is invalid
 */
void vet();

} // `RunPar` namespace

} // `chanio` namespace

#endif /* MAIN_RUNPAR_RUNPAR_H_ */
