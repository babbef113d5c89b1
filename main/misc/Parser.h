/**
 * This file declares a parser of YAML scalars.
 *
 *  @file:  Parser.h
 *
 *    Copyright 2022 University Corporation for Atmospheric Research
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

#ifndef MAIN_MISC_PARSER_H_
#define MAIN_MISC_PARSER_H_

#include "CommonTypes.h"
#include "error.h"

#include <yaml-cpp/yaml.h>

namespace chanio {

/// Class for parsing a scalar YAML value.
class Parser
{
public:
    /**
     * Tries to decode a scalar (i.e., primitive) value in a YAML map. Does nothing if the scalar
     * doesn't exist.
     *
     * @tparam     T           Type of scalar value
     * @param[in]  mapNode     Map containing the scalar
     * @param[in]  key         Name of the scalar
     * @param[out] value       Scalar value
     * @retval     true        Scalar exists and was successfully decoded into `value`
     * @retval     false       Scalar doesn't exist. `value` is unchanged.
     * @throw InvalidArgument  Node isn't a map
     * @throw InvalidArgument  Subnode with given name isn't a scalar
     * @throw InvalidArgument  Scalar couldn't be decoded as given type
     */
    template<class T>
    static bool tryDecode(const YAML::Node& mapNode,
                          const String&     key,
                          T&                value) {
        if (!mapNode.IsMap())
            throw INVALID_ARGUMENT("Node \"" + mapNode.Tag() + "\" isn't a map");

        auto child = mapNode[key];

        if (child) {
            if (!child.IsScalar())
                throw INVALID_ARGUMENT("Node \"" + key + "\" isn't scalar");

            try {
                value = child.as<T>();
            }
            catch (const std::exception& ex) {
                std::throw_with_nested(INVALID_ARGUMENT("Couldn't decode \"" + key + "\" value \"" +
                        child.as<String>() + "\""));
            }
        }

        return static_cast<bool>(child);
    }

    /**
     * Tries to decode a byte-count in a YAML map. Does nothing if the scalar doesn't exist.
     *
     * @param[in]  mapNode     Map containing the scalar
     * @param[in]  key         Name of the scalar
     * @param[out] value       Byte-count
     * @retval     true        Scalar exists and was successfully decoded into `value`
     * @retval     false       Scalar doesn't exist. `value` is unchanged.
     * @throw InvalidArgument  Scalar isn't a positive integer
     */
    static bool tryDecodeSize(
            const YAML::Node& mapNode,
            const String&     key,
            size_t&           value) {
        long long count;
        const bool exists = tryDecode<long long>(mapNode, key, count);
        if (exists) {
            if (count <= 0)
                throw INVALID_ARGUMENT("Value of \"" + key + "\" isn't positive: " +
                        std::to_string(count));
            value = static_cast<size_t>(count);
        }
        return exists;
    }
};

} // namespace

#endif /* MAIN_MISC_PARSER_H_ */
