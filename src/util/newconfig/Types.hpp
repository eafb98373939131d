//------------------------------------------------------------------------------
/*
    This file is part of tablemig.
    Copyright (c) 2025, the tablemig developers.

    Permission to use, copy, modify, and distribute this software for any
    purpose with or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL,  DIRECT,  INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <type_traits>
#include <variant>

namespace util::config {

/** @brief Custom types used in a config definition */
enum class ConfigType { Integer, String, Double, Boolean };

/**
 * @brief Prints the name of a config type
 *
 * @param stream The output stream
 * @param type The config type
 * @return The same stream
 */
std::ostream&
operator<<(std::ostream& stream, ConfigType type);

/** @brief Represents the supported config value types */
using Value = std::variant<int64_t, std::string, bool, double>;

/**
 * @brief Get the corresponding config type of a C++ type
 *
 * @tparam Type The type to get the config type of
 * @return The ConfigType matching Type
 */
template <typename Type>
constexpr ConfigType
getType()
{
    if constexpr (std::is_same_v<Type, bool>) {
        return ConfigType::Boolean;
    } else if constexpr (std::is_integral_v<Type>) {
        return ConfigType::Integer;
    } else if constexpr (std::is_same_v<Type, std::string>) {
        return ConfigType::String;
    } else {
        static_assert(std::is_floating_point_v<Type>, "Unsupported config type");
        return ConfigType::Double;
    }
}

}  // namespace util::config
