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

#include "util/newconfig/ConfigValue.hpp"
#include "util/newconfig/Error.hpp"
#include "util/newconfig/Types.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace util::config {

/**
 * @brief Array definition to store multiple values provided by the user from the config file
 *
 * Every element must match the item pattern given on construction.
 */
class Array {
public:
    /**
     * @brief Constructs an Array with the provided pattern for its items
     *
     * @param arg The config value every element must follow
     */
    Array(ConfigValue arg);

    /**
     * @brief Add a value to the end of the array
     *
     * @param value The value to add
     * @param key The key of the array, used in error messages
     * @return An Error if the value does not match the pattern, std::nullopt otherwise
     */
    [[nodiscard]] std::optional<Error>
    addValue(Value value, std::optional<std::string_view> key = std::nullopt);

    /**
     * @brief Add an element without a value. Only allowed when the item pattern is optional
     *
     * @param key The key of the array, used in error messages
     * @return An Error if the pattern requires a value, std::nullopt otherwise
     */
    [[nodiscard]] std::optional<Error>
    addEmpty(std::string_view key);

    /**
     * @brief Remove all elements, keeping the item pattern
     */
    void
    clear();

    /**
     * @return The number of elements
     */
    [[nodiscard]] std::size_t
    size() const;

    /**
     * @brief Access an element
     *
     * @param idx The index of the element
     * @return The config value at idx
     */
    [[nodiscard]] ConfigValue const&
    at(std::size_t idx) const;

    /**
     * @return The pattern every element must follow
     */
    [[nodiscard]] ConfigValue const&
    getArrayPattern() const;

private:
    ConfigValue itemPattern_;
    std::vector<ConfigValue> elements_;
};

}  // namespace util::config
