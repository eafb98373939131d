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

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace util::config {

class ConfigDefinition;

/**
 * @brief Provides a view into a subset of configuration data defined by a prefix
 *
 * Allows key-value pairs of an object (or of one element of an array of objects) to be accessed without repeating the
 * prefix. The view does not own the data. The template accessors are defined in ConfigDefinition.hpp.
 */
class ObjectView {
public:
    /**
     * @brief Constructs an ObjectView for the specified prefix
     *
     * @param prefix The prefix key for the object
     * @param configDef The ConfigDefinition holding the data
     */
    ObjectView(std::string_view prefix, ConfigDefinition const& configDef);

    /**
     * @brief Constructs an ObjectView for an element of an array of objects
     *
     * @param prefix The prefix key of the array
     * @param arrayIndex The index of the element
     * @param configDef The ConfigDefinition holding the data
     */
    ObjectView(std::string_view prefix, std::size_t arrayIndex, ConfigDefinition const& configDef);

    /**
     * @brief Checks if the object contains the given key
     *
     * @param key The key relative to the object
     * @return true if the key exists, false otherwise
     */
    [[nodiscard]] bool
    containsKey(std::string_view key) const;

    /**
     * @brief Returns the value of the given key
     *
     * @tparam T The requested type
     * @param key The key relative to the object
     * @return The value
     */
    template <typename T>
    [[nodiscard]] T
    get(std::string_view key) const;

    /**
     * @brief Returns the value of the given key if it is set
     *
     * @tparam T The requested type
     * @param key The key relative to the object
     * @return The value or std::nullopt
     */
    template <typename T>
    [[nodiscard]] std::optional<T>
    maybeValue(std::string_view key) const;

private:
    [[nodiscard]] std::string
    getFullKey(std::string_view key) const;

    std::string prefix_;
    std::optional<std::size_t> arrayIndex_;
    std::reference_wrapper<ConfigDefinition const> config_;
};

}  // namespace util::config
