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

#include "util/Assert.hpp"
#include "util/newconfig/Array.hpp"
#include "util/newconfig/ArrayView.hpp"
#include "util/newconfig/ConfigFileInterface.hpp"
#include "util/newconfig/ConfigValue.hpp"
#include "util/newconfig/Error.hpp"
#include "util/newconfig/ObjectView.hpp"
#include "util/newconfig/Types.hpp"

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace util::config {

namespace impl {

/**
 * @brief Converts a config value into the requested C++ type
 *
 * @tparam T The requested type
 * @param value The stored value
 * @param key The key of the value, used in assertion messages
 * @return The converted value
 */
template <typename T>
[[nodiscard]] T
extractValue(Value const& value, std::string_view key)
{
    if constexpr (std::is_same_v<T, bool>) {
        ASSERT(std::holds_alternative<bool>(value), "Value of {} is not a boolean", key);
        return std::get<bool>(value);
    } else if constexpr (std::is_integral_v<T>) {
        ASSERT(std::holds_alternative<int64_t>(value), "Value of {} is not an integer", key);
        return static_cast<T>(std::get<int64_t>(value));
    } else if constexpr (std::is_same_v<T, std::string>) {
        ASSERT(std::holds_alternative<std::string>(value), "Value of {} is not a string", key);
        return std::get<std::string>(value);
    } else {
        static_assert(std::is_floating_point_v<T>, "Unsupported config value type");
        ASSERT(std::holds_alternative<double>(value), "Value of {} is not a double", key);
        return static_cast<T>(std::get<double>(value));
    }
}

}  // namespace impl

/**
 * @brief All the config data will be stored and extracted from this class
 *
 * Represents all the possible config data. Every key is declared up front together with its type, default value and
 * whether it is optional. Array keys use '.[]' to address their elements.
 */
class ConfigDefinition {
public:
    /** @brief A key-value pair used to declare one config entry */
    using KeyValuePair = std::pair<std::string_view, std::variant<ConfigValue, Array>>;

    /**
     * @brief Constructs a new ConfigDefinition
     *
     * @param pair A list of key-value pairs for the config definition
     */
    ConfigDefinition(std::initializer_list<KeyValuePair> pair);

    /**
     * @brief Parses the configuration file
     *
     * Values of the wrong type and missing required values are collected as errors. Keys present in the file but
     * not in the definition are ignored.
     *
     * @param config The configuration file interface
     * @return An optional vector of Error objects stating all the failures if parsing fails
     */
    [[nodiscard]] std::optional<std::vector<Error>>
    parse(ConfigFileInterface const& config);

    /**
     * @brief Returns the ObjectView specified with the prefix
     *
     * @param prefix The key prefix for the ObjectView
     * @return ObjectView with the given prefix
     */
    [[nodiscard]] ObjectView
    getObject(std::string_view prefix) const;

    /**
     * @brief Returns the ArrayView specified with the prefix
     *
     * @param prefix The key prefix for the ArrayView, without the trailing '.[]'
     * @return ArrayView with the given prefix
     */
    [[nodiscard]] ArrayView
    getArray(std::string_view prefix) const;

    /**
     * @brief Checks if a key is present in the definition
     *
     * @param key The key to search for
     * @return true if the key is present, false otherwise
     */
    [[nodiscard]] bool
    contains(std::string_view key) const;

    /**
     * @brief Checks if any key in the definition starts with the given prefix
     *
     * @param key The prefix to search for
     * @return true if at least one key has the prefix, false otherwise
     */
    [[nodiscard]] bool
    hasItemsWithPrefix(std::string_view key) const;

    /**
     * @brief Returns the config value at the given key. The key must refer to a plain value, not an array
     *
     * @param fullKey The full key
     * @return The config value
     */
    [[nodiscard]] ConfigValue const&
    valueAt(std::string_view fullKey) const;

    /**
     * @brief Returns the array at the given key. The key must refer to an array
     *
     * @param fullKey The full key, including '.[]'
     * @return The array
     */
    [[nodiscard]] Array const&
    arrayAt(std::string_view fullKey) const;

    /**
     * @brief Returns the specified value of given string if value exists
     *
     * @tparam T The type T to return
     * @param fullKey The config key to search for
     * @return The value of the config key
     */
    template <typename T>
    [[nodiscard]] T
    get(std::string_view fullKey) const
    {
        auto const& value = valueAt(fullKey);
        ASSERT(value.hasValue(), "Key {} has no value", fullKey);
        return impl::extractValue<T>(value.getValue(), fullKey);
    }

    /**
     * @brief Returns the specified value of given string if it is set
     *
     * @tparam T The type T to return
     * @param fullKey The config key to search for
     * @return The value or std::nullopt if the optional key was not set
     */
    template <typename T>
    [[nodiscard]] std::optional<T>
    maybeValue(std::string_view fullKey) const
    {
        auto const& value = valueAt(fullKey);
        if (not value.hasValue())
            return std::nullopt;
        return impl::extractValue<T>(value.getValue(), fullKey);
    }

    /**
     * @return Iterator to the first declared key
     */
    [[nodiscard]] auto
    begin() const
    {
        return map_.begin();
    }

    /**
     * @return Iterator past the last declared key
     */
    [[nodiscard]] auto
    end() const
    {
        return map_.end();
    }

private:
    std::map<std::string, std::variant<ConfigValue, Array>, std::less<>> map_;
};

template <typename T>
T
ObjectView::get(std::string_view key) const
{
    auto const fullKey = getFullKey(key);
    if (not arrayIndex_.has_value())
        return config_.get().get<T>(fullKey);

    auto const& value = config_.get().arrayAt(fullKey).at(*arrayIndex_);
    ASSERT(value.hasValue(), "Key {} has no value at index {}", fullKey, *arrayIndex_);
    return impl::extractValue<T>(value.getValue(), fullKey);
}

template <typename T>
std::optional<T>
ObjectView::maybeValue(std::string_view key) const
{
    auto const fullKey = getFullKey(key);
    if (not arrayIndex_.has_value())
        return config_.get().maybeValue<T>(fullKey);

    auto const& value = config_.get().arrayAt(fullKey).at(*arrayIndex_);
    if (not value.hasValue())
        return std::nullopt;
    return impl::extractValue<T>(value.getValue(), fullKey);
}

template <typename T>
T
ArrayView::valueAt(std::size_t idx) const
{
    auto const fullKey = prefix_ + ".[]";
    auto const& value = config_.get().arrayAt(fullKey).at(idx);
    ASSERT(value.hasValue(), "Key {} has no value at index {}", fullKey, idx);
    return impl::extractValue<T>(value.getValue(), fullKey);
}

/**
 * @brief Full configuration definition of tablemig with all keys, types and defaults
 *
 * @return A fresh, unparsed definition
 */
[[nodiscard]] ConfigDefinition
getTablemigConfig();

}  // namespace util::config
