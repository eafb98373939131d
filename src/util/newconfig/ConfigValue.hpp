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
#include "util/newconfig/Error.hpp"
#include "util/newconfig/Types.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace util::config {

/**
 * @brief Represents the config values for the config definition
 *
 * Each config value holds its expected type, an optional default value and whether the value may be absent.
 */
class ConfigValue {
public:
    /**
     * @brief Constructs a new ConfigValue of the given type
     *
     * @param type The type of the value
     */
    ConfigValue(ConfigType type) : type_(type)
    {
    }

    /**
     * @brief Sets the default value of the config
     *
     * @param value The default value
     * @return Reference to this ConfigValue
     */
    [[nodiscard]] ConfigValue&
    defaultValue(Value value)
    {
        auto const err = checkTypeConsistency(type_, value);
        ASSERT(not err.has_value(), "Default value does not match type of {}", typeName());
        value_ = std::move(value);
        return *this;
    }

    /**
     * @brief Sets the value of the config, checking that it matches the expected type
     *
     * @param value The value to set
     * @param key The config key, used in the error message
     * @return An Error if the value has the wrong type, std::nullopt otherwise
     */
    [[nodiscard]] std::optional<Error>
    setValue(Value value, std::optional<std::string_view> key = std::nullopt)
    {
        auto err = checkTypeConsistency(type_, value);
        if (err.has_value()) {
            if (key.has_value())
                err->error = fmt::format("{} {}", key.value(), err->error);
            return err;
        }

        if (type_ == ConfigType::Double and std::holds_alternative<int64_t>(value)) {
            value_ = static_cast<double>(std::get<int64_t>(value));
        } else {
            value_ = std::move(value);
        }
        return std::nullopt;
    }

    /**
     * @brief Marks the value as optional
     *
     * @return Reference to this ConfigValue
     */
    [[nodiscard]] ConfigValue&
    optional()
    {
        optional_ = true;
        return *this;
    }

    /**
     * @return The type of the value
     */
    [[nodiscard]] ConfigType
    type() const
    {
        return type_;
    }

    /**
     * @return true if the value may be absent, false otherwise
     */
    [[nodiscard]] bool
    isOptional() const
    {
        return optional_;
    }

    /**
     * @return true if a value (default or user supplied) is set, false otherwise
     */
    [[nodiscard]] bool
    hasValue() const
    {
        return value_.has_value();
    }

    /**
     * @brief Get the value. Must only be called if hasValue() is true
     *
     * @return The value
     */
    [[nodiscard]] Value const&
    getValue() const
    {
        ASSERT(value_.has_value(), "Config value of type {} is not set", typeName());
        return value_.value();
    }

private:
    [[nodiscard]] std::string
    typeName() const
    {
        std::stringstream ss;
        ss << type_;
        return ss.str();
    }

    static std::optional<Error>
    checkTypeConsistency(ConfigType type, Value const& value)
    {
        if (type == ConfigType::String and not std::holds_alternative<std::string>(value))
            return Error{"value does not match type string"};
        if (type == ConfigType::Boolean and not std::holds_alternative<bool>(value))
            return Error{"value does not match type boolean"};
        if (type == ConfigType::Double and not std::holds_alternative<double>(value) and
            not std::holds_alternative<int64_t>(value))
            return Error{"value does not match type double"};
        if (type == ConfigType::Integer and not std::holds_alternative<int64_t>(value))
            return Error{"value does not match type int"};
        return std::nullopt;
    }

    ConfigType type_{};
    bool optional_{false};
    std::optional<Value> value_;
};

}  // namespace util::config
