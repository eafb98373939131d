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

#include "util/newconfig/ConfigFileJson.hpp"

#include "util/Assert.hpp"
#include "util/newconfig/Error.hpp"
#include "util/newconfig/Types.hpp"

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>
#include <fmt/core.h>

#include <cstdint>
#include <exception>
#include <expected>
#include <fstream>
#include <ios>
#include <iterator>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace util::config {

namespace {

/**
 * @brief Extracts the value from a JSON object and converts it into the corresponding type.
 *
 * @param jsonValue The JSON value to extract.
 * @return A variant containing the same type corresponding to the extracted value.
 */
[[nodiscard]] Value
extractJsonValue(boost::json::value const& jsonValue)
{
    if (jsonValue.is_int64())
        return jsonValue.as_int64();
    if (jsonValue.is_uint64())
        return static_cast<int64_t>(jsonValue.as_uint64());
    if (jsonValue.is_string())
        return std::string{jsonValue.as_string().c_str()};
    if (jsonValue.is_bool())
        return jsonValue.as_bool();
    if (jsonValue.is_double())
        return jsonValue.as_double();

    ASSERT(false, "Json is not of type int, uint, string, bool or double");
    std::unreachable();
}

}  // namespace

ConfigFileJson::ConfigFileJson(boost::json::object jsonObj)
{
    flattenJson(jsonObj, "");
}

std::expected<ConfigFileJson, Error>
ConfigFileJson::makeConfigFileJson(std::string_view configFilePath)
{
    try {
        std::ifstream const in{std::string{configFilePath}, std::ios::in | std::ios::binary};
        if (not in)
            return std::unexpected<Error>(fmt::format("Could not open file: {}", configFilePath));

        std::stringstream contents;
        contents << in.rdbuf();
        auto const tempObj = boost::json::parse(contents.str());
        if (not tempObj.is_object())
            return std::unexpected<Error>(fmt::format("Config file {} must contain a JSON object", configFilePath));

        return ConfigFileJson{tempObj.as_object()};
    } catch (std::exception const& e) {
        return std::unexpected<Error>(fmt::format("An error occurred while processing configuration file '{}': {}",
                                                  configFilePath, e.what()));
    }
}

Value
ConfigFileJson::getValue(std::string_view key) const
{
    auto const jsonValue = jsonObject_.at(key);
    return extractJsonValue(jsonValue);
}

std::vector<std::optional<Value>>
ConfigFileJson::getArray(std::string_view key) const
{
    ASSERT(jsonObject_.at(key).is_array(), "Key {} has value that is not an array", key);

    std::vector<std::optional<Value>> configValues;
    for (auto const& elem : jsonObject_.at(key).as_array()) {
        if (elem.is_null()) {
            configValues.emplace_back(std::nullopt);
        } else {
            configValues.emplace_back(extractJsonValue(elem));
        }
    }
    return configValues;
}

bool
ConfigFileJson::containsKey(std::string_view key) const
{
    return jsonObject_.contains(key);
}

void
ConfigFileJson::flattenJson(boost::json::object const& obj, std::string const& prefix)
{
    for (auto const& [key, value] : obj) {
        std::string const fullKey = prefix.empty() ? std::string(key) : fmt::format("{}.{}", prefix, key);

        if (value.is_object()) {
            flattenJson(value.as_object(), fullKey);
            continue;
        }

        if (not value.is_array()) {
            jsonObject_[fullKey] = value;
            continue;
        }

        auto const& array = value.as_array();
        bool const ofObjects = not array.empty() and array.front().is_object();
        if (not ofObjects) {
            jsonObject_[fullKey + ".[]"] = array;
            continue;
        }

        std::set<std::string> members;
        for (auto const& elem : array) {
            if (elem.is_object()) {
                for (auto const& [member, _] : elem.as_object())
                    members.emplace(member);
            }
        }

        for (auto const& member : members) {
            boost::json::array column;
            for (auto const& elem : array) {
                if (elem.is_object() and elem.as_object().contains(member)) {
                    column.push_back(elem.as_object().at(member));
                } else {
                    column.emplace_back(nullptr);
                }
            }
            jsonObject_[fmt::format("{}.[].{}", fullKey, member)] = std::move(column);
        }
    }
}

}  // namespace util::config
