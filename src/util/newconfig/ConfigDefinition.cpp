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

#include "util/newconfig/ConfigDefinition.hpp"

#include "util/Assert.hpp"
#include "util/newconfig/Array.hpp"
#include "util/newconfig/ArrayView.hpp"
#include "util/newconfig/ConfigFileInterface.hpp"
#include "util/newconfig/ConfigValue.hpp"
#include "util/newconfig/Error.hpp"
#include "util/newconfig/ObjectView.hpp"
#include "util/newconfig/Types.hpp"

#include <algorithm>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace util::config {

ConfigDefinition::ConfigDefinition(std::initializer_list<KeyValuePair> pair)
{
    for (auto const& [key, value] : pair) {
        if (key.contains(".[]")) {
            ASSERT(std::holds_alternative<Array>(value), "Value of {} must be an array", key);
        }
        map_.emplace(std::string{key}, value);
    }
}

std::optional<std::vector<Error>>
ConfigDefinition::parse(ConfigFileInterface const& config)
{
    std::vector<Error> listOfErrors;
    for (auto& [key, value] : map_) {
        if (auto* array = std::get_if<Array>(&value); array != nullptr) {
            array->clear();
            if (not config.containsKey(key))
                continue;

            for (auto const& elem : config.getArray(key)) {
                auto const err = elem.has_value() ? array->addValue(*elem, key) : array->addEmpty(key);
                if (err.has_value())
                    listOfErrors.push_back(*err);
            }
            continue;
        }

        auto& configValue = std::get<ConfigValue>(value);
        if (config.containsKey(key)) {
            if (auto const err = configValue.setValue(config.getValue(key), key); err.has_value())
                listOfErrors.push_back(*err);
        } else if (not configValue.hasValue() and not configValue.isOptional()) {
            listOfErrors.emplace_back(key, "is required but was not provided");
        }
    }

    if (listOfErrors.empty())
        return std::nullopt;
    return listOfErrors;
}

ObjectView
ConfigDefinition::getObject(std::string_view prefix) const
{
    ASSERT(hasItemsWithPrefix(std::string{prefix} + "."), "Key {} is not found in config", prefix);
    return ObjectView{prefix, *this};
}

ArrayView
ConfigDefinition::getArray(std::string_view prefix) const
{
    return ArrayView{prefix, *this};
}

bool
ConfigDefinition::contains(std::string_view key) const
{
    return map_.contains(key);
}

bool
ConfigDefinition::hasItemsWithPrefix(std::string_view key) const
{
    return std::ranges::any_of(map_, [&key](auto const& pair) { return pair.first.starts_with(key); });
}

ConfigValue const&
ConfigDefinition::valueAt(std::string_view fullKey) const
{
    auto const it = map_.find(fullKey);
    ASSERT(it != map_.end(), "key {} does not exist in config", fullKey);
    ASSERT(std::holds_alternative<ConfigValue>(it->second), "key {} is an array", fullKey);
    return std::get<ConfigValue>(it->second);
}

Array const&
ConfigDefinition::arrayAt(std::string_view fullKey) const
{
    auto const it = map_.find(fullKey);
    ASSERT(it != map_.end(), "key {} does not exist in config", fullKey);
    ASSERT(std::holds_alternative<Array>(it->second), "key {} is not an array", fullKey);
    return std::get<Array>(it->second);
}

ConfigDefinition
getTablemigConfig()
{
    return ConfigDefinition{
        {"log_channels.[].channel", Array{ConfigValue{ConfigType::String}.optional()}},
        {"log_channels.[].log_level", Array{ConfigValue{ConfigType::String}.optional()}},
        {"log_level", ConfigValue{ConfigType::String}.defaultValue("info")},
        {"log_format",
         ConfigValue{ConfigType::String}.defaultValue(
             R"(%TimeStamp% (%SourceLocation%) [%ThreadID%] %Channel%:%Severity% %Message%)"
         )},
        {"log_to_console", ConfigValue{ConfigType::Boolean}.defaultValue(true)},
        {"log_directory", ConfigValue{ConfigType::String}.optional()},
        {"log_rotation_size", ConfigValue{ConfigType::Integer}.defaultValue(2048)},
        {"log_directory_max_size", ConfigValue{ConfigType::Integer}.defaultValue(50 * 1024)},
        {"log_rotation_hour_interval", ConfigValue{ConfigType::Integer}.defaultValue(12)},

        {"migration.legacy_catalog", ConfigValue{ConfigType::String}.defaultValue("hive_metastore")},
        {"migration.inventory_database", ConfigValue{ConfigType::String}.defaultValue("ucx")},
        {"migration.status_table", ConfigValue{ConfigType::String}.defaultValue("migration_status")},
        {"migration.source_property", ConfigValue{ConfigType::String}.defaultValue("upgraded_from")},
        {"migration.marker_property", ConfigValue{ConfigType::String}.defaultValue("upgraded_to")},
        {"migration.skip_catalog_types.[]", Array{ConfigValue{ConfigType::String}}},

        {"snapshot_store.directory", ConfigValue{ConfigType::String}.defaultValue("./snapshots")},
        {"workspace.export_file", ConfigValue{ConfigType::String}.optional()},
    };
}

}  // namespace util::config
