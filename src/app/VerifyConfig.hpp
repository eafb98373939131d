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

#include "util/newconfig/ConfigDefinition.hpp"
#include "util/newconfig/ConfigFileJson.hpp"

#include <fmt/core.h>

#include <array>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace app {

/**
 * @brief Check the migration settings that the type checks of the config definition can not catch
 *
 * @param config A parsed config definition
 * @return A message for every inconsistent setting; empty if the settings are usable
 */
inline std::vector<std::string>
checkMigrationSettings(util::config::ConfigDefinition const& config)
{
    static constexpr std::array kIDENTIFIERS = {
        "migration.legacy_catalog",
        "migration.inventory_database",
        "migration.status_table",
    };

    std::vector<std::string> problems;
    for (auto const* key : kIDENTIFIERS) {
        auto const value = config.get<std::string>(key);
        if (value.empty() or value.find('.') != std::string::npos)
            problems.push_back(fmt::format("{} must be a non-empty name without dots, got '{}'", key, value));
    }

    auto const source = config.get<std::string>("migration.source_property");
    auto const marker = config.get<std::string>("migration.marker_property");
    if (source.empty() or marker.empty()) {
        problems.emplace_back("migration.source_property and migration.marker_property must not be empty");
    } else if (source == marker) {
        problems.push_back(
            fmt::format("migration.source_property and migration.marker_property must differ, both are '{}'", source)
        );
    }

    if (config.get<std::string>("snapshot_store.directory").empty())
        problems.emplace_back("snapshot_store.directory must not be empty");

    return problems;
}

/**
 * @brief Parses the config file at the given path into the definition and verifies the result
 *
 * @param configPath The path to config
 * @param config The definition to fill with the parsed values
 * @return true if config values are all correct, false otherwise
 */
inline bool
verifyConfig(std::string_view configPath, util::config::ConfigDefinition& config)
{
    using namespace util::config;

    auto const json = ConfigFileJson::makeConfigFileJson(configPath);
    if (not json.has_value()) {
        std::cerr << json.error().error << std::endl;
        return false;
    }

    if (auto const errors = config.parse(json.value()); errors.has_value()) {
        for (auto const& err : errors.value())
            std::cerr << configPath << ": " << err.error << std::endl;
        return false;
    }

    auto const problems = checkMigrationSettings(config);
    for (auto const& problem : problems)
        std::cerr << configPath << ": " << problem << std::endl;
    return problems.empty();
}

}  // namespace app
