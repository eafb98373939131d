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

#include <algorithm>
#include <array>
#include <ostream>
#include <string_view>

namespace util::config {

/**
 * @brief All the config description are stored and extracted from this class
 *
 * Represents all the possible config description
 */
struct ConfigDescription {
public:
    /** @brief Struct to represent a key-value pair*/
    struct KV {
        std::string_view key;
        std::string_view value;
    };

    /**
     * @brief Constructs a new Config Description based on pre-existing descriptions
     *
     * Config Keys and it's corresponding descriptions are all predefined. Used to print the config reference.
     */
    constexpr ConfigDescription() = default;

    /**
     * @brief Retrieves the description for a given key
     *
     * @param key The key to look up the description for
     * @return The description associated with the key
     */
    [[nodiscard]] static constexpr std::string_view
    get(std::string_view key)
    {
        auto const itr = std::ranges::find_if(kCONFIG_DESCRIPTION, [&](auto const& v) { return v.key == key; });
        ASSERT(itr != kCONFIG_DESCRIPTION.end(), "Key {} doesn't exist in config", key);
        return itr->value;
    }

    /**
     * @brief Checks whether a description exists for the given key
     *
     * @param key The key to look up
     * @return true if described, false otherwise
     */
    [[nodiscard]] static constexpr bool
    contains(std::string_view key)
    {
        return std::ranges::any_of(kCONFIG_DESCRIPTION, [&](auto const& v) { return v.key == key; });
    }

    /**
     * @brief Writes every key with its description, one per line
     *
     * @param stream The output stream
     */
    static void
    print(std::ostream& stream)
    {
        for (auto const& [key, value] : kCONFIG_DESCRIPTION)
            stream << key << ": " << value << '\n';
    }

private:
    static constexpr auto kCONFIG_DESCRIPTION = std::array{
        KV{.key = "log_channels.[].channel", .value = "Name of the log channel."},
        KV{.key = "log_channels.[].log_level", .value = "Log level for the log channel."},
        KV{.key = "log_level", .value = "General logging level of tablemig."},
        KV{.key = "log_format", .value = "Format string for log messages."},
        KV{.key = "log_to_console", .value = "Enable or disable logging to console."},
        KV{.key = "log_directory", .value = "Directory path for log files."},
        KV{.key = "log_rotation_size", .value = "Log rotation size in megabytes."},
        KV{.key = "log_directory_max_size", .value = "Maximum size of the log directory in megabytes."},
        KV{.key = "log_rotation_hour_interval", .value = "Interval in hours for log rotation."},
        KV{.key = "migration.legacy_catalog",
           .value = "Name of the legacy catalog. Prefixes the key of every legacy table, e.g. hive_metastore.db.tbl."},
        KV{.key = "migration.inventory_database",
           .value = "Database holding the crawl snapshots, including the migration status table."},
        KV{.key = "migration.status_table", .value = "Name of the table the migration status snapshot is saved to."},
        KV{.key = "migration.source_property",
           .value = "Property of a migrated object in the new metadata store that names its legacy source."},
        KV{.key = "migration.marker_property",
           .value = "Property of a legacy table that marks it as migrated. Checked by the live probe."},
        KV{.key = "migration.skip_catalog_types.[]",
           .value = "Catalog types excluded from the back-reference scan. Defaults to SYSTEM_CATALOG when empty."},
        KV{.key = "snapshot_store.directory", .value = "Directory of the JSON snapshot store."},
        KV{.key = "workspace.export_file",
           .value = "JSON export of the legacy inventory and the new metadata store used by the command line tool."},
    };
};

}  // namespace util::config
