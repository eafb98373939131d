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

#include "migration/TableMigrationStatus.hpp"

#include <boost/container_hash/hash.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace migration {

/**
 * @brief An immutable point-lookup index over the records of one refresh pass.
 *
 * Keys are case-insensitive. A key that is known but not migrated behaves like an unknown key for get(), and reports
 * false from isMigrated(). The index never changes after construction, so it may be read from any number of threads.
 */
class TableMigrationIndex {
    using KeyType = std::pair<std::string, std::string>;

    std::unordered_map<KeyType, TableMigrationStatus, boost::hash<KeyType>> index_;

public:
    TableMigrationIndex() = default;

    /**
     * @brief Build the index. For duplicate keys the last record wins
     *
     * @param records The records of a refresh pass
     */
    explicit TableMigrationIndex(std::vector<TableMigrationStatus> const& records);

    /**
     * @brief Check if a table is migrated
     *
     * @param schema The source schema, any casing
     * @param table The source table, any casing
     * @return true if the table is known and carries a destination
     */
    [[nodiscard]] bool
    isMigrated(std::string_view schema, std::string_view table) const;

    /**
     * @brief Get the migration status of a migrated table
     *
     * @param schema The source schema, any casing
     * @param table The source table, any casing
     * @return The record, or std::nullopt if the table is unknown or not migrated
     */
    [[nodiscard]] std::optional<TableMigrationStatus>
    get(std::string_view schema, std::string_view table) const;

    /**
     * @return The keys of every known table, migrated or not
     */
    [[nodiscard]] std::vector<std::pair<std::string, std::string>>
    snapshot() const;

    /**
     * @return The number of known tables
     */
    [[nodiscard]] std::size_t
    size() const;

private:
    [[nodiscard]] static KeyType
    makeKey(std::string_view schema, std::string_view table);
};

}  // namespace migration
