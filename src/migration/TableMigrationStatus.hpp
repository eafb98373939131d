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

#include "crawler/SnapshotStoreInterface.hpp"

#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace migration {

/**
 * @brief The identity of a migrated object in the new metadata store
 */
struct Destination {
    std::string catalog;
    std::string schema;
    std::string table;

    /**
     * @return The lower-cased `catalog.schema.table` identity
     */
    [[nodiscard]] std::string
    identity() const;

    /**
     * @brief Parse a dotted identity. Anything but exactly three non-empty parts is rejected
     *
     * @param identity The identity, e.g. main.sales.orders
     * @return The lower-cased destination or std::nullopt if malformed
     */
    [[nodiscard]] static std::optional<Destination>
    parse(std::string_view identity);

    bool
    operator==(Destination const&) const = default;
};

/**
 * @brief The migration status of one legacy table, as produced by one refresh pass.
 *
 * The source identity is lower-cased on creation. A record without a destination reports a table that is known but not
 * migrated.
 */
struct TableMigrationStatus {
    static constexpr std::array<char const*, 6> kCOLUMNS = {
        "src_schema",
        "src_table",
        "dst_catalog",
        "dst_schema",
        "dst_table",
        "update_ts",
    };

    std::string srcSchema;
    std::string srcTable;
    std::optional<Destination> destination;
    std::string updateTs;

    /**
     * @brief Create a record with a lower-cased source identity
     *
     * @param schema The source schema
     * @param table The source table
     * @param updateTs The timestamp of the refresh pass
     * @param destination The destination, if the table is migrated
     * @return The record
     */
    [[nodiscard]] static TableMigrationStatus
    make(
        std::string_view schema,
        std::string_view table,
        std::string updateTs,
        std::optional<Destination> destination = std::nullopt
    );

    /**
     * @return true if the record carries a destination
     */
    [[nodiscard]] bool
    isMigrated() const
    {
        return destination.has_value();
    }

    /**
     * @return The destination identity, or std::nullopt for tables that are not migrated
     */
    [[nodiscard]] std::optional<std::string>
    destinationIdentity() const;

    /**
     * @return The persisted form of the record, one value per column of kCOLUMNS
     */
    [[nodiscard]] crawler::Row
    toRow() const;

    /**
     * @brief Read a record back from its persisted form
     *
     * @param row The row
     * @return The record, or std::nullopt if the row lacks the source identity
     */
    [[nodiscard]] static std::optional<TableMigrationStatus>
    fromRow(crawler::Row const& row);

    bool
    operator==(TableMigrationStatus const&) const = default;
};

/**
 * @brief Format a point in time as seconds since epoch, the form stored in TableMigrationStatus::updateTs
 *
 * @param timePoint The point in time
 * @return The timestamp text, e.g. 1712345678.123456
 */
[[nodiscard]] std::string
makeUpdateTimestamp(std::chrono::system_clock::time_point timePoint);

}  // namespace migration
