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

#include "migration/TableMigrationStatus.hpp"

#include "catalog/Types.hpp"
#include "crawler/SnapshotStoreInterface.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <fmt/core.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace migration {

namespace {

constexpr std::size_t kMIN_ROW_SIZE = 2;

std::optional<std::string>
cell(crawler::Row const& row, std::size_t idx)
{
    if (idx >= row.size())
        return std::nullopt;
    return row[idx];
}

}  // namespace

std::string
Destination::identity() const
{
    return ::catalog::toLower(fmt::format("{}.{}.{}", catalog, schema, table));
}

std::optional<Destination>
Destination::parse(std::string_view identity)
{
    std::vector<std::string> parts;
    boost::algorithm::split(parts, identity, boost::algorithm::is_any_of("."));
    if (parts.size() != 3 or std::ranges::any_of(parts, [](auto const& part) { return part.empty(); }))
        return std::nullopt;

    return Destination{
        .catalog = ::catalog::toLower(parts[0]),
        .schema = ::catalog::toLower(parts[1]),
        .table = ::catalog::toLower(parts[2]),
    };
}

TableMigrationStatus
TableMigrationStatus::make(
    std::string_view schema,
    std::string_view table,
    std::string updateTs,
    std::optional<Destination> destination
)
{
    return TableMigrationStatus{
        .srcSchema = ::catalog::toLower(std::string{schema}),
        .srcTable = ::catalog::toLower(std::string{table}),
        .destination = std::move(destination),
        .updateTs = std::move(updateTs),
    };
}

std::optional<std::string>
TableMigrationStatus::destinationIdentity() const
{
    if (not destination.has_value())
        return std::nullopt;
    return destination->identity();
}

crawler::Row
TableMigrationStatus::toRow() const
{
    crawler::Row row{srcSchema, srcTable, std::nullopt, std::nullopt, std::nullopt, updateTs};
    if (destination.has_value()) {
        row[2] = destination->catalog;
        row[3] = destination->schema;
        row[4] = destination->table;
    }
    return row;
}

std::optional<TableMigrationStatus>
TableMigrationStatus::fromRow(crawler::Row const& row)
{
    if (row.size() < kMIN_ROW_SIZE or not row[0].has_value() or not row[1].has_value())
        return std::nullopt;

    std::optional<Destination> destination;
    auto dstCatalog = cell(row, 2);
    auto dstSchema = cell(row, 3);
    auto dstTable = cell(row, 4);
    if (dstCatalog.has_value() and dstSchema.has_value() and dstTable.has_value()) {
        destination = Destination{
            .catalog = std::move(dstCatalog).value(),
            .schema = std::move(dstSchema).value(),
            .table = std::move(dstTable).value(),
        };
    }

    return make(*row[0], *row[1], cell(row, 5).value_or(""), std::move(destination));
}

std::string
makeUpdateTimestamp(std::chrono::system_clock::time_point timePoint)
{
    auto const micros = std::chrono::duration_cast<std::chrono::microseconds>(timePoint.time_since_epoch()).count();
    return fmt::format("{}.{:06}", micros / 1'000'000, micros % 1'000'000);
}

}  // namespace migration
