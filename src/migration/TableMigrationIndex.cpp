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

#include "migration/TableMigrationIndex.hpp"

#include "catalog/Types.hpp"
#include "migration/TableMigrationStatus.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace migration {

TableMigrationIndex::TableMigrationIndex(std::vector<TableMigrationStatus> const& records)
{
    for (auto const& record : records)
        index_.insert_or_assign(makeKey(record.srcSchema, record.srcTable), record);
}

bool
TableMigrationIndex::isMigrated(std::string_view schema, std::string_view table) const
{
    return get(schema, table).has_value();
}

std::optional<TableMigrationStatus>
TableMigrationIndex::get(std::string_view schema, std::string_view table) const
{
    auto const it = index_.find(makeKey(schema, table));
    if (it == index_.end() or not it->second.isMigrated())
        return std::nullopt;
    return it->second;
}

std::vector<std::pair<std::string, std::string>>
TableMigrationIndex::snapshot() const
{
    std::vector<KeyType> keys;
    keys.reserve(index_.size());
    std::ranges::transform(index_, std::back_inserter(keys), [](auto const& entry) { return entry.first; });
    return keys;
}

std::size_t
TableMigrationIndex::size() const
{
    return index_.size();
}

TableMigrationIndex::KeyType
TableMigrationIndex::makeKey(std::string_view schema, std::string_view table)
{
    return {catalog::toLower(std::string{schema}), catalog::toLower(std::string{table})};
}

}  // namespace migration
