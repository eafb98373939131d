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

#include "catalog/RemoteError.hpp"

#include <optional>
#include <string>
#include <vector>

namespace crawler {

/** @brief One persisted row; std::nullopt represents a NULL column */
using Row = std::vector<std::optional<std::string>>;

/** @brief How saved rows combine with the rows already stored */
enum class SaveMode { Append, Overwrite };

/**
 * @brief A queryable store that keeps the result of every crawler in a table of its own
 */
class SnapshotStoreInterface {
public:
    virtual ~SnapshotStoreInterface() = default;

    /**
     * @brief Fetch every row of a table
     *
     * @param fullName The full name of the table
     * @return The rows, or a NotFound error if the table was never saved
     */
    virtual catalog::RemoteResult<std::vector<Row>>
    fetchRows(std::string const& fullName) const = 0;

    /**
     * @brief Save rows to a table, creating it if needed
     *
     * @param fullName The full name of the table
     * @param columns The column names
     * @param rows The rows, each with one value per column
     * @param mode Whether to replace the table content or append to it
     * @return Nothing on success, the error otherwise
     */
    virtual catalog::RemoteResult<void>
    saveRows(
        std::string const& fullName,
        std::vector<std::string> const& columns,
        std::vector<Row> const& rows,
        SaveMode mode
    ) = 0;
};

}  // namespace crawler
