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

#include "migration/LiveMigrationStatus.hpp"
#include "migration/TableMigrationIndex.hpp"

#include <string>

namespace migration {

/**
 * @brief The interface for the table migration inspector. Components that rewrite grants, ACLs or code use this
 * interface to learn whether a legacy table is migrated and where to.
 */
struct TableMigrationInspectorInterface {
    virtual ~TableMigrationInspectorInterface() = default;

    /**
     * @brief Get the index over the latest migration status snapshot
     *
     * @param forceRefresh Recompute the snapshot from the live sources instead of reading the saved one
     * @return The index
     */
    virtual TableMigrationIndex
    index(bool forceRefresh) = 0;

    /**
     * @brief Check a single table against the legacy store, bypassing any snapshot
     *
     * @param schema The source schema
     * @param table The source table
     * @return The live status of the table
     */
    virtual LiveMigrationStatus
    probe(std::string const& schema, std::string const& table) const = 0;

    /**
     * @brief Check a single table against the legacy store, bypassing any snapshot
     *
     * @param schema The source schema
     * @param table The source table
     * @return true if the table is migrated or no longer exists, false otherwise
     */
    virtual bool
    isMigrated(std::string const& schema, std::string const& table) const = 0;
};

}  // namespace migration
