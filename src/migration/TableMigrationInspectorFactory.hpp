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

#include "catalog/LegacyStoreInterface.hpp"
#include "catalog/MetadataStoreInterface.hpp"
#include "catalog/TableInventoryInterface.hpp"
#include "crawler/SnapshotStoreInterface.hpp"
#include "migration/TableMigrationStatusRefresher.hpp"
#include "util/Assert.hpp"
#include "util/newconfig/ConfigDefinition.hpp"

#include <memory>
#include <utility>

namespace migration {

/**
 * @brief A factory function that creates the migration status refresher from the `migration` section of the config.
 *
 * @param config The config.
 * @param inventory The legacy table inventory
 * @param metadataStore The new metadata store
 * @param legacyStore The legacy store used by the live probe
 * @param snapshotStore The store caching the refresh result
 * @return A shared_ptr<TableMigrationStatusRefresher> instance
 */
inline std::shared_ptr<TableMigrationStatusRefresher>
makeTableMigrationStatusRefresher(
    util::config::ConfigDefinition const& config,
    std::shared_ptr<catalog::TableInventoryInterface const> inventory,
    std::shared_ptr<catalog::MetadataStoreInterface const> metadataStore,
    std::shared_ptr<catalog::LegacyStoreInterface const> legacyStore,
    std::shared_ptr<crawler::SnapshotStoreInterface> snapshotStore
)
{
    ASSERT(snapshotStore != nullptr, "Snapshot store is not initialized");

    return std::make_shared<TableMigrationStatusRefresher>(
        std::move(inventory),
        std::move(metadataStore),
        std::move(legacyStore),
        std::move(snapshotStore),
        RefresherSettings::fromConfig(config)
    );
}

}  // namespace migration
