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

#include "migration/TableMigrationStatusRefresher.hpp"

#include "catalog/LegacyStoreInterface.hpp"
#include "catalog/MetadataStoreInterface.hpp"
#include "catalog/TableInventoryInterface.hpp"
#include "catalog/Types.hpp"
#include "crawler/CrawlerBase.hpp"
#include "crawler/SnapshotStoreInterface.hpp"
#include "migration/LiveMigrationStatus.hpp"
#include "migration/SeenTableResolver.hpp"
#include "migration/TableMigrationIndex.hpp"
#include "migration/TableMigrationStatus.hpp"
#include "util/Assert.hpp"
#include "util/log/Logger.hpp"
#include "util/newconfig/ArrayView.hpp"
#include "util/newconfig/ConfigDefinition.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace migration {

RefresherSettings
RefresherSettings::fromConfig(util::config::ConfigDefinition const& config)
{
    RefresherSettings settings;
    settings.legacyCatalog = config.get<std::string>("migration.legacy_catalog");
    settings.inventoryDatabase = config.get<std::string>("migration.inventory_database");
    settings.statusTable = config.get<std::string>("migration.status_table");
    settings.sourceProperty = config.get<std::string>("migration.source_property");
    settings.markerProperty = config.get<std::string>("migration.marker_property");

    auto const skipTypes = config.getArray("migration.skip_catalog_types");
    if (skipTypes.size() != 0) {
        settings.skipCatalogTypes.clear();
        for (std::size_t idx = 0; idx < skipTypes.size(); ++idx)
            settings.skipCatalogTypes.insert(skipTypes.valueAt<std::string>(idx));
    }
    return settings;
}

TableMigrationStatusRefresher::TableMigrationStatusRefresher(
    std::shared_ptr<catalog::TableInventoryInterface const> inventory,
    std::shared_ptr<catalog::MetadataStoreInterface const> metadataStore,
    std::shared_ptr<catalog::LegacyStoreInterface const> legacyStore,
    std::shared_ptr<crawler::SnapshotStoreInterface> snapshotStore,
    RefresherSettings settings,
    ClockType clock
)
    : crawler::CrawlerBase<TableMigrationStatus>(
          std::move(snapshotStore),
          settings.legacyCatalog,
          settings.inventoryDatabase,
          settings.statusTable
      )
    , inventory_{std::move(inventory)}
    , legacyStore_{std::move(legacyStore)}
    , resolver_{std::move(metadataStore), settings.sourceProperty, settings.skipCatalogTypes}
    , settings_{std::move(settings)}
    , clock_{std::move(clock)}
{
    ASSERT(inventory_ != nullptr, "Table inventory is not initialized");
    ASSERT(legacyStore_ != nullptr, "Legacy store is not initialized");
    ASSERT(static_cast<bool>(clock_), "Clock is not initialized");
}

TableMigrationIndex
TableMigrationStatusRefresher::index(bool forceRefresh)
{
    return TableMigrationIndex{snapshot(forceRefresh)};
}

LiveMigrationStatus
TableMigrationStatusRefresher::probe(std::string const& schema, std::string const& table) const
{
    auto const marker = legacyStore_->fetchTableProperty(schema, table, settings_.markerProperty);
    if (not marker.has_value()) {
        if (marker.error().isNotFound()) {
            LOG(log_.warn()) << "failed-to-migrate: " << schema << "." << table
                             << " set as a source does no longer exist";
            return LiveMigrationStatus::SourceMissing;
        }

        LOG(log_.error()) << "Could not read " << settings_.markerProperty << " of " << schema << "." << table << ": "
                          << marker.error();
        return LiveMigrationStatus::NotMigrated;
    }

    if (marker->has_value()) {
        LOG(log_.info()) << schema << "." << table << " is set as migrated";
        return LiveMigrationStatus::Migrated;
    }

    LOG(log_.info()) << schema << "." << table << " is set as not migrated";
    return LiveMigrationStatus::NotMigrated;
}

bool
TableMigrationStatusRefresher::isMigrated(std::string const& schema, std::string const& table) const
{
    return probe(schema, table).countsAsMigrated();
}

SeenTableResolver::SeenTables
TableMigrationStatusRefresher::getSeenTables() const
{
    return resolver_.resolve();
}

std::vector<TableMigrationStatus>
TableMigrationStatusRefresher::crawl()
{
    auto const updateTs = makeUpdateTimestamp(clock_());
    auto const tables = inventory_->snapshot();

    std::unordered_map<std::string, std::string> reverseSeen;
    for (auto const& [destination, source] : getSeenTables())
        reverseSeen[source] = destination;

    std::vector<TableMigrationStatus> records;
    records.reserve(tables.size());

    for (auto const& table : tables) {
        auto record = TableMigrationStatus::make(table.schema, table.name, updateTs);

        auto const candidate = reverseSeen.find(table.key());
        if (candidate != reverseSeen.end() and isMigrated(record.srcSchema, record.srcTable)) {
            record.destination = Destination::parse(candidate->second);
            if (not record.destination.has_value()) {
                LOG(log_.debug()) << "Unexpected dst table name: " << candidate->second << " for " << table.key()
                                  << ", treating as not migrated";
            }
        }
        records.push_back(std::move(record));
    }

    LOG(log_.info()) << "Refreshed migration status of " << records.size() << " tables";
    return records;
}

}  // namespace migration
