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
#include "catalog/Types.hpp"
#include "crawler/CrawlerBase.hpp"
#include "crawler/SnapshotStoreInterface.hpp"
#include "migration/LiveMigrationStatus.hpp"
#include "migration/SeenTableResolver.hpp"
#include "migration/TableMigrationIndex.hpp"
#include "migration/TableMigrationInspectorInterface.hpp"
#include "migration/TableMigrationStatus.hpp"
#include "util/log/Logger.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace util::config {
class ConfigDefinition;
}  // namespace util::config

namespace migration {

/**
 * @brief The settings of the migration status refresher
 */
struct RefresherSettings {
    std::string legacyCatalog = "hive_metastore";
    std::string inventoryDatabase = "ucx";
    std::string statusTable = "migration_status";
    std::string sourceProperty = "upgraded_from"; /**< back-reference set on objects of the new metadata store */
    std::string markerProperty = "upgraded_to";   /**< marker set on migrated legacy tables */
    std::unordered_set<std::string> skipCatalogTypes = {catalog::kSYSTEM_CATALOG_TYPE};

    /**
     * @brief Read the settings from the `migration` section of the config
     *
     * @param config The parsed config
     * @return The settings
     */
    [[nodiscard]] static RefresherSettings
    fromConfig(util::config::ConfigDefinition const& config);
};

/**
 * @brief Crawler that captures the migration status of every legacy table and view.
 *
 * A refresh pass finds candidate matches in bulk by scanning the new metadata store for back-references, then confirms
 * each candidate with a live probe of the marker property on the legacy table. Only confirmed candidates get a
 * destination. Tables without a candidate are never probed.
 */
class TableMigrationStatusRefresher : public crawler::CrawlerBase<TableMigrationStatus>,
                                      public TableMigrationInspectorInterface {
public:
    using ClockType = std::function<std::chrono::system_clock::time_point()>;

private:
    util::Logger log_{"Migration"};
    std::shared_ptr<catalog::TableInventoryInterface const> inventory_;
    std::shared_ptr<catalog::LegacyStoreInterface const> legacyStore_;
    SeenTableResolver resolver_;
    RefresherSettings settings_;
    ClockType clock_;

public:
    /**
     * @brief Construct a new refresher
     *
     * @param inventory The legacy table inventory
     * @param metadataStore The new metadata store
     * @param legacyStore The legacy store used by the live probe
     * @param snapshotStore The store caching the refresh result
     * @param settings The settings
     * @param clock The clock providing the timestamp of a refresh pass
     */
    TableMigrationStatusRefresher(
        std::shared_ptr<catalog::TableInventoryInterface const> inventory,
        std::shared_ptr<catalog::MetadataStoreInterface const> metadataStore,
        std::shared_ptr<catalog::LegacyStoreInterface const> legacyStore,
        std::shared_ptr<crawler::SnapshotStoreInterface> snapshotStore,
        RefresherSettings settings,
        ClockType clock = [] { return std::chrono::system_clock::now(); }
    );

    TableMigrationIndex
    index(bool forceRefresh) override;

    LiveMigrationStatus
    probe(std::string const& schema, std::string const& table) const override;

    bool
    isMigrated(std::string const& schema, std::string const& table) const override;

    /**
     * @brief Scan the new metadata store for back-references
     *
     * @return Destination identity to legacy identity
     */
    [[nodiscard]] SeenTableResolver::SeenTables
    getSeenTables() const;

protected:
    std::vector<TableMigrationStatus>
    crawl() override;
};

}  // namespace migration
