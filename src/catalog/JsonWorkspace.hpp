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
#include "catalog/RemoteError.hpp"
#include "catalog/TableInventoryInterface.hpp"
#include "catalog/Types.hpp"
#include "util/log/Logger.hpp"

#include <boost/json/value.hpp>

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace catalog {

/**
 * @brief An offline export of a workspace: the legacy inventory with the properties of every legacy table, and the
 * catalogs, schemas and tables of the new metadata store.
 *
 * Implements all collaborators the migration status refresher needs so that it can run without live services.
 *
 * Expected document shape:
 * @code{.json}
 * {
 *   "legacy_tables": [{"catalog": "hive_metastore", "database": "sales", "name": "orders",
 *                      "properties": {"upgraded_to": "main.sales.orders"}}],
 *   "catalogs": [{"name": "main", "catalog_type": "MANAGED_CATALOG",
 *                 "schemas": [{"name": "sales",
 *                              "tables": [{"name": "orders", "full_name": "main.sales.orders",
 *                                          "properties": {"upgraded_from": "hive_metastore.sales.orders"}}]}]}]
 * }
 * @endcode
 */
class JsonWorkspace : public TableInventoryInterface, public MetadataStoreInterface, public LegacyStoreInterface {
    struct LegacyEntry {
        TableView view;
        Properties properties;
    };

    struct SchemaEntry {
        SchemaInfo info;
        std::vector<TableInfo> tables;
    };

    struct CatalogEntry {
        CatalogInfo info;
        std::vector<SchemaEntry> schemas;
    };

    util::Logger log_{"Catalog"};
    std::vector<LegacyEntry> legacyTables_;
    std::vector<CatalogEntry> catalogs_;

    JsonWorkspace() = default;

public:
    /**
     * @brief Build a workspace from a parsed JSON document
     *
     * @param json The document
     * @param defaultLegacyCatalog The catalog assigned to legacy tables that do not name one
     * @return The workspace or a description of the first malformed element
     */
    [[nodiscard]] static std::expected<std::shared_ptr<JsonWorkspace>, std::string>
    fromJson(boost::json::value const& json, std::string const& defaultLegacyCatalog);

    std::vector<TableView>
    snapshot() const override;

    RemoteResult<std::vector<CatalogInfo>>
    listCatalogs() const override;

    RemoteResult<std::vector<SchemaInfo>>
    listSchemas(std::string const& catalogName) const override;

    RemoteResult<std::vector<TableInfo>>
    listTables(std::string const& catalogName, std::string const& schemaName) const override;

    RemoteResult<std::optional<std::string>>
    fetchTableProperty(std::string const& schema, std::string const& table, std::string const& property)
        const override;

private:
    [[nodiscard]] CatalogEntry const*
    findCatalog(std::string const& catalogName) const;
};

/**
 * @brief Read a workspace export from a file
 *
 * @param path The path of the JSON file
 * @param defaultLegacyCatalog The catalog assigned to legacy tables that do not name one
 * @return The workspace or an error message
 */
[[nodiscard]] std::expected<std::shared_ptr<JsonWorkspace>, std::string>
makeJsonWorkspace(std::string_view path, std::string const& defaultLegacyCatalog);

}  // namespace catalog
