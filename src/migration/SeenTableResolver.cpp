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

#include "migration/SeenTableResolver.hpp"

#include "catalog/MetadataStoreInterface.hpp"
#include "catalog/Types.hpp"
#include "util/Assert.hpp"
#include "util/log/Logger.hpp"

#include <memory>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace migration {

SeenTableResolver::SeenTableResolver(
    std::shared_ptr<catalog::MetadataStoreInterface const> metadataStore,
    std::string sourceProperty,
    std::unordered_set<std::string> skipCatalogTypes
)
    : metadataStore_{std::move(metadataStore)}
    , sourceProperty_{std::move(sourceProperty)}
    , skipCatalogTypes_{std::move(skipCatalogTypes)}
{
    ASSERT(metadataStore_ != nullptr, "Metadata store is not initialized");
}

SeenTableResolver::SeenTables
SeenTableResolver::resolve() const
{
    SeenTables seenTables;
    for (auto const& schema : listSchemas()) {
        if (not schema.catalogName.has_value() or not schema.name.has_value())
            continue;

        auto const tables = metadataStore_->listTables(*schema.catalogName, *schema.name);
        if (not tables.has_value()) {
            if (tables.error().isNotFound()) {
                LOG(log_.warn()) << "Schema " << schema.fullName()
                                 << " no longer exists. Skipping checking its migration status.";
            } else {
                LOG(log_.warn()) << "Error while listing tables in schema: " << schema.fullName() << ": "
                                 << tables.error();
            }
            continue;
        }

        for (auto const& table : tables.value()) {
            auto const property = table.properties.find(sourceProperty_);
            if (property == table.properties.end())
                continue;

            if (not table.fullName.has_value() or table.fullName->empty()) {
                LOG(log_.warn()) << "The table " << table.name << " in " << *schema.name << " has no full name";
                continue;
            }
            seenTables[catalog::toLower(*table.fullName)] = catalog::toLower(property->second);
        }
    }
    return seenTables;
}

std::vector<catalog::CatalogInfo>
SeenTableResolver::listCatalogs() const
{
    auto const catalogs = metadataStore_->listCatalogs();
    if (not catalogs.has_value()) {
        LOG(log_.error()) << "Cannot list catalogs: " << catalogs.error();
        return {};
    }

    std::vector<catalog::CatalogInfo> result;
    for (auto const& info : catalogs.value()) {
        if (skipCatalogTypes_.contains(info.catalogType))
            continue;
        result.push_back(info);
    }
    return result;
}

std::vector<catalog::SchemaInfo>
SeenTableResolver::listSchemas() const
{
    std::vector<catalog::SchemaInfo> result;
    for (auto const& info : listCatalogs()) {
        if (not info.name.has_value())
            continue;

        auto const schemas = metadataStore_->listSchemas(*info.name);
        if (not schemas.has_value()) {
            if (schemas.error().isNotFound()) {
                LOG(log_.warn()) << "Catalog " << *info.name
                                 << " no longer exists. Skipping checking its migration status.";
            } else {
                LOG(log_.warn()) << "Error while listing schemas in catalog: " << *info.name << ": "
                                 << schemas.error();
            }
            continue;
        }
        result.insert(result.end(), schemas->begin(), schemas->end());
    }
    return result;
}

}  // namespace migration
