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

#include "catalog/MetadataStoreInterface.hpp"
#include "catalog/Types.hpp"
#include "util/log/Logger.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace migration {

/**
 * @brief Scans the new metadata store for objects that name their legacy source in a back-reference property.
 *
 * Catalogs of excluded types are not scanned. Catalogs and schemas that vanish or fail to list are logged and skipped,
 * so a scan always completes with whatever could be read.
 */
class SeenTableResolver {
    util::Logger log_{"Migration"};
    std::shared_ptr<catalog::MetadataStoreInterface const> metadataStore_;
    std::string sourceProperty_;
    std::unordered_set<std::string> skipCatalogTypes_;

public:
    /** @brief Lower-cased destination identity to lower-cased legacy identity */
    using SeenTables = std::unordered_map<std::string, std::string>;

    /**
     * @brief Construct a new resolver
     *
     * @param metadataStore The new metadata store
     * @param sourceProperty The back-reference property, e.g. upgraded_from
     * @param skipCatalogTypes The catalog types excluded from the scan
     */
    SeenTableResolver(
        std::shared_ptr<catalog::MetadataStoreInterface const> metadataStore,
        std::string sourceProperty,
        std::unordered_set<std::string> skipCatalogTypes
    );

    /**
     * @brief Scan the metadata store. A destination seen twice keeps the last legacy identity found
     *
     * @return The map of every object carrying the back-reference
     */
    [[nodiscard]] SeenTables
    resolve() const;

private:
    [[nodiscard]] std::vector<catalog::CatalogInfo>
    listCatalogs() const;

    [[nodiscard]] std::vector<catalog::SchemaInfo>
    listSchemas() const;
};

}  // namespace migration
