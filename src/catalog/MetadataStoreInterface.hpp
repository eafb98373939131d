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
#include "catalog/Types.hpp"

#include <string>
#include <vector>

namespace catalog {

/**
 * @brief The client of the new metadata store. Every listing may fail with a not-found or a generic remote error.
 */
class MetadataStoreInterface {
public:
    virtual ~MetadataStoreInterface() = default;

    /**
     * @return All catalogs of the metadata store
     */
    virtual RemoteResult<std::vector<CatalogInfo>>
    listCatalogs() const = 0;

    /**
     * @brief List the schemas of a catalog
     *
     * @param catalogName The catalog
     * @return The schemas
     */
    virtual RemoteResult<std::vector<SchemaInfo>>
    listSchemas(std::string const& catalogName) const = 0;

    /**
     * @brief List the tables and views of a schema
     *
     * @param catalogName The catalog
     * @param schemaName The schema
     * @return The tables and views
     */
    virtual RemoteResult<std::vector<TableInfo>>
    listTables(std::string const& catalogName, std::string const& schemaName) const = 0;
};

}  // namespace catalog
