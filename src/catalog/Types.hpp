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

#include <map>
#include <optional>
#include <string>

namespace catalog {

/**
 * @brief The catalog type reported by the metadata store for internal catalogs, skipped by default when scanning
 */
inline constexpr auto kSYSTEM_CATALOG_TYPE = "SYSTEM_CATALOG";

/** @brief Properties attached to a table or view */
using Properties = std::map<std::string, std::string>;

/**
 * @brief A catalog of the new metadata store
 */
struct CatalogInfo {
    std::optional<std::string> name;
    std::string catalogType;

    bool
    operator==(CatalogInfo const&) const = default;
};

/**
 * @brief A schema of the new metadata store
 */
struct SchemaInfo {
    std::optional<std::string> catalogName;
    std::optional<std::string> name;

    /**
     * @return The dotted name of the schema, with empty parts for unset names
     */
    [[nodiscard]] std::string
    fullName() const;

    bool
    operator==(SchemaInfo const&) const = default;
};

/**
 * @brief A table or view of the new metadata store
 */
struct TableInfo {
    std::string name;
    std::optional<std::string> fullName;  // catalog.schema.table
    Properties properties;

    bool
    operator==(TableInfo const&) const = default;
};

/**
 * @brief A table or view of the legacy catalog, as reported by the table inventory
 */
struct TableView {
    std::string catalog;
    std::string schema;
    std::string name;

    /**
     * @brief The lower-cased dotted identity of the table. An empty catalog is omitted
     *
     * @return The key, e.g. hive_metastore.sales.orders
     */
    [[nodiscard]] std::string
    key() const;

    bool
    operator==(TableView const&) const = default;
};

/**
 * @brief Lower-case a name
 *
 * @param value The name
 * @return The lower-cased copy
 */
[[nodiscard]] std::string
toLower(std::string const& value);

}  // namespace catalog
