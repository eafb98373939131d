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

#include "catalog/JsonWorkspace.hpp"

#include "catalog/RemoteError.hpp"
#include "catalog/Types.hpp"
#include "util/log/Logger.hpp"

#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>
#include <boost/system/error_code.hpp>
#include <fmt/core.h>

#include <algorithm>
#include <exception>
#include <expected>
#include <fstream>
#include <ios>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace catalog {

namespace {

std::string
stringOr(boost::json::object const& obj, std::string_view key, std::string fallback)
{
    if (auto const* value = obj.if_contains(key); value != nullptr and value->is_string())
        return std::string{value->as_string().c_str()};
    return fallback;
}

std::optional<std::string>
maybeString(boost::json::object const& obj, std::string_view key)
{
    if (auto const* value = obj.if_contains(key); value != nullptr and value->is_string())
        return std::string{value->as_string().c_str()};
    return std::nullopt;
}

Properties
readProperties(boost::json::object const& obj)
{
    Properties properties;
    if (auto const* props = obj.if_contains("properties"); props != nullptr) {
        for (auto const& [key, value] : props->as_object())
            properties.emplace(std::string{key}, std::string{value.as_string().c_str()});
    }
    return properties;
}

boost::json::array const&
arrayOrEmpty(boost::json::object const& obj, std::string_view key)
{
    static boost::json::array const kEMPTY;
    if (auto const* value = obj.if_contains(key); value != nullptr)
        return value->as_array();
    return kEMPTY;
}

}  // namespace

std::expected<std::shared_ptr<JsonWorkspace>, std::string>
JsonWorkspace::fromJson(boost::json::value const& json, std::string const& defaultLegacyCatalog)
{
    if (not json.is_object())
        return std::unexpected<std::string>{"Workspace export must be a JSON object"};

    auto workspace = std::shared_ptr<JsonWorkspace>(new JsonWorkspace());
    auto const& root = json.as_object();

    try {
        for (auto const& table : arrayOrEmpty(root, "legacy_tables")) {
            auto const& obj = table.as_object();
            workspace->legacyTables_.push_back(LegacyEntry{
                .view =
                    TableView{
                        .catalog = stringOr(obj, "catalog", defaultLegacyCatalog),
                        .schema = std::string{obj.at("database").as_string().c_str()},
                        .name = std::string{obj.at("name").as_string().c_str()},
                    },
                .properties = readProperties(obj),
            });
        }

        for (auto const& catalogJson : arrayOrEmpty(root, "catalogs")) {
            auto const& catalogObj = catalogJson.as_object();
            CatalogEntry catalogEntry{
                .info = CatalogInfo{.name = maybeString(catalogObj, "name"),
                                    .catalogType = stringOr(catalogObj, "catalog_type", "MANAGED_CATALOG")},
                .schemas = {},
            };

            for (auto const& schemaJson : arrayOrEmpty(catalogObj, "schemas")) {
                auto const& schemaObj = schemaJson.as_object();
                SchemaEntry schemaEntry{
                    .info = SchemaInfo{.catalogName = catalogEntry.info.name, .name = maybeString(schemaObj, "name")},
                    .tables = {},
                };

                for (auto const& tableJson : arrayOrEmpty(schemaObj, "tables")) {
                    auto const& tableObj = tableJson.as_object();
                    auto const name = std::string{tableObj.at("name").as_string().c_str()};

                    std::optional<std::string> fullName;
                    if (auto const* value = tableObj.if_contains("full_name"); value != nullptr) {
                        if (value->is_string())
                            fullName = std::string{value->as_string().c_str()};
                    } else if (catalogEntry.info.name and schemaEntry.info.name) {
                        fullName = fmt::format("{}.{}.{}", *catalogEntry.info.name, *schemaEntry.info.name, name);
                    }

                    schemaEntry.tables.push_back(
                        TableInfo{.name = name, .fullName = std::move(fullName), .properties = readProperties(tableObj)}
                    );
                }
                catalogEntry.schemas.push_back(std::move(schemaEntry));
            }
            workspace->catalogs_.push_back(std::move(catalogEntry));
        }
    } catch (std::exception const& e) {
        return std::unexpected{fmt::format("Malformed workspace export: {}", e.what())};
    }

    return workspace;
}

std::vector<TableView>
JsonWorkspace::snapshot() const
{
    std::vector<TableView> tables;
    tables.reserve(legacyTables_.size());
    std::ranges::transform(legacyTables_, std::back_inserter(tables), [](auto const& entry) { return entry.view; });
    return tables;
}

RemoteResult<std::vector<CatalogInfo>>
JsonWorkspace::listCatalogs() const
{
    std::vector<CatalogInfo> catalogs;
    catalogs.reserve(catalogs_.size());
    std::ranges::transform(catalogs_, std::back_inserter(catalogs), [](auto const& entry) { return entry.info; });
    return catalogs;
}

RemoteResult<std::vector<SchemaInfo>>
JsonWorkspace::listSchemas(std::string const& catalogName) const
{
    auto const* catalogEntry = findCatalog(catalogName);
    if (catalogEntry == nullptr)
        return std::unexpected{RemoteError::notFound(fmt::format("Catalog '{}' does not exist", catalogName))};

    std::vector<SchemaInfo> schemas;
    std::ranges::transform(catalogEntry->schemas, std::back_inserter(schemas), [](auto const& entry) {
        return entry.info;
    });
    return schemas;
}

RemoteResult<std::vector<TableInfo>>
JsonWorkspace::listTables(std::string const& catalogName, std::string const& schemaName) const
{
    auto const* catalogEntry = findCatalog(catalogName);
    if (catalogEntry == nullptr)
        return std::unexpected{RemoteError::notFound(fmt::format("Catalog '{}' does not exist", catalogName))};

    auto const it = std::ranges::find_if(catalogEntry->schemas, [&schemaName](auto const& entry) {
        return entry.info.name == schemaName;
    });
    if (it == catalogEntry->schemas.end())
        return std::unexpected{
            RemoteError::notFound(fmt::format("Schema '{}.{}' does not exist", catalogName, schemaName))
        };

    return it->tables;
}

RemoteResult<std::optional<std::string>>
JsonWorkspace::fetchTableProperty(std::string const& schema, std::string const& table, std::string const& property)
    const
{
    auto const schemaLower = toLower(schema);
    auto const tableLower = toLower(table);
    auto const it = std::ranges::find_if(legacyTables_, [&](auto const& entry) {
        return toLower(entry.view.schema) == schemaLower and toLower(entry.view.name) == tableLower;
    });

    if (it == legacyTables_.end()) {
        LOG(log_.debug()) << "Legacy table " << schema << "." << table << " is not in the workspace export";
        return std::unexpected{RemoteError::notFound(fmt::format("Table '{}.{}' does not exist", schema, table))};
    }

    if (auto const prop = it->properties.find(property); prop != it->properties.end())
        return prop->second;
    return std::nullopt;
}

JsonWorkspace::CatalogEntry const*
JsonWorkspace::findCatalog(std::string const& catalogName) const
{
    auto const it = std::ranges::find_if(catalogs_, [&catalogName](auto const& entry) {
        return entry.info.name == catalogName;
    });
    return it == catalogs_.end() ? nullptr : &*it;
}

std::expected<std::shared_ptr<JsonWorkspace>, std::string>
makeJsonWorkspace(std::string_view path, std::string const& defaultLegacyCatalog)
{
    std::ifstream const in{std::string{path}, std::ios::in | std::ios::binary};
    if (not in)
        return std::unexpected{fmt::format("Could not open workspace export: {}", path)};

    std::stringstream contents;
    contents << in.rdbuf();

    boost::system::error_code ec;
    auto const json = boost::json::parse(contents.str(), ec);
    if (ec)
        return std::unexpected{fmt::format("Could not parse workspace export {}: {}", path, ec.message())};

    return JsonWorkspace::fromJson(json, defaultLegacyCatalog);
}

}  // namespace catalog
