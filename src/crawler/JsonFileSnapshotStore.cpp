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

#include "crawler/JsonFileSnapshotStore.hpp"

#include "catalog/RemoteError.hpp"
#include "crawler/SnapshotStoreInterface.hpp"
#include "util/log/Logger.hpp"

#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/serialize.hpp>
#include <boost/json/value.hpp>
#include <boost/system/error_code.hpp>
#include <fmt/core.h>

#include <exception>
#include <expected>
#include <fstream>
#include <ios>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace crawler {

namespace {

catalog::RemoteResult<boost::json::object>
readDocument(boost::filesystem::path const& path)
{
    if (not boost::filesystem::exists(path))
        return std::unexpected{catalog::RemoteError::notFound(fmt::format("Snapshot {} does not exist", path.string()))
        };

    std::ifstream const in{path.string(), std::ios::in | std::ios::binary};
    if (not in)
        return std::unexpected{catalog::RemoteError::generic(fmt::format("Could not open {}", path.string()))};

    std::stringstream contents;
    contents << in.rdbuf();

    boost::system::error_code ec;
    auto const json = boost::json::parse(contents.str(), ec);
    if (ec or not json.is_object()) {
        return std::unexpected{
            catalog::RemoteError::generic(fmt::format("Snapshot {} is not a valid JSON object", path.string()))
        };
    }
    return json.as_object();
}

Row
toRow(boost::json::value const& json)
{
    Row row;
    for (auto const& cell : json.as_array()) {
        if (cell.is_null()) {
            row.emplace_back(std::nullopt);
        } else {
            row.emplace_back(std::string{cell.as_string().c_str()});
        }
    }
    return row;
}

boost::json::array
toJson(Row const& row)
{
    boost::json::array json;
    for (auto const& cell : row) {
        if (cell.has_value()) {
            json.emplace_back(cell->c_str());
        } else {
            json.emplace_back(nullptr);
        }
    }
    return json;
}

}  // namespace

JsonFileSnapshotStore::JsonFileSnapshotStore(boost::filesystem::path directory) : directory_{std::move(directory)}
{
}

catalog::RemoteResult<std::vector<Row>>
JsonFileSnapshotStore::fetchRows(std::string const& fullName) const
{
    auto const document = readDocument(tablePath(fullName));
    if (not document.has_value())
        return std::unexpected{document.error()};

    try {
        std::vector<Row> rows;
        if (auto const* rowsJson = document->if_contains("rows"); rowsJson != nullptr) {
            for (auto const& row : rowsJson->as_array())
                rows.push_back(toRow(row));
        }
        return rows;
    } catch (std::exception const& e) {
        return std::unexpected{
            catalog::RemoteError::generic(fmt::format("Malformed rows in snapshot {}: {}", fullName, e.what()))
        };
    }
}

catalog::RemoteResult<void>
JsonFileSnapshotStore::saveRows(
    std::string const& fullName,
    std::vector<std::string> const& columns,
    std::vector<Row> const& rows,
    SaveMode mode
)
{
    boost::json::array rowsJson;
    if (mode == SaveMode::Append) {
        auto const existingColumns = readColumns(fullName);
        if (existingColumns.has_value() and existingColumns.value() != columns) {
            return std::unexpected{
                catalog::RemoteError::generic(fmt::format("Columns of {} do not match the saved snapshot", fullName))
            };
        }

        auto const existing = fetchRows(fullName);
        if (existing.has_value()) {
            for (auto const& row : existing.value())
                rowsJson.push_back(toJson(row));
        } else if (not existing.error().isNotFound()) {
            return std::unexpected{existing.error()};
        }
    }

    for (auto const& row : rows)
        rowsJson.push_back(toJson(row));

    boost::json::array columnsJson;
    for (auto const& column : columns)
        columnsJson.emplace_back(column.c_str());

    boost::json::object document;
    document["columns"] = std::move(columnsJson);
    document["rows"] = std::move(rowsJson);

    boost::system::error_code ec;
    boost::filesystem::create_directories(directory_, ec);
    if (ec) {
        return std::unexpected{catalog::RemoteError::generic(
            fmt::format("Could not create snapshot directory {}: {}", directory_.string(), ec.message())
        )};
    }

    auto const path = tablePath(fullName);
    auto tmpPath = path;
    tmpPath += ".tmp";
    {
        std::ofstream out{tmpPath.string(), std::ios::out | std::ios::trunc | std::ios::binary};
        out << boost::json::serialize(document);
        if (not out) {
            return std::unexpected{
                catalog::RemoteError::generic(fmt::format("Could not write snapshot {}", tmpPath.string()))
            };
        }
    }

    boost::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        return std::unexpected{catalog::RemoteError::generic(
            fmt::format("Could not replace snapshot {}: {}", path.string(), ec.message())
        )};
    }

    LOG(log_.debug()) << "Saved " << rows.size() << " rows to " << path.string();
    return {};
}

boost::filesystem::path
JsonFileSnapshotStore::tablePath(std::string const& fullName) const
{
    return directory_ / (fullName + ".json");
}

catalog::RemoteResult<std::vector<std::string>>
JsonFileSnapshotStore::readColumns(std::string const& fullName) const
{
    auto const document = readDocument(tablePath(fullName));
    if (not document.has_value())
        return std::unexpected{document.error()};

    std::vector<std::string> columns;
    auto const* columnsJson = document->if_contains("columns");
    if (columnsJson != nullptr and columnsJson->is_array()) {
        for (auto const& column : columnsJson->as_array()) {
            if (column.is_string())
                columns.emplace_back(column.as_string().c_str());
        }
    }
    return columns;
}

}  // namespace crawler
