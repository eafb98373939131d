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
#include "crawler/SnapshotStoreInterface.hpp"
#include "util/log/Logger.hpp"

#include <boost/filesystem/path.hpp>

#include <string>
#include <vector>

namespace crawler {

/**
 * @brief Snapshot store keeping every table as a JSON file in a directory.
 *
 * A table named `a.b.c` is stored in `<directory>/a.b.c.json` as `{"columns": [...], "rows": [[...], ...]}` with
 * `null` for absent values. Overwrites go through a temporary file that is renamed into place.
 */
class JsonFileSnapshotStore : public SnapshotStoreInterface {
    util::Logger log_{"Crawler"};
    boost::filesystem::path directory_;

public:
    /**
     * @brief Construct a new store; the directory is created on the first save
     *
     * @param directory The directory holding the table files
     */
    explicit JsonFileSnapshotStore(boost::filesystem::path directory);

    catalog::RemoteResult<std::vector<Row>>
    fetchRows(std::string const& fullName) const override;

    catalog::RemoteResult<void>
    saveRows(
        std::string const& fullName,
        std::vector<std::string> const& columns,
        std::vector<Row> const& rows,
        SaveMode mode
    ) override;

private:
    [[nodiscard]] boost::filesystem::path
    tablePath(std::string const& fullName) const;

    [[nodiscard]] catalog::RemoteResult<std::vector<std::string>>
    readColumns(std::string const& fullName) const;
};

}  // namespace crawler
