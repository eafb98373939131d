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

#include "crawler/SnapshotStoreInterface.hpp"
#include "util/Assert.hpp"
#include "util/log/Logger.hpp"

#include <fmt/core.h>

#include <concepts>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace crawler {

/**
 * @brief The concept for records a crawler can persist: a fixed column list and a conversion to and from a row
 */
template <typename T>
concept SnapshotRecord = requires(T const& record, Row const& row) {
    { T::kCOLUMNS.size() } -> std::convertible_to<std::size_t>;
    { record.toRow() } -> std::same_as<Row>;
    { T::fromRow(row) } -> std::same_as<std::optional<T>>;
};

/**
 * @brief Base of crawlers whose results are cached in a snapshot store.
 *
 * The first snapshot crawls and saves the result; later snapshots read the saved rows back until a refresh is forced.
 * Saving always replaces the previous content of the crawler's table.
 *
 * @tparam RecordType The record produced by the crawler
 */
template <SnapshotRecord RecordType>
class CrawlerBase {
    util::Logger log_{"Crawler"};
    std::shared_ptr<SnapshotStoreInterface> store_;
    std::string catalog_;
    std::string schema_;
    std::string table_;

public:
    /**
     * @brief Construct a new crawler
     *
     * @param store The snapshot store
     * @param catalog The catalog of the snapshot table
     * @param schema The schema of the snapshot table
     * @param table The name of the snapshot table
     */
    CrawlerBase(
        std::shared_ptr<SnapshotStoreInterface> store,
        std::string catalog,
        std::string schema,
        std::string table
    )
        : store_{std::move(store)}, catalog_{std::move(catalog)}, schema_{std::move(schema)}, table_{std::move(table)}
    {
        ASSERT(store_ != nullptr, "Snapshot store is not initialized");
    }

    virtual ~CrawlerBase() = default;

    /**
     * @return The full name of the snapshot table
     */
    [[nodiscard]] std::string
    fullName() const
    {
        return fmt::format("{}.{}.{}", catalog_, schema_, table_);
    }

    /**
     * @brief Get the crawler's records, from the store when possible
     *
     * @param forceRefresh Crawl again even if the store holds a snapshot
     * @return The records
     */
    [[nodiscard]] std::vector<RecordType>
    snapshot(bool forceRefresh = false)
    {
        if (not forceRefresh) {
            if (auto cached = tryFetch(); cached.has_value())
                return std::move(cached).value();
        }

        LOG(log_.debug()) << "[" << fullName() << "] crawling new set of snapshot data";
        auto records = crawl();
        updateSnapshot(records);
        return records;
    }

protected:
    /**
     * @brief Produce a fresh set of records from the live sources
     *
     * @return The records
     */
    virtual std::vector<RecordType>
    crawl() = 0;

private:
    std::optional<std::vector<RecordType>>
    tryFetch() const
    {
        auto const rows = store_->fetchRows(fullName());
        if (not rows.has_value()) {
            if (rows.error().isNotFound()) {
                LOG(log_.debug()) << "[" << fullName() << "] no snapshot saved yet";
            } else {
                LOG(log_.warn()) << "[" << fullName() << "] could not read snapshot: " << rows.error();
            }
            return std::nullopt;
        }

        if (rows->empty())
            return std::nullopt;

        std::vector<RecordType> records;
        records.reserve(rows->size());
        for (auto const& row : rows.value()) {
            if (auto record = RecordType::fromRow(row); record.has_value()) {
                records.push_back(std::move(record).value());
            } else {
                LOG(log_.warn()) << "[" << fullName() << "] skipping malformed snapshot row";
            }
        }
        return records;
    }

    void
    updateSnapshot(std::vector<RecordType> const& records)
    {
        std::vector<std::string> const columns(RecordType::kCOLUMNS.begin(), RecordType::kCOLUMNS.end());

        std::vector<Row> rows;
        rows.reserve(records.size());
        for (auto const& record : records)
            rows.push_back(record.toRow());

        LOG(log_.debug()) << "[" << fullName() << "] found " << rows.size() << " new records";
        if (auto const res = store_->saveRows(fullName(), columns, rows, SaveMode::Overwrite); not res.has_value())
            LOG(log_.error()) << "[" << fullName() << "] could not save snapshot: " << res.error();
    }
};

}  // namespace crawler
