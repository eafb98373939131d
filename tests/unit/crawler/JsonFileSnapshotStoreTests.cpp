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
#include "crawler/SnapshotStoreInterface.hpp"
#include "util/LoggerFixtures.hpp"
#include "util/TmpFile.hpp"

#include <boost/filesystem/operations.hpp>
#include <gtest/gtest.h>

#include <fstream>
#include <optional>
#include <string>
#include <vector>

using namespace crawler;

struct JsonFileSnapshotStoreTest : public NoLoggerFixture {
protected:
    TmpDir dir_;
    JsonFileSnapshotStore store_{dir_.path / "snapshots"};
    std::vector<std::string> const columns_{"src_schema", "src_table", "dst_catalog"};
};

TEST_F(JsonFileSnapshotStoreTest, MissingSnapshotIsNotFound)
{
    auto const rows = store_.fetchRows("hive_metastore.ucx.migration_status");
    ASSERT_FALSE(rows.has_value());
    EXPECT_TRUE(rows.error().isNotFound());
}

TEST_F(JsonFileSnapshotStoreTest, OverwriteReplacesRows)
{
    std::vector<Row> const first{{"sales", "orders", "main"}, {"sales", "customers", std::nullopt}};
    std::vector<Row> const second{{"hr", "people", std::nullopt}};

    ASSERT_TRUE(store_.saveRows("a.b.c", columns_, first, SaveMode::Overwrite).has_value());
    auto rows = store_.fetchRows("a.b.c");
    ASSERT_TRUE(rows.has_value());
    EXPECT_EQ(rows.value(), first);

    ASSERT_TRUE(store_.saveRows("a.b.c", columns_, second, SaveMode::Overwrite).has_value());
    rows = store_.fetchRows("a.b.c");
    ASSERT_TRUE(rows.has_value());
    EXPECT_EQ(rows.value(), second);
    EXPECT_FALSE(boost::filesystem::exists(dir_.path / "snapshots" / "a.b.c.json.tmp"));
}

TEST_F(JsonFileSnapshotStoreTest, AppendConcatenatesRows)
{
    std::vector<Row> const first{{"sales", "orders", "main"}};
    std::vector<Row> const second{{"hr", "people", std::nullopt}};

    ASSERT_TRUE(store_.saveRows("a.b.c", columns_, first, SaveMode::Append).has_value());
    ASSERT_TRUE(store_.saveRows("a.b.c", columns_, second, SaveMode::Append).has_value());

    auto const rows = store_.fetchRows("a.b.c");
    ASSERT_TRUE(rows.has_value());
    EXPECT_EQ(rows.value(), (std::vector<Row>{{"sales", "orders", "main"}, {"hr", "people", std::nullopt}}));
}

TEST_F(JsonFileSnapshotStoreTest, AppendWithDifferentColumnsFails)
{
    ASSERT_TRUE(store_.saveRows("a.b.c", columns_, {{"x", "y", "z"}}, SaveMode::Overwrite).has_value());

    auto const res = store_.saveRows("a.b.c", {"other"}, {{"x"}}, SaveMode::Append);
    ASSERT_FALSE(res.has_value());
    EXPECT_FALSE(res.error().isNotFound());
}

TEST_F(JsonFileSnapshotStoreTest, TablesAreIndependent)
{
    ASSERT_TRUE(store_.saveRows("a.b.one", columns_, {{"1", "1", "1"}}, SaveMode::Overwrite).has_value());
    ASSERT_TRUE(store_.saveRows("a.b.two", columns_, {{"2", "2", "2"}}, SaveMode::Overwrite).has_value());

    auto const one = store_.fetchRows("a.b.one");
    ASSERT_TRUE(one.has_value());
    EXPECT_EQ(one->size(), 1);
    EXPECT_EQ(one->front().front(), "1");
}

TEST_F(JsonFileSnapshotStoreTest, CorruptedSnapshotIsAnError)
{
    boost::filesystem::create_directories(dir_.path / "snapshots");
    std::ofstream{(dir_.path / "snapshots" / "a.b.c.json").string()} << "{not json";

    auto const rows = store_.fetchRows("a.b.c");
    ASSERT_FALSE(rows.has_value());
    EXPECT_FALSE(rows.error().isNotFound());
}
