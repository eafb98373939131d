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

#include "app/MigrationStatusApplication.hpp"
#include "migration/LiveMigrationStatus.hpp"
#include "migration/TableMigrationIndex.hpp"
#include "migration/TableMigrationStatus.hpp"
#include "util/LoggerFixtures.hpp"
#include "util/MockTableMigrationInspector.hpp"
#include "util/TmpFile.hpp"
#include "util/newconfig/ConfigDefinition.hpp"
#include "util/newconfig/ConfigFileJson.hpp"

#include <boost/json/object.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdlib>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace app;
using migration::Destination;
using migration::LiveMigrationStatus;
using migration::TableMigrationIndex;
using migration::TableMigrationStatus;
using testing::Return;

namespace {

constexpr auto kTS = "1712345678.000000";

constexpr auto kWORKSPACE = R"JSON({
    "legacy_tables": [
        {"database": "sales", "name": "orders", "properties": {"upgraded_to": "main.sales.orders"}},
        {"database": "sales", "name": "customers"}
    ],
    "catalogs": [
        {"name": "main", "catalog_type": "MANAGED_CATALOG",
         "schemas": [{"name": "sales",
                      "tables": [{"name": "orders", "properties": {"upgraded_from": "hive_metastore.sales.orders"}}]}]}
    ]
})JSON";

TableMigrationIndex
makeIndex()
{
    return TableMigrationIndex{std::vector<TableMigrationStatus>{
        TableMigrationStatus::make("sales", "orders", kTS, Destination{"main", "sales", "orders"}),
        TableMigrationStatus::make("sales", "customers", kTS),
    }};
}

}  // namespace

struct MigrationStatusApplicationTest : public NoLoggerFixture {
protected:
    std::shared_ptr<testing::StrictMock<MockTableMigrationInspector>> inspector_ =
        std::make_shared<testing::StrictMock<MockTableMigrationInspector>>();
    std::stringstream out_;
};

TEST_F(MigrationStatusApplicationTest, PrintStatus)
{
    EXPECT_CALL(*inspector_, index(false)).WillOnce(Return(makeIndex()));

    MigrationStatusApplication app{inspector_, MigrationStatusCmd::status(), out_};
    EXPECT_EQ(app.run(), EXIT_SUCCESS);
    EXPECT_EQ(
        out_.str(),
        "Current Migration Status:\n"
        "sales.customers - not migrated\n"
        "sales.orders - main.sales.orders\n"
    );
}

TEST_F(MigrationStatusApplicationTest, PrintStatusForced)
{
    EXPECT_CALL(*inspector_, index(true)).WillOnce(Return(TableMigrationIndex{}));

    MigrationStatusApplication app{inspector_, MigrationStatusCmd::status(true), out_};
    EXPECT_EQ(app.run(), EXIT_SUCCESS);
    EXPECT_EQ(out_.str(), "Current Migration Status:\nNo table found\n");
}

TEST_F(MigrationStatusApplicationTest, CheckMigrated)
{
    EXPECT_CALL(*inspector_, probe("sales", "orders")).WillOnce(Return(LiveMigrationStatus::Migrated));

    MigrationStatusApplication app{inspector_, MigrationStatusCmd::check("sales", "orders"), out_};
    EXPECT_EQ(app.run(), EXIT_SUCCESS);
    EXPECT_EQ(out_.str(), "sales.orders - Migrated\n");
}

TEST_F(MigrationStatusApplicationTest, CheckSourceMissing)
{
    EXPECT_CALL(*inspector_, probe("sales", "gone")).WillOnce(Return(LiveMigrationStatus::SourceMissing));

    MigrationStatusApplication app{inspector_, MigrationStatusCmd::check("sales", "gone"), out_};
    EXPECT_EQ(app.run(), EXIT_SUCCESS);
    EXPECT_EQ(out_.str(), "sales.gone - SourceMissing\n");
}

TEST_F(MigrationStatusApplicationTest, CheckNotMigrated)
{
    EXPECT_CALL(*inspector_, probe("sales", "customers")).WillOnce(Return(LiveMigrationStatus::NotMigrated));

    MigrationStatusApplication app{inspector_, MigrationStatusCmd::check("sales", "customers"), out_};
    EXPECT_EQ(app.run(), EXIT_FAILURE);
    EXPECT_EQ(out_.str(), "sales.customers - NotMigrated\n");
}

TEST_F(MigrationStatusApplicationTest, Refresh)
{
    EXPECT_CALL(*inspector_, index(true)).WillOnce(Return(makeIndex()));

    MigrationStatusApplication app{inspector_, MigrationStatusCmd::refresh(), out_};
    EXPECT_EQ(app.run(), EXIT_SUCCESS);
    EXPECT_EQ(out_.str(), "Refreshed migration status: 1 of 2 tables migrated\n");
}

struct MigrationStatusApplicationConfigTest : public NoLoggerFixture {
protected:
    util::config::ConfigDefinition config_ = util::config::getTablemigConfig();
    TmpDir snapshots_;
};

TEST_F(MigrationStatusApplicationConfigTest, MissingWorkspaceExport)
{
    ASSERT_FALSE(config_.parse(util::config::ConfigFileJson{boost::json::object{}}).has_value());
    EXPECT_THROW(MigrationStatusApplication(config_, MigrationStatusCmd::status()), std::runtime_error);
}

TEST_F(MigrationStatusApplicationConfigTest, UnreadableWorkspaceExport)
{
    auto const errors = config_.parse(util::config::ConfigFileJson{boost::json::object{
        {"workspace", boost::json::object{{"export_file", "/does/not/exist.json"}}},
    }});
    ASSERT_FALSE(errors.has_value());
    EXPECT_THROW(MigrationStatusApplication(config_, MigrationStatusCmd::status()), std::runtime_error);
}

TEST_F(MigrationStatusApplicationConfigTest, RunsAgainstWorkspaceExport)
{
    auto const workspace = TmpFile(kWORKSPACE);
    auto const errors = config_.parse(util::config::ConfigFileJson{boost::json::object{
        {"workspace", boost::json::object{{"export_file", workspace.path}}},
        {"snapshot_store", boost::json::object{{"directory", snapshots_.path.string()}}},
    }});
    ASSERT_FALSE(errors.has_value());

    MigrationStatusApplication app{config_, MigrationStatusCmd::refresh()};
    EXPECT_EQ(app.run(), EXIT_SUCCESS);

    MigrationStatusApplication check{config_, MigrationStatusCmd::check("sales", "orders")};
    EXPECT_EQ(check.run(), EXIT_SUCCESS);

    MigrationStatusApplication checkOther{config_, MigrationStatusCmd::check("sales", "customers")};
    EXPECT_EQ(checkOther.run(), EXIT_FAILURE);
}
