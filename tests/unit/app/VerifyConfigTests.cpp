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

#include "app/VerifyConfig.hpp"
#include "util/TmpFile.hpp"
#include "util/newconfig/ConfigDefinition.hpp"
#include "util/newconfig/ConfigFileJson.hpp"

#include <boost/json/object.hpp>
#include <gtest/gtest.h>

#include <string>

using namespace app;
using namespace util::config;

TEST(VerifyConfigTest, InvalidConfig)
{
    static constexpr auto kWRONG_TYPES = R"JSON({
        "log_level": 5,
        "migration": {
            "status_table": true
        }
    })JSON";
    auto const tmpConfigFile = TmpFile(kWRONG_TYPES);
    auto config = getTablemigConfig();

    EXPECT_FALSE(verifyConfig(tmpConfigFile.path, config));
}

TEST(VerifyConfigTest, ValidConfig)
{
    static constexpr auto kVALID_JSON_DATA = R"JSON({
        "log_level": "debug",
        "migration": {
            "inventory_database": "inventory",
            "skip_catalog_types": ["SYSTEM_CATALOG", "FOREIGN_CATALOG"]
        },
        "workspace": {
            "export_file": "/tmp/workspace.json"
        }
    })JSON";
    auto const tmpConfigFile = TmpFile(kVALID_JSON_DATA);
    auto config = getTablemigConfig();

    ASSERT_TRUE(verifyConfig(tmpConfigFile.path, config));
    EXPECT_EQ(config.get<std::string>("log_level"), "debug");
    EXPECT_EQ(config.get<std::string>("migration.inventory_database"), "inventory");
    EXPECT_EQ(config.get<std::string>("migration.status_table"), "migration_status");
    EXPECT_EQ(config.getArray("migration.skip_catalog_types").size(), 2);
    EXPECT_EQ(config.maybeValue<std::string>("workspace.export_file"), "/tmp/workspace.json");
}

TEST(VerifyConfigTest, ConfigFileNotExist)
{
    auto config = getTablemigConfig();
    EXPECT_FALSE(verifyConfig("doesn't exist Config File", config));
}

TEST(VerifyConfigTest, InvalidJsonFile)
{
    // invalid json because extra "," after "info"
    static constexpr auto kINVALID_JSON = R"({
                                             "log_level": "info",
                                         })";
    auto const tmpConfigFile = TmpFile(kINVALID_JSON);
    auto config = getTablemigConfig();

    EXPECT_FALSE(verifyConfig(tmpConfigFile.path, config));
}

TEST(VerifyConfigTest, SameSourceAndMarkerProperty)
{
    static constexpr auto kSAME_PROPERTIES = R"JSON({
        "migration": {
            "source_property": "upgraded",
            "marker_property": "upgraded"
        }
    })JSON";
    auto const tmpConfigFile = TmpFile(kSAME_PROPERTIES);
    auto config = getTablemigConfig();

    EXPECT_FALSE(verifyConfig(tmpConfigFile.path, config));
}

TEST(VerifyConfigTest, DottedStatusTable)
{
    static constexpr auto kDOTTED = R"JSON({
        "migration": {
            "status_table": "ucx.migration_status"
        }
    })JSON";
    auto const tmpConfigFile = TmpFile(kDOTTED);
    auto config = getTablemigConfig();

    EXPECT_FALSE(verifyConfig(tmpConfigFile.path, config));
}

TEST(CheckMigrationSettingsTest, DefaultsAreConsistent)
{
    auto config = getTablemigConfig();
    ASSERT_FALSE(config.parse(ConfigFileJson{boost::json::object{}}).has_value());

    EXPECT_TRUE(checkMigrationSettings(config).empty());
}

TEST(CheckMigrationSettingsTest, ReportsEveryProblem)
{
    auto config = getTablemigConfig();
    auto const errors = config.parse(ConfigFileJson{boost::json::object{
        {"migration",
         boost::json::object{
             {"legacy_catalog", ""},
             {"inventory_database", "a.b"},
             {"source_property", "p"},
             {"marker_property", "p"},
         }},
    }});
    ASSERT_FALSE(errors.has_value());

    auto const problems = checkMigrationSettings(config);
    ASSERT_EQ(problems.size(), 3);
    EXPECT_EQ(problems[0], "migration.legacy_catalog must be a non-empty name without dots, got ''");
    EXPECT_EQ(problems[1], "migration.inventory_database must be a non-empty name without dots, got 'a.b'");
    EXPECT_EQ(
        problems[2], "migration.source_property and migration.marker_property must differ, both are 'p'"
    );
}
