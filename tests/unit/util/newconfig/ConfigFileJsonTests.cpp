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

#include "util/TmpFile.hpp"
#include "util/newconfig/ConfigFileJson.hpp"
#include "util/newconfig/Types.hpp"

#include <boost/json/parse.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

using namespace util::config;

TEST(ConfigFileJsonTest, NestedObjectsAreFlattened)
{
    auto const file = ConfigFileJson{boost::json::parse(R"JSON({
        "migration": {"status_table": "status", "inner": {"depth": 2}},
        "log_to_console": false,
        "ratio": 0.25
    })JSON").as_object()};

    EXPECT_TRUE(file.containsKey("migration.status_table"));
    EXPECT_TRUE(file.containsKey("migration.inner.depth"));
    EXPECT_FALSE(file.containsKey("migration"));

    EXPECT_EQ(std::get<std::string>(file.getValue("migration.status_table")), "status");
    EXPECT_EQ(std::get<int64_t>(file.getValue("migration.inner.depth")), 2);
    EXPECT_EQ(std::get<bool>(file.getValue("log_to_console")), false);
    EXPECT_DOUBLE_EQ(std::get<double>(file.getValue("ratio")), 0.25);
}

TEST(ConfigFileJsonTest, ArraysOfValues)
{
    auto const file = ConfigFileJson{boost::json::parse(R"JSON({
        "migration": {"skip_catalog_types": ["SYSTEM_CATALOG", null]}
    })JSON").as_object()};

    ASSERT_TRUE(file.containsKey("migration.skip_catalog_types.[]"));
    auto const values = file.getArray("migration.skip_catalog_types.[]");
    ASSERT_EQ(values.size(), 2);
    EXPECT_EQ(std::get<std::string>(values[0].value()), "SYSTEM_CATALOG");
    EXPECT_FALSE(values[1].has_value());
}

TEST(ConfigFileJsonTest, ArraysOfObjectsArePaddedWithNull)
{
    auto const file = ConfigFileJson{boost::json::parse(R"JSON({
        "log_channels": [{"channel": "Migration", "log_level": "trace"}, {"channel": "Crawler"}]
    })JSON").as_object()};

    auto const channels = file.getArray("log_channels.[].channel");
    ASSERT_EQ(channels.size(), 2);
    EXPECT_EQ(std::get<std::string>(channels[1].value()), "Crawler");

    auto const levels = file.getArray("log_channels.[].log_level");
    ASSERT_EQ(levels.size(), 2);
    EXPECT_EQ(std::get<std::string>(levels[0].value()), "trace");
    EXPECT_FALSE(levels[1].has_value());
}

TEST(ConfigFileJsonTest, MakeFromFile)
{
    auto const tmp = TmpFile(R"JSON({"log_level": "debug"})JSON");
    auto const file = ConfigFileJson::makeConfigFileJson(tmp.path);
    ASSERT_TRUE(file.has_value());
    EXPECT_EQ(std::get<std::string>(file->getValue("log_level")), "debug");
}

TEST(ConfigFileJsonTest, MakeFromMissingFile)
{
    auto const file = ConfigFileJson::makeConfigFileJson("/does/not/exist.json");
    ASSERT_FALSE(file.has_value());
    EXPECT_THAT(file.error().error, testing::HasSubstr("Could not open file"));
}

TEST(ConfigFileJsonTest, MakeFromNonObject)
{
    auto const tmp = TmpFile("[1, 2]");
    auto const file = ConfigFileJson::makeConfigFileJson(tmp.path);
    ASSERT_FALSE(file.has_value());
    EXPECT_THAT(file.error().error, testing::HasSubstr("must contain a JSON object"));
}
