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

#include "util/newconfig/Array.hpp"
#include "util/newconfig/ConfigDefinition.hpp"
#include "util/newconfig/ConfigDescription.hpp"
#include "util/newconfig/ConfigFileJson.hpp"
#include "util/newconfig/ConfigValue.hpp"
#include "util/newconfig/Types.hpp"

#include <boost/json/parse.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <string_view>

using namespace util::config;

struct NewConfigTest : testing::Test {
protected:
    ConfigDefinition config_{
        {"header.text", ConfigValue{ConfigType::String}.defaultValue("value")},
        {"header.port", ConfigValue{ConfigType::Integer}.defaultValue(123)},
        {"header.ratio", ConfigValue{ConfigType::Double}.defaultValue(0.5)},
        {"header.enabled", ConfigValue{ConfigType::Boolean}.defaultValue(true)},
        {"header.optional", ConfigValue{ConfigType::String}.optional()},
        {"required", ConfigValue{ConfigType::String}},
        {"values.[]", Array{ConfigValue{ConfigType::Integer}}},
        {"objects.[].name", Array{ConfigValue{ConfigType::String}}},
        {"objects.[].comment", Array{ConfigValue{ConfigType::String}.optional()}},
    };

    [[nodiscard]] static ConfigFileJson
    json(std::string_view text)
    {
        return ConfigFileJson{boost::json::parse(text).as_object()};
    }
};

TEST_F(NewConfigTest, DefaultValues)
{
    EXPECT_EQ(config_.get<std::string>("header.text"), "value");
    EXPECT_EQ(config_.get<int64_t>("header.port"), 123);
    EXPECT_EQ(config_.get<uint16_t>("header.port"), 123);
    EXPECT_DOUBLE_EQ(config_.get<double>("header.ratio"), 0.5);
    EXPECT_TRUE(config_.get<bool>("header.enabled"));
    EXPECT_FALSE(config_.maybeValue<std::string>("header.optional").has_value());
}

TEST_F(NewConfigTest, ParseOverridesDefaults)
{
    auto const errors = config_.parse(json(R"JSON({
        "header": {"text": "other", "port": 8080, "ratio": 2, "optional": "set"},
        "required": "here",
        "values": [1, 2, 3]
    })JSON"));
    ASSERT_FALSE(errors.has_value());

    EXPECT_EQ(config_.get<std::string>("header.text"), "other");
    EXPECT_EQ(config_.get<int>("header.port"), 8080);
    EXPECT_DOUBLE_EQ(config_.get<double>("header.ratio"), 2.0);
    EXPECT_EQ(config_.maybeValue<std::string>("header.optional"), "set");
    EXPECT_EQ(config_.get<std::string>("required"), "here");

    auto const values = config_.getArray("values");
    ASSERT_EQ(values.size(), 3);
    EXPECT_EQ(values.valueAt<int64_t>(2), 3);
}

TEST_F(NewConfigTest, MissingRequiredValue)
{
    auto const errors = config_.parse(json(R"JSON({})JSON"));
    ASSERT_TRUE(errors.has_value());
    ASSERT_EQ(errors->size(), 1);
    EXPECT_EQ(errors->front().error, "required is required but was not provided");
}

TEST_F(NewConfigTest, WrongTypesAreAllReported)
{
    auto const errors = config_.parse(json(R"JSON({
        "header": {"text": 1, "enabled": "yes"},
        "required": "here",
        "values": [1, "two"]
    })JSON"));
    ASSERT_TRUE(errors.has_value());

    std::vector<std::string> messages;
    for (auto const& err : errors.value())
        messages.push_back(err.error);

    EXPECT_THAT(
        messages,
        testing::UnorderedElementsAre(
            "header.text value does not match type string",
            "header.enabled value does not match type boolean",
            "values.[] value does not match type int"
        )
    );
}

TEST_F(NewConfigTest, ArrayOfObjects)
{
    auto const errors = config_.parse(json(R"JSON({
        "required": "here",
        "objects": [{"name": "first", "comment": "hello"}, {"name": "second"}]
    })JSON"));
    ASSERT_FALSE(errors.has_value());

    auto const objects = config_.getArray("objects");
    ASSERT_EQ(objects.size(), 2);
    EXPECT_EQ(objects.objectAt(0).get<std::string>("name"), "first");
    EXPECT_EQ(objects.objectAt(0).maybeValue<std::string>("comment"), "hello");
    EXPECT_EQ(objects.objectAt(1).get<std::string>("name"), "second");
    EXPECT_FALSE(objects.objectAt(1).maybeValue<std::string>("comment").has_value());
}

TEST_F(NewConfigTest, MissingRequiredArrayElementMember)
{
    auto const errors = config_.parse(json(R"JSON({
        "required": "here",
        "objects": [{"name": "first"}, {"comment": "nameless"}]
    })JSON"));
    ASSERT_TRUE(errors.has_value());
    ASSERT_EQ(errors->size(), 1);
    EXPECT_EQ(errors->front().error, "objects.[].name is missing a required array element value");
}

TEST_F(NewConfigTest, ParsingAgainClearsArrays)
{
    ASSERT_FALSE(config_.parse(json(R"JSON({"required": "a", "values": [1, 2]})JSON")).has_value());
    ASSERT_FALSE(config_.parse(json(R"JSON({"required": "a", "values": [7]})JSON")).has_value());

    auto const values = config_.getArray("values");
    ASSERT_EQ(values.size(), 1);
    EXPECT_EQ(values.valueAt<int>(0), 7);
}

TEST_F(NewConfigTest, ObjectView)
{
    auto const header = config_.getObject("header");
    EXPECT_TRUE(header.containsKey("port"));
    EXPECT_FALSE(header.containsKey("nope"));
    EXPECT_EQ(header.get<int>("port"), 123);
    EXPECT_FALSE(header.maybeValue<std::string>("optional").has_value());
}

TEST_F(NewConfigTest, ContainsAndPrefix)
{
    EXPECT_TRUE(config_.contains("header.text"));
    EXPECT_FALSE(config_.contains("header"));
    EXPECT_TRUE(config_.hasItemsWithPrefix("header."));
    EXPECT_FALSE(config_.hasItemsWithPrefix("footer"));
}

TEST(TablemigConfigTest, DefaultsAreValid)
{
    auto config = getTablemigConfig();
    ASSERT_FALSE(config.parse(ConfigFileJson{boost::json::object{}}).has_value());

    EXPECT_EQ(config.get<std::string>("log_level"), "info");
    EXPECT_TRUE(config.get<bool>("log_to_console"));
    EXPECT_EQ(config.get<int>("log_directory_max_size"), 50 * 1024);
    EXPECT_EQ(config.get<std::string>("migration.legacy_catalog"), "hive_metastore");
    EXPECT_EQ(config.get<std::string>("migration.inventory_database"), "ucx");
    EXPECT_EQ(config.get<std::string>("migration.status_table"), "migration_status");
    EXPECT_EQ(config.get<std::string>("migration.source_property"), "upgraded_from");
    EXPECT_EQ(config.get<std::string>("migration.marker_property"), "upgraded_to");
    EXPECT_EQ(config.getArray("migration.skip_catalog_types").size(), 0);
    EXPECT_EQ(config.get<std::string>("snapshot_store.directory"), "./snapshots");
    EXPECT_FALSE(config.maybeValue<std::string>("workspace.export_file").has_value());
}

TEST(TablemigConfigTest, EveryKeyIsDescribed)
{
    auto const config = getTablemigConfig();
    for (auto const& [key, _] : config)
        EXPECT_TRUE(ConfigDescription::contains(key)) << key;
}
