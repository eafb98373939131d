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

#include "migration/LiveMigrationStatus.hpp"

#include <gtest/gtest.h>

using migration::LiveMigrationStatus;

TEST(LiveMigrationStatus, ToString)
{
    LiveMigrationStatus status(LiveMigrationStatus::Migrated);
    EXPECT_EQ(status.toString(), "Migrated");
    status = LiveMigrationStatus(LiveMigrationStatus::NotMigrated);
    EXPECT_EQ(status.toString(), "NotMigrated");
    status = LiveMigrationStatus(LiveMigrationStatus::SourceMissing);
    EXPECT_EQ(status.toString(), "SourceMissing");
}

TEST(LiveMigrationStatus, FromString)
{
    EXPECT_EQ(LiveMigrationStatus::fromString("Migrated"), LiveMigrationStatus::Migrated);
    EXPECT_EQ(LiveMigrationStatus::fromString("NotMigrated"), LiveMigrationStatus::NotMigrated);
    EXPECT_EQ(LiveMigrationStatus::fromString("SourceMissing"), LiveMigrationStatus::SourceMissing);
    EXPECT_EQ(LiveMigrationStatus::fromString("Unknown"), LiveMigrationStatus::NotMigrated);
}

TEST(LiveMigrationStatus, Compare)
{
    LiveMigrationStatus const status1(LiveMigrationStatus::Migrated);
    LiveMigrationStatus status2(LiveMigrationStatus::Migrated);
    EXPECT_TRUE(status1 == status2);
    status2 = LiveMigrationStatus(LiveMigrationStatus::NotMigrated);
    EXPECT_FALSE(status1 == status2);
    EXPECT_FALSE(status1 == LiveMigrationStatus::NotMigrated);
    EXPECT_TRUE(status1 == LiveMigrationStatus::Migrated);
}

TEST(LiveMigrationStatus, MissingSourceCountsAsMigrated)
{
    EXPECT_TRUE(LiveMigrationStatus(LiveMigrationStatus::Migrated).countsAsMigrated());
    EXPECT_TRUE(LiveMigrationStatus(LiveMigrationStatus::SourceMissing).countsAsMigrated());
    EXPECT_FALSE(LiveMigrationStatus(LiveMigrationStatus::NotMigrated).countsAsMigrated());
}
