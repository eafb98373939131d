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

#include "migration/LiveMigrationStatus.hpp"
#include "migration/TableMigrationIndex.hpp"
#include "migration/TableMigrationInspectorInterface.hpp"

#include <gmock/gmock.h>

#include <string>

struct MockTableMigrationInspector : public migration::TableMigrationInspectorInterface {
    MOCK_METHOD(migration::TableMigrationIndex, index, (bool), (override));
    MOCK_METHOD(
        migration::LiveMigrationStatus,
        probe,
        (std::string const&, std::string const&),
        (const, override)
    );
    MOCK_METHOD(bool, isMigrated, (std::string const&, std::string const&), (const, override));
};
