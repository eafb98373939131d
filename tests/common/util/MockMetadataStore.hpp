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

#include "catalog/MetadataStoreInterface.hpp"
#include "catalog/RemoteError.hpp"
#include "catalog/Types.hpp"

#include <gmock/gmock.h>

#include <string>
#include <vector>

struct MockMetadataStore : public catalog::MetadataStoreInterface {
    MOCK_METHOD(catalog::RemoteResult<std::vector<catalog::CatalogInfo>>, listCatalogs, (), (const, override));

    MOCK_METHOD(
        catalog::RemoteResult<std::vector<catalog::SchemaInfo>>,
        listSchemas,
        (std::string const&),
        (const, override)
    );

    MOCK_METHOD(
        catalog::RemoteResult<std::vector<catalog::TableInfo>>,
        listTables,
        (std::string const&, std::string const&),
        (const, override)
    );
};
