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

#include <optional>
#include <string>

namespace catalog {

/**
 * @brief Point queries against the legacy store
 */
class LegacyStoreInterface {
public:
    virtual ~LegacyStoreInterface() = default;

    /**
     * @brief Fetch one property of one table
     *
     * @param schema The schema (database) of the table
     * @param table The table name
     * @param property The property name
     * @return The value if the property is set, std::nullopt if it is absent, or a NotFound error if the table does
     * not exist
     */
    virtual RemoteResult<std::optional<std::string>>
    fetchTableProperty(std::string const& schema, std::string const& table, std::string const& property) const = 0;
};

}  // namespace catalog
