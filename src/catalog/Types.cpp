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

#include "catalog/Types.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <fmt/core.h>

#include <string>

namespace catalog {

std::string
SchemaInfo::fullName() const
{
    return fmt::format("{}.{}", catalogName.value_or(""), name.value_or(""));
}

std::string
TableView::key() const
{
    if (catalog.empty())
        return toLower(fmt::format("{}.{}", schema, name));
    return toLower(fmt::format("{}.{}.{}", catalog, schema, name));
}

std::string
toLower(std::string const& value)
{
    return boost::algorithm::to_lower_copy(value);
}

}  // namespace catalog
