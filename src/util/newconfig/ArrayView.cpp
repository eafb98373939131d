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

#include "util/newconfig/ArrayView.hpp"

#include "util/Assert.hpp"
#include "util/newconfig/ConfigDefinition.hpp"
#include "util/newconfig/ObjectView.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace util::config {

ArrayView::ArrayView(std::string_view prefix, ConfigDefinition const& configDef) : prefix_{prefix}, config_{configDef}
{
    ASSERT(config_.get().hasItemsWithPrefix(prefix_ + ".[]"), "Key {} is not an array", prefix_);
}

std::size_t
ArrayView::size() const
{
    auto const valuesKey = prefix_ + ".[]";
    if (config_.get().contains(valuesKey))
        return config_.get().arrayAt(valuesKey).size();

    // all members of an array of objects have the same number of elements
    auto const membersPrefix = valuesKey + ".";
    for (auto const& [key, _] : config_.get()) {
        if (key.starts_with(membersPrefix))
            return config_.get().arrayAt(key).size();
    }
    return 0;
}

ObjectView
ArrayView::objectAt(std::size_t idx) const
{
    ASSERT(idx < size(), "Object index {} is out of scope of array {}", idx, prefix_);
    return ObjectView{prefix_, idx, config_.get()};
}

}  // namespace util::config
