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

#include "util/Assert.hpp"
#include "util/newconfig/ConfigValue.hpp"
#include "util/newconfig/Error.hpp"
#include "util/newconfig/Types.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

namespace util::config {

Array::Array(ConfigValue arg) : itemPattern_{std::move(arg)}
{
}

std::optional<Error>
Array::addValue(Value value, std::optional<std::string_view> key)
{
    auto newElem = ConfigValue{itemPattern_.type()};
    if (auto const err = newElem.setValue(std::move(value), key); err.has_value())
        return err;

    elements_.push_back(std::move(newElem));
    return std::nullopt;
}

std::optional<Error>
Array::addEmpty(std::string_view key)
{
    if (not itemPattern_.isOptional())
        return Error{key, "is missing a required array element value"};

    elements_.push_back(ConfigValue{itemPattern_.type()}.optional());
    return std::nullopt;
}

void
Array::clear()
{
    elements_.clear();
}

std::size_t
Array::size() const
{
    return elements_.size();
}

ConfigValue const&
Array::at(std::size_t idx) const
{
    ASSERT(idx < elements_.size(), "Index {} is out of scope of array of size {}", idx, elements_.size());
    return elements_.at(idx);
}

ConfigValue const&
Array::getArrayPattern() const
{
    return itemPattern_;
}

}  // namespace util::config
