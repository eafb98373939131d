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

#include "util/newconfig/ObjectView.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

namespace util::config {

class ConfigDefinition;

/**
 * @brief View for array structure for config.
 *
 * Arrays of plain values are declared as 'prefix.[]' and read with valueAt(). Arrays of objects are declared as
 * 'prefix.[].member' and read with objectAt().
 */
class ArrayView {
public:
    /**
     * @brief Constructs an ArrayView with the provided prefix and config definition
     *
     * @param prefix Prefix of the array, without the trailing '.[]'
     * @param configDef The ConfigDefinition holding the data
     */
    ArrayView(std::string_view prefix, ConfigDefinition const& configDef);

    /**
     * @brief Returns the number of elements in the array
     *
     * @return Number of elements
     */
    [[nodiscard]] std::size_t
    size() const;

    /**
     * @brief Returns an ObjectView for the element at the given index. Only valid for arrays of objects
     *
     * @param idx Index of the element
     * @return ObjectView of the element
     */
    [[nodiscard]] ObjectView
    objectAt(std::size_t idx) const;

    /**
     * @brief Returns the plain value at the given index. Only valid for arrays of values
     *
     * @tparam T The requested type
     * @param idx Index of the element
     * @return The value
     */
    template <typename T>
    [[nodiscard]] T
    valueAt(std::size_t idx) const;

private:
    std::string prefix_;
    std::reference_wrapper<ConfigDefinition const> config_;
};

}  // namespace util::config
