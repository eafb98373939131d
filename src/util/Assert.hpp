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

#include "util/SourceLocation.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace util::impl {

/**
 * @brief The action performed when an assertion fails. By default it logs the message and terminates the process.
 * Tests may replace it, for example to throw an exception instead.
 */
class OnAssert {
public:
    using ActionType = std::function<void(std::string_view)>;

    /**
     * @brief Run the current action with the given message
     *
     * @param message The assertion message
     */
    static void
    call(std::string_view message);

    /**
     * @brief Replace the current action
     *
     * @param newAction The new action
     */
    static void
    setAction(ActionType newAction);

    /**
     * @brief Restore the default action
     */
    static void
    resetAction();

private:
    static ActionType action;

    static void
    defaultAction(std::string_view message);
};

template <typename... Args>
constexpr void
assertImpl(
    SourceLocationType const location,
    char const* expression,
    bool const condition,
    fmt::format_string<Args...> format,
    Args&&... args
)
{
    if (not condition) {
        std::string const resultMessage = fmt::format(
            "Assertion '{}' failed at {}:{}:\n{}",
            expression,
            location.file_name(),
            location.line(),
            fmt::format(format, std::forward<Args>(args)...)
        );
        OnAssert::call(resultMessage);
    }
}

}  // namespace util::impl

#define ASSERT(condition, ...) \
    util::impl::assertImpl(CURRENT_SRC_LOCATION, #condition, static_cast<bool>(condition), __VA_ARGS__)
