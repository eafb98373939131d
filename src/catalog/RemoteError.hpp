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

#include <expected>
#include <ostream>
#include <string>
#include <utility>

namespace catalog {

/**
 * @brief A failure reported by a remote collaborator
 */
struct RemoteError {
    enum class Code {
        NotFound, /**< the object disappeared or never existed */
        Generic,  /**< any other remote failure */
    };

    Code code = Code::Generic;
    std::string message;

    /**
     * @return true if the error reports a missing object
     */
    [[nodiscard]] bool
    isNotFound() const
    {
        return code == Code::NotFound;
    }

    /**
     * @brief Make a not-found error
     *
     * @param message The error message
     * @return The error
     */
    [[nodiscard]] static RemoteError
    notFound(std::string message)
    {
        return RemoteError{.code = Code::NotFound, .message = std::move(message)};
    }

    /**
     * @brief Make a generic error
     *
     * @param message The error message
     * @return The error
     */
    [[nodiscard]] static RemoteError
    generic(std::string message)
    {
        return RemoteError{.code = Code::Generic, .message = std::move(message)};
    }

    bool
    operator==(RemoteError const&) const = default;
};

/**
 * @brief The result of a remote call
 *
 * @tparam T The type of the value on success
 */
template <typename T>
using RemoteResult = std::expected<T, RemoteError>;

/**
 * @brief Prints a remote error
 *
 * @param stream The output stream
 * @param err The error
 * @return The same stream
 */
inline std::ostream&
operator<<(std::ostream& stream, RemoteError const& err)
{
    return stream << (err.isNotFound() ? "NotFound: " : "RemoteError: ") << err.message;
}

}  // namespace catalog
