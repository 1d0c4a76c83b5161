//------------------------------------------------------------------------------
/*
    This file is part of indexer-processor: https://github.com/indexer-processor/indexer-processor
    Copyright (c) 2025, the indexer-processor developers.

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

#include <chrono>
#include <string>
#include <type_traits>
#include <utility>

namespace util {

/**
 * @brief Format a time point the way the sinks store timestamps: ISO 8601 UTC with microseconds and no zone suffix
 *
 * e.g. 2024-01-01T10:50:40.000123
 *
 * @param tp The time point
 * @return The formatted string
 */
[[nodiscard]] std::string
UTCStrFromSystemTp(std::chrono::system_clock::time_point tp);

/**
 * @brief Measure how long a call takes on the steady clock
 *
 * @tparam U The unit of the reported time; milliseconds by default
 * @param func Any callable taking no arguments
 * @return The elapsed count of U for a void callable; the result paired with the elapsed count otherwise
 */
template <typename U = std::chrono::milliseconds, typename FnType>
[[nodiscard]] auto
timed(FnType&& func)
{
    auto const start = std::chrono::steady_clock::now();
    auto const elapsed = [&start]() {
        return std::chrono::duration_cast<U>(std::chrono::steady_clock::now() - start).count();
    };

    if constexpr (std::is_void_v<std::invoke_result_t<FnType>>) {
        std::forward<FnType>(func)();
        return elapsed();
    } else {
        auto ret = std::forward<FnType>(func)();
        return std::make_pair(std::move(ret), elapsed());
    }
}

}  // namespace util
