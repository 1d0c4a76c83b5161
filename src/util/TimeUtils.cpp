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

#include "util/TimeUtils.hpp"

#include <fmt/core.h>

#include <chrono>
#include <ctime>
#include <string>

namespace util {

std::string
UTCStrFromSystemTp(std::chrono::system_clock::time_point tp)
{
    using namespace std::chrono;

    auto const micros = duration_cast<microseconds>(tp.time_since_epoch());
    auto const secs = floor<seconds>(micros);
    auto const fraction = (micros - secs).count();

    std::time_t const time = secs.count();
    std::tm timeStruct{};
    gmtime_r(&time, &timeStruct);

    return fmt::format(
        "{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}",
        timeStruct.tm_year + 1900,
        timeStruct.tm_mon + 1,
        timeStruct.tm_mday,
        timeStruct.tm_hour,
        timeStruct.tm_min,
        timeStruct.tm_sec,
        fraction
    );
}

}  // namespace util
