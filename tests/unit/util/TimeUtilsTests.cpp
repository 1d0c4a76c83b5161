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

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

TEST(TimeUtilTests, UTCStrFromSystemTpKeepsMicroseconds)
{
    using namespace std::chrono;

    auto const tp = system_clock::time_point{seconds{1'704'106'240} + microseconds{123}};
    EXPECT_EQ(util::UTCStrFromSystemTp(tp), "2024-01-01T10:50:40.000123");
}

TEST(TimeUtilTests, UTCStrFromSystemTpDropsNanoseconds)
{
    using namespace std::chrono;

    auto const tp = system_clock::time_point{duration_cast<system_clock::duration>(seconds{0} + nanoseconds{1'999})};
    EXPECT_EQ(util::UTCStrFromSystemTp(tp), "1970-01-01T00:00:00.000001");
}

TEST(TimeUtilTests, UTCStrFromSystemTpAtEpoch)
{
    EXPECT_EQ(util::UTCStrFromSystemTp(std::chrono::system_clock::time_point{}), "1970-01-01T00:00:00.000000");
}

TEST(TimeUtilTests, TimedVoidCallReportsElapsed)
{
    bool called = false;
    auto const elapsed = util::timed([&called]() {
        called = true;
        std::this_thread::sleep_for(std::chrono::milliseconds{5});
    });

    EXPECT_TRUE(called);
    EXPECT_GE(elapsed, 5);
}

TEST(TimeUtilTests, TimedCallKeepsResult)
{
    auto const [result, elapsed] = util::timed<std::chrono::microseconds>([]() { return std::string{"done"}; });
    EXPECT_EQ(result, "done");
    EXPECT_GE(elapsed, 0);
}
