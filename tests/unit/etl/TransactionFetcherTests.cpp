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

#include "etl/ETLHelpers.hpp"
#include "etl/Errors.hpp"
#include "etl/Models.hpp"
#include "etl/SourceInterface.hpp"
#include "etl/impl/TransactionFetcher.hpp"
#include "util/FakeSource.hpp"
#include "util/LoggerFixtures.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

using namespace etl;
using namespace etl::impl;
using namespace testing;

namespace {

constexpr std::size_t kWINDOW = 1000;

TransactionFetcher::Settings const kSETTINGS{
    .maxReconnects = 3,
    .reconnectDelay = std::chrono::milliseconds{1},
    .reconnectMaxDelay = std::chrono::milliseconds{2},
};

}  // namespace

struct TransactionFetcherTest : NoLoggerFixture {
    FakeSource source_;
    ThreadSafeQueue<Transaction> out_{kWINDOW};
    InFlightWindow window_{kWINDOW};

    /** Pop everything until the fetcher closes the queue, releasing window slots like the coordinator does */
    std::vector<Version>
    drain()
    {
        std::vector<Version> versions;
        while (auto txn = out_.pop()) {
            versions.push_back(txn->version);
            window_.release();
        }
        return versions;
    }

    static std::vector<Version>
    range(Version first, Version last)
    {
        std::vector<Version> versions;
        for (auto v = first; v <= last; ++v)
            versions.push_back(v);
        return versions;
    }
};

TEST_F(TransactionFetcherTest, BoundedRangeInOrder)
{
    TransactionFetcher fetcher{source_, out_, window_, 5, 14, kSETTINGS};

    EXPECT_EQ(drain(), range(5, 14));
    fetcher.waitTillFinished();
    EXPECT_FALSE(fetcher.failure().has_value());
    EXPECT_EQ(source_.fetchStarts(), std::vector<Version>{5});
}

TEST_F(TransactionFetcherTest, SingleVersion)
{
    TransactionFetcher fetcher{source_, out_, window_, 7, 7, kSETTINGS};

    EXPECT_EQ(drain(), std::vector<Version>{7});
    fetcher.waitTillFinished();
    EXPECT_FALSE(fetcher.failure().has_value());
}

TEST_F(TransactionFetcherTest, ReconnectsFromNextUnconsumedVersion)
{
    source_.state().breakBefore = {4, 9};
    TransactionFetcher fetcher{source_, out_, window_, 0, 11, kSETTINGS};

    EXPECT_EQ(drain(), range(0, 11));
    fetcher.waitTillFinished();
    EXPECT_FALSE(fetcher.failure().has_value());
    EXPECT_EQ(source_.fetchStarts(), (std::vector<Version>{0, 4, 9}));
}

TEST_F(TransactionFetcherTest, GapIsAnOrderingViolation)
{
    source_.state().skipped = {6};
    TransactionFetcher fetcher{source_, out_, window_, 0, 10, kSETTINGS};

    EXPECT_EQ(drain(), range(0, 5));
    fetcher.waitTillFinished();

    auto const failure = fetcher.failure();
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->code, PipelineErrorCode::OrderingViolation);
    EXPECT_THAT(failure->message, HasSubstr("Expected version 6 but received 7"));
}

TEST_F(TransactionFetcherTest, FatalSourceErrorStops)
{
    source_.state().fatalBefore = {3};
    TransactionFetcher fetcher{source_, out_, window_, 0, 10, kSETTINGS};

    EXPECT_EQ(drain(), range(0, 2));
    fetcher.waitTillFinished();

    auto const failure = fetcher.failure();
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->code, PipelineErrorCode::SourceFailure);
    EXPECT_EQ(source_.fetchStarts().size(), 1);
}

TEST_F(TransactionFetcherTest, RangeBeyondHeadIsUnavailable)
{
    source_.state().head = 100;
    TransactionFetcher fetcher{source_, out_, window_, 200, 300, kSETTINGS};

    EXPECT_TRUE(drain().empty());
    fetcher.waitTillFinished();

    auto const failure = fetcher.failure();
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->code, PipelineErrorCode::RangeUnavailable);
}

TEST_F(TransactionFetcherTest, ExhaustedAfterReconnectsWithoutProgress)
{
    StrictMock<MockSource> source;
    EXPECT_CALL(source, fetch(2, std::optional<Version>{10}))
        .Times(static_cast<int>(kSETTINGS.maxReconnects) + 1)
        .WillRepeatedly([](Version, std::optional<Version>) {
            return std::expected<std::unique_ptr<TransactionStreamInterface>, SourceError>{
                std::unexpected{SourceError{.code = SourceError::Code::Timeout, .message = "deadline exceeded"}}
            };
        });

    TransactionFetcher fetcher{source, out_, window_, 2, 10, kSETTINGS};
    EXPECT_TRUE(drain().empty());
    fetcher.waitTillFinished();

    auto const failure = fetcher.failure();
    ASSERT_TRUE(failure.has_value());
    EXPECT_EQ(failure->code, PipelineErrorCode::SourceExhausted);
    EXPECT_THAT(failure->message, HasSubstr("deadline exceeded"));
}

TEST_F(TransactionFetcherTest, ProgressResetsTheReconnectBudget)
{
    // more breaks than reconnects allowed, but every stream delivers something first
    source_.state().chunkSize = 1;
    source_.state().breakBefore = {1, 2, 3, 4, 5, 6};
    TransactionFetcher fetcher{source_, out_, window_, 0, 8, kSETTINGS};

    EXPECT_EQ(drain(), range(0, 8));
    fetcher.waitTillFinished();
    EXPECT_FALSE(fetcher.failure().has_value());
}

TEST_F(TransactionFetcherTest, StopCancelsStreamWaitingAtHead)
{
    source_.state().head = 4;
    source_.state().waitAtHead = true;
    TransactionFetcher fetcher{source_, out_, window_, 0, std::nullopt, kSETTINGS};

    for (Version v = 0; v <= 4; ++v) {
        auto txn = out_.pop();
        ASSERT_TRUE(txn.has_value());
        EXPECT_EQ(txn->version, v);
        window_.release();
    }

    fetcher.stop();
    fetcher.waitTillFinished();
    EXPECT_FALSE(out_.pop().has_value());
    EXPECT_FALSE(fetcher.failure().has_value());
}

TEST_F(TransactionFetcherTest, WindowBoundsTransactionsInFlight)
{
    InFlightWindow window{4};
    TransactionFetcher fetcher{source_, out_, window, 0, 99, kSETTINGS};

    std::this_thread::sleep_for(std::chrono::milliseconds{20});
    EXPECT_EQ(out_.size(), 4);

    std::size_t received = 0;
    while (auto txn = out_.pop()) {
        ++received;
        window.release();
    }
    fetcher.waitTillFinished();

    EXPECT_EQ(received, 100);
    EXPECT_EQ(window.peak(), 4);
}
