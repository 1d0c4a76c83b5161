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

#include "data/Types.hpp"
#include "etl/Models.hpp"
#include "etl/impl/BatchLoader.hpp"
#include "util/FakeStore.hpp"
#include "util/LoggerFixtures.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <expected>
#include <string>

using namespace etl;
using namespace etl::impl;
using namespace testing;

namespace {

data::SinkError
connectionError()
{
    return data::SinkError{.code = data::SinkError::Code::Connection, .message = "connection refused"};
}

}  // namespace

struct BatchLoaderTest : NoLoggerFixture {
    StrictMock<MockSink> sink_;
    BatchLoader loader_{sink_, 2, std::chrono::milliseconds{1}, std::chrono::milliseconds{2}};

    Batch batch_ = [] {
        Batch batch;
        batch.startVersion = 10;
        batch.endVersion = 19;
        return batch;
    }();
    data::CheckpointUpdate checkpoint_{.name = "events_processor", .version = 19, .lastTransactionTimestamp = {}, .backfill = {}};
};

TEST_F(BatchLoaderTest, CommitsOnce)
{
    EXPECT_CALL(sink_, commit(Ref(batch_), Ref(checkpoint_))).WillOnce(Return(std::expected<void, data::SinkError>{}));
    EXPECT_TRUE(loader_.load(batch_, checkpoint_).has_value());
}

TEST_F(BatchLoaderTest, RetriesFailedCommit)
{
    EXPECT_CALL(sink_, commit)
        .WillOnce(Return(std::unexpected{connectionError()}))
        .WillOnce(Return(std::expected<void, data::SinkError>{}));

    EXPECT_TRUE(loader_.load(batch_, checkpoint_).has_value());
}

TEST_F(BatchLoaderTest, GivesUpAfterWriteRetries)
{
    EXPECT_CALL(sink_, commit).Times(3).WillRepeatedly(Return(std::unexpected{connectionError()}));

    auto const result = loader_.load(batch_, checkpoint_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, data::SinkError::Code::Connection);
    EXPECT_EQ(result.error().message, "connection refused");
}

TEST_F(BatchLoaderTest, InvalidBatchIsNotRetried)
{
    EXPECT_CALL(sink_, commit)
        .WillOnce(Return(std::unexpected{
            data::SinkError{.code = data::SinkError::Code::Invalid, .message = "Unknown table not_a_table"}
        }));

    auto const result = loader_.load(batch_, checkpoint_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, data::SinkError::Code::Invalid);
    EXPECT_FALSE(result.error().isTransient());
}

TEST_F(BatchLoaderTest, RetryBudgetIsPerBatch)
{
    EXPECT_CALL(sink_, commit)
        .WillOnce(Return(std::unexpected{connectionError()}))
        .WillOnce(Return(std::unexpected{connectionError()}))
        .WillOnce(Return(std::expected<void, data::SinkError>{}))
        .WillOnce(Return(std::unexpected{connectionError()}))
        .WillOnce(Return(std::unexpected{connectionError()}))
        .WillOnce(Return(std::expected<void, data::SinkError>{}));

    EXPECT_TRUE(loader_.load(batch_, checkpoint_).has_value());
    EXPECT_TRUE(loader_.load(batch_, checkpoint_).has_value());
}

TEST(BatchLoaderNoRetryTest, ZeroRetriesMeansOneAttempt)
{
    StrictMock<MockSink> sink;
    BatchLoader loader{sink, 0, std::chrono::milliseconds{1}, std::chrono::milliseconds{1}};

    EXPECT_CALL(sink, commit).WillOnce(Return(std::unexpected{connectionError()}));
    EXPECT_FALSE(loader.load(Batch{}, data::CheckpointUpdate{}).has_value());
}

struct BatchLoaderLogTest : LoggerFixture {};

TEST_F(BatchLoaderLogTest, LogsEveryFailedAttempt)
{
    StrictMock<MockSink> sink;
    BatchLoader loader{sink, 1, std::chrono::milliseconds{1}, std::chrono::milliseconds{1}};

    Batch batch;
    batch.startVersion = 1;
    batch.endVersion = 2;

    EXPECT_CALL(sink, commit).Times(2).WillRepeatedly(Return(std::unexpected{connectionError()}));
    EXPECT_FALSE(loader.load(batch, data::CheckpointUpdate{}).has_value());

    EXPECT_THAT(
        loggedLines(),
        testing::ElementsAre(
            "Sink:WRN Commit of versions [1, 2] failed on attempt 1: Connection: connection refused",
            "Sink:WRN Commit of versions [1, 2] failed on attempt 2: Connection: connection refused",
            "Sink:ERR Giving up on versions [1, 2] after 2 attempts"
        )
    );
}
