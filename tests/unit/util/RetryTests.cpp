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

#include "util/Retry.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <thread>

using namespace util;

struct RetryTests : virtual ::testing::Test {
    std::chrono::milliseconds const delay_{1};
    std::chrono::milliseconds const maxDelay_{5};
};

TEST_F(RetryTests, ExponentialBackoffStrategy)
{
    ExponentialBackoffStrategy strategy{delay_, maxDelay_};

    EXPECT_EQ(strategy.getDelay(), delay_);

    strategy.increaseDelay();
    EXPECT_EQ(strategy.getDelay(), delay_ * 2);

    strategy.increaseDelay();
    EXPECT_LT(strategy.getDelay(), maxDelay_);

    for (size_t i = 0; i < 10; ++i) {
        strategy.increaseDelay();
        EXPECT_EQ(strategy.getDelay(), maxDelay_);
    }

    strategy.reset();
    EXPECT_EQ(strategy.getDelay(), delay_);
}

struct RetryWithExponentialBackoffStrategyTests : RetryTests {
    RetryWithExponentialBackoffStrategyTests()
    {
        EXPECT_EQ(retry_->attemptNumber(), 0);
        EXPECT_EQ(retry_->delayValue(), delay_);
    }

    std::unique_ptr<Retry> retry_ = makeRetryExponentialBackoff(delay_, maxDelay_);
    testing::StrictMock<testing::MockFunction<std::optional<int>()>> mockCallback_;
};

TEST_F(RetryWithExponentialBackoffStrategyTests, WaitForNextAttempt)
{
    EXPECT_TRUE(retry_->waitForNextAttempt());

    EXPECT_EQ(retry_->attemptNumber(), 1);
    EXPECT_EQ(retry_->delayValue(), delay_ * 2);
}

TEST_F(RetryWithExponentialBackoffStrategyTests, RunSucceedsFirstTime)
{
    EXPECT_CALL(mockCallback_, Call).WillOnce(testing::Return(42));

    auto const result = retry_->run(mockCallback_.AsStdFunction(), 3);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 42);
    EXPECT_EQ(retry_->attemptNumber(), 0);
}

TEST_F(RetryWithExponentialBackoffStrategyTests, RunRetriesUntilSuccess)
{
    EXPECT_CALL(mockCallback_, Call)
        .WillOnce(testing::Return(std::nullopt))
        .WillOnce(testing::Return(std::nullopt))
        .WillOnce(testing::Return(7));

    auto const result = retry_->run(mockCallback_.AsStdFunction(), 5);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 7);
    EXPECT_EQ(retry_->attemptNumber(), 2);
}

TEST_F(RetryWithExponentialBackoffStrategyTests, RunGivesUpAfterMaxRetries)
{
    EXPECT_CALL(mockCallback_, Call).Times(3).WillRepeatedly(testing::Return(std::nullopt));

    auto const result = retry_->run(mockCallback_.AsStdFunction(), 2);
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(retry_->attemptNumber(), 2);
}

TEST_F(RetryWithExponentialBackoffStrategyTests, Cancel)
{
    retry_->cancel();
    EXPECT_TRUE(retry_->isCancelled());
    EXPECT_FALSE(retry_->waitForNextAttempt());
    EXPECT_EQ(retry_->attemptNumber(), 0);

    EXPECT_CALL(mockCallback_, Call).WillOnce(testing::Return(std::nullopt));
    EXPECT_FALSE(retry_->run(mockCallback_.AsStdFunction(), 10).has_value());
}

TEST_F(RetryWithExponentialBackoffStrategyTests, CancelWakesUpWaiter)
{
    auto retry = makeRetryExponentialBackoff(std::chrono::hours{1}, std::chrono::hours{1});
    std::thread canceller{[&retry]() {
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
        retry->cancel();
    }};

    EXPECT_FALSE(retry->waitForNextAttempt());
    canceller.join();
}

TEST_F(RetryWithExponentialBackoffStrategyTests, Reset)
{
    EXPECT_TRUE(retry_->waitForNextAttempt());
    EXPECT_EQ(retry_->attemptNumber(), 1);
    EXPECT_EQ(retry_->delayValue(), delay_ * 2);

    retry_->reset();
    EXPECT_EQ(retry_->attemptNumber(), 0);
    EXPECT_EQ(retry_->delayValue(), delay_);
}
