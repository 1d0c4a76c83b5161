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

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <utility>

namespace util {

RetryStrategy::RetryStrategy(std::chrono::steady_clock::duration delay) : initialDelay_(delay), delay_(delay)
{
}

std::chrono::steady_clock::duration
RetryStrategy::getDelay() const
{
    return delay_;
}

void
RetryStrategy::increaseDelay()
{
    delay_ = nextDelay();
}

void
RetryStrategy::reset()
{
    delay_ = initialDelay_;
}

Retry::Retry(RetryStrategyPtr strategy) : strategy_(std::move(strategy))
{
}

bool
Retry::waitForNextAttempt()
{
    std::unique_lock lk{mtx_};
    auto const cancelled = cv_.wait_for(lk, strategy_->getDelay(), [this] { return cancelled_; });
    if (cancelled)
        return false;

    strategy_->increaseDelay();
    ++attemptNumber_;
    return true;
}

void
Retry::cancel()
{
    {
        std::lock_guard const lk{mtx_};
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool
Retry::isCancelled()
{
    std::lock_guard const lk{mtx_};
    return cancelled_;
}

void
Retry::reset()
{
    std::lock_guard const lk{mtx_};
    attemptNumber_ = 0;
    strategy_->reset();
}

std::size_t
Retry::attemptNumber() const
{
    return attemptNumber_;
}

std::chrono::steady_clock::duration
Retry::delayValue() const
{
    return strategy_->getDelay();
}

ExponentialBackoffStrategy::ExponentialBackoffStrategy(
    std::chrono::steady_clock::duration delay,
    std::chrono::steady_clock::duration maxDelay
)
    : RetryStrategy(delay), maxDelay_(maxDelay)
{
}

std::chrono::steady_clock::duration
ExponentialBackoffStrategy::nextDelay() const
{
    auto const next = getDelay() * 2;
    return std::min(next, maxDelay_);
}

std::unique_ptr<Retry>
makeRetryExponentialBackoff(std::chrono::steady_clock::duration delay, std::chrono::steady_clock::duration maxDelay)
{
    return std::make_unique<Retry>(std::make_unique<ExponentialBackoffStrategy>(delay, maxDelay));
}

}  // namespace util
