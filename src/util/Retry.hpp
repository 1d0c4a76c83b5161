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
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>

namespace util {

/**
 * @brief Interface for retry strategies
 */
class RetryStrategy {
    std::chrono::steady_clock::duration initialDelay_;
    std::chrono::steady_clock::duration delay_;

public:
    RetryStrategy(std::chrono::steady_clock::duration delay);
    virtual ~RetryStrategy() = default;

    /**
     * @brief Get the current delay value
     *
     * @return std::chrono::steady_clock::duration
     */
    [[nodiscard]] std::chrono::steady_clock::duration
    getDelay() const;

    /**
     * @brief Increase the delay value
     */
    void
    increaseDelay();

    /**
     * @brief Reset the delay value to the initial one
     */
    void
    reset();

protected:
    /**
     * @brief Compute the next delay value
     *
     * @return std::chrono::steady_clock::duration
     */
    [[nodiscard]] virtual std::chrono::steady_clock::duration
    nextDelay() const = 0;
};
using RetryStrategyPtr = std::unique_ptr<RetryStrategy>;

/**
 * @brief A blocking retry mechanism for stage threads
 *
 * The wait between two attempts can be interrupted from another thread with cancel().
 */
class Retry {
    RetryStrategyPtr strategy_;
    std::size_t attemptNumber_ = 0;

    std::mutex mtx_;
    std::condition_variable cv_;
    bool cancelled_ = false;

public:
    Retry(RetryStrategyPtr strategy);

    /**
     * @brief Sleep for the current delay and then increase it
     *
     * @return true if the delay elapsed; false if the retry was cancelled
     */
    [[nodiscard]] bool
    waitForNextAttempt();

    /**
     * @brief Run the callable until it reports success, the attempt budget is used up, or the retry is cancelled
     *
     * @tparam Fn Callable returning something testable as bool; true means success
     * @param func The callable to execute
     * @param maxRetries Number of retries allowed after the first attempt
     * @return The result of the last attempt
     */
    template <typename Fn>
    [[nodiscard]] auto
    run(Fn&& func, std::size_t maxRetries)
    {
        auto result = func();
        while (not static_cast<bool>(result) and attemptNumber_ < maxRetries) {
            if (not waitForNextAttempt())
                break;
            result = func();
        }
        return result;
    }

    /**
     * @brief Cancel the current wait and every future one
     */
    void
    cancel();

    /** @return true if cancel() was called */
    [[nodiscard]] bool
    isCancelled();

    /**
     * @brief Reset the attempt counter and the delay
     */
    void
    reset();

    /**
     * @brief Get the current attempt number
     *
     * @return size_t
     */
    [[nodiscard]] std::size_t
    attemptNumber() const;

    /**
     * @brief Get the current delay value
     *
     * @return std::chrono::steady_clock::duration
     */
    [[nodiscard]] std::chrono::steady_clock::duration
    delayValue() const;
};

/**
 * @brief Retry strategy doubling the delay after every attempt up to a maximum
 */
class ExponentialBackoffStrategy : public RetryStrategy {
    std::chrono::steady_clock::duration maxDelay_;

public:
    ExponentialBackoffStrategy(std::chrono::steady_clock::duration delay, std::chrono::steady_clock::duration maxDelay);

private:
    [[nodiscard]] std::chrono::steady_clock::duration
    nextDelay() const override;
};

/**
 * @brief Create a retry mechanism with exponential backoff strategy
 *
 * @param delay The initial delay value
 * @param maxDelay The maximum delay value
 * @return The retry object
 */
[[nodiscard]] std::unique_ptr<Retry>
makeRetryExponentialBackoff(std::chrono::steady_clock::duration delay, std::chrono::steady_clock::duration maxDelay);

}  // namespace util
