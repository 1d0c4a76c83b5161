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

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <expected>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

namespace etl {

/** @brief Why a timed pop returned without an element */
enum class PopError { Timeout, Closed };

/**
 * @brief Generic thread-safe queue with a max capacity
 *
 * Push blocks while the queue is full and pop blocks while it is empty. Once closed, pushes are rejected and pop drains
 * what is left before reporting the end of the stream.
 *
 * @note We can't use a lockfree queue here, since we need the ability to wait for an element to be added or removed
 * from the queue. These waits are blocking calls.
 */
template <class T>
class ThreadSafeQueue {
    std::queue<T> queue_;

    mutable std::mutex m_;
    std::condition_variable cv_;
    std::size_t maxSize_;
    bool closed_ = false;

public:
    /**
     * @brief Create an instance of the queue
     *
     * @param maxSize maximum size of the queue. Calls that would cause the queue to exceed this size will block until
     * free space is available
     */
    ThreadSafeQueue(std::size_t maxSize) : maxSize_(maxSize)
    {
    }

    /**
     * @brief Push element onto the queue
     *
     * Note: This method will block until free space is available or the queue is closed
     *
     * @param elt element to push onto queue. elt is moved from
     * @return false if the queue was closed and the element dropped
     */
    [[nodiscard]] bool
    push(T&& elt)
    {
        std::unique_lock lck(m_);
        cv_.wait(lck, [this]() { return closed_ or queue_.size() < maxSize_; });
        if (closed_)
            return false;

        queue_.push(std::move(elt));
        cv_.notify_all();
        return true;
    }

    /**
     * @brief Pop element from the queue
     *
     * Note: Will block until queue is non-empty or closed
     *
     * @return element popped from queue; nullopt once the queue is closed and empty
     */
    [[nodiscard]] std::optional<T>
    pop()
    {
        std::unique_lock lck(m_);
        cv_.wait(lck, [this]() { return closed_ or !queue_.empty(); });
        if (queue_.empty())
            return std::nullopt;

        T ret = std::move(queue_.front());
        queue_.pop();
        cv_.notify_all();
        return ret;
    }

    /**
     * @brief Pop element from the queue, waiting at most the given time
     *
     * @param timeout How long to wait for an element
     * @return element popped from queue; PopError::Closed once the queue is closed and empty
     */
    template <typename Rep, typename Period>
    [[nodiscard]] std::expected<T, PopError>
    popFor(std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock lck(m_);
        if (not cv_.wait_for(lck, timeout, [this]() { return closed_ or !queue_.empty(); }))
            return std::unexpected{PopError::Timeout};
        if (queue_.empty())
            return std::unexpected{PopError::Closed};

        T ret = std::move(queue_.front());
        queue_.pop();
        cv_.notify_all();
        return ret;
    }

    /**
     * @brief Close the queue and wake up every waiting thread
     */
    void
    close()
    {
        {
            std::lock_guard const lck(m_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    /** @return number of elements currently in the queue */
    [[nodiscard]] std::size_t
    size() const
    {
        std::lock_guard const lck(m_);
        return queue_.size();
    }
};

/**
 * @brief Counting limiter for the number of transactions between the fetch stage and the accumulator
 *
 * The fetch stage acquires a slot for every transaction it reads; the coordinator releases the slot once the
 * transaction's records have been handed to the accumulator.
 */
class InFlightWindow {
    mutable std::mutex m_;
    std::condition_variable cv_;
    std::size_t capacity_;
    std::size_t used_ = 0;
    std::size_t peak_ = 0;
    bool closed_ = false;

public:
    InFlightWindow(std::size_t capacity) : capacity_(capacity)
    {
    }

    /**
     * @brief Wait for a free slot
     *
     * @return false if the window was closed while waiting
     */
    [[nodiscard]] bool
    acquire()
    {
        std::unique_lock lck(m_);
        cv_.wait(lck, [this]() { return closed_ or used_ < capacity_; });
        if (closed_)
            return false;

        ++used_;
        peak_ = std::max(peak_, used_);
        return true;
    }

    void
    release()
    {
        {
            std::lock_guard const lck(m_);
            if (used_ > 0)
                --used_;
        }
        cv_.notify_all();
    }

    void
    close()
    {
        {
            std::lock_guard const lck(m_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    /** @return The largest number of slots held at the same time */
    [[nodiscard]] std::size_t
    peak() const
    {
        std::lock_guard const lck(m_);
        return peak_;
    }
};

}  // namespace etl
