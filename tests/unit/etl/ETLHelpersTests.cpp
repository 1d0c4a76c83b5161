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

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>
#include <thread>
#include <vector>

using namespace etl;
using namespace std::chrono_literals;

TEST(ThreadSafeQueueTest, PushPopInOrder)
{
    ThreadSafeQueue<int> queue{3};
    EXPECT_TRUE(queue.push(1));
    EXPECT_TRUE(queue.push(2));
    EXPECT_EQ(queue.size(), 2);

    EXPECT_EQ(queue.pop(), 1);
    EXPECT_EQ(queue.pop(), 2);
    EXPECT_EQ(queue.size(), 0);
}

TEST(ThreadSafeQueueTest, PopForTimesOut)
{
    ThreadSafeQueue<int> queue{1};
    auto const result = queue.popFor(5ms);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), PopError::Timeout);
}

TEST(ThreadSafeQueueTest, CloseDrainsBeforeReportingClosed)
{
    ThreadSafeQueue<int> queue{2};
    EXPECT_TRUE(queue.push(5));
    queue.close();

    EXPECT_FALSE(queue.push(6));

    auto const first = queue.popFor(5ms);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, 5);

    auto const second = queue.popFor(5ms);
    ASSERT_FALSE(second.has_value());
    EXPECT_EQ(second.error(), PopError::Closed);
    EXPECT_EQ(queue.pop(), std::nullopt);
}

TEST(ThreadSafeQueueTest, PushBlocksWhileFull)
{
    ThreadSafeQueue<int> queue{1};
    EXPECT_TRUE(queue.push(1));

    std::atomic_bool pushed = false;
    std::thread producer{[&]() {
        EXPECT_TRUE(queue.push(2));
        pushed = true;
    }};

    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(pushed);

    EXPECT_EQ(queue.pop(), 1);
    producer.join();
    EXPECT_TRUE(pushed);
    EXPECT_EQ(queue.pop(), 2);
}

TEST(ThreadSafeQueueTest, CloseWakesBlockedProducer)
{
    ThreadSafeQueue<int> queue{1};
    EXPECT_TRUE(queue.push(1));

    std::thread producer{[&]() { EXPECT_FALSE(queue.push(2)); }};
    std::this_thread::sleep_for(10ms);
    queue.close();
    producer.join();
}

TEST(ThreadSafeQueueTest, ManyProducersOneConsumer)
{
    constexpr std::size_t kPRODUCERS = 4;
    constexpr int kPER_PRODUCER = 100;

    ThreadSafeQueue<int> queue{8};
    std::vector<std::thread> producers;
    for (std::size_t i = 0; i < kPRODUCERS; ++i) {
        producers.emplace_back([&queue]() {
            for (int j = 0; j < kPER_PRODUCER; ++j)
                EXPECT_TRUE(queue.push(1));
        });
    }

    int sum = 0;
    for (std::size_t i = 0; i < kPRODUCERS * kPER_PRODUCER; ++i)
        sum += queue.pop().value_or(0);

    for (auto& producer : producers)
        producer.join();

    EXPECT_EQ(sum, static_cast<int>(kPRODUCERS) * kPER_PRODUCER);
}

TEST(InFlightWindowTest, AcquireUpToCapacity)
{
    InFlightWindow window{2};
    EXPECT_TRUE(window.acquire());
    EXPECT_TRUE(window.acquire());
    EXPECT_EQ(window.peak(), 2);

    std::atomic_bool acquired = false;
    std::thread waiter{[&]() {
        EXPECT_TRUE(window.acquire());
        acquired = true;
    }};

    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(acquired);

    window.release();
    waiter.join();
    EXPECT_TRUE(acquired);
    EXPECT_EQ(window.peak(), 2);
}

TEST(InFlightWindowTest, CloseWakesWaiter)
{
    InFlightWindow window{1};
    EXPECT_TRUE(window.acquire());

    std::thread waiter{[&]() { EXPECT_FALSE(window.acquire()); }};
    std::this_thread::sleep_for(10ms);
    window.close();
    waiter.join();

    EXPECT_FALSE(window.acquire());
}

TEST(InFlightWindowTest, ReleaseWithoutAcquireIsIgnored)
{
    InFlightWindow window{1};
    window.release();
    EXPECT_TRUE(window.acquire());
    EXPECT_EQ(window.peak(), 1);
}
