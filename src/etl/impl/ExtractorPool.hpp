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

#include "etl/ETLHelpers.hpp"
#include "etl/Errors.hpp"
#include "etl/ExtractionEngine.hpp"
#include "etl/Models.hpp"
#include "util/log/Logger.hpp"

#include <boost/asio/thread_pool.hpp>

#include <cstddef>
#include <expected>
#include <functional>
#include <future>
#include <thread>

namespace etl::impl {

/**
 * @brief Extraction stage of the pipeline
 *
 * A dispatcher thread takes transactions in version order and runs the extraction engine for each of them on a
 * bounded pool of workers. The futures are queued in the order the transactions arrived, so the consumer receives the
 * results in version order no matter which worker finishes first.
 */
class ExtractorPool {
public:
    using ResultType = std::expected<ExtractedTransaction, ExtractionError>;
    using OutputQueueType = ThreadSafeQueue<std::future<ResultType>>;

private:
    util::Logger log_{"Extraction"};

    std::reference_wrapper<ExtractionEngine const> engine_;
    std::reference_wrapper<ThreadSafeQueue<Transaction>> in_;
    std::reference_wrapper<OutputQueueType> out_;

    boost::asio::thread_pool workers_;
    std::thread dispatcher_;

public:
    /**
     * @brief Create the pool and start dispatching
     *
     * @param engine The engine to run for every transaction
     * @param in Transactions in version order; the stage ends once it is closed and drained
     * @param out Futures of the extracted transactions, in the same order; closed when the stage ends
     * @param numThreads Number of worker threads
     */
    ExtractorPool(
        ExtractionEngine const& engine,
        ThreadSafeQueue<Transaction>& in,
        OutputQueueType& out,
        std::size_t numThreads
    );

    /**
     * @brief Joins the dispatcher and waits for running extractions
     */
    ~ExtractorPool();

    ExtractorPool(ExtractorPool const&) = delete;
    ExtractorPool&
    operator=(ExtractorPool const&) = delete;

private:
    void
    dispatch();
};

}  // namespace etl::impl
