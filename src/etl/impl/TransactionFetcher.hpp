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
#include "etl/Models.hpp"
#include "etl/SourceInterface.hpp"
#include "util/Retry.hpp"
#include "util/log/Logger.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace etl::impl {

/**
 * @brief Fetch stage of the pipeline
 *
 * Spawns a thread that pulls transactions from the source and pushes them in strict version order. A stream that
 * breaks or ends early is reopened from the next unconsumed version with exponential backoff. The output queue is
 * closed once the ending version was pushed, the fetcher is stopped or a fatal error occurs.
 */
class TransactionFetcher {
public:
    struct Settings {
        std::size_t maxReconnects = 5;
        std::chrono::steady_clock::duration reconnectDelay = std::chrono::milliseconds{500};
        std::chrono::steady_clock::duration reconnectMaxDelay = std::chrono::seconds{30};
    };

    /** @brief The fatal error that ended the fetch stage */
    struct Failure {
        PipelineErrorCode code;
        std::string message;
    };

private:
    util::Logger log_{"Source"};

    std::reference_wrapper<SourceInterface> source_;
    std::reference_wrapper<ThreadSafeQueue<Transaction>> out_;
    std::reference_wrapper<InFlightWindow> window_;

    Version nextVersion_;
    std::optional<Version> endingVersion_;
    std::size_t maxReconnects_;
    std::unique_ptr<util::Retry> retry_;

    std::atomic_bool stopping_ = false;
    mutable std::mutex mtx_;
    TransactionStreamInterface* currentStream_ = nullptr;
    std::optional<Failure> failure_;

    std::thread thread_;

public:
    /**
     * @brief Create the fetcher and start its thread
     *
     * @param source The transaction source
     * @param out Queue receiving the transactions
     * @param window Limits the number of transactions in flight; one slot is taken per pushed transaction
     * @param startingVersion The first version to fetch
     * @param endingVersion The last version to fetch; unbounded if nullopt
     * @param settings Reconnect policy
     */
    TransactionFetcher(
        SourceInterface& source,
        ThreadSafeQueue<Transaction>& out,
        InFlightWindow& window,
        Version startingVersion,
        std::optional<Version> endingVersion,
        Settings const& settings
    );

    ~TransactionFetcher();

    TransactionFetcher(TransactionFetcher const&) = delete;
    TransactionFetcher&
    operator=(TransactionFetcher const&) = delete;

    /**
     * @brief Stop fetching; a pending read is cancelled and no new stream is opened
     */
    void
    stop();

    /**
     * @brief Block until the fetch thread exits
     */
    void
    waitTillFinished();

    /** @return The fatal error that ended the stage, if any */
    [[nodiscard]] std::optional<Failure>
    failure() const;

private:
    void
    run();

    enum class StreamEnd { Finished, Reconnect, Stopped };

    [[nodiscard]] StreamEnd
    consume(TransactionStreamInterface& stream, bool& madeProgress);

    [[nodiscard]] bool
    waitBeforeReconnect(bool madeProgress, std::string const& reason);

    [[nodiscard]] bool
    isDone() const;

    void
    setFailure(PipelineErrorCode code, std::string message);

    void
    setCurrentStream(TransactionStreamInterface* stream);
};

}  // namespace etl::impl
