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

#include "data/CheckpointStoreInterface.hpp"
#include "data/SinkInterface.hpp"
#include "data/Types.hpp"
#include "etl/BatchAccumulator.hpp"
#include "etl/ETLHelpers.hpp"
#include "etl/Errors.hpp"
#include "etl/ExtractionEngine.hpp"
#include "etl/Models.hpp"
#include "etl/PipelineSettings.hpp"
#include "etl/ProcessorRunSpec.hpp"
#include "etl/SourceInterface.hpp"
#include "etl/impl/BatchLoader.hpp"
#include "util/log/Logger.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>

namespace etl {

/**
 * @brief Drives one processor run from its checkpoint to the end of its range
 *
 * Three stages run concurrently: the fetch thread, the extraction pool and the thread calling run(), which
 * accumulates the extracted transactions and commits batches. The stages are connected by queues of
 * PipelineSettings::channelSize elements, and at most that many transactions are in flight between the fetch stage and
 * the accumulator.
 *
 * Tailing and backfill runs share this state machine; the ProcessorRunSpec only decides where the run starts, where it
 * ends and which checkpoint it advances.
 */
class PipelineCoordinator {
public:
    enum class State { Initializing, Streaming, Backfilling, Flushing, Draining, Stopped };

private:
    struct Range {
        Version start = 0;
        std::optional<Version> end;
    };

    util::Logger log_{"ETL"};

    PipelineSettings settings_;
    ProcessorRunSpec runSpec_;
    std::string processorName_;

    std::shared_ptr<SourceInterface> source_;
    std::shared_ptr<ExtractionEngine const> engine_;
    std::shared_ptr<data::SinkInterface> sink_;
    std::shared_ptr<data::CheckpointStoreInterface> checkpoints_;

    impl::BatchLoader loader_;
    InFlightWindow window_;

    std::atomic<State> state_ = State::Initializing;
    std::atomic_bool stopRequested_ = false;
    std::atomic_bool failed_ = false;

    std::mutex mtx_;
    std::function<void()> stopStages_;

    std::optional<Version> lastCommitted_;
    std::chrono::steady_clock::time_point lastCommitAt_;

public:
    /**
     * @brief Create the coordinator
     *
     * @param settings Tuning of the stages
     * @param runSpec Mode and bounds of the run
     * @param processorName Checkpoint key of tailing runs
     * @param source The transaction source
     * @param engine The extractors of the processor
     * @param sink Where batches are committed
     * @param checkpoints The checkpoint store the sink advances
     */
    PipelineCoordinator(
        PipelineSettings settings,
        ProcessorRunSpec runSpec,
        std::string processorName,
        std::shared_ptr<SourceInterface> source,
        std::shared_ptr<ExtractionEngine const> engine,
        std::shared_ptr<data::SinkInterface> sink,
        std::shared_ptr<data::CheckpointStoreInterface> checkpoints
    );

    /**
     * @brief Run until the range is done, a fatal error occurs or stop() is called
     *
     * @return The terminal status
     */
    [[nodiscard]] PipelineStatus
    run();

    /**
     * @brief Request a graceful shutdown; safe to call from any thread
     *
     * No new transactions are fetched. What was fetched already is extracted and flushed before run() returns.
     */
    void
    stop();

    /** @return The current state */
    [[nodiscard]] State
    state() const
    {
        return state_;
    }

    /** @return false once the run stopped with a fatal error */
    [[nodiscard]] bool
    isHealthy() const
    {
        return not failed_;
    }

    /** @return The largest number of transactions that were in flight at the same time */
    [[nodiscard]] std::size_t
    inFlightPeak() const
    {
        return window_.peak();
    }

private:
    [[nodiscard]] std::expected<Range, PipelineStatus>
    initialize();

    [[nodiscard]] std::expected<Range, PipelineStatus>
    resolveTailingRange();

    [[nodiscard]] std::expected<Range, PipelineStatus>
    resolveBackfillRange();

    [[nodiscard]] std::optional<PipelineStatus>
    checkChainId(Version version);

    [[nodiscard]] PipelineStatus
    stream(Range const& range);

    [[nodiscard]] std::expected<void, data::SinkError>
    flush(BatchAccumulator& accumulator, Range const& range, State resumeState);

    [[nodiscard]] data::CheckpointUpdate
    makeCheckpointUpdate(Batch const& batch, Range const& range) const;

    [[nodiscard]] bool
    statusUpdateDue(BatchAccumulator const& accumulator, std::chrono::steady_clock::time_point now) const;

    [[nodiscard]] std::chrono::steady_clock::duration
    waitTime(BatchAccumulator const& accumulator, std::chrono::steady_clock::time_point now) const;

    template <typename FnType>
    [[nodiscard]] auto
    withStoreRetries(FnType&& func);

    [[nodiscard]] PipelineStatus
    finish(PipelineStatus status);

    void
    setState(State state);
};

std::ostream&
operator<<(std::ostream& os, PipelineCoordinator::State state);

}  // namespace etl
