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

#include "etl/PipelineCoordinator.hpp"

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
#include "etl/impl/ExtractorPool.hpp"
#include "etl/impl/TransactionFetcher.hpp"
#include "util/Retry.hpp"
#include "util/log/Logger.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace etl {

namespace {

constexpr auto kIDLE_WAIT = std::chrono::seconds{1};

}  // namespace

PipelineCoordinator::PipelineCoordinator(
    PipelineSettings settings,
    ProcessorRunSpec runSpec,
    std::string processorName,
    std::shared_ptr<SourceInterface> source,
    std::shared_ptr<ExtractionEngine const> engine,
    std::shared_ptr<data::SinkInterface> sink,
    std::shared_ptr<data::CheckpointStoreInterface> checkpoints
)
    : settings_{std::move(settings)}
    , runSpec_{std::move(runSpec)}
    , processorName_{std::move(processorName)}
    , source_{std::move(source)}
    , engine_{std::move(engine)}
    , sink_{std::move(sink)}
    , checkpoints_{std::move(checkpoints)}
    , loader_{*sink_, settings_.writeRetries, settings_.retryDelay, settings_.retryMaxDelay}
    , window_{settings_.channelSize}
{
}

PipelineStatus
PipelineCoordinator::run()
{
    LOG(log_.info()) << "Starting " << (runSpec_.isBackfill() ? "backfill " + runSpec_.backfillAlias : "tailing")
                     << " run of processor " << processorName_;

    auto range = initialize();
    if (not range.has_value())
        return finish(std::move(range).error());

    return finish(stream(*range));
}

void
PipelineCoordinator::stop()
{
    LOG(log_.info()) << "Stop requested";
    stopRequested_ = true;

    std::lock_guard const lock{mtx_};
    if (stopStages_)
        stopStages_();
}

template <typename FnType>
auto
PipelineCoordinator::withStoreRetries(FnType&& func)
{
    auto retry = util::makeRetryExponentialBackoff(settings_.retryDelay, settings_.retryMaxDelay);
    return retry->run(
        [&]() {
            auto res = func();
            if (not res.has_value())
                LOG(log_.warn()) << "Store call failed: " << res.error();
            return res;
        },
        settings_.writeRetries
    );
}

std::expected<PipelineCoordinator::Range, PipelineStatus>
PipelineCoordinator::initialize()
{
    setState(State::Initializing);

    auto range = runSpec_.isBackfill() ? resolveBackfillRange() : resolveTailingRange();
    if (not range.has_value())
        return range;

    if (range->end.has_value() and range->start > *range->end) {
        LOG(log_.info()) << "Nothing to do: next version " << range->start << " is past the ending version "
                         << *range->end;
        return std::unexpected{PipelineStatus::success(lastCommitted_)};
    }

    if (stopRequested_)
        return std::unexpected{PipelineStatus::failure(PipelineErrorCode::Cancelled, "Stopped", lastCommitted_)};

    if (auto err = checkChainId(range->start); err.has_value())
        return std::unexpected{std::move(*err)};

    auto prepared = withStoreRetries([&]() { return sink_->prepareResume(range->start, range->end); });
    if (not prepared.has_value()) {
        return std::unexpected{PipelineStatus::failure(
            PipelineErrorCode::SinkExhausted,
            fmt::format("Could not prepare the sink to resume at {}: {}", range->start, prepared.error().message),
            lastCommitted_
        )};
    }

    LOG(log_.info()) << "Processing from version " << range->start << " to "
                     << (range->end.has_value() ? std::to_string(*range->end) : std::string{"the chain head"});
    return range;
}

std::expected<PipelineCoordinator::Range, PipelineStatus>
PipelineCoordinator::resolveTailingRange()
{
    auto status = withStoreRetries([this]() { return checkpoints_->fetchProcessorStatus(processorName_); });
    if (not status.has_value()) {
        return std::unexpected{PipelineStatus::failure(
            PipelineErrorCode::SinkExhausted,
            fmt::format("Could not read the checkpoint of {}: {}", processorName_, status.error().message),
            std::nullopt
        )};
    }

    Range range{.start = runSpec_.startingVersion, .end = runSpec_.endingVersion};
    if (not status->has_value())
        return range;

    lastCommitted_ = (*status)->lastSuccessVersion;
    if (runSpec_.overwriteCheckpoint) {
        LOG(log_.info()) << "Ignoring checkpoint " << *lastCommitted_ << " of " << processorName_
                         << "; starting at configured version " << range.start;
        return range;
    }

    range.start = std::max(*lastCommitted_ + 1, runSpec_.startingVersion);
    LOG(log_.info()) << "Resuming " << processorName_ << " after checkpoint " << *lastCommitted_;
    return range;
}

std::expected<PipelineCoordinator::Range, PipelineStatus>
PipelineCoordinator::resolveBackfillRange()
{
    auto const& alias = runSpec_.backfillAlias;

    auto stored = withStoreRetries([&]() { return checkpoints_->fetchBackfillStatus(alias); });
    if (not stored.has_value()) {
        return std::unexpected{PipelineStatus::failure(
            PipelineErrorCode::SinkExhausted,
            fmt::format("Could not read the checkpoint of backfill {}: {}", alias, stored.error().message),
            std::nullopt
        )};
    }

    Range range{.start = runSpec_.startingVersion, .end = runSpec_.endingVersion};

    if (not range.end.has_value()) {
        auto tailing = withStoreRetries([this]() { return checkpoints_->fetchProcessorStatus(processorName_); });
        if (not tailing.has_value()) {
            return std::unexpected{PipelineStatus::failure(
                PipelineErrorCode::SinkExhausted,
                fmt::format("Could not read the checkpoint of {}: {}", processorName_, tailing.error().message),
                std::nullopt
            )};
        }
        if (not tailing->has_value()) {
            return std::unexpected{PipelineStatus::failure(
                PipelineErrorCode::RangeUnavailable,
                fmt::format("Backfill {} has no ending version and {} has no checkpoint", alias, processorName_),
                std::nullopt
            )};
        }
        range.end = (*tailing)->lastSuccessVersion;
        LOG(log_.info()) << "Backfill " << alias << " ends at the checkpoint of " << processorName_ << ": "
                         << *range.end;
    }

    if (runSpec_.overwriteCheckpoint) {
        if (stored->has_value()) {
            LOG(log_.info()) << "Discarding checkpoint " << (*stored)->lastSuccessVersion << " of backfill " << alias;
            auto reset = withStoreRetries([&]() { return checkpoints_->resetBackfillStatus(alias); });
            if (not reset.has_value()) {
                return std::unexpected{PipelineStatus::failure(
                    PipelineErrorCode::SinkExhausted,
                    fmt::format("Could not reset backfill {}: {}", alias, reset.error().message),
                    std::nullopt
                )};
            }
        }
        return range;
    }

    if (not stored->has_value())
        return range;

    lastCommitted_ = (*stored)->lastSuccessVersion;
    if ((*stored)->status == data::BackfillStatus::Complete) {
        LOG(log_.info()) << "Backfill " << alias << " is already complete at version " << *lastCommitted_;
        return std::unexpected{PipelineStatus::success(lastCommitted_)};
    }

    range.start = std::max(*lastCommitted_ + 1, runSpec_.startingVersion);
    LOG(log_.info()) << "Resuming backfill " << alias << " after checkpoint " << *lastCommitted_;
    return range;
}

std::optional<PipelineStatus>
PipelineCoordinator::checkChainId(Version version)
{
    auto retry = util::makeRetryExponentialBackoff(settings_.reconnectDelay, settings_.reconnectMaxDelay);

    auto chainId = source_->fetchChainId(version);
    while (not chainId.has_value() and chainId.error().isTransient() and not stopRequested_ and
           retry->attemptNumber() < settings_.maxReconnects) {
        LOG(log_.warn()) << "Could not fetch the chain id: " << chainId.error().message;
        if (not retry->waitForNextAttempt())
            break;
        chainId = source_->fetchChainId(version);
    }

    if (not chainId.has_value()) {
        auto const code = [&]() {
            switch (chainId.error().code) {
                case SourceError::Code::RangeUnavailable:
                    return PipelineErrorCode::RangeUnavailable;
                case SourceError::Code::Fatal:
                    return PipelineErrorCode::SourceFailure;
                default:
                    return PipelineErrorCode::SourceExhausted;
            }
        }();
        return PipelineStatus::failure(
            code, fmt::format("Could not fetch the chain id: {}", chainId.error().message), lastCommitted_
        );
    }

    auto stored = withStoreRetries([this]() { return checkpoints_->fetchChainId(); });
    if (not stored.has_value()) {
        return PipelineStatus::failure(
            PipelineErrorCode::SinkExhausted,
            fmt::format("Could not read the stored chain id: {}", stored.error().message),
            lastCommitted_
        );
    }

    if (not stored->has_value()) {
        LOG(log_.info()) << "Recording chain id " << *chainId;
        auto written = withStoreRetries([&]() { return checkpoints_->writeChainId(*chainId); });
        if (not written.has_value()) {
            return PipelineStatus::failure(
                PipelineErrorCode::SinkExhausted,
                fmt::format("Could not record the chain id: {}", written.error().message),
                lastCommitted_
            );
        }
        return std::nullopt;
    }

    if (**stored != *chainId) {
        return PipelineStatus::failure(
            PipelineErrorCode::ChainIdMismatch,
            fmt::format("The store was filled from chain {} but the source serves chain {}", **stored, *chainId),
            lastCommitted_
        );
    }

    return std::nullopt;
}

PipelineStatus
PipelineCoordinator::stream(Range const& range)
{
    auto const streamingState = runSpec_.isBackfill() ? State::Backfilling : State::Streaming;

    ThreadSafeQueue<Transaction> fetched{settings_.channelSize};
    impl::ExtractorPool::OutputQueueType extracted{settings_.channelSize};
    BatchAccumulator accumulator{settings_.maxBufferSize, settings_.uploadInterval};

    impl::TransactionFetcher fetcher{
        *source_,
        fetched,
        window_,
        range.start,
        range.end,
        impl::TransactionFetcher::Settings{
            .maxReconnects = settings_.maxReconnects,
            .reconnectDelay = settings_.reconnectDelay,
            .reconnectMaxDelay = settings_.reconnectMaxDelay
        }
    };
    impl::ExtractorPool pool{*engine_, fetched, extracted, settings_.extractorThreads};

    {
        std::lock_guard const lock{mtx_};
        stopStages_ = [&fetcher]() { fetcher.stop(); };
    }
    if (stopRequested_)
        fetcher.stop();

    setState(streamingState);
    lastCommitAt_ = std::chrono::steady_clock::now();

    std::optional<PipelineStatus> fatal;
    std::optional<data::SinkError> sinkError;

    while (true) {
        auto item = extracted.popFor(waitTime(accumulator, std::chrono::steady_clock::now()));
        if (item.has_value()) {
            auto result = [&]() -> impl::ExtractorPool::ResultType {
                try {
                    return item->get();
                } catch (std::exception const& e) {
                    return std::unexpected{ExtractionError{.version = 0, .extractor = {}, .message = e.what()}};
                }
            }();
            window_.release();

            if (not result.has_value()) {
                auto const& err = result.error();
                fatal = PipelineStatus::failure(
                    PipelineErrorCode::ExtractionError,
                    fmt::format("Extractor {} failed on version {}: {}", err.extractor, err.version, err.message),
                    lastCommitted_
                );
                break;
            }

            accumulator.add(std::move(*result));
        } else if (item.error() == PopError::Closed) {
            break;
        }

        auto const now = std::chrono::steady_clock::now();
        if (not accumulator.empty() and (accumulator.shouldFlush(now) or statusUpdateDue(accumulator, now))) {
            if (auto res = flush(accumulator, range, streamingState); not res.has_value()) {
                sinkError = std::move(res).error();
                break;
            }
        }
    }

    {
        std::lock_guard const lock{mtx_};
        stopStages_ = nullptr;
    }

    fetcher.stop();
    extracted.close();
    fetched.close();
    fetcher.waitTillFinished();

    if (not sinkError.has_value() and not accumulator.empty()) {
        setState(State::Draining);
        LOG(log_.info()) << "Draining " << accumulator.bufferedSize() << " buffered bytes";
        if (auto res = flush(accumulator, range, State::Draining); not res.has_value())
            sinkError = std::move(res).error();
    }

    if (sinkError.has_value()) {
        return PipelineStatus::failure(
            PipelineErrorCode::SinkExhausted,
            fmt::format("Commit failed; the checkpoint was not advanced: {}", sinkError->message),
            lastCommitted_
        );
    }

    if (fatal.has_value()) {
        fatal->lastCommittedVersion = lastCommitted_;
        return std::move(*fatal);
    }

    if (auto failure = fetcher.failure(); failure.has_value())
        return PipelineStatus::failure(failure->code, failure->message, lastCommitted_);

    bool const rangeDone = range.end.has_value() and lastCommitted_.has_value() and *lastCommitted_ >= *range.end;
    if (stopRequested_ and not rangeDone)
        return PipelineStatus::failure(PipelineErrorCode::Cancelled, "Stopped", lastCommitted_);

    return PipelineStatus::success(lastCommitted_);
}

std::expected<void, data::SinkError>
PipelineCoordinator::flush(BatchAccumulator& accumulator, Range const& range, State resumeState)
{
    setState(State::Flushing);

    auto const batch = accumulator.flush();
    auto const update = makeCheckpointUpdate(batch, range);

    if (auto res = loader_.load(batch, update); not res.has_value())
        return res;

    lastCommitted_ = batch.endVersion;
    lastCommitAt_ = std::chrono::steady_clock::now();
    setState(resumeState);
    return {};
}

data::CheckpointUpdate
PipelineCoordinator::makeCheckpointUpdate(Batch const& batch, Range const& range) const
{
    data::CheckpointUpdate update{
        .name = processorName_,
        .version = batch.endVersion,
        .lastTransactionTimestamp = batch.lastTransactionTimestamp,
        .backfill = std::nullopt
    };

    if (runSpec_.isBackfill()) {
        bool const complete = range.end.has_value() and batch.endVersion >= *range.end;
        update.name = runSpec_.backfillAlias;
        update.backfill = data::CheckpointUpdate::Backfill{
            .status = complete ? data::BackfillStatus::Complete : data::BackfillStatus::InProgress,
            .startVersion = runSpec_.startingVersion,
            .endVersion = range.end
        };
    }

    return update;
}

bool
PipelineCoordinator::statusUpdateDue(BatchAccumulator const& accumulator, std::chrono::steady_clock::time_point now)
    const
{
    if (not settings_.statusUpdateInterval.has_value() or accumulator.empty())
        return false;

    return now - lastCommitAt_ >= *settings_.statusUpdateInterval;
}

std::chrono::steady_clock::duration
PipelineCoordinator::waitTime(BatchAccumulator const& accumulator, std::chrono::steady_clock::time_point now) const
{
    if (accumulator.empty())
        return kIDLE_WAIT;

    std::chrono::steady_clock::duration wait = kIDLE_WAIT;
    if (auto const deadline = accumulator.deadline(); deadline.has_value())
        wait = std::min(wait, *deadline - now);

    if (settings_.statusUpdateInterval.has_value())
        wait = std::min(wait, lastCommitAt_ + *settings_.statusUpdateInterval - now);

    return std::max(wait, std::chrono::steady_clock::duration::zero());
}

PipelineStatus
PipelineCoordinator::finish(PipelineStatus status)
{
    failed_ = not status.isSuccess();
    setState(State::Stopped);

    if (status.isSuccess()) {
        LOG(log_.info()) << "Run finished" << (status.error.has_value() ? " after a stop request" : "")
                         << "; last committed version "
                         << (status.lastCommittedVersion.has_value() ? std::to_string(*status.lastCommittedVersion)
                                                                     : std::string{"none"});
    } else {
        LOG(log_.error()) << "Run failed with " << *status.error << ": " << status.message;
    }

    return status;
}

void
PipelineCoordinator::setState(State state)
{
    if (state_.exchange(state) != state)
        LOG(log_.debug()) << "State: " << state;
}

std::ostream&
operator<<(std::ostream& os, PipelineCoordinator::State state)
{
    switch (state) {
        case PipelineCoordinator::State::Initializing:
            return os << "Initializing";
        case PipelineCoordinator::State::Streaming:
            return os << "Streaming";
        case PipelineCoordinator::State::Backfilling:
            return os << "Backfilling";
        case PipelineCoordinator::State::Flushing:
            return os << "Flushing";
        case PipelineCoordinator::State::Draining:
            return os << "Draining";
        case PipelineCoordinator::State::Stopped:
            return os << "Stopped";
    }
    return os;
}

}  // namespace etl
