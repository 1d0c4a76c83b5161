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

#include "etl/impl/TransactionFetcher.hpp"

#include "etl/ETLHelpers.hpp"
#include "etl/Errors.hpp"
#include "etl/Models.hpp"
#include "etl/SourceInterface.hpp"
#include "util/Assert.hpp"
#include "util/Retry.hpp"
#include "util/log/Logger.hpp"

#include <fmt/core.h>

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace etl::impl {

TransactionFetcher::TransactionFetcher(
    SourceInterface& source,
    ThreadSafeQueue<Transaction>& out,
    InFlightWindow& window,
    Version startingVersion,
    std::optional<Version> endingVersion,
    Settings const& settings
)
    : source_{source}
    , out_{out}
    , window_{window}
    , nextVersion_{startingVersion}
    , endingVersion_{endingVersion}
    , maxReconnects_{settings.maxReconnects}
    , retry_{util::makeRetryExponentialBackoff(settings.reconnectDelay, settings.reconnectMaxDelay)}
{
    thread_ = std::thread([this]() { run(); });
}

TransactionFetcher::~TransactionFetcher()
{
    stop();
    if (thread_.joinable())
        thread_.join();
}

void
TransactionFetcher::stop()
{
    stopping_ = true;
    {
        std::lock_guard const lck{mtx_};
        if (currentStream_ != nullptr)
            currentStream_->cancel();
    }
    retry_->cancel();
    window_.get().close();
}

void
TransactionFetcher::waitTillFinished()
{
    ASSERT(thread_.joinable(), "Fetcher thread must be joinable");
    thread_.join();
}

std::optional<TransactionFetcher::Failure>
TransactionFetcher::failure() const
{
    std::lock_guard const lck{mtx_};
    return failure_;
}

void
TransactionFetcher::run()
{
    LOG(log_.info()) << "Fetching from version " << nextVersion_
                     << (endingVersion_ ? fmt::format(" to {}", *endingVersion_) : std::string{" onwards"});

    while (not stopping_ and not isDone()) {
        auto stream = source_.get().fetch(nextVersion_, endingVersion_);
        if (not stream.has_value()) {
            auto const& error = stream.error();
            if (error.code == SourceError::Code::RangeUnavailable) {
                setFailure(PipelineErrorCode::RangeUnavailable, error.message);
                break;
            }
            if (not error.isTransient()) {
                setFailure(PipelineErrorCode::SourceFailure, error.message);
                break;
            }
            if (not waitBeforeReconnect(false, error.message))
                break;
            continue;
        }

        setCurrentStream(stream->get());
        bool madeProgress = false;
        auto const end = stopping_ ? StreamEnd::Stopped : consume(**stream, madeProgress);
        setCurrentStream(nullptr);

        if (end != StreamEnd::Reconnect)
            break;

        if (not waitBeforeReconnect(madeProgress, "stream ended"))
            break;
    }

    LOG(log_.info()) << "Fetch stage finished; next version would be " << nextVersion_;
    out_.get().close();
}

TransactionFetcher::StreamEnd
TransactionFetcher::consume(TransactionStreamInterface& stream, bool& madeProgress)
{
    while (true) {
        auto chunk = stream.next();
        if (stopping_)
            return StreamEnd::Stopped;

        if (not chunk.has_value()) {
            auto const& error = chunk.error();
            if (error.code == SourceError::Code::RangeUnavailable) {
                setFailure(PipelineErrorCode::RangeUnavailable, error.message);
                return StreamEnd::Stopped;
            }
            if (not error.isTransient()) {
                setFailure(PipelineErrorCode::SourceFailure, error.message);
                return StreamEnd::Stopped;
            }

            LOG(log_.warn()) << "Stream broke at version " << nextVersion_ << ": " << error.message;
            return StreamEnd::Reconnect;
        }

        if (not chunk->has_value()) {
            LOG(log_.info()) << "Stream ended before version " << nextVersion_;
            return StreamEnd::Reconnect;
        }

        for (auto& transaction : (*chunk)->transactions) {
            if (transaction.version != nextVersion_) {
                setFailure(
                    PipelineErrorCode::OrderingViolation,
                    fmt::format("Expected version {} but received {}", nextVersion_, transaction.version)
                );
                return StreamEnd::Stopped;
            }

            if (not window_.get().acquire())
                return StreamEnd::Stopped;

            if (not out_.get().push(std::move(transaction))) {
                window_.get().release();
                return StreamEnd::Stopped;
            }

            ++nextVersion_;
            madeProgress = true;

            if (isDone())
                return StreamEnd::Finished;
        }
    }
}

bool
TransactionFetcher::waitBeforeReconnect(bool madeProgress, std::string const& reason)
{
    if (madeProgress)
        retry_->reset();

    if (retry_->attemptNumber() >= maxReconnects_) {
        setFailure(
            PipelineErrorCode::SourceExhausted,
            fmt::format("Gave up after {} reconnects without progress at version {}: {}", maxReconnects_, nextVersion_, reason)
        );
        return false;
    }

    LOG(log_.warn()) << "Reopening stream at version " << nextVersion_ << " in "
                     << std::chrono::duration_cast<std::chrono::milliseconds>(retry_->delayValue()).count()
                     << "ms; reason: " << reason;
    return retry_->waitForNextAttempt();
}

bool
TransactionFetcher::isDone() const
{
    return endingVersion_.has_value() and nextVersion_ > *endingVersion_;
}

void
TransactionFetcher::setFailure(PipelineErrorCode code, std::string message)
{
    LOG(log_.error()) << "Fetch stage failed with " << code << ": " << message;

    std::lock_guard const lck{mtx_};
    failure_ = Failure{.code = code, .message = std::move(message)};
}

void
TransactionFetcher::setCurrentStream(TransactionStreamInterface* stream)
{
    std::lock_guard const lck{mtx_};
    currentStream_ = stream;
}

}  // namespace etl::impl
