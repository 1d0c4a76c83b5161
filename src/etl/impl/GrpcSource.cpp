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

#include "etl/impl/GrpcSource.hpp"

#include "etl/Errors.hpp"
#include "etl/Models.hpp"
#include "etl/SourceInterface.hpp"
#include "util/config/ConfigDefinition.hpp"
#include "util/log/Logger.hpp"

#include <fmt/core.h>
#include <grpc/grpc.h>
#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>
#include <grpcpp/support/channel_arguments.h>
#include <grpcpp/support/status.h>
#include <indexer/v1/raw_data.grpc.pb.h>
#include <indexer/v1/raw_data.pb.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace etl::impl {

namespace {

constexpr std::string_view kHTTP_SCHEME = "http://";
constexpr std::string_view kHTTPS_SCHEME = "https://";
constexpr auto kREQUEST_NAME_HEADER = "x-indexer-request-name";
constexpr auto kKEEPALIVE_INTERVAL = std::chrono::seconds{30};

std::shared_ptr<grpc::Channel>
makeChannel(GrpcSourceSettings const& settings)
{
    grpc::ChannelArguments chArgs;
    chArgs.SetMaxReceiveMessageSize(-1);
    chArgs.SetInt(GRPC_ARG_KEEPALIVE_TIME_MS, static_cast<int>(std::chrono::milliseconds{kKEEPALIVE_INTERVAL}.count()));
    chArgs.SetInt(GRPC_ARG_KEEPALIVE_TIMEOUT_MS, static_cast<int>(settings.requestTimeout.count()));
    chArgs.SetInt(GRPC_ARG_KEEPALIVE_PERMIT_WITHOUT_CALLS, 1);

    std::string_view target = settings.address;
    if (target.starts_with(kHTTPS_SCHEME)) {
        target.remove_prefix(kHTTPS_SCHEME.size());
        return grpc::CreateCustomChannel(
            std::string{target}, grpc::SslCredentials(grpc::SslCredentialsOptions{}), chArgs
        );
    }

    if (target.starts_with(kHTTP_SCHEME))
        target.remove_prefix(kHTTP_SCHEME.size());
    return grpc::CreateCustomChannel(std::string{target}, grpc::InsecureChannelCredentials(), chArgs);
}

}  // namespace

GrpcSourceSettings
makeGrpcSourceSettings(util::config::IndexerConfigDefinition const& config)
{
    using util::config::IndexerConfigDefinition;

    return GrpcSourceSettings{
        .address = config.get<std::string>("transaction_stream_config.indexer_grpc_data_service_address"),
        .authToken = config.get<std::string>("transaction_stream_config.auth_token"),
        .requestName = config.get<std::string>("transaction_stream_config.request_name_header"),
        .requestTimeout = IndexerConfigDefinition::toMilliseconds(
            config.get<double>("transaction_stream_config.request_timeout")
        ),
    };
}

std::optional<SourceError>
toSourceError(grpc::Status const& status)
{
    using Code = SourceError::Code;

    auto const makeError = [&](Code code) {
        return SourceError{
            .code = code,
            .message = fmt::format("{} (grpc code {})", status.error_message(), static_cast<int>(status.error_code()))
        };
    };

    switch (status.error_code()) {
        case grpc::StatusCode::OK:
            return std::nullopt;
        case grpc::StatusCode::OUT_OF_RANGE:
        case grpc::StatusCode::NOT_FOUND:
        case grpc::StatusCode::FAILED_PRECONDITION:
            return makeError(Code::RangeUnavailable);
        case grpc::StatusCode::UNAUTHENTICATED:
        case grpc::StatusCode::PERMISSION_DENIED:
        case grpc::StatusCode::INVALID_ARGUMENT:
        case grpc::StatusCode::UNIMPLEMENTED:
            return makeError(Code::Fatal);
        case grpc::StatusCode::DEADLINE_EXCEEDED:
            return makeError(Code::Timeout);
        default:
            return makeError(Code::Transport);
    }
}

ReadWatchdog::ReadWatchdog(std::chrono::milliseconds timeout, std::function<void()> onExpire)
    : timeout_{timeout}, onExpire_{std::move(onExpire)}, thread_{[this]() { watch(); }}
{
}

ReadWatchdog::~ReadWatchdog()
{
    {
        std::lock_guard const lock{mtx_};
        stopping_ = true;
    }
    cv_.notify_all();
    thread_.join();
}

void
ReadWatchdog::arm()
{
    {
        std::lock_guard const lock{mtx_};
        deadline_ = std::chrono::steady_clock::now() + timeout_;
        expired_ = false;
    }
    cv_.notify_all();
}

bool
ReadWatchdog::disarm()
{
    std::lock_guard const lock{mtx_};
    deadline_.reset();
    return expired_;
}

void
ReadWatchdog::watch()
{
    std::unique_lock lock{mtx_};
    while (not stopping_) {
        if (not deadline_.has_value()) {
            cv_.wait(lock, [this]() { return stopping_ or deadline_.has_value(); });
            continue;
        }

        auto const deadline = *deadline_;
        if (cv_.wait_until(lock, deadline, [&]() { return stopping_ or deadline_ != deadline; }))
            continue;

        deadline_.reset();
        expired_ = true;

        lock.unlock();
        onExpire_();
        lock.lock();
    }
}

GrpcStream::GrpcStream(
    std::unique_ptr<grpc::ClientContext> context,
    std::unique_ptr<grpc::ClientReader<indexer::v1::TransactionsResponse>> reader,
    std::chrono::milliseconds requestTimeout
)
    : requestTimeout_{requestTimeout}, context_{std::move(context)}, reader_{std::move(reader)}
{
    if (requestTimeout_.count() > 0)
        watchdog_ = std::make_unique<ReadWatchdog>(requestTimeout_, [this]() { context_->TryCancel(); });
}

GrpcStream::~GrpcStream()
{
    if (finished_)
        return;

    context_->TryCancel();
    if (auto const status = reader_->Finish(); not status.ok() and status.error_code() != grpc::StatusCode::CANCELLED)
        LOG(log_.debug()) << "Stream closed with " << status.error_message();
}

std::expected<std::optional<TransactionsChunk>, SourceError>
GrpcStream::next()
{
    if (finished_)
        return std::nullopt;

    indexer::v1::TransactionsResponse response;

    if (watchdog_)
        watchdog_->arm();
    bool const received = reader_->Read(&response);
    bool const expired = watchdog_ and watchdog_->disarm();

    if (received) {
        TransactionsChunk chunk;
        chunk.transactions.reserve(static_cast<std::size_t>(response.transactions_size()));
        for (auto& txn : *response.mutable_transactions())
            chunk.transactions.push_back(makeTransaction(std::move(txn)));

        if (response.has_chain_id())
            chunk.chainId = response.chain_id();
        return chunk;
    }

    finished_ = true;
    auto const status = reader_->Finish();
    if (expired) {
        LOG(log_.warn()) << "No transactions received for " << requestTimeout_.count() << "ms; cancelled the stream";
        return std::unexpected{SourceError{
            .code = SourceError::Code::Timeout,
            .message = fmt::format("No transactions received for {}ms", requestTimeout_.count())
        }};
    }

    if (auto err = toSourceError(status); err.has_value())
        return std::unexpected{std::move(err).value()};

    return std::nullopt;
}

void
GrpcStream::cancel()
{
    context_->TryCancel();
}

GrpcSource::GrpcSource(GrpcSourceSettings settings)
    : settings_{std::move(settings)}, stub_{indexer::v1::RawData::NewStub(makeChannel(settings_))}
{
    LOG(log_.info()) << "Made stub for " << settings_.address;
}

std::unique_ptr<grpc::ClientContext>
GrpcSource::makeContext() const
{
    auto context = std::make_unique<grpc::ClientContext>();
    if (not settings_.authToken.empty())
        context->AddMetadata("authorization", "Bearer " + settings_.authToken);
    if (not settings_.requestName.empty())
        context->AddMetadata(kREQUEST_NAME_HEADER, settings_.requestName);
    return context;
}

std::expected<std::unique_ptr<TransactionStreamInterface>, SourceError>
GrpcSource::fetch(Version startingVersion, std::optional<Version> endingVersion)
{
    if (endingVersion.has_value() and *endingVersion < startingVersion) {
        return std::unexpected{SourceError{
            .code = SourceError::Code::RangeUnavailable,
            .message = fmt::format("Empty range [{}, {}]", startingVersion, *endingVersion)
        }};
    }

    indexer::v1::GetTransactionsRequest request;
    request.set_starting_version(startingVersion);
    if (endingVersion.has_value())
        request.set_transactions_count(*endingVersion - startingVersion + 1);

    auto context = makeContext();
    auto reader = stub_->GetTransactions(context.get(), request);
    if (not reader) {
        return std::unexpected{
            SourceError{.code = SourceError::Code::Transport, .message = "Could not open the transaction stream"}
        };
    }

    LOG(log_.info()) << "Streaming from version " << startingVersion
                     << (endingVersion ? fmt::format(" to {}", *endingVersion) : std::string{" onwards"});

    return std::make_unique<GrpcStream>(std::move(context), std::move(reader), settings_.requestTimeout);
}

std::expected<std::uint64_t, SourceError>
GrpcSource::fetchChainId(Version version)
{
    auto stream = fetch(version, version);
    if (not stream.has_value())
        return std::unexpected{std::move(stream).error()};

    while (true) {
        auto chunk = (*stream)->next();
        if (not chunk.has_value())
            return std::unexpected{std::move(chunk).error()};

        if (not chunk->has_value()) {
            return std::unexpected{SourceError{
                .code = SourceError::Code::Fatal, .message = "Stream ended before reporting the chain id"
            }};
        }

        if ((*chunk)->chainId.has_value()) {
            (*stream)->cancel();
            return *(*chunk)->chainId;
        }
    }
}

}  // namespace etl::impl
