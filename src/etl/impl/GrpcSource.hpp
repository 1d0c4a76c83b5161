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

#include "etl/Errors.hpp"
#include "etl/Models.hpp"
#include "etl/SourceInterface.hpp"
#include "util/config/ConfigDefinition.hpp"
#include "util/log/Logger.hpp"

#include <grpcpp/client_context.h>
#include <grpcpp/support/status.h>
#include <grpcpp/support/sync_stream.h>
#include <indexer/v1/raw_data.grpc.pb.h>
#include <indexer/v1/raw_data.pb.h>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace etl::impl {

/**
 * @brief Where and how to reach the transaction stream service
 */
struct GrpcSourceSettings {
    std::string address;
    std::string authToken;
    std::string requestName;
    std::chrono::milliseconds requestTimeout{0};
};

/**
 * @brief Read the stream settings out of transaction_stream_config
 *
 * @param config The validated configuration
 * @return The settings
 */
[[nodiscard]] GrpcSourceSettings
makeGrpcSourceSettings(util::config::IndexerConfigDefinition const& config);

/**
 * @brief Map a finished RPC status to a source error
 *
 * @param status The status of the finished call
 * @return The error; nullopt if the call finished cleanly
 */
[[nodiscard]] std::optional<SourceError>
toSourceError(grpc::Status const& status);

/**
 * @brief Calls a function when a blocking read takes longer than the timeout
 *
 * Every read is bracketed by arm() and disarm(). The function runs on the watchdog thread.
 */
class ReadWatchdog {
    std::chrono::milliseconds timeout_;
    std::function<void()> onExpire_;

    std::mutex mtx_;
    std::condition_variable cv_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
    bool expired_ = false;
    bool stopping_ = false;
    std::thread thread_;

public:
    ReadWatchdog(std::chrono::milliseconds timeout, std::function<void()> onExpire);

    ~ReadWatchdog();

    ReadWatchdog(ReadWatchdog const&) = delete;
    ReadWatchdog&
    operator=(ReadWatchdog const&) = delete;

    /** @brief Start counting the timeout */
    void
    arm();

    /**
     * @brief Stop counting
     *
     * @return true if the timeout elapsed since the last arm()
     */
    [[nodiscard]] bool
    disarm();

private:
    void
    watch();
};

/**
 * @brief An open GetTransactions call
 *
 * A read that receives nothing for the request timeout cancels the call and fails with SourceError::Code::Timeout.
 */
class GrpcStream : public TransactionStreamInterface {
    util::Logger log_{"Source"};

    std::chrono::milliseconds requestTimeout_;
    std::unique_ptr<grpc::ClientContext> context_;
    std::unique_ptr<grpc::ClientReader<indexer::v1::TransactionsResponse>> reader_;
    bool finished_ = false;
    std::unique_ptr<ReadWatchdog> watchdog_;

public:
    /**
     * @brief Wrap an open call
     *
     * @param context The context of the call
     * @param reader The reader of the call
     * @param requestTimeout Longest wait for one message; zero waits forever
     */
    GrpcStream(
        std::unique_ptr<grpc::ClientContext> context,
        std::unique_ptr<grpc::ClientReader<indexer::v1::TransactionsResponse>> reader,
        std::chrono::milliseconds requestTimeout
    );

    ~GrpcStream() override;

    GrpcStream(GrpcStream const&) = delete;
    GrpcStream&
    operator=(GrpcStream const&) = delete;

    [[nodiscard]] std::expected<std::optional<TransactionsChunk>, SourceError>
    next() override;

    void
    cancel() override;
};

/**
 * @brief Source of transactions served over gRPC by the RawData service
 */
class GrpcSource : public SourceInterface {
    util::Logger log_{"Source"};

    GrpcSourceSettings settings_;
    std::unique_ptr<indexer::v1::RawData::Stub> stub_;

public:
    explicit GrpcSource(GrpcSourceSettings settings);

    [[nodiscard]] std::expected<std::unique_ptr<TransactionStreamInterface>, SourceError>
    fetch(Version startingVersion, std::optional<Version> endingVersion) override;

    [[nodiscard]] std::expected<std::uint64_t, SourceError>
    fetchChainId(Version version) override;

private:
    [[nodiscard]] std::unique_ptr<grpc::ClientContext>
    makeContext() const;
};

}  // namespace etl::impl
