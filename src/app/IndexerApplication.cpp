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

#include "app/IndexerApplication.hpp"

#include "data/SinkFactory.hpp"
#include "etl/ExtractionEngine.hpp"
#include "etl/PipelineCoordinator.hpp"
#include "etl/PipelineSettings.hpp"
#include "etl/ProcessorRegistry.hpp"
#include "etl/ProcessorRunSpec.hpp"
#include "etl/impl/GrpcSource.hpp"
#include "util/SignalsHandler.hpp"
#include "util/build/Build.hpp"
#include "util/config/ConfigDefinition.hpp"
#include "util/log/Logger.hpp"
#include "web/HealthCheckServer.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/signals2/connection.hpp>
#include <fmt/core.h>

#include <cstdint>
#include <cstdlib>
#include <expected>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace app {

namespace {

// Runs an io_context on its own thread and always joins it, also when the pipeline throws
class IoThread {
    boost::asio::io_context& ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    std::thread thread_;

public:
    explicit IoThread(boost::asio::io_context& ioc)
        : ioc_(ioc), work_(boost::asio::make_work_guard(ioc)), thread_([this]() { ioc_.run(); })
    {
    }

    IoThread(IoThread const&) = delete;
    IoThread&
    operator=(IoThread const&) = delete;

    ~IoThread()
    {
        work_.reset();
        ioc_.stop();
        if (thread_.joinable())
            thread_.join();
    }
};

}  // namespace

std::expected<void, std::string>
verifyConfig(util::config::IndexerConfigDefinition const& config)
{
    auto const definition = etl::makeProcessorDefinition(config.get<std::string>("processor_config.type"));
    if (not definition.has_value())
        return std::unexpected{definition.error()};

    auto const dbType = config.get<std::string>("db_config.type");
    if (auto const required = etl::requiredDatabaseType(definition->sink); dbType != required) {
        return std::unexpected{
            fmt::format("Processor {} requires db_config.type {}, got {}", definition->type, required, dbType)
        };
    }

    if (definition->sink == etl::SinkKind::Parquet and
        not config.maybeValue<std::string>("db_config.bucket_name").has_value())
        return std::unexpected{std::string{"db_config.bucket_name is required by Parquet processors"}};

    try {
        [[maybe_unused]] auto const runSpec = etl::makeProcessorRunSpec(config);
        [[maybe_unused]] auto const settings = etl::makePipelineSettings(config);
    } catch (std::runtime_error const& e) {
        return std::unexpected{std::string{e.what()}};
    }

    return {};
}

IndexerApplication::IndexerApplication(util::config::IndexerConfigDefinition const& config)
    : config_(config), signalsHandler_{config_}
{
    LOG(log_.info()) << "Indexer version: " << util::build::getIndexerFullVersionString();
}

int
IndexerApplication::run()
{
    auto const type = config_.get<std::string>("processor_config.type");
    auto definition = etl::makeProcessorDefinition(type);
    if (not definition.has_value())
        throw std::runtime_error(definition.error());

    auto const settings = etl::makePipelineSettings(config_);
    auto const runSpec = etl::makeProcessorRunSpec(config_);
    auto [sink, checkpoints] = data::makeSink(config_, *definition);

    auto source = std::make_shared<etl::impl::GrpcSource>(etl::impl::makeGrpcSourceSettings(config_));
    auto engine = std::make_shared<etl::ExtractionEngine const>(
        definition->extractors, settings.tablesToWrite, settings.failurePolicy
    );

    auto coordinator = std::make_shared<etl::PipelineCoordinator>(
        settings, runSpec, type, std::move(source), std::move(engine), std::move(sink), std::move(checkpoints)
    );

    boost::signals2::scoped_connection const stopSubscription = signalsHandler_.subscribeToStop(
        [weak = std::weak_ptr<etl::PipelineCoordinator>{coordinator}]() {
            if (auto const coordinator = weak.lock(); coordinator)
                coordinator->stop();
        }
    );

    // health checks are answered on their own thread so a busy pipeline never delays them
    boost::asio::io_context ioc;
    auto healthCheck = web::makeHealthCheckServer(
        config_.maybeValue<std::uint16_t>("health_check_port"), ioc, [coordinator]() {
            return coordinator->isHealthy();
        }
    );

    auto const status = [&]() {
        IoThread const ioThread{ioc};
        auto result = coordinator->run();
        if (healthCheck)
            healthCheck->stop();
        return result;
    }();

    if (not status.isSuccess()) {
        LOG(log_.fatal()) << "Processor " << type << " failed: " << status.message;
        return EXIT_FAILURE;
    }

    LOG(log_.info()) << "Processor " << type << " finished";
    return EXIT_SUCCESS;
}

}  // namespace app
