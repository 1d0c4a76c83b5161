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

#include "etl/PipelineSettings.hpp"

#include "etl/ExtractionEngine.hpp"
#include "util/config/ConfigDefinition.hpp"

#include <cstddef>
#include <string>

namespace etl {

PipelineSettings
makePipelineSettings(util::config::IndexerConfigDefinition const& config)
{
    using util::config::IndexerConfigDefinition;

    PipelineSettings settings;
    settings.channelSize = config.get<std::size_t>("processor_config.channel_size");
    settings.maxBufferSize = config.get<std::size_t>("processor_config.max_buffer_size");
    settings.uploadInterval =
        IndexerConfigDefinition::toMilliseconds(config.get<double>("processor_config.upload_interval"));
    settings.extractorThreads = config.get<std::size_t>("processor_config.extractor_threads");
    settings.tablesToWrite = config.getStringArray("processor_config.tables_to_write");

    // already validated to be one of skip or fatal
    if (config.get<std::string>("processor_config.extraction_failure_policy") == "fatal")
        settings.failurePolicy = ExtractionFailurePolicy::Fatal;

    settings.maxReconnects = config.get<std::size_t>("transaction_stream_config.max_reconnects");
    settings.reconnectDelay =
        IndexerConfigDefinition::toMilliseconds(config.get<double>("transaction_stream_config.reconnect_delay"));
    settings.reconnectMaxDelay =
        IndexerConfigDefinition::toMilliseconds(config.get<double>("transaction_stream_config.reconnect_max_delay"));

    settings.writeRetries = config.get<std::size_t>("db_config.write_retries");
    settings.retryDelay = IndexerConfigDefinition::toMilliseconds(config.get<double>("db_config.retry_delay"));
    settings.retryMaxDelay = IndexerConfigDefinition::toMilliseconds(config.get<double>("db_config.retry_max_delay"));

    if (auto const interval = config.maybeValue<double>("db_config.update_processor_status_interval"); interval)
        settings.statusUpdateInterval = IndexerConfigDefinition::toMilliseconds(*interval);

    return settings;
}

}  // namespace etl
