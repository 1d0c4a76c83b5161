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

#include "etl/ExtractionEngine.hpp"
#include "util/config/ConfigDefinition.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace etl {

/**
 * @brief Tuning of the pipeline stages
 */
struct PipelineSettings {
    std::size_t channelSize = 100;                                   /**< transactions in flight between stages */
    std::size_t maxBufferSize = 100'000'000;                         /**< bytes buffered before a flush */
    std::chrono::milliseconds uploadInterval{30'000};                /**< time buffered before a flush */
    std::size_t extractorThreads = 2;                                /**< workers running the extractors */
    ExtractionFailurePolicy failurePolicy = ExtractionFailurePolicy::Skip;
    std::vector<std::string> tablesToWrite;                          /**< every table if empty */

    std::size_t maxReconnects = 5;                                   /**< stream reopens without progress */
    std::chrono::milliseconds reconnectDelay{500};
    std::chrono::milliseconds reconnectMaxDelay{30'000};

    std::size_t writeRetries = 5;                                    /**< retries after a failed commit */
    std::chrono::milliseconds retryDelay{500};
    std::chrono::milliseconds retryMaxDelay{30'000};

    std::optional<std::chrono::milliseconds> statusUpdateInterval;  /**< longest time without a commit */
};

/**
 * @brief Create the pipeline settings from the configuration
 *
 * @param config The parsed configuration
 * @return The settings
 */
[[nodiscard]] PipelineSettings
makePipelineSettings(util::config::IndexerConfigDefinition const& config);

}  // namespace etl
