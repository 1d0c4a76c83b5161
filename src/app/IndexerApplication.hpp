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

#include "util/SignalsHandler.hpp"
#include "util/config/ConfigDefinition.hpp"
#include "util/log/Logger.hpp"

#include <expected>
#include <string>

namespace app {

/**
 * @brief Check that a validated config describes a processor that can be set up
 *
 * Covers what the config definition alone can't: the processor type, the run range and the backfill alias.
 * Nothing is connected to.
 *
 * @param config The parsed configuration
 * @return Nothing if the processor can be set up; the reason otherwise
 */
[[nodiscard]] std::expected<void, std::string>
verifyConfig(util::config::IndexerConfigDefinition const& config);

/**
 * @brief The main application class
 */
class IndexerApplication {
    util::config::IndexerConfigDefinition const& config_;
    util::SignalsHandler signalsHandler_;
    util::Logger log_{"App"};

public:
    /**
     * @brief Construct a new IndexerApplication object
     *
     * @param config The configuration of the application
     */
    IndexerApplication(util::config::IndexerConfigDefinition const& config);

    /**
     * @brief Run the configured processor until its range is done or a stop signal arrives
     *
     * @return exit code
     * @throws std::runtime_error if the processor can't be set up
     */
    int
    run();
};

}  // namespace app
