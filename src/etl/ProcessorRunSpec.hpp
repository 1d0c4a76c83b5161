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

#include "etl/Models.hpp"
#include "util/config/ConfigDefinition.hpp"

#include <optional>
#include <string>

namespace etl {

/**
 * @brief How one run of a processor is bounded and where its checkpoint lives
 */
struct ProcessorRunSpec {
    enum class Mode { Tailing, Backfill };

    Mode mode = Mode::Tailing;
    Version startingVersion = 0;
    std::optional<Version> endingVersion;
    bool overwriteCheckpoint = false;
    std::string backfillAlias;  ///< checkpoint key of a backfill run; empty when tailing

    /** @return true for a bounded backfill run */
    [[nodiscard]] bool
    isBackfill() const
    {
        return mode == Mode::Backfill;
    }
};

/**
 * @brief Read the run spec from the processor_mode section of the configuration
 * @throws std::runtime_error if a backfill has no alias
 *
 * @param config The parsed configuration
 * @return The run spec
 */
[[nodiscard]] ProcessorRunSpec
makeProcessorRunSpec(util::config::IndexerConfigDefinition const& config);

}  // namespace etl
