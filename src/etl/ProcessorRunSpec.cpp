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

#include "etl/ProcessorRunSpec.hpp"

#include "etl/Models.hpp"
#include "util/config/ConfigDefinition.hpp"

#include <stdexcept>
#include <string>

namespace etl {

ProcessorRunSpec
makeProcessorRunSpec(util::config::IndexerConfigDefinition const& config)
{
    ProcessorRunSpec spec;
    spec.startingVersion = config.get<Version>("processor_mode.initial_starting_version");
    spec.endingVersion = config.maybeValue<Version>("processor_mode.ending_version");
    spec.overwriteCheckpoint = config.get<bool>("processor_mode.overwrite_checkpoint");

    if (config.get<std::string>("processor_mode.type") == "backfill") {
        spec.mode = ProcessorRunSpec::Mode::Backfill;
        spec.backfillAlias = config.maybeValue<std::string>("processor_mode.backfill_alias").value_or("");
        if (spec.backfillAlias.empty())
            throw std::runtime_error("processor_mode.backfill_alias is required in backfill mode");
    }

    if (spec.endingVersion.has_value() and *spec.endingVersion < spec.startingVersion) {
        throw std::runtime_error(
            "processor_mode.ending_version must not be lower than processor_mode.initial_starting_version"
        );
    }

    return spec;
}

}  // namespace etl
