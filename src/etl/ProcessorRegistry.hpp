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

#include "etl/ExtractorInterface.hpp"

#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace etl {

enum class SinkKind { Postgres, Parquet };

/**
 * @brief What a processor type runs: its extractors and the kind of sink they write to
 */
struct ProcessorDefinition {
    std::string type;
    SinkKind sink = SinkKind::Postgres;
    std::vector<std::shared_ptr<ExtractorInterface const>> extractors;
};

/**
 * @brief Look up a processor type
 *
 * Every type exists twice: plain for PostgreSQL and with the parquet_ prefix for Parquet files.
 *
 * @param type The processor type, e.g. events_processor or parquet_events_processor
 * @return The definition; an error message for an unknown type
 */
[[nodiscard]] std::expected<ProcessorDefinition, std::string>
makeProcessorDefinition(std::string const& type);

/** @return The db_config.type a sink kind requires */
[[nodiscard]] char const*
requiredDatabaseType(SinkKind kind);

}  // namespace etl
