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

#include "data/CheckpointStoreInterface.hpp"
#include "data/SinkInterface.hpp"
#include "data/parquet/ParquetSink.hpp"
#include "data/postgres/Pg.hpp"
#include "data/postgres/PostgresBackend.hpp"
#include "etl/Models.hpp"
#include "etl/ProcessorRegistry.hpp"
#include "util/config/ConfigDefinition.hpp"
#include "util/log/Logger.hpp"

#include <fmt/core.h>

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace data {

/**
 * @brief The sink a processor writes to and the store its checkpoints live in
 */
struct SinkBundle {
    std::shared_ptr<SinkInterface> sink;
    std::shared_ptr<CheckpointStoreInterface> checkpoints;
};

/**
 * @brief A factory function that creates the sink based on a config.
 *
 * The checkpoint store is always PostgreSQL; for the Parquet sink it only holds the status tables.
 *
 * @param config The validated config
 * @param definition The processor to create the sink for
 * @return The sink and the checkpoint store
 * @throws std::runtime_error if db_config does not fit the processor or the database is unreachable
 */
inline SinkBundle
makeSink(util::config::IndexerConfigDefinition const& config, etl::ProcessorDefinition const& definition)
{
    using util::config::IndexerConfigDefinition;

    static util::Logger const log{"Sink"};
    LOG(log.info()) << "Constructing sink for " << definition.type;

    auto const type = config.get<std::string>("db_config.type");
    if (auto const required = etl::requiredDatabaseType(definition.sink); type != required) {
        throw std::runtime_error(
            fmt::format("Processor {} requires db_config.type {}, got {}", definition.type, required, type)
        );
    }

    std::vector<etl::TableSpec> tables;
    for (auto const& extractor : definition.extractors)
        tables.insert(tables.end(), extractor->tables().begin(), extractor->tables().end());

    auto pool = std::make_shared<postgres::PgPool>(
        config.get<std::string>("db_config.connection_string"),
        config.get<std::size_t>("db_config.db_pool_size"),
        IndexerConfigDefinition::toMilliseconds(config.get<double>("db_config.statement_timeout"))
    );

    auto backend = std::make_shared<postgres::PostgresBackend>(std::move(pool), tables);
    if (auto const res = backend->bootstrap(); not res.has_value())
        throw std::runtime_error("Could not prepare the status tables: " + res.error().message);

    if (definition.sink == etl::SinkKind::Postgres) {
        LOG(log.info()) << "Constructed PostgreSQL sink successfully";
        return SinkBundle{.sink = backend, .checkpoints = backend};
    }

    auto const bucketName = config.maybeValue<std::string>("db_config.bucket_name");
    if (not bucketName.has_value())
        throw std::runtime_error("db_config.bucket_name is required by Parquet processors");

    auto location =
        parquet::resolveLocation(*bucketName, config.maybeValue<std::string>("db_config.bucket_root").value_or(""));
    if (not location.has_value())
        throw std::runtime_error(location.error().message);

    auto sink = std::make_shared<parquet::ParquetSink>(std::move(location).value(), tables, backend);

    LOG(log.info()) << "Constructed Parquet sink successfully";
    return SinkBundle{.sink = std::move(sink), .checkpoints = backend};
}

}  // namespace data
