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
#include "data/Types.hpp"
#include "data/postgres/Pg.hpp"
#include "etl/Models.hpp"
#include "util/log/Logger.hpp"

#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace data::postgres {

/**
 * @brief Relational sink and checkpoint store on PostgreSQL
 *
 * A commit runs in one database transaction that writes every table of the batch and then the checkpoint row, so a
 * failed commit leaves neither data nor checkpoint behind.
 */
class PostgresBackend : public SinkInterface, public CheckpointStoreInterface {
    util::Logger log_{"Backend"};
    util::Logger checkpointLog_{"Checkpoint"};

    std::shared_ptr<PgPool> pool_;
    std::map<std::string, etl::TableSpec> tables_;

public:
    /**
     * @brief Create the backend
     *
     * @param pool Connections to the database
     * @param tables The tables batches may contain
     */
    PostgresBackend(std::shared_ptr<PgPool> pool, std::vector<etl::TableSpec> const& tables);

    ~PostgresBackend() override;

    /**
     * @brief Create the status tables if they do not exist
     *
     * @return Nothing on success; the error otherwise
     */
    [[nodiscard]] std::expected<void, SinkError>
    bootstrap();

    [[nodiscard]] std::expected<void, SinkError>
    commit(etl::Batch const& batch, CheckpointUpdate const& checkpoint) override;

    /** @brief Nothing to remove: a failed commit is rolled back as a whole */
    [[nodiscard]] std::expected<void, SinkError>
    prepareResume(etl::Version startVersion, std::optional<etl::Version> endVersion) override;

    [[nodiscard]] std::expected<std::optional<ProcessorStatus>, SinkError>
    fetchProcessorStatus(std::string const& processor) override;

    [[nodiscard]] std::expected<std::optional<BackfillProcessorStatus>, SinkError>
    fetchBackfillStatus(std::string const& alias) override;

    [[nodiscard]] std::expected<void, SinkError>
    writeCheckpoint(CheckpointUpdate const& update) override;

    [[nodiscard]] std::expected<void, SinkError>
    resetBackfillStatus(std::string const& alias) override;

    [[nodiscard]] std::expected<std::optional<std::uint64_t>, SinkError>
    fetchChainId() override;

    [[nodiscard]] std::expected<void, SinkError>
    writeChainId(std::uint64_t chainId) override;
};

}  // namespace data::postgres
