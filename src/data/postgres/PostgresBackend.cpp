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

#include "data/postgres/PostgresBackend.hpp"

#include "data/Types.hpp"
#include "data/postgres/Pg.hpp"
#include "data/postgres/SqlBuilder.hpp"
#include "etl/Models.hpp"
#include "util/TimeUtils.hpp"
#include "util/log/Logger.hpp"

#include <fmt/core.h>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace data::postgres {

namespace {

std::expected<PgResult, SinkError>
execute(PgQuery& query, Statement const& statement)
{
    auto res = query(statement.sql, statement.params);
    if (not res.has_value())
        return std::unexpected{res.error().toSinkError()};
    return std::move(*res);
}

}  // namespace

PostgresBackend::PostgresBackend(std::shared_ptr<PgPool> pool, std::vector<etl::TableSpec> const& tables)
    : pool_{std::move(pool)}
{
    for (auto const& table : tables)
        tables_.emplace(table.name, table);
}

PostgresBackend::~PostgresBackend()
{
    pool_->stop();
}

std::expected<void, SinkError>
PostgresBackend::bootstrap()
{
    PgQuery query{pool_};
    for (auto const& statement : bootstrapStatements()) {
        if (auto res = query(statement); not res.has_value())
            return std::unexpected{res.error().toSinkError()};
    }

    LOG(log_.info()) << "Status tables are in place";
    return {};
}

std::expected<void, SinkError>
PostgresBackend::commit(etl::Batch const& batch, CheckpointUpdate const& checkpoint)
{
    PgQuery query{pool_};

    auto const rollback = [&](SinkError err) -> std::expected<void, SinkError> {
        if (auto res = query("ROLLBACK"); not res.has_value())
            LOG(log_.warn()) << "Rollback failed: " << res.error().message;
        return std::unexpected{std::move(err)};
    };

    auto const [result, elapsed] = util::timed([&]() -> std::expected<void, SinkError> {
        if (auto res = query("BEGIN"); not res.has_value())
            return std::unexpected{res.error().toSinkError()};

        std::size_t statements = 0;
        for (auto const& [name, records] : batch.tables) {
            auto const it = tables_.find(name);
            if (it == tables_.end())
                return rollback(SinkError{.code = SinkError::Code::Invalid, .message = "Unknown table " + name});

            for (auto const& statement : buildWriteStatements(it->second, records)) {
                if (auto res = execute(query, statement); not res.has_value())
                    return rollback(std::move(res).error());
                ++statements;
            }
        }

        if (auto res = execute(query, buildCheckpointUpsert(checkpoint)); not res.has_value())
            return rollback(std::move(res).error());

        if (auto res = query("COMMIT"); not res.has_value())
            return std::unexpected{res.error().toSinkError()};

        LOG(log_.trace()) << "Ran " << statements << " write statements";
        return {};
    });

    if (result.has_value()) {
        LOG(log_.debug()) << "Wrote " << batch.recordCount() << " records of versions [" << batch.startVersion << ", "
                          << batch.endVersion << "] in " << elapsed << "ms";
        LOG(checkpointLog_.debug()) << "Checkpoint " << checkpoint.name << " = " << checkpoint.version;
    }
    return result;
}

std::expected<void, SinkError>
PostgresBackend::prepareResume(etl::Version, std::optional<etl::Version>)
{
    return {};
}

std::expected<std::optional<ProcessorStatus>, SinkError>
PostgresBackend::fetchProcessorStatus(std::string const& processor)
{
    PgQuery query{pool_};
    auto res = execute(query, selectProcessorStatus(processor));
    if (not res.has_value())
        return std::unexpected{std::move(res).error()};

    if (res->rows() == 0) {
        LOG(checkpointLog_.info()) << "No checkpoint stored for " << processor;
        return std::nullopt;
    }

    ProcessorStatus status{
        .processor = res->text(0, 0),
        .lastSuccessVersion = static_cast<etl::Version>(res->bigint(0, 1)),
        .lastUpdated = fromMicros(res->bigint(0, 2)),
        .lastTransactionTimestamp = std::nullopt
    };
    if (not res->isNull(0, 3))
        status.lastTransactionTimestamp = fromMicros(res->bigint(0, 3));
    return status;
}

std::expected<std::optional<BackfillProcessorStatus>, SinkError>
PostgresBackend::fetchBackfillStatus(std::string const& alias)
{
    PgQuery query{pool_};
    auto res = execute(query, selectBackfillStatus(alias));
    if (not res.has_value())
        return std::unexpected{std::move(res).error()};

    if (res->rows() == 0) {
        LOG(checkpointLog_.info()) << "No checkpoint stored for backfill " << alias;
        return std::nullopt;
    }

    BackfillProcessorStatus status{
        .backfillAlias = res->text(0, 0),
        .status = res->text(0, 1) == toString(BackfillStatus::Complete) ? BackfillStatus::Complete
                                                                         : BackfillStatus::InProgress,
        .lastSuccessVersion = static_cast<etl::Version>(res->bigint(0, 2)),
        .lastUpdated = fromMicros(res->bigint(0, 3)),
        .lastTransactionTimestamp = std::nullopt,
        .backfillStartVersion = static_cast<etl::Version>(res->bigint(0, 5)),
        .backfillEndVersion = std::nullopt
    };
    if (not res->isNull(0, 4))
        status.lastTransactionTimestamp = fromMicros(res->bigint(0, 4));
    if (not res->isNull(0, 6))
        status.backfillEndVersion = static_cast<etl::Version>(res->bigint(0, 6));
    return status;
}

std::expected<void, SinkError>
PostgresBackend::writeCheckpoint(CheckpointUpdate const& update)
{
    PgQuery query{pool_};
    if (auto res = execute(query, buildCheckpointUpsert(update)); not res.has_value())
        return std::unexpected{std::move(res).error()};

    LOG(checkpointLog_.debug()) << "Checkpoint " << update.name << " = " << update.version;
    return {};
}

std::expected<void, SinkError>
PostgresBackend::resetBackfillStatus(std::string const& alias)
{
    PgQuery query{pool_};
    if (auto res = execute(query, deleteBackfillStatus(alias)); not res.has_value())
        return std::unexpected{std::move(res).error()};

    LOG(checkpointLog_.info()) << "Deleted the checkpoint of backfill " << alias;
    return {};
}

std::expected<std::optional<std::uint64_t>, SinkError>
PostgresBackend::fetchChainId()
{
    PgQuery query{pool_};
    auto res = execute(query, selectChainId());
    if (not res.has_value())
        return std::unexpected{std::move(res).error()};

    if (res->rows() == 0)
        return std::nullopt;
    return static_cast<std::uint64_t>(res->bigint(0, 0));
}

std::expected<void, SinkError>
PostgresBackend::writeChainId(std::uint64_t chainId)
{
    PgQuery query{pool_};
    if (auto res = execute(query, insertChainId(chainId)); not res.has_value())
        return std::unexpected{std::move(res).error()};
    return {};
}

}  // namespace data::postgres
