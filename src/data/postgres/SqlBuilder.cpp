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

#include "data/postgres/SqlBuilder.hpp"

#include "data/Types.hpp"
#include "etl/Models.hpp"
#include "util/Assert.hpp"
#include "util/OverloadSet.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace data::postgres {

namespace {

constexpr std::string_view kTIMESTAMP_PARAM = "(TIMESTAMP 'epoch' + {}::bigint * INTERVAL '1 microsecond')";
constexpr std::string_view kTIMESTAMP_COLUMN = "(EXTRACT(EPOCH FROM {}) * 1000000)::bigint";

char const*
castOf(etl::ColumnType type)
{
    switch (type) {
        case etl::ColumnType::Boolean:
            return "boolean";
        case etl::ColumnType::Integer:
            return "bigint";
        case etl::ColumnType::Double:
            return "double precision";
        case etl::ColumnType::Text:
            return "text";
    }
    return "text";
}

std::vector<etl::ColumnSpec>
writtenColumns(etl::TableSpec const& table)
{
    auto columns = table.columns;
    if (table.isCurrentState()) {
        columns.push_back({.name = std::string{kLAST_TRANSACTION_VERSION}, .type = etl::ColumnType::Integer});
        columns.push_back({.name = std::string{kIS_DELETED}, .type = etl::ColumnType::Boolean});
    }
    return columns;
}

std::optional<std::string>
columnParam(etl::TableSpec const& table, etl::ExtractedRecord const& record, etl::ColumnSpec const& column)
{
    if (table.isCurrentState()) {
        if (column.name == kLAST_TRANSACTION_VERSION)
            return std::to_string(record.version);
        if (column.name == kIS_DELETED)
            return record.kind == etl::MutationKind::DeleteMarker ? "true" : "false";
    }

    if (auto const* value = record.find(column.name); value != nullptr)
        return toParam(*value);
    return std::nullopt;
}

std::string
joinQuoted(std::vector<std::string> const& names)
{
    std::string out;
    for (auto const& name : names) {
        if (not out.empty())
            out += ", ";
        out += quoteIdentifier(name);
    }
    return out;
}

std::string
makeConflictClause(etl::TableSpec const& table, std::vector<etl::ColumnSpec> const& columns)
{
    auto const key = joinQuoted(table.primaryKey);
    if (not table.isCurrentState())
        return fmt::format(" ON CONFLICT ({}) DO NOTHING", key);

    std::string updates;
    for (auto const& column : columns) {
        if (std::ranges::find(table.primaryKey, column.name) != table.primaryKey.end())
            continue;
        if (not updates.empty())
            updates += ", ";
        updates += fmt::format("{0} = EXCLUDED.{0}", quoteIdentifier(column.name));
    }

    auto const version = quoteIdentifier(kLAST_TRANSACTION_VERSION);
    return fmt::format(
        " ON CONFLICT ({}) DO UPDATE SET {} WHERE t.{} <= EXCLUDED.{}", key, updates, version, version
    );
}

}  // namespace

std::string
quoteIdentifier(std::string_view name)
{
    std::string out = "\"";
    for (auto const ch : name) {
        if (ch == '"')
            out += '"';
        out += ch;
    }
    out += '"';
    return out;
}

std::optional<std::string>
toParam(etl::FieldValue const& value)
{
    return std::visit(
        util::OverloadSet{
            [](std::monostate) -> std::optional<std::string> { return std::nullopt; },
            [](bool v) -> std::optional<std::string> { return v ? "true" : "false"; },
            [](std::int64_t v) -> std::optional<std::string> { return std::to_string(v); },
            [](double v) -> std::optional<std::string> { return fmt::format("{}", v); },
            [](std::string const& v) -> std::optional<std::string> { return v; },
        },
        value
    );
}

std::int64_t
toMicros(etl::Timestamp timestamp)
{
    return std::chrono::duration_cast<std::chrono::microseconds>(timestamp.time_since_epoch()).count();
}

etl::Timestamp
fromMicros(std::int64_t micros)
{
    return etl::Timestamp{std::chrono::duration_cast<etl::Timestamp::duration>(std::chrono::microseconds{micros})};
}

std::vector<Statement>
buildWriteStatements(
    etl::TableSpec const& table,
    std::vector<etl::ExtractedRecord> const& records,
    std::size_t maxParams
)
{
    ASSERT(not table.primaryKey.empty(), "Table {} has no primary key", table.name);

    std::vector<Statement> statements;
    if (records.empty())
        return statements;

    auto const columns = writtenColumns(table);
    auto const rowsPerStatement = std::max<std::size_t>(1, maxParams / columns.size());

    std::vector<std::string> names;
    names.reserve(columns.size());
    for (auto const& column : columns)
        names.push_back(column.name);

    auto const head = fmt::format("INSERT INTO {} AS t ({}) VALUES ", quoteIdentifier(table.name), joinQuoted(names));
    auto const conflict = makeConflictClause(table, columns);

    for (std::size_t first = 0; first < records.size(); first += rowsPerStatement) {
        auto const last = std::min(records.size(), first + rowsPerStatement);

        Statement statement;
        statement.sql = head;
        statement.params.reserve((last - first) * columns.size());

        for (auto i = first; i < last; ++i) {
            if (i != first)
                statement.sql += ", ";
            statement.sql += '(';
            for (std::size_t c = 0; c < columns.size(); ++c) {
                if (c != 0)
                    statement.sql += ", ";
                statement.params.push_back(columnParam(table, records[i], columns[c]));
                statement.sql += fmt::format("${}::{}", statement.params.size(), castOf(columns[c].type));
            }
            statement.sql += ')';
        }

        statement.sql += conflict;
        statements.push_back(std::move(statement));
    }

    return statements;
}

Statement
buildCheckpointUpsert(CheckpointUpdate const& update)
{
    auto const timestamp = fmt::format(fmt::runtime(kTIMESTAMP_PARAM), "$3");

    if (not update.backfill.has_value()) {
        return Statement{
            .sql = fmt::format(
                "INSERT INTO processor_status AS ps "
                "(processor, last_success_version, last_updated, last_transaction_timestamp) "
                "VALUES ($1, $2::bigint, NOW(), {}) "
                "ON CONFLICT (processor) DO UPDATE SET "
                "last_success_version = EXCLUDED.last_success_version, "
                "last_updated = EXCLUDED.last_updated, "
                "last_transaction_timestamp = EXCLUDED.last_transaction_timestamp "
                "WHERE ps.last_success_version <= EXCLUDED.last_success_version",
                timestamp
            ),
            .params = {update.name, std::to_string(update.version), std::to_string(toMicros(update.lastTransactionTimestamp))}
        };
    }

    auto const& backfill = *update.backfill;
    std::optional<std::string> endVersion;
    if (backfill.endVersion.has_value())
        endVersion = std::to_string(*backfill.endVersion);

    return Statement{
        .sql = fmt::format(
            "INSERT INTO backfill_processor_status AS bps "
            "(backfill_alias, backfill_status, last_success_version, last_updated, last_transaction_timestamp, "
            "backfill_start_version, backfill_end_version) "
            "VALUES ($1, $4, $2::bigint, NOW(), {}, $5::bigint, $6::bigint) "
            "ON CONFLICT (backfill_alias) DO UPDATE SET "
            "backfill_status = EXCLUDED.backfill_status, "
            "last_success_version = EXCLUDED.last_success_version, "
            "last_updated = EXCLUDED.last_updated, "
            "last_transaction_timestamp = EXCLUDED.last_transaction_timestamp, "
            "backfill_start_version = EXCLUDED.backfill_start_version, "
            "backfill_end_version = EXCLUDED.backfill_end_version "
            "WHERE bps.last_success_version <= EXCLUDED.last_success_version",
            timestamp
        ),
        .params =
            {update.name,
             std::to_string(update.version),
             std::to_string(toMicros(update.lastTransactionTimestamp)),
             std::string{toString(backfill.status)},
             std::to_string(backfill.startVersion),
             endVersion}
    };
}

std::vector<std::string>
bootstrapStatements()
{
    return {
        "CREATE TABLE IF NOT EXISTS processor_status ("
        "processor VARCHAR(100) PRIMARY KEY NOT NULL, "
        "last_success_version BIGINT NOT NULL, "
        "last_updated TIMESTAMP NOT NULL DEFAULT NOW(), "
        "last_transaction_timestamp TIMESTAMP NULL)",

        "CREATE TABLE IF NOT EXISTS backfill_processor_status ("
        "backfill_alias VARCHAR(100) PRIMARY KEY NOT NULL, "
        "backfill_status VARCHAR(50) NOT NULL, "
        "last_success_version BIGINT NOT NULL, "
        "last_updated TIMESTAMP NOT NULL DEFAULT NOW(), "
        "last_transaction_timestamp TIMESTAMP NULL, "
        "backfill_start_version BIGINT NOT NULL, "
        "backfill_end_version BIGINT NULL)",

        "CREATE TABLE IF NOT EXISTS ledger_infos (chain_id BIGINT PRIMARY KEY NOT NULL)",
    };
}

Statement
selectProcessorStatus(std::string const& processor)
{
    return Statement{
        .sql = fmt::format(
            "SELECT processor, last_success_version, {}, {} FROM processor_status WHERE processor = $1",
            fmt::format(fmt::runtime(kTIMESTAMP_COLUMN), "last_updated"),
            fmt::format(fmt::runtime(kTIMESTAMP_COLUMN), "last_transaction_timestamp")
        ),
        .params = {processor}
    };
}

Statement
selectBackfillStatus(std::string const& alias)
{
    return Statement{
        .sql = fmt::format(
            "SELECT backfill_alias, backfill_status, last_success_version, {}, {}, backfill_start_version, "
            "backfill_end_version FROM backfill_processor_status WHERE backfill_alias = $1",
            fmt::format(fmt::runtime(kTIMESTAMP_COLUMN), "last_updated"),
            fmt::format(fmt::runtime(kTIMESTAMP_COLUMN), "last_transaction_timestamp")
        ),
        .params = {alias}
    };
}

Statement
deleteBackfillStatus(std::string const& alias)
{
    return Statement{.sql = "DELETE FROM backfill_processor_status WHERE backfill_alias = $1", .params = {alias}};
}

Statement
selectChainId()
{
    return Statement{.sql = "SELECT chain_id FROM ledger_infos LIMIT 1", .params = {}};
}

Statement
insertChainId(std::uint64_t chainId)
{
    return Statement{
        .sql = "INSERT INTO ledger_infos (chain_id) VALUES ($1::bigint) ON CONFLICT DO NOTHING",
        .params = {std::to_string(chainId)}
    };
}

}  // namespace data::postgres
