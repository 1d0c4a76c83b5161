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

#include "data/Types.hpp"
#include "data/postgres/Pg.hpp"
#include "etl/Models.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace data::postgres {

/** Largest number of bind parameters one statement may carry */
inline constexpr std::size_t kMAX_PARAMS = 65535;

inline constexpr std::string_view kLAST_TRANSACTION_VERSION = "last_transaction_version";
inline constexpr std::string_view kIS_DELETED = "is_deleted";

/**
 * @brief A statement and its bind parameters
 */
struct Statement {
    std::string sql;
    PgParams params;
};

/**
 * @brief Quote an identifier for use in SQL
 *
 * @param name The identifier
 * @return The quoted identifier
 */
[[nodiscard]] std::string
quoteIdentifier(std::string_view name);

/**
 * @brief Convert a field value into the text form of a bind parameter
 *
 * @param value The value
 * @return The text; nullopt for NULL
 */
[[nodiscard]] std::optional<std::string>
toParam(etl::FieldValue const& value);

/**
 * @brief Microseconds since the epoch, the form timestamps are bound in
 */
[[nodiscard]] std::int64_t
toMicros(etl::Timestamp timestamp);

[[nodiscard]] etl::Timestamp
fromMicros(std::int64_t micros);

/**
 * @brief Build the statements writing the records of one table
 *
 * Immutable rows are inserted and conflicts on the primary key are ignored, which makes replaying a batch a no-op.
 * Current state rows are upserted; a row is only replaced by a row of the same or a later version. Rows are split
 * across statements so that no statement binds more than maxParams parameters.
 *
 * @param table The table
 * @param records The records of the table, at most one per primary key for current state tables
 * @param maxParams Parameter limit of one statement
 * @return The statements, in the order they must run
 */
[[nodiscard]] std::vector<Statement>
buildWriteStatements(
    etl::TableSpec const& table,
    std::vector<etl::ExtractedRecord> const& records,
    std::size_t maxParams = kMAX_PARAMS
);

/**
 * @brief Build the statement advancing a checkpoint
 *
 * Writes processor_status for tailing updates and backfill_processor_status when the update names a backfill. The
 * stored version never decreases.
 *
 * @param update The checkpoint
 * @return The statement
 */
[[nodiscard]] Statement
buildCheckpointUpsert(CheckpointUpdate const& update);

/** @return CREATE TABLE IF NOT EXISTS statements of the tables the processor owns */
[[nodiscard]] std::vector<std::string>
bootstrapStatements();

[[nodiscard]] Statement
selectProcessorStatus(std::string const& processor);

[[nodiscard]] Statement
selectBackfillStatus(std::string const& alias);

[[nodiscard]] Statement
deleteBackfillStatus(std::string const& alias);

[[nodiscard]] Statement
selectChainId();

[[nodiscard]] Statement
insertChainId(std::uint64_t chainId);

}  // namespace data::postgres
