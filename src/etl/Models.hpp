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

#include <indexer/v1/transaction.pb.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace etl {

using Version = std::uint64_t;
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief A transaction observed on the stream
 *
 * The payload is shared read-only between every extractor.
 */
struct Transaction {
    Version version = 0;
    Timestamp timestamp;
    bool success = false;
    std::shared_ptr<indexer::v1::Transaction const> payload;
};

/**
 * @brief Make a Transaction out of the decoded protobuf message
 *
 * @param proto The message received from the stream
 * @return The transaction sharing ownership of the message
 */
[[nodiscard]] inline Transaction
makeTransaction(indexer::v1::Transaction proto)
{
    using namespace std::chrono;

    auto const ts = proto.timestamp();
    auto const timestamp = Timestamp{duration_cast<system_clock::duration>(seconds{ts.seconds()} + nanoseconds{ts.nanos()})};
    auto const version = proto.version();
    auto const success = proto.success();

    return Transaction{
        .version = version,
        .timestamp = timestamp,
        .success = success,
        .payload = std::make_shared<indexer::v1::Transaction const>(std::move(proto))
    };
}

/** @brief NULL, boolean, signed 64-bit integer, double or text */
using FieldValue = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

struct Field {
    std::string name;
    FieldValue value;

    bool
    operator==(Field const&) const = default;
};

enum class MutationKind { InsertImmutable, UpsertCurrent, DeleteMarker };

/**
 * @brief One row produced by an extractor
 *
 * The primary key lists column names; the key values are the values of those columns in fields.
 */
struct ExtractedRecord {
    std::string table;
    std::vector<std::string> primaryKey;
    MutationKind kind = MutationKind::InsertImmutable;
    std::vector<Field> fields;
    Version version = 0;

    /**
     * @brief Get the value of a column
     *
     * @param column The column name
     * @return Pointer to the value or nullptr if the record has no such column
     */
    [[nodiscard]] FieldValue const*
    find(std::string_view column) const
    {
        for (auto const& field : fields) {
            if (field.name == column)
                return &field.value;
        }
        return nullptr;
    }

    /** @return The values of the primary key columns, in key order */
    [[nodiscard]] std::vector<FieldValue>
    keyValues() const
    {
        std::vector<FieldValue> values;
        values.reserve(primaryKey.size());
        for (auto const& column : primaryKey) {
            if (auto const* value = find(column); value != nullptr) {
                values.push_back(*value);
            } else {
                values.emplace_back(std::monostate{});
            }
        }
        return values;
    }

    bool
    operator==(ExtractedRecord const&) const = default;
};

enum class ColumnType { Boolean, Integer, Double, Text };

struct ColumnSpec {
    std::string name;
    ColumnType type = ColumnType::Text;
};

/**
 * @brief Shape of one table an extractor writes
 *
 * Tables of current state take UpsertCurrent and DeleteMarker records and carry the last_transaction_version and
 * is_deleted columns. Tables of immutable rows take InsertImmutable records only.
 */
struct TableSpec {
    std::string name;
    MutationKind kind = MutationKind::InsertImmutable;
    std::vector<std::string> primaryKey;
    std::vector<ColumnSpec> columns;

    /** @return true if the table keeps the latest state per key */
    [[nodiscard]] bool
    isCurrentState() const
    {
        return kind != MutationKind::InsertImmutable;
    }
};

/**
 * @brief Every record one transaction produced, across all extractors
 */
struct ExtractedTransaction {
    Version version = 0;
    Timestamp timestamp;
    std::vector<ExtractedRecord> records;
};

/**
 * @brief Records of a contiguous version range grouped by table
 *
 * The range is inclusive. A batch may hold no records at all.
 */
struct Batch {
    std::map<std::string, std::vector<ExtractedRecord>> tables;
    Version startVersion = 0;
    Version endVersion = 0;
    Timestamp lastTransactionTimestamp;

    /** @return Total number of records in the batch */
    [[nodiscard]] std::size_t
    recordCount() const
    {
        std::size_t count = 0;
        for (auto const& [_, records] : tables)
            count += records.size();
        return count;
    }
};

}  // namespace etl
