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
#include "util/log/Logger.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace etl {

/**
 * @brief Buffers extracted transactions until a size or time threshold is reached
 *
 * Whole transactions are added in version order, so a batch never holds part of a transaction. Owned by the pipeline
 * coordinator and only used from its thread.
 */
class BatchAccumulator {
public:
    using ClockType = std::chrono::steady_clock;

private:
    struct TableBuffer {
        std::vector<ExtractedRecord> records;
        std::map<std::vector<FieldValue>, std::size_t> indexByKey;
    };

    util::Logger log_{"ETL"};

    std::size_t maxBufferSize_;
    ClockType::duration uploadInterval_;

    std::map<std::string, TableBuffer> tables_;
    std::optional<Version> startVersion_;
    Version endVersion_ = 0;
    Timestamp lastTransactionTimestamp_;
    std::size_t bufferedSize_ = 0;
    std::optional<ClockType::time_point> firstAddedAt_;

public:
    /**
     * @brief Create an empty accumulator
     *
     * @param maxBufferSize Serialized size of buffered records that triggers a flush
     * @param uploadInterval Time since the first buffered transaction that triggers a flush
     */
    BatchAccumulator(std::size_t maxBufferSize, ClockType::duration uploadInterval);

    /**
     * @brief Buffer every record of one transaction
     * @note The transaction must directly follow the previously added one
     *
     * @param transaction The extracted transaction
     * @param now The current time; starts the upload interval if nothing is buffered
     */
    void
    add(ExtractedTransaction transaction, ClockType::time_point now = ClockType::now());

    /**
     * @brief Check the size and time thresholds
     *
     * @param now The current time
     * @return true if the buffered transactions should be flushed
     */
    [[nodiscard]] bool
    shouldFlush(ClockType::time_point now = ClockType::now()) const;

    /** @return The time the upload interval elapses; nullopt if nothing is buffered */
    [[nodiscard]] std::optional<ClockType::time_point>
    deadline() const;

    /** @return true if no transaction is buffered */
    [[nodiscard]] bool
    empty() const
    {
        return not startVersion_.has_value();
    }

    /** @return Serialized size of the buffered records */
    [[nodiscard]] std::size_t
    bufferedSize() const
    {
        return bufferedSize_;
    }

    /**
     * @brief Hand every buffered record over as one batch and reset the buffers
     * @note Must not be called on an empty accumulator
     *
     * @return The batch covering every transaction added since the previous flush
     */
    [[nodiscard]] Batch
    flush();

    /**
     * @brief Serialized size of one record
     *
     * Counts the table name, the column names and the values: text by length, numbers as 8 bytes, booleans and NULL
     * as 1 byte.
     *
     * @param record The record
     * @return The size in bytes
     */
    [[nodiscard]] static std::size_t
    serializedSize(ExtractedRecord const& record);

private:
    void
    addRecord(ExtractedRecord record);
};

}  // namespace etl
