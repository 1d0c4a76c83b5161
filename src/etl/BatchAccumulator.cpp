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

#include "etl/BatchAccumulator.hpp"

#include "etl/Models.hpp"
#include "util/Assert.hpp"
#include "util/OverloadSet.hpp"
#include "util/log/Logger.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace etl {

BatchAccumulator::BatchAccumulator(std::size_t maxBufferSize, ClockType::duration uploadInterval)
    : maxBufferSize_{maxBufferSize}, uploadInterval_{uploadInterval}
{
}

void
BatchAccumulator::add(ExtractedTransaction transaction, ClockType::time_point now)
{
    if (startVersion_.has_value()) {
        ASSERT(
            transaction.version == endVersion_ + 1,
            "Transactions must be added in order; expected {} got {}",
            endVersion_ + 1,
            transaction.version
        );
    } else {
        startVersion_ = transaction.version;
        firstAddedAt_ = now;
    }

    endVersion_ = transaction.version;
    lastTransactionTimestamp_ = transaction.timestamp;

    for (auto& record : transaction.records)
        addRecord(std::move(record));
}

void
BatchAccumulator::addRecord(ExtractedRecord record)
{
    bufferedSize_ += serializedSize(record);

    auto& buffer = tables_[record.table];
    auto key = record.keyValues();

    if (auto const it = buffer.indexByKey.find(key); it != buffer.indexByKey.end()) {
        // immutable rows are written once per key; current state keeps the latest write
        if (record.kind != MutationKind::InsertImmutable)
            buffer.records[it->second] = std::move(record);
        return;
    }

    buffer.indexByKey.emplace(std::move(key), buffer.records.size());
    buffer.records.push_back(std::move(record));
}

bool
BatchAccumulator::shouldFlush(ClockType::time_point now) const
{
    if (empty())
        return false;

    if (bufferedSize_ >= maxBufferSize_)
        return true;

    return now >= *deadline();
}

std::optional<BatchAccumulator::ClockType::time_point>
BatchAccumulator::deadline() const
{
    if (not firstAddedAt_.has_value())
        return std::nullopt;

    return *firstAddedAt_ + uploadInterval_;
}

Batch
BatchAccumulator::flush()
{
    ASSERT(not empty(), "Flushing an empty accumulator");

    Batch batch;
    batch.startVersion = *startVersion_;
    batch.endVersion = endVersion_;
    batch.lastTransactionTimestamp = lastTransactionTimestamp_;

    for (auto& [table, buffer] : tables_) {
        if (not buffer.records.empty())
            batch.tables.emplace(table, std::move(buffer.records));
    }

    LOG(log_.debug()) << "Flushing versions [" << batch.startVersion << ", " << batch.endVersion << "] with "
                      << batch.recordCount() << " records, " << bufferedSize_ << " bytes";

    tables_.clear();
    startVersion_.reset();
    firstAddedAt_.reset();
    bufferedSize_ = 0;

    return batch;
}

std::size_t
BatchAccumulator::serializedSize(ExtractedRecord const& record)
{
    static constexpr std::size_t kNUMBER_SIZE = sizeof(std::int64_t);

    std::size_t size = record.table.size();
    for (auto const& field : record.fields) {
        size += field.name.size();
        size += std::visit(
            util::OverloadSet{
                [](std::monostate) -> std::size_t { return 1; },
                [](bool) -> std::size_t { return 1; },
                [](std::int64_t) -> std::size_t { return kNUMBER_SIZE; },
                [](double) -> std::size_t { return kNUMBER_SIZE; },
                [](std::string const& text) -> std::size_t { return text.size(); },
            },
            field.value
        );
    }
    return size;
}

}  // namespace etl
