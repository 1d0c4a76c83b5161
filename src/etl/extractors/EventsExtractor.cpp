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

#include "etl/Models.hpp"
#include "etl/extractors/ExtractorUtils.hpp"
#include "etl/extractors/Extractors.hpp"
#include "util/TimeUtils.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace etl::extractors {

namespace {

using enum ColumnType;

// Longer event types are truncated; the full type is still part of the data.
constexpr std::size_t kEVENT_TYPE_MAX_LENGTH = 300;

}  // namespace

EventsExtractor::EventsExtractor()
    : TableExtractor{
          "events",
          {TableSpec{
              .name = "events",
              .kind = MutationKind::InsertImmutable,
              .primaryKey = {"transaction_version", "event_index"},
              .columns =
                  {{"transaction_version", Integer},
                   {"event_index", Integer},
                   {"account_address", Text},
                   {"sequence_number", Integer},
                   {"creation_number", Integer},
                   {"type", Text},
                   {"indexed_type", Text},
                   {"data", Text},
                   {"transaction_block_height", Integer},
                   {"block_timestamp", Text}}
          }}
      }
{
}

std::expected<std::vector<ExtractedRecord>, std::string>
EventsExtractor::extract(Transaction const& transaction) const
{
    auto const& txn = *transaction.payload;

    auto const version = toBigInt(txn.version());
    auto const blockHeight = toBigInt(txn.block_height());
    if (not version or not blockHeight)
        return std::unexpected{std::string{"Version or block height out of range"}};

    auto const timestamp = util::UTCStrFromSystemTp(transaction.timestamp);

    std::vector<ExtractedRecord> records;
    records.reserve(static_cast<std::size_t>(txn.events_size()));

    for (std::int64_t index = 0; auto const& event : txn.events()) {
        auto const sequence = toBigInt(event.sequence_number());
        auto const creation = toBigInt(event.creation_number());
        if (not sequence or not creation)
            return std::unexpected{"Event " + std::to_string(index) + ": sequence or creation number out of range"};

        records.push_back(makeRecord(
            table(0),
            transaction.version,
            {{"transaction_version", *version},
             {"event_index", index},
             {"account_address", standardizeAddress(event.account_address())},
             {"sequence_number", *sequence},
             {"creation_number", *creation},
             {"type", event.type()},
             {"indexed_type", event.type().substr(0, kEVENT_TYPE_MAX_LENGTH)},
             {"data", event.data()},
             {"transaction_block_height", *blockHeight},
             {"block_timestamp", timestamp}}
        ));
        ++index;
    }

    return records;
}

}  // namespace etl::extractors
