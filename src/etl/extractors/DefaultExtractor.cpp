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

#include <indexer/v1/transaction.pb.h>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace etl::extractors {

namespace {

using enum ColumnType;

enum TableIndex { kTRANSACTIONS, kWRITE_SET_CHANGES, kCURRENT_TABLE_ITEMS };

std::vector<TableSpec>
makeTables()
{
    return {
        TableSpec{
            .name = "transactions",
            .kind = MutationKind::InsertImmutable,
            .primaryKey = {"version"},
            .columns =
                {{"version", Integer},
                 {"block_height", Integer},
                 {"hash", Text},
                 {"type", Text},
                 {"payload", Text},
                 {"payload_type", Text},
                 {"state_change_hash", Text},
                 {"event_root_hash", Text},
                 {"accumulator_root_hash", Text},
                 {"gas_used", Integer},
                 {"success", Boolean},
                 {"vm_status", Text},
                 {"num_events", Integer},
                 {"num_write_set_changes", Integer},
                 {"epoch", Integer},
                 {"size_in_bytes", Integer},
                 {"block_timestamp", Text}}
        },
        TableSpec{
            .name = "write_set_changes",
            .kind = MutationKind::InsertImmutable,
            .primaryKey = {"transaction_version", "index"},
            .columns =
                {{"transaction_version", Integer},
                 {"index", Integer},
                 {"hash", Text},
                 {"block_height", Integer},
                 {"type", Text},
                 {"address", Text},
                 {"resource_type", Text}}
        },
        TableSpec{
            .name = "current_table_items",
            .kind = MutationKind::UpsertCurrent,
            .primaryKey = {"table_handle", "key_hash"},
            .columns = {{"table_handle", Text}, {"key_hash", Text}, {"key", Text}, {"decoded_value", Text}}
        },
    };
}

FieldValue
optionalText(std::string const& value)
{
    if (value.empty())
        return std::monostate{};
    return value;
}

}  // namespace

DefaultExtractor::DefaultExtractor() : TableExtractor{"default", makeTables()}
{
}

std::expected<std::vector<ExtractedRecord>, std::string>
DefaultExtractor::extract(Transaction const& transaction) const
{
    auto const& txn = *transaction.payload;

    auto const version = toBigInt(txn.version());
    auto const blockHeight = toBigInt(txn.block_height());
    auto const epoch = toBigInt(txn.epoch());
    if (not version or not blockHeight or not epoch)
        return std::unexpected{std::string{"Version, block height or epoch out of range"}};

    std::vector<ExtractedRecord> records;
    records.reserve(1 + static_cast<std::size_t>(txn.changes_size()) * 2);

    std::string payload;
    std::string payloadType;
    if (txn.has_user_request()) {
        payload = txn.user_request().payload();
        payloadType = txn.user_request().payload_type();
    }

    records.push_back(makeRecord(
        table(kTRANSACTIONS),
        transaction.version,
        {{"version", *version},
         {"block_height", *blockHeight},
         {"hash", txn.hash()},
         {"type", transactionTypeName(txn.type())},
         {"payload", optionalText(payload)},
         {"payload_type", optionalText(payloadType)},
         {"state_change_hash", txn.state_change_hash()},
         {"event_root_hash", txn.event_root_hash()},
         {"accumulator_root_hash", txn.accumulator_root_hash()},
         {"gas_used", static_cast<std::int64_t>(txn.gas_used())},
         {"success", txn.success()},
         {"vm_status", txn.vm_status()},
         {"num_events", static_cast<std::int64_t>(txn.events_size())},
         {"num_write_set_changes", static_cast<std::int64_t>(txn.changes_size())},
         {"epoch", *epoch},
         {"size_in_bytes", static_cast<std::int64_t>(txn.size_in_bytes())},
         {"block_timestamp", util::UTCStrFromSystemTp(transaction.timestamp)}}
    ));

    for (std::int64_t index = 0; auto const& change : txn.changes()) {
        records.push_back(makeRecord(
            table(kWRITE_SET_CHANGES),
            transaction.version,
            {{"transaction_version", *version},
             {"index", index},
             {"hash", change.state_key_hash()},
             {"block_height", *blockHeight},
             {"type", changeTypeName(change.type())},
             {"address", standardizeAddress(change.address())},
             {"resource_type", optionalText(change.resource_type())}}
        ));
        ++index;

        using indexer::v1::WriteSetChange;
        if (change.type() == WriteSetChange::TYPE_WRITE_TABLE_ITEM) {
            records.push_back(makeRecord(
                table(kCURRENT_TABLE_ITEMS),
                transaction.version,
                {{"table_handle", standardizeAddress(change.address())},
                 {"key_hash", change.state_key_hash()},
                 {"key", change.key()},
                 {"decoded_value", optionalText(change.data())}}
            ));
        } else if (change.type() == WriteSetChange::TYPE_DELETE_TABLE_ITEM) {
            records.push_back(makeRecord(
                table(kCURRENT_TABLE_ITEMS),
                transaction.version,
                {{"table_handle", standardizeAddress(change.address())},
                 {"key_hash", change.state_key_hash()},
                 {"key", change.key()},
                 {"decoded_value", std::monostate{}}},
                MutationKind::DeleteMarker
            ));
        }
    }

    return records;
}

}  // namespace etl::extractors
