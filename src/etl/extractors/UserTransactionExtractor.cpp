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

#include <expected>
#include <string>
#include <vector>

namespace etl::extractors {

namespace {

using enum ColumnType;

}  // namespace

UserTransactionExtractor::UserTransactionExtractor()
    : TableExtractor{
          "user_transactions",
          {TableSpec{
              .name = "user_transactions",
              .kind = MutationKind::InsertImmutable,
              .primaryKey = {"version"},
              .columns =
                  {{"version", Integer},
                   {"block_height", Integer},
                   {"sender", Text},
                   {"sequence_number", Integer},
                   {"max_gas_amount", Integer},
                   {"gas_unit_price", Integer},
                   {"expiration_timestamp_secs", Integer},
                   {"entry_function_id_str", Text},
                   {"payload_type", Text},
                   {"success", Boolean},
                   {"epoch", Integer},
                   {"timestamp", Text}}
          }}
      }
{
}

std::expected<std::vector<ExtractedRecord>, std::string>
UserTransactionExtractor::extract(Transaction const& transaction) const
{
    auto const& txn = *transaction.payload;
    if (txn.type() != indexer::v1::Transaction::TRANSACTION_TYPE_USER)
        return std::vector<ExtractedRecord>{};

    if (not txn.has_user_request())
        return std::unexpected{std::string{"User transaction without a request"}};

    auto const& request = txn.user_request();
    auto const version = toBigInt(txn.version());
    auto const blockHeight = toBigInt(txn.block_height());
    auto const epoch = toBigInt(txn.epoch());
    auto const sequence = toBigInt(request.sequence_number());
    auto const maxGas = toBigInt(request.max_gas_amount());
    auto const gasPrice = toBigInt(request.gas_unit_price());
    auto const expiration = toBigInt(request.expiration_timestamp_secs());
    if (not version or not blockHeight or not epoch or not sequence or not maxGas or not gasPrice or not expiration)
        return std::unexpected{std::string{"Numeric field of the user transaction out of range"}};

    std::vector<ExtractedRecord> records;
    records.push_back(makeRecord(
        table(0),
        transaction.version,
        {{"version", *version},
         {"block_height", *blockHeight},
         {"sender", standardizeAddress(request.sender())},
         {"sequence_number", *sequence},
         {"max_gas_amount", *maxGas},
         {"gas_unit_price", *gasPrice},
         {"expiration_timestamp_secs", *expiration},
         {"entry_function_id_str", request.entry_function_id()},
         {"payload_type", request.payload_type()},
         {"success", txn.success()},
         {"epoch", *epoch},
         {"timestamp", util::UTCStrFromSystemTp(transaction.timestamp)}}
    ));
    return records;
}

}  // namespace etl::extractors
