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

#include <indexer/v1/transaction.pb.h>

#include <expected>
#include <set>
#include <string>
#include <vector>

namespace etl::extractors {

AccountTransactionsExtractor::AccountTransactionsExtractor()
    : TableExtractor{
          "account_transactions",
          {TableSpec{
              .name = "account_transactions",
              .kind = MutationKind::InsertImmutable,
              .primaryKey = {"account_address", "transaction_version"},
              .columns = {{"transaction_version", ColumnType::Integer}, {"account_address", ColumnType::Text}}
          }}
      }
{
}

std::expected<std::vector<ExtractedRecord>, std::string>
AccountTransactionsExtractor::extract(Transaction const& transaction) const
{
    auto const& txn = *transaction.payload;
    auto const version = toBigInt(txn.version());
    if (not version)
        return std::unexpected{version.error()};

    // sorted so that the rows of a transaction come out in a stable order
    std::set<std::string> accounts;
    if (txn.has_user_request() and not txn.user_request().sender().empty())
        accounts.insert(standardizeAddress(txn.user_request().sender()));

    for (auto const& event : txn.events()) {
        if (not event.account_address().empty())
            accounts.insert(standardizeAddress(event.account_address()));
    }

    for (auto const& change : txn.changes()) {
        if (change.type() == indexer::v1::WriteSetChange::TYPE_WRITE_RESOURCE or
            change.type() == indexer::v1::WriteSetChange::TYPE_DELETE_RESOURCE) {
            accounts.insert(standardizeAddress(change.address()));
        }
    }

    std::vector<ExtractedRecord> records;
    records.reserve(accounts.size());
    for (auto const& account : accounts) {
        records.push_back(makeRecord(
            table(0), transaction.version, {{"transaction_version", *version}, {"account_address", account}}
        ));
    }
    return records;
}

}  // namespace etl::extractors
