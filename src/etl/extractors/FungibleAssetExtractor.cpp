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

#include <boost/json/object.hpp>
#include <fmt/core.h>

#include <indexer/v1/transaction.pb.h>

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace etl::extractors {

namespace {

using enum ColumnType;

constexpr std::string_view kCOIN_STORE = "0x1::coin::CoinStore";

enum TableIndex { kCOIN_BALANCES, kCURRENT_COIN_BALANCES };

std::vector<TableSpec>
makeTables()
{
    return {
        TableSpec{
            .name = "coin_balances",
            .kind = MutationKind::InsertImmutable,
            .primaryKey = {"transaction_version", "owner_address", "coin_type"},
            .columns =
                {{"transaction_version", Integer},
                 {"owner_address", Text},
                 {"coin_type", Text},
                 {"amount", Text},
                 {"transaction_timestamp", Text}}
        },
        TableSpec{
            .name = "current_coin_balances",
            .kind = MutationKind::UpsertCurrent,
            .primaryKey = {"owner_address", "coin_type"},
            .columns =
                {{"owner_address", Text}, {"coin_type", Text}, {"amount", Text}, {"last_transaction_timestamp", Text}}
        },
    };
}

/** Balance of a CoinStore resource; the amount is a decimal string since it does not fit 64 bits */
std::expected<std::string, std::string>
coinAmount(std::string const& data)
{
    auto const object = parseObject(data);
    if (not object.has_value())
        return std::unexpected{object.error()};

    auto const* coin = object->if_contains("coin");
    if (coin == nullptr or not coin->is_object())
        return std::unexpected{std::string{"CoinStore without coin"}};

    auto amount = decimalMember(coin->as_object(), "value");
    if (not amount.has_value())
        return std::unexpected{std::string{"CoinStore coin value is not a decimal string"}};
    return std::move(*amount);
}

}  // namespace

FungibleAssetExtractor::FungibleAssetExtractor() : TableExtractor{"fungible_asset", makeTables()}
{
}

std::expected<std::vector<ExtractedRecord>, std::string>
FungibleAssetExtractor::extract(Transaction const& transaction) const
{
    using indexer::v1::WriteSetChange;

    auto const& txn = *transaction.payload;
    auto const version = toBigInt(txn.version());
    if (not version)
        return std::unexpected{version.error()};

    auto const timestamp = util::UTCStrFromSystemTp(transaction.timestamp);
    std::vector<ExtractedRecord> records;

    for (int index = 0; index < txn.changes_size(); ++index) {
        auto const& change = txn.changes(index);
        auto const coinType = genericArgument(change.resource_type(), kCOIN_STORE);
        if (not coinType.has_value())
            continue;

        auto const owner = standardizeAddress(change.address());

        if (change.type() == WriteSetChange::TYPE_DELETE_RESOURCE) {
            records.push_back(makeRecord(
                table(kCURRENT_COIN_BALANCES),
                transaction.version,
                {{"owner_address", owner},
                 {"coin_type", *coinType},
                 {"amount", std::monostate{}},
                 {"last_transaction_timestamp", timestamp}},
                MutationKind::DeleteMarker
            ));
            continue;
        }

        if (change.type() != WriteSetChange::TYPE_WRITE_RESOURCE)
            continue;

        auto const amount = coinAmount(change.data());
        if (not amount.has_value())
            return std::unexpected{fmt::format("Write set change {}: {}", index, amount.error())};

        records.push_back(makeRecord(
            table(kCOIN_BALANCES),
            transaction.version,
            {{"transaction_version", *version},
             {"owner_address", owner},
             {"coin_type", *coinType},
             {"amount", *amount},
             {"transaction_timestamp", timestamp}}
        ));
        records.push_back(makeRecord(
            table(kCURRENT_COIN_BALANCES),
            transaction.version,
            {{"owner_address", owner},
             {"coin_type", *coinType},
             {"amount", *amount},
             {"last_transaction_timestamp", timestamp}}
        ));
    }

    return records;
}

}  // namespace etl::extractors
