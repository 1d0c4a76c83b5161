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

#include "etl/extractors/ExtractorUtils.hpp"

#include "etl/Models.hpp"

#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/value.hpp>
#include <fmt/core.h>

#include <indexer/v1/transaction.pb.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace etl::extractors {

namespace {

constexpr std::size_t kADDRESS_HEX_LENGTH = 64;

}  // namespace

std::string
standardizeAddress(std::string_view address)
{
    if (address.starts_with("0x") or address.starts_with("0X"))
        address.remove_prefix(2);

    std::string hex;
    hex.reserve(kADDRESS_HEX_LENGTH + 2);
    hex += "0x";
    if (address.size() < kADDRESS_HEX_LENGTH)
        hex.append(kADDRESS_HEX_LENGTH - address.size(), '0');

    std::ranges::transform(address, std::back_inserter(hex), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return hex;
}

std::expected<std::int64_t, std::string>
toBigInt(std::uint64_t value)
{
    if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
        return std::unexpected{fmt::format("Value {} does not fit a BIGINT", value)};
    return static_cast<std::int64_t>(value);
}

std::string
transactionTypeName(indexer::v1::Transaction::TransactionType type)
{
    using indexer::v1::Transaction;

    switch (type) {
        case Transaction::TRANSACTION_TYPE_GENESIS:
            return "genesis_transaction";
        case Transaction::TRANSACTION_TYPE_BLOCK_METADATA:
            return "block_metadata_transaction";
        case Transaction::TRANSACTION_TYPE_STATE_CHECKPOINT:
            return "state_checkpoint_transaction";
        case Transaction::TRANSACTION_TYPE_USER:
            return "user_transaction";
        case Transaction::TRANSACTION_TYPE_VALIDATOR:
            return "validator_transaction";
        case Transaction::TRANSACTION_TYPE_BLOCK_EPILOGUE:
            return "block_epilogue_transaction";
        default:
            return "unknown";
    }
}

std::string
changeTypeName(indexer::v1::WriteSetChange::Type type)
{
    using indexer::v1::WriteSetChange;

    switch (type) {
        case WriteSetChange::TYPE_DELETE_MODULE:
            return "delete_module";
        case WriteSetChange::TYPE_DELETE_RESOURCE:
            return "delete_resource";
        case WriteSetChange::TYPE_DELETE_TABLE_ITEM:
            return "delete_table_item";
        case WriteSetChange::TYPE_WRITE_MODULE:
            return "write_module";
        case WriteSetChange::TYPE_WRITE_RESOURCE:
            return "write_resource";
        case WriteSetChange::TYPE_WRITE_TABLE_ITEM:
            return "write_table_item";
        default:
            return "unknown";
    }
}

std::expected<boost::json::object, std::string>
parseObject(std::string_view data)
{
    std::error_code ec;
    auto value = boost::json::parse(data, ec);
    if (ec)
        return std::unexpected{fmt::format("Invalid JSON: {}", ec.message())};
    if (not value.is_object())
        return std::unexpected{std::string{"JSON data is not an object"}};
    return boost::json::object{std::move(value.as_object())};
}

std::optional<std::string>
decimalMember(boost::json::object const& object, std::string_view key)
{
    auto const* value = object.if_contains(key);
    if (value == nullptr or not value->is_string())
        return std::nullopt;

    std::string digits{value->as_string()};
    if (digits.empty() or not std::ranges::all_of(digits, [](unsigned char ch) { return std::isdigit(ch) != 0; }))
        return std::nullopt;
    return digits;
}

std::optional<std::string>
genericArgument(std::string_view moveType, std::string_view prefix)
{
    if (not moveType.starts_with(prefix))
        return std::nullopt;

    moveType.remove_prefix(prefix.size());
    if (moveType.size() < 2 or moveType.front() != '<' or moveType.back() != '>')
        return std::nullopt;

    return std::string{moveType.substr(1, moveType.size() - 2)};
}

ExtractedRecord
makeRecord(TableSpec const& table, Version version, std::vector<Field> fields, std::optional<MutationKind> kind)
{
    return ExtractedRecord{
        .table = table.name,
        .primaryKey = table.primaryKey,
        .kind = kind.value_or(table.kind),
        .fields = std::move(fields),
        .version = version
    };
}

}  // namespace etl::extractors
