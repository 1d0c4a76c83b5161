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

#include <boost/json/object.hpp>

#include <indexer/v1/transaction.pb.h>

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace etl::extractors {

/**
 * @brief Normalize an account address to 0x followed by 64 lowercase hex digits
 *
 * @param address The address as found in the payload, with or without 0x and leading zeros
 * @return The standardized address
 */
[[nodiscard]] std::string
standardizeAddress(std::string_view address);

/**
 * @brief Convert an unsigned value of the payload into a BIGINT column value
 *
 * @param value The value
 * @return The value; an error message if it does not fit
 */
[[nodiscard]] std::expected<std::int64_t, std::string>
toBigInt(std::uint64_t value);

/** @return Name of the transaction type as stored in the type column */
[[nodiscard]] std::string
transactionTypeName(indexer::v1::Transaction::TransactionType type);

/** @return Name of the write set change type as stored in the type column */
[[nodiscard]] std::string
changeTypeName(indexer::v1::WriteSetChange::Type type);

/**
 * @brief Parse the JSON data of an event or a write set change
 *
 * @param data The JSON text
 * @return The object; an error message if the text is not a JSON object
 */
[[nodiscard]] std::expected<boost::json::object, std::string>
parseObject(std::string_view data);

/**
 * @brief Read a member that Move serializes as a decimal string
 *
 * @param object The JSON object
 * @param key The member name
 * @return The digits; nullopt if missing or not a decimal string
 */
[[nodiscard]] std::optional<std::string>
decimalMember(boost::json::object const& object, std::string_view key);

/**
 * @brief Inner type of a generic Move struct type
 *
 * @param moveType The full type, e.g. 0x1::coin::CoinStore<0x1::aptos_coin::AptosCoin>
 * @param prefix The generic struct name, e.g. 0x1::coin::CoinStore
 * @return The inner type; nullopt if moveType is not an instance of prefix
 */
[[nodiscard]] std::optional<std::string>
genericArgument(std::string_view moveType, std::string_view prefix);

/**
 * @brief Make a record of a table
 *
 * @param table The table
 * @param version Version of the transaction the record comes from
 * @param fields The column values
 * @param kind The mutation; the table's kind if nullopt
 * @return The record
 */
[[nodiscard]] ExtractedRecord
makeRecord(
    TableSpec const& table,
    Version version,
    std::vector<Field> fields,
    std::optional<MutationKind> kind = std::nullopt
);

}  // namespace etl::extractors
