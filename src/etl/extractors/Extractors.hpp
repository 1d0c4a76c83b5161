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

#include "etl/ExtractorInterface.hpp"
#include "etl/Models.hpp"

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace etl::extractors {

/**
 * @brief Base of the extractors shipped with the indexer; owns the table list
 */
class TableExtractor : public ExtractorInterface {
    std::string name_;
    std::vector<TableSpec> tables_;

public:
    TableExtractor(std::string name, std::vector<TableSpec> tables);

    [[nodiscard]] std::string_view
    name() const override
    {
        return name_;
    }

    [[nodiscard]] std::vector<TableSpec> const&
    tables() const override
    {
        return tables_;
    }

protected:
    [[nodiscard]] TableSpec const&
    table(std::size_t index) const
    {
        return tables_.at(index);
    }
};

/**
 * @brief Writes transactions, write_set_changes and current_table_items
 */
class DefaultExtractor : public TableExtractor {
public:
    DefaultExtractor();

    [[nodiscard]] std::expected<std::vector<ExtractedRecord>, std::string>
    extract(Transaction const& transaction) const override;
};

/**
 * @brief Writes one events row per event
 */
class EventsExtractor : public TableExtractor {
public:
    EventsExtractor();

    [[nodiscard]] std::expected<std::vector<ExtractedRecord>, std::string>
    extract(Transaction const& transaction) const override;
};

/**
 * @brief Writes one user_transactions row per user transaction
 */
class UserTransactionExtractor : public TableExtractor {
public:
    UserTransactionExtractor();

    [[nodiscard]] std::expected<std::vector<ExtractedRecord>, std::string>
    extract(Transaction const& transaction) const override;
};

/**
 * @brief Writes coin_balances and current_coin_balances out of CoinStore resources
 */
class FungibleAssetExtractor : public TableExtractor {
public:
    FungibleAssetExtractor();

    [[nodiscard]] std::expected<std::vector<ExtractedRecord>, std::string>
    extract(Transaction const& transaction) const override;
};

/**
 * @brief Writes one account_transactions row per account a transaction touched
 *
 * An account is touched if it sent the transaction, emitted one of its events or owns a changed resource.
 */
class AccountTransactionsExtractor : public TableExtractor {
public:
    AccountTransactionsExtractor();

    [[nodiscard]] std::expected<std::vector<ExtractedRecord>, std::string>
    extract(Transaction const& transaction) const override;
};

/**
 * @brief Writes objects and current_objects out of ObjectCore resources
 */
class ObjectsExtractor : public TableExtractor {
public:
    ObjectsExtractor();

    [[nodiscard]] std::expected<std::vector<ExtractedRecord>, std::string>
    extract(Transaction const& transaction) const override;
};

}  // namespace etl::extractors
