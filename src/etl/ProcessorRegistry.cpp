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

#include "etl/ProcessorRegistry.hpp"

#include "etl/ExtractorInterface.hpp"
#include "etl/extractors/Extractors.hpp"

#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace etl {

namespace {

constexpr std::string_view kPARQUET_PREFIX = "parquet_";

using ExtractorList = std::vector<std::shared_ptr<ExtractorInterface const>>;

std::map<std::string, std::function<ExtractorList()>, std::less<>> const&
registry()
{
    static std::map<std::string, std::function<ExtractorList()>, std::less<>> const kREGISTRY = {
        {"default_processor", [] { return ExtractorList{std::make_shared<extractors::DefaultExtractor const>()}; }},
        {"events_processor", [] { return ExtractorList{std::make_shared<extractors::EventsExtractor const>()}; }},
        {"user_transaction_processor",
         [] { return ExtractorList{std::make_shared<extractors::UserTransactionExtractor const>()}; }},
        {"fungible_asset_processor",
         [] { return ExtractorList{std::make_shared<extractors::FungibleAssetExtractor const>()}; }},
        {"account_transactions_processor",
         [] { return ExtractorList{std::make_shared<extractors::AccountTransactionsExtractor const>()}; }},
        {"objects_processor", [] { return ExtractorList{std::make_shared<extractors::ObjectsExtractor const>()}; }},
    };
    return kREGISTRY;
}

}  // namespace

std::expected<ProcessorDefinition, std::string>
makeProcessorDefinition(std::string const& type)
{
    std::string_view base = type;
    auto sink = SinkKind::Postgres;
    if (base.starts_with(kPARQUET_PREFIX)) {
        base.remove_prefix(kPARQUET_PREFIX.size());
        sink = SinkKind::Parquet;
    }

    auto const it = registry().find(base);
    if (it == registry().end())
        return std::unexpected{"Unknown processor type " + type};

    return ProcessorDefinition{.type = type, .sink = sink, .extractors = it->second()};
}

char const*
requiredDatabaseType(SinkKind kind)
{
    return kind == SinkKind::Parquet ? "parquet_config" : "postgres_config";
}

}  // namespace etl
