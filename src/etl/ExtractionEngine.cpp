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

#include "etl/ExtractionEngine.hpp"

#include "etl/Errors.hpp"
#include "etl/ExtractorInterface.hpp"
#include "etl/Models.hpp"
#include "util/log/Logger.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <expected>
#include <iterator>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace etl {

ExtractionEngine::ExtractionEngine(
    std::vector<std::shared_ptr<ExtractorInterface const>> extractors,
    std::vector<std::string> const& tablesToWrite,
    ExtractionFailurePolicy policy
)
    : extractors_{std::move(extractors)}, tablesToWrite_{tablesToWrite.begin(), tablesToWrite.end()}, policy_{policy}
{
    std::set<std::string, std::less<>> known;
    for (auto const& extractor : extractors_) {
        for (auto const& table : extractor->tables())
            known.insert(table.name);
    }

    for (auto const& table : tablesToWrite_) {
        if (not known.contains(table))
            throw std::runtime_error(fmt::format("Table '{}' is not written by this processor", table));
    }
}

std::expected<ExtractedTransaction, ExtractionError>
ExtractionEngine::extract(Transaction const& transaction) const
{
    ExtractedTransaction result{.version = transaction.version, .timestamp = transaction.timestamp, .records = {}};

    for (auto const& extractor : extractors_) {
        auto records = extractor->extract(transaction);
        if (not records.has_value()) {
            auto error = ExtractionError{
                .version = transaction.version, .extractor = std::string{extractor->name()}, .message = records.error()
            };

            if (policy_ == ExtractionFailurePolicy::Fatal) {
                LOG(log_.error()) << "Extractor " << error.extractor << " failed on version " << error.version << ": "
                                  << error.message;
                return std::unexpected{std::move(error)};
            }

            ++skipped_;
            LOG(log_.warn()) << "Skipping records of extractor " << error.extractor << " for version "
                             << error.version << ": " << error.message;
            continue;
        }

        for (auto& record : *records) {
            if (isWritten(record.table))
                result.records.push_back(std::move(record));
        }
    }

    return result;
}

std::vector<TableSpec>
ExtractionEngine::tables() const
{
    std::vector<TableSpec> result;
    for (auto const& extractor : extractors_) {
        std::ranges::copy_if(extractor->tables(), std::back_inserter(result), [this](TableSpec const& table) {
            return isWritten(table.name);
        });
    }
    return result;
}

bool
ExtractionEngine::isWritten(std::string const& table) const
{
    return tablesToWrite_.empty() or tablesToWrite_.contains(table);
}

}  // namespace etl
