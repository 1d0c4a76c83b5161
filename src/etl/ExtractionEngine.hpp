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

#include "etl/Errors.hpp"
#include "etl/ExtractorInterface.hpp"
#include "etl/Models.hpp"
#include "util/log/Logger.hpp"

#include <atomic>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace etl {

/** @brief What to do when one extractor cannot decode a transaction */
enum class ExtractionFailurePolicy { Skip, Fatal };

/**
 * @brief Runs the fixed extractor set of a processor over single transactions
 *
 * Safe to call from several threads at once.
 */
class ExtractionEngine {
    util::Logger log_{"Extraction"};

    std::vector<std::shared_ptr<ExtractorInterface const>> extractors_;
    std::set<std::string, std::less<>> tablesToWrite_;
    ExtractionFailurePolicy policy_;

    mutable std::atomic_size_t skipped_ = 0;

public:
    /**
     * @brief Create the engine
     * @throws std::runtime_error if tablesToWrite names a table none of the extractors writes
     *
     * @param extractors The extractors to run, in the order their records are emitted
     * @param tablesToWrite Tables whose records are kept; every table if empty
     * @param policy Whether a failing extractor stops the pipeline
     */
    ExtractionEngine(
        std::vector<std::shared_ptr<ExtractorInterface const>> extractors,
        std::vector<std::string> const& tablesToWrite,
        ExtractionFailurePolicy policy
    );

    /**
     * @brief Extract every record of one transaction
     *
     * With the skip policy a failing extractor only loses its own records; the failure is logged and counted.
     *
     * @param transaction The transaction
     * @return The records of the transaction; the first failure if the policy is fatal
     */
    [[nodiscard]] std::expected<ExtractedTransaction, ExtractionError>
    extract(Transaction const& transaction) const;

    /** @return The tables whose records are kept */
    [[nodiscard]] std::vector<TableSpec>
    tables() const;

    /** @return Number of extractor failures that were skipped so far */
    [[nodiscard]] std::size_t
    skippedCount() const
    {
        return skipped_;
    }

private:
    [[nodiscard]] bool
    isWritten(std::string const& table) const;
};

}  // namespace etl
