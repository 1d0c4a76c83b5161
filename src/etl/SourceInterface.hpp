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
#include "etl/Models.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <vector>

namespace etl {

/**
 * @brief Transactions received in one response of the stream
 */
struct TransactionsChunk {
    std::vector<Transaction> transactions;
    std::optional<std::uint64_t> chainId;
};

/**
 * @brief An open stream of transactions in version order
 */
class TransactionStreamInterface {
public:
    virtual ~TransactionStreamInterface() = default;

    /**
     * @brief Block until the next chunk of transactions arrives
     *
     * @return The next chunk; nullopt if the stream ended cleanly; the error if it broke
     */
    [[nodiscard]] virtual std::expected<std::optional<TransactionsChunk>, SourceError>
    next() = 0;

    /**
     * @brief Interrupt a pending next() from another thread
     */
    virtual void
    cancel() = 0;
};

/**
 * @brief The remote source of transactions
 */
class SourceInterface {
public:
    virtual ~SourceInterface() = default;

    /**
     * @brief Open a stream starting at the given version
     *
     * A stream that broke is resumed by calling fetch again from the next unconsumed version.
     *
     * @param startingVersion The first version to receive
     * @param endingVersion The last version to receive; unbounded if nullopt
     * @return The stream; the error if it could not be opened
     */
    [[nodiscard]] virtual std::expected<std::unique_ptr<TransactionStreamInterface>, SourceError>
    fetch(Version startingVersion, std::optional<Version> endingVersion) = 0;

    /**
     * @brief Ask the source which chain it serves
     *
     * @param version A version the source is expected to serve
     * @return The chain id; the error if the source could not be reached
     */
    [[nodiscard]] virtual std::expected<std::uint64_t, SourceError>
    fetchChainId(Version version) = 0;
};

}  // namespace etl
