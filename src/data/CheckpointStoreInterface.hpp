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

#include "data/Types.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>

namespace data {

/**
 * @brief Durable record of how far each processor got
 *
 * One processor name (or backfill alias) has exactly one writer at a time.
 */
class CheckpointStoreInterface {
public:
    virtual ~CheckpointStoreInterface() = default;

    /**
     * @brief Read the checkpoint of a tailing processor
     *
     * @param processor The processor name
     * @return The stored status; nullopt if the processor never committed anything
     */
    [[nodiscard]] virtual std::expected<std::optional<ProcessorStatus>, SinkError>
    fetchProcessorStatus(std::string const& processor) = 0;

    /**
     * @brief Read the checkpoint of a backfill run
     *
     * @param alias The backfill alias
     * @return The stored status; nullopt if the alias is unknown
     */
    [[nodiscard]] virtual std::expected<std::optional<BackfillProcessorStatus>, SinkError>
    fetchBackfillStatus(std::string const& alias) = 0;

    /**
     * @brief Advance a checkpoint
     *
     * The stored version never goes down: an update older than the stored value is a no-op.
     *
     * @param update The new checkpoint
     * @return Nothing on success; the error otherwise
     */
    [[nodiscard]] virtual std::expected<void, SinkError>
    writeCheckpoint(CheckpointUpdate const& update) = 0;

    /**
     * @brief Discard the checkpoint of a backfill alias
     *
     * Used when a backfill is started with overwrite_checkpoint; the next commit of the alias writes a fresh row.
     *
     * @param alias The backfill alias
     * @return Nothing on success; the error otherwise
     */
    [[nodiscard]] virtual std::expected<void, SinkError>
    resetBackfillStatus(std::string const& alias) = 0;

    /** @return The chain id the store was first filled from; nullopt if none was recorded yet */
    [[nodiscard]] virtual std::expected<std::optional<std::uint64_t>, SinkError>
    fetchChainId() = 0;

    /**
     * @brief Record the chain id the store is filled from
     *
     * @param chainId The chain id
     * @return Nothing on success; the error otherwise
     */
    [[nodiscard]] virtual std::expected<void, SinkError>
    writeChainId(std::uint64_t chainId) = 0;
};

}  // namespace data
