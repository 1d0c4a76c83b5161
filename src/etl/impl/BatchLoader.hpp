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

#include "data/SinkInterface.hpp"
#include "data/Types.hpp"
#include "etl/Models.hpp"
#include "util/Retry.hpp"
#include "util/log/Logger.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>

namespace etl::impl {

/**
 * @brief Commits batches to the sink, retrying transient failures with exponential backoff
 */
class BatchLoader {
    util::Logger log_{"Sink"};

    std::reference_wrapper<data::SinkInterface> sink_;
    std::size_t writeRetries_;
    std::unique_ptr<util::Retry> retry_;

public:
    /**
     * @brief Create the loader
     *
     * @param sink The sink to commit to
     * @param writeRetries Retries allowed after a failed commit of one batch
     * @param delay Delay before the first retry
     * @param maxDelay Upper bound of the delay between retries
     */
    BatchLoader(
        data::SinkInterface& sink,
        std::size_t writeRetries,
        std::chrono::steady_clock::duration delay,
        std::chrono::steady_clock::duration maxDelay
    );

    /**
     * @brief Commit a batch together with its checkpoint
     *
     * @param batch The batch
     * @param checkpoint The checkpoint to advance
     * @return Nothing on success; the last error once the retry budget is used up or on an error that is not transient
     */
    [[nodiscard]] std::expected<void, data::SinkError>
    load(Batch const& batch, data::CheckpointUpdate const& checkpoint);
};

}  // namespace etl::impl
