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

#include "etl/impl/BatchLoader.hpp"

#include "data/SinkInterface.hpp"
#include "data/Types.hpp"
#include "etl/Models.hpp"
#include "util/Retry.hpp"
#include "util/TimeUtils.hpp"
#include "util/log/Logger.hpp"

#include <chrono>
#include <cstddef>
#include <expected>

namespace etl::impl {

BatchLoader::BatchLoader(
    data::SinkInterface& sink,
    std::size_t writeRetries,
    std::chrono::steady_clock::duration delay,
    std::chrono::steady_clock::duration maxDelay
)
    : sink_{sink}, writeRetries_{writeRetries}, retry_{util::makeRetryExponentialBackoff(delay, maxDelay)}
{
}

std::expected<void, data::SinkError>
BatchLoader::load(Batch const& batch, data::CheckpointUpdate const& checkpoint)
{
    retry_->reset();

    auto const commitOnce = [&]() {
        auto res = sink_.get().commit(batch, checkpoint);
        if (not res.has_value()) {
            LOG(log_.warn()) << "Commit of versions [" << batch.startVersion << ", " << batch.endVersion
                             << "] failed on attempt " << retry_->attemptNumber() + 1 << ": " << res.error();
        }
        return res;
    };

    auto const [result, elapsed] = util::timed([&]() {
        auto res = commitOnce();
        while (not res.has_value() and res.error().isTransient() and retry_->attemptNumber() < writeRetries_) {
            if (not retry_->waitForNextAttempt())
                break;
            res = commitOnce();
        }
        return res;
    });

    if (not result.has_value()) {
        LOG(log_.error()) << "Giving up on versions [" << batch.startVersion << ", " << batch.endVersion << "] after "
                          << retry_->attemptNumber() + 1 << " attempts";
        return result;
    }

    LOG(log_.info()) << "Committed versions [" << batch.startVersion << ", " << batch.endVersion << "] with "
                     << batch.recordCount() << " records in " << elapsed << "ms; checkpoint " << checkpoint.name
                     << " = " << checkpoint.version;
    return result;
}

}  // namespace etl::impl
