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
#include "etl/Models.hpp"

#include <expected>
#include <optional>

namespace data {

/**
 * @brief Durable destination of extracted records
 */
class SinkInterface {
public:
    virtual ~SinkInterface() = default;

    /**
     * @brief Write a batch and advance the checkpoint to its end version
     *
     * Either every record of the batch lands together with the checkpoint, or the batch can be committed again without
     * changing the outcome. Current-state rows keep the write with the highest version; immutable rows are written
     * once per key.
     *
     * @param batch The batch to write
     * @param checkpoint The checkpoint to advance once the records are durable
     * @return Nothing on success; the error otherwise
     */
    [[nodiscard]] virtual std::expected<void, SinkError>
    commit(etl::Batch const& batch, CheckpointUpdate const& checkpoint) = 0;

    /**
     * @brief Remove what an interrupted run wrote past its checkpoint
     *
     * Called once before streaming starts. A sink whose commits are atomic has nothing to remove.
     *
     * @param startVersion The first version the run is going to commit
     * @param endVersion The last version of the run, if bounded
     * @return Nothing on success; the error otherwise
     */
    [[nodiscard]] virtual std::expected<void, SinkError>
    prepareResume(etl::Version startVersion, std::optional<etl::Version> endVersion) = 0;
};

}  // namespace data
