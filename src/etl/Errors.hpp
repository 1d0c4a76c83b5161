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

#include <fmt/core.h>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace etl {

/**
 * @brief Error reported by a transaction source
 */
struct SourceError {
    enum class Code {
        RangeUnavailable,  ///< requested versions are pruned or beyond the chain head
        Transport,         ///< connection dropped; fetch again from the next unconsumed version
        Timeout,           ///< no progress within the request timeout; same handling as Transport
        Fatal,             ///< credentials rejected or another error retrying cannot fix
    };

    Code code;
    std::string message;

    /** @return true if fetching again may succeed */
    [[nodiscard]] bool
    isTransient() const
    {
        return code == Code::Transport or code == Code::Timeout;
    }
};

/**
 * @brief A transaction one extractor could not decode
 */
struct ExtractionError {
    Version version = 0;
    std::string extractor;
    std::string message;
};

enum class PipelineErrorCode {
    RangeUnavailable,
    OrderingViolation,
    ExtractionError,
    SinkExhausted,
    SourceExhausted,
    SourceFailure,
    ChainIdMismatch,
    Cancelled,
};

/**
 * @brief Terminal status of a pipeline run
 *
 * An empty error means the run completed successfully.
 */
struct PipelineStatus {
    std::optional<PipelineErrorCode> error;
    std::string message;
    std::optional<Version> lastCommittedVersion;

    /** @return true if the run ended without a fatal error; cancellation is not fatal */
    [[nodiscard]] bool
    isSuccess() const
    {
        return not error.has_value() or *error == PipelineErrorCode::Cancelled;
    }

    static PipelineStatus
    success(std::optional<Version> lastCommitted)
    {
        return PipelineStatus{.error = std::nullopt, .message = {}, .lastCommittedVersion = lastCommitted};
    }

    static PipelineStatus
    failure(PipelineErrorCode code, std::string message, std::optional<Version> lastCommitted)
    {
        return PipelineStatus{.error = code, .message = std::move(message), .lastCommittedVersion = lastCommitted};
    }
};

/**
 * @brief Get the name of an error code for logs
 *
 * @param code The code
 * @return The name
 */
[[nodiscard]] inline char const*
toString(PipelineErrorCode code)
{
    switch (code) {
        case PipelineErrorCode::RangeUnavailable:
            return "RangeUnavailable";
        case PipelineErrorCode::OrderingViolation:
            return "OrderingViolation";
        case PipelineErrorCode::ExtractionError:
            return "ExtractionError";
        case PipelineErrorCode::SinkExhausted:
            return "SinkExhausted";
        case PipelineErrorCode::SourceExhausted:
            return "SourceExhausted";
        case PipelineErrorCode::SourceFailure:
            return "SourceFailure";
        case PipelineErrorCode::ChainIdMismatch:
            return "ChainIdMismatch";
        case PipelineErrorCode::Cancelled:
            return "Cancelled";
    }
    return "Unknown";
}

inline std::ostream&
operator<<(std::ostream& os, PipelineErrorCode code)
{
    return os << toString(code);
}

}  // namespace etl
