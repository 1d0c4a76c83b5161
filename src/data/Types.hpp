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

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace data {

/**
 * @brief Error reported by a sink or the checkpoint store
 *
 * Every error but Invalid is considered transient by the writer; only the retry budget decides when to give up.
 */
struct SinkError {
    enum class Code {
        Connection,  ///< no connection to the store could be made or it broke mid-statement
        Timeout,     ///< the statement timeout elapsed
        Query,       ///< the store rejected a statement
        Io,          ///< writing a file object failed
        Invalid,     ///< the batch can not be written as it is
    };

    Code code = Code::Query;
    std::string message;

    /** @return true if committing again may succeed */
    [[nodiscard]] bool
    isTransient() const
    {
        return code != Code::Invalid;
    }
};

inline std::ostream&
operator<<(std::ostream& os, SinkError const& err)
{
    static constexpr char const* kNAMES[] = {"Connection", "Timeout", "Query", "Io", "Invalid"};
    return os << kNAMES[static_cast<int>(err.code)] << ": " << err.message;
}

/**
 * @brief Persisted progress of a tailing processor
 */
struct ProcessorStatus {
    std::string processor;
    etl::Version lastSuccessVersion = 0;
    etl::Timestamp lastUpdated;
    std::optional<etl::Timestamp> lastTransactionTimestamp;
};

enum class BackfillStatus { InProgress, Complete };

/**
 * @brief Persisted progress of a backfill run, keyed by its alias
 */
struct BackfillProcessorStatus {
    std::string backfillAlias;
    BackfillStatus status = BackfillStatus::InProgress;
    etl::Version lastSuccessVersion = 0;
    etl::Timestamp lastUpdated;
    std::optional<etl::Timestamp> lastTransactionTimestamp;
    etl::Version backfillStartVersion = 0;
    std::optional<etl::Version> backfillEndVersion;
};

/** @return The value stored in the backfill_status column */
[[nodiscard]] inline char const*
toString(BackfillStatus status)
{
    return status == BackfillStatus::Complete ? "complete" : "in_progress";
}

/**
 * @brief The checkpoint a commit advances together with its batch
 *
 * Tailing runs write the processor_status row named by name; backfill runs write the backfill_processor_status row of
 * the alias in name and fill backfill.
 */
struct CheckpointUpdate {
    struct Backfill {
        BackfillStatus status = BackfillStatus::InProgress;
        etl::Version startVersion = 0;
        std::optional<etl::Version> endVersion;
    };

    std::string name;
    etl::Version version = 0;
    etl::Timestamp lastTransactionTimestamp;
    std::optional<Backfill> backfill;
};

}  // namespace data
