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
#include "util/log/Logger.hpp"

#include <libpq-fe.h>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace data::postgres {

/**
 * @brief Error reported by libpq
 */
struct PgError {
    SinkError::Code code = SinkError::Code::Query;
    std::string message;
    std::string sqlState;  ///< five character SQLSTATE; empty when the server did not answer

    /** @return The error as the sink reports it */
    [[nodiscard]] SinkError
    toSinkError() const
    {
        return SinkError{.code = code, .message = message};
    }
};

using PgParams = std::vector<std::optional<std::string>>;

/**
 * @brief Owns the result of one statement
 */
class PgResult {
    std::unique_ptr<PGresult, void (*)(PGresult*)> result_;

public:
    explicit PgResult(PGresult* result);

    /** @return Status of the statement */
    [[nodiscard]] ExecStatusType
    status() const;

    /** @return The raw libpq result */
    [[nodiscard]] PGresult const*
    get() const
    {
        return result_.get();
    }

    /** @return Number of rows returned */
    [[nodiscard]] int
    rows() const;

    /** @return true if the field is NULL */
    [[nodiscard]] bool
    isNull(int row, int column) const;

    /** @return The field as text; the empty string for NULL */
    [[nodiscard]] std::string
    text(int row, int column) const;

    /** @return The field parsed as an integer */
    [[nodiscard]] std::int64_t
    bigint(int row, int column) const;

    /** @return Number of rows changed by the statement */
    [[nodiscard]] std::size_t
    affectedRows() const;
};

/**
 * @brief One connection to PostgreSQL
 *
 * Connects lazily and reconnects after the connection broke. Not thread safe; use through PgPool.
 */
class Pg {
    util::Logger log_{"Backend"};

    std::string conninfo_;
    std::chrono::milliseconds statementTimeout_;
    std::unique_ptr<PGconn, void (*)(PGconn*)> conn_;

public:
    /**
     * @brief Create a connection that is not connected yet
     *
     * @param conninfo libpq connection string or URI
     * @param statementTimeout Server side limit of one statement; 0 for none
     */
    Pg(std::string conninfo, std::chrono::milliseconds statementTimeout);

    /**
     * @brief Connect if not connected already
     *
     * @return Nothing on success; the error otherwise
     */
    [[nodiscard]] std::expected<void, PgError>
    connect();

    /**
     * @brief Run one statement
     *
     * @param command The statement; params are referenced as $1, $2, ...
     * @param params Text values of the params; nullopt is NULL
     * @return The result; the error if the statement failed
     */
    [[nodiscard]] std::expected<PgResult, PgError>
    query(std::string const& command, PgParams const& params = {});

    /**
     * @brief Consume pending results so the connection can be reused
     *
     * @return false if the connection is unusable
     */
    [[nodiscard]] bool
    clear();

    /** @return true if the connection is up */
    [[nodiscard]] bool
    isConnected() const;

    void
    disconnect();
};

/**
 * @brief Bounded pool of connections
 *
 * checkout() blocks while every connection is in use.
 */
class PgPool {
    util::Logger log_{"Backend"};

    std::string conninfo_;
    std::chrono::milliseconds statementTimeout_;
    std::size_t maxConnections_;

    std::mutex mutex_;
    std::condition_variable cond_;
    std::vector<std::unique_ptr<Pg>> idle_;
    std::size_t connections_ = 0;
    bool stop_ = false;

public:
    /**
     * @brief Create the pool
     *
     * @param conninfo libpq connection string or URI
     * @param maxConnections Upper bound of open connections
     * @param statementTimeout Server side limit of one statement
     */
    PgPool(std::string conninfo, std::size_t maxConnections, std::chrono::milliseconds statementTimeout);

    /**
     * @brief Take a connection out of the pool
     *
     * @return The connection; nullptr once the pool is stopped
     */
    [[nodiscard]] std::unique_ptr<Pg>
    checkout();

    /**
     * @brief Give a connection back
     *
     * A connection that is unusable is dropped.
     *
     * @param pg The connection; reset by the call
     */
    void
    checkin(std::unique_ptr<Pg>& pg);

    /** @brief Wake up waiting callers and drop idle connections */
    void
    stop();
};

/**
 * @brief Connection checked out of a pool for the lifetime of the object
 */
class PgQuery {
    std::shared_ptr<PgPool> pool_;
    std::unique_ptr<Pg> pg_;

public:
    explicit PgQuery(std::shared_ptr<PgPool> pool);
    ~PgQuery();

    PgQuery(PgQuery const&) = delete;
    PgQuery&
    operator=(PgQuery const&) = delete;

    /**
     * @brief Run one statement on the checked out connection
     *
     * @param command The statement
     * @param params Text values of the params
     * @return The result; the error if the statement failed
     */
    [[nodiscard]] std::expected<PgResult, PgError>
    operator()(std::string const& command, PgParams const& params = {});
};

}  // namespace data::postgres
