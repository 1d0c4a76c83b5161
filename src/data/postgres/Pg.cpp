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

#include "data/postgres/Pg.hpp"

#include "data/Types.hpp"
#include "util/log/Logger.hpp"

#include <fmt/core.h>
#include <libpq-fe.h>

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace data::postgres {

namespace {

void
noticeReceiver(void* arg, PGresult const* res)
{
    auto const* log = static_cast<util::Logger const*>(arg);
    LOG(log->trace()) << "server message: " << PQresultErrorMessage(res);
}

PgError
makeError(PGconn* conn, PGresult const* res, std::string const& context)
{
    std::string sqlState;
    if (res != nullptr) {
        if (char const* state = PQresultErrorField(res, PG_DIAG_SQLSTATE); state != nullptr)
            sqlState = state;
    }

    auto code = SinkError::Code::Query;
    if (conn == nullptr or PQstatus(conn) != CONNECTION_OK or sqlState.starts_with("08")) {
        code = SinkError::Code::Connection;
    } else if (sqlState == "57014") {
        code = SinkError::Code::Timeout;
    }

    std::string message = context;
    if (res != nullptr and PQresultErrorMessage(res)[0] != '\0') {
        message += ": ";
        message += PQresultErrorMessage(res);
    } else if (conn != nullptr) {
        message += ": ";
        message += PQerrorMessage(conn);
    }
    while (not message.empty() and message.back() == '\n')
        message.pop_back();

    return PgError{.code = code, .message = std::move(message), .sqlState = std::move(sqlState)};
}

}  // namespace

PgResult::PgResult(PGresult* result) : result_{result, [](PGresult* res) { PQclear(res); }}
{
}

ExecStatusType
PgResult::status() const
{
    return PQresultStatus(result_.get());
}

int
PgResult::rows() const
{
    return PQntuples(result_.get());
}

bool
PgResult::isNull(int row, int column) const
{
    return PQgetisnull(result_.get(), row, column) != 0;
}

std::string
PgResult::text(int row, int column) const
{
    if (isNull(row, column))
        return {};
    return std::string{PQgetvalue(result_.get(), row, column), static_cast<std::size_t>(PQgetlength(result_.get(), row, column))};
}

std::int64_t
PgResult::bigint(int row, int column) const
{
    auto const str = text(row, column);
    std::int64_t value = 0;
    std::from_chars(str.data(), str.data() + str.size(), value);
    return value;
}

std::size_t
PgResult::affectedRows() const
{
    char const* tuples = PQcmdTuples(result_.get());
    if (tuples == nullptr or tuples[0] == '\0')
        return 0;
    return std::strtoull(tuples, nullptr, 10);
}

Pg::Pg(std::string conninfo, std::chrono::milliseconds statementTimeout)
    : conninfo_{std::move(conninfo)}
    , statementTimeout_{statementTimeout}
    , conn_{nullptr, [](PGconn* conn) { PQfinish(conn); }}
{
}

std::expected<void, PgError>
Pg::connect()
{
    if (conn_) {
        // Nothing to do if we already have a good connection.
        if (PQstatus(conn_.get()) == CONNECTION_OK)
            return {};
        PQreset(conn_.get());
    } else {
        conn_.reset(PQconnectdb(conninfo_.c_str()));
        if (not conn_)
            return std::unexpected{PgError{.code = SinkError::Code::Connection, .message = "No db connection struct", .sqlState = {}}};
    }

    if (PQstatus(conn_.get()) == CONNECTION_BAD) {
        auto err = makeError(conn_.get(), nullptr, "DB connection failed");
        disconnect();
        return std::unexpected{std::move(err)};
    }

    PQsetNoticeReceiver(conn_.get(), noticeReceiver, &log_);

    if (statementTimeout_.count() > 0) {
        auto const setTimeout = fmt::format("SET statement_timeout = {}", statementTimeout_.count());
        PgResult const res{PQexec(conn_.get(), setTimeout.c_str())};
        if (res.status() != PGRES_COMMAND_OK) {
            auto err = makeError(conn_.get(), res.get(), "Could not set statement_timeout");
            disconnect();
            return std::unexpected{std::move(err)};
        }
    }

    LOG(log_.debug()) << "Connected to " << PQhost(conn_.get()) << ":" << PQport(conn_.get()) << "/" << PQdb(conn_.get());
    return {};
}

std::expected<PgResult, PgError>
Pg::query(std::string const& command, PgParams const& params)
{
    if (auto connected = connect(); not connected.has_value())
        return std::unexpected{std::move(connected).error()};

    std::vector<char const*> values;
    values.reserve(params.size());
    for (auto const& param : params)
        values.push_back(param.has_value() ? param->c_str() : nullptr);

    LOG(log_.trace()) << "query: " << command << "; " << params.size() << " params";

    PGresult* raw = nullptr;
    if (params.empty()) {
        // PQexec can process multiple commands separated by semicolons
        raw = PQexec(conn_.get(), command.c_str());
    } else {
        raw = PQexecParams(
            conn_.get(), command.c_str(), static_cast<int>(values.size()), nullptr, values.data(), nullptr, nullptr, 0
        );
    }

    if (raw == nullptr) {
        auto err = makeError(conn_.get(), nullptr, "No result structure returned");
        disconnect();
        return std::unexpected{std::move(err)};
    }

    PgResult result{raw};
    switch (PQresultStatus(raw)) {
        case PGRES_TUPLES_OK:
        case PGRES_COMMAND_OK:
            return result;
        default: {
            auto err = makeError(conn_.get(), raw, "Bad query result");
            LOG(log_.error()) << err.message;
            if (err.code == SinkError::Code::Connection)
                disconnect();
            return std::unexpected{std::move(err)};
        }
    }
}

bool
Pg::clear()
{
    if (not conn_)
        return false;

    // Consume results until no more, or until the connection is severed.
    while (PGresult* res = PQgetResult(conn_.get())) {
        PgResult const owned{res};
        switch (PQresultStatus(res)) {
            case PGRES_COPY_IN:
            case PGRES_COPY_OUT:
            case PGRES_COPY_BOTH:
                disconnect();
                return false;
            default:
                break;
        }
    }

    if (PQtransactionStatus(conn_.get()) != PQTRANS_IDLE) {
        PgResult const rollback{PQexec(conn_.get(), "ROLLBACK")};
        if (PQtransactionStatus(conn_.get()) != PQTRANS_IDLE) {
            disconnect();
            return false;
        }
    }

    return PQstatus(conn_.get()) == CONNECTION_OK;
}

bool
Pg::isConnected() const
{
    return conn_ and PQstatus(conn_.get()) == CONNECTION_OK;
}

void
Pg::disconnect()
{
    conn_.reset();
}

PgPool::PgPool(std::string conninfo, std::size_t maxConnections, std::chrono::milliseconds statementTimeout)
    : conninfo_{std::move(conninfo)}, statementTimeout_{statementTimeout}, maxConnections_{maxConnections}
{
    LOG(log_.info()) << "Postgres pool of up to " << maxConnections_ << " connections; statement timeout "
                     << statementTimeout_.count() << "ms";
}

std::unique_ptr<Pg>
PgPool::checkout()
{
    std::unique_ptr<Pg> ret;
    std::unique_lock lock{mutex_};
    do {
        if (stop_)
            return {};

        // If there is a connection in the pool, return the most recent.
        if (not idle_.empty()) {
            ret = std::move(idle_.back());
            idle_.pop_back();
        }
        // Otherwise, return a new connection unless over threshold.
        else if (connections_ < maxConnections_) {
            ++connections_;
            ret = std::make_unique<Pg>(conninfo_, statementTimeout_);
        }
        // Otherwise, wait until a connection becomes available or we stop.
        else {
            LOG(log_.warn()) << "No database connections available";
            cond_.wait(lock);
        }
    } while (not ret and not stop_);

    return ret;
}

void
PgPool::checkin(std::unique_ptr<Pg>& pg)
{
    if (pg) {
        std::lock_guard const lock{mutex_};
        if (not stop_ and pg->clear()) {
            idle_.push_back(std::move(pg));
        } else {
            --connections_;
            pg.reset();
        }
    }

    cond_.notify_all();
}

void
PgPool::stop()
{
    std::lock_guard const lock{mutex_};
    stop_ = true;
    connections_ -= idle_.size();
    idle_.clear();
    cond_.notify_all();
    LOG(log_.info()) << "Postgres pool stopped";
}

PgQuery::PgQuery(std::shared_ptr<PgPool> pool) : pool_{std::move(pool)}, pg_{pool_->checkout()}
{
}

PgQuery::~PgQuery()
{
    pool_->checkin(pg_);
}

std::expected<PgResult, PgError>
PgQuery::operator()(std::string const& command, PgParams const& params)
{
    if (not pg_)
        return std::unexpected{PgError{.code = SinkError::Code::Connection, .message = "Pool is stopped", .sqlState = {}}};
    return pg_->query(command, params);
}

}  // namespace data::postgres
