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

#include "util/log/Logger.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace web {

using HealthProbe = std::function<bool()>;

/**
 * @brief Build the answer to a health check request
 *
 * GET / and GET /readiness answer 200 while the probe reports healthy and 503 once it does not; anything else is 404.
 *
 * @param request The received request
 * @param healthy What the probe reports
 * @return The response to send
 */
[[nodiscard]] boost::beast::http::response<boost::beast::http::string_body>
makeHealthCheckResponse(boost::beast::http::request<boost::beast::http::string_body> const& request, bool healthy);

/**
 * @brief Plain HTTP server answering liveness and readiness probes
 */
class HealthCheckServer : public std::enable_shared_from_this<HealthCheckServer> {
    util::Logger log_{"WebServer"};
    std::reference_wrapper<boost::asio::io_context> ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    HealthProbe probe_;

public:
    /**
     * @brief Bind the server; no connection is accepted until run() is called
     *
     * @param ioc The io_context to run on
     * @param endpoint Where to listen
     * @param probe Reports whether the processor is healthy
     * @throws std::runtime_error if the endpoint can't be bound
     */
    HealthCheckServer(boost::asio::io_context& ioc, boost::asio::ip::tcp::endpoint const& endpoint, HealthProbe probe);

    void
    run();

    /** @return The port the server listens on */
    [[nodiscard]] std::uint16_t
    port() const;

    void
    stop();

private:
    void
    doAccept();

    void
    onAccept(boost::beast::error_code ec, boost::asio::ip::tcp::socket socket);
};

/**
 * @brief Start a health check server if health_check_port is configured
 *
 * @param port The configured port
 * @param ioc The io_context to run on
 * @param probe Reports whether the processor is healthy
 * @return The running server; nullptr if no port is configured
 */
[[nodiscard]] std::shared_ptr<HealthCheckServer>
makeHealthCheckServer(std::optional<std::uint16_t> port, boost::asio::io_context& ioc, HealthProbe probe);

}  // namespace web
