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

#include "web/HealthCheckServer.hpp"

#include "util/build/Build.hpp"
#include "util/log/Logger.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/beast/http/write.hpp>
#include <fmt/core.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace web {

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr auto kREAD_TIMEOUT = std::chrono::seconds{30};

/**
 * @brief Serves the requests of one connection until the peer closes it
 */
class HealthCheckSession : public std::enable_shared_from_this<HealthCheckSession> {
    util::Logger log_{"WebServer"};
    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    http::response<http::string_body> res_;
    HealthProbe probe_;

public:
    HealthCheckSession(tcp::socket&& socket, HealthProbe probe) : stream_(std::move(socket)), probe_(std::move(probe))
    {
    }

    void
    run()
    {
        doRead();
    }

private:
    void
    doRead()
    {
        req_ = {};
        stream_.expires_after(kREAD_TIMEOUT);
        http::async_read(
            stream_, buffer_, req_, boost::beast::bind_front_handler(&HealthCheckSession::onRead, shared_from_this())
        );
    }

    void
    onRead(boost::beast::error_code ec, std::size_t)
    {
        if (ec == http::error::end_of_stream)
            return close();

        if (ec) {
            LOG(log_.debug()) << "Health check read failed: " << ec.message();
            return;
        }

        res_ = makeHealthCheckResponse(req_, probe_());
        http::async_write(
            stream_, res_, boost::beast::bind_front_handler(&HealthCheckSession::onWrite, shared_from_this())
        );
    }

    void
    onWrite(boost::beast::error_code ec, std::size_t)
    {
        if (ec) {
            LOG(log_.debug()) << "Health check write failed: " << ec.message();
            return;
        }

        if (not res_.keep_alive())
            return close();

        doRead();
    }

    void
    close()
    {
        boost::beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }
};

}  // namespace

http::response<http::string_body>
makeHealthCheckResponse(http::request<http::string_body> const& request, bool healthy)
{
    auto const target = std::string{request.target()};
    auto const isProbe = request.method() == http::verb::get and (target == "/" or target == "/readiness");

    auto status = http::status::not_found;
    std::string body = "not found";
    if (isProbe) {
        status = healthy ? http::status::ok : http::status::service_unavailable;
        body = healthy ? "ok" : "unhealthy";
    }

    http::response<http::string_body> response{status, request.version()};
    response.set(http::field::server, util::build::getIndexerFullVersionString());
    response.set(http::field::content_type, "text/plain");
    response.keep_alive(request.keep_alive());
    response.body() = std::move(body);
    response.prepare_payload();
    return response;
}

HealthCheckServer::HealthCheckServer(boost::asio::io_context& ioc, tcp::endpoint const& endpoint, HealthProbe probe)
    : ioc_(std::ref(ioc)), acceptor_(boost::asio::make_strand(ioc)), probe_(std::move(probe))
{
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec)
        throw std::runtime_error(fmt::format("Failed to open health check acceptor: {}", ec.message()));

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec)
        throw std::runtime_error(fmt::format("Failed to set reuse_address: {}", ec.message()));

    acceptor_.bind(endpoint, ec);
    if (ec) {
        LOG(log_.error()) << "Failed to bind to endpoint: " << endpoint << ". message: " << ec.message();
        throw std::runtime_error(
            fmt::format("Failed to bind to endpoint: {}:{}", endpoint.address().to_string(), endpoint.port())
        );
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        LOG(log_.error()) << "Failed to listen at endpoint: " << endpoint << ". message: " << ec.message();
        throw std::runtime_error(
            fmt::format("Failed to listen at endpoint: {}:{}", endpoint.address().to_string(), endpoint.port())
        );
    }
}

void
HealthCheckServer::run()
{
    LOG(log_.info()) << "Health check listening on port " << port();
    doAccept();
}

std::uint16_t
HealthCheckServer::port() const
{
    return acceptor_.local_endpoint().port();
}

void
HealthCheckServer::stop()
{
    boost::beast::error_code ec;
    acceptor_.close(ec);
}

void
HealthCheckServer::doAccept()
{
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_.get()),
        boost::beast::bind_front_handler(&HealthCheckServer::onAccept, shared_from_this())
    );
}

void
HealthCheckServer::onAccept(boost::beast::error_code ec, tcp::socket socket)
{
    if (ec == boost::asio::error::operation_aborted)
        return;

    if (!ec)
        std::make_shared<HealthCheckSession>(std::move(socket), probe_)->run();

    doAccept();
}

std::shared_ptr<HealthCheckServer>
makeHealthCheckServer(std::optional<std::uint16_t> port, boost::asio::io_context& ioc, HealthProbe probe)
{
    if (not port.has_value())
        return nullptr;

    auto server = std::make_shared<HealthCheckServer>(
        ioc, tcp::endpoint{boost::asio::ip::address_v4::any(), *port}, std::move(probe)
    );
    server->run();
    return server;
}

}  // namespace web
