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

#include "util/LoggerFixtures.hpp"
#include "util/build/Build.hpp"
#include "web/HealthCheckServer.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address_v4.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

using namespace web;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

http::request<http::string_body>
makeRequest(http::verb method, std::string const& target)
{
    http::request<http::string_body> request{method, target, 11};
    request.set(http::field::host, "localhost");
    return request;
}

}  // namespace

TEST(HealthCheckResponseTest, HealthyRootAndReadiness)
{
    for (auto const* target : {"/", "/readiness"}) {
        auto const response = makeHealthCheckResponse(makeRequest(http::verb::get, target), true);
        EXPECT_EQ(response.result(), http::status::ok) << target;
        EXPECT_EQ(response.body(), "ok");
    }
}

TEST(HealthCheckResponseTest, UnhealthyIsUnavailable)
{
    auto const response = makeHealthCheckResponse(makeRequest(http::verb::get, "/readiness"), false);
    EXPECT_EQ(response.result(), http::status::service_unavailable);
    EXPECT_EQ(response.body(), "unhealthy");
}

TEST(HealthCheckResponseTest, UnknownTargetOrMethodIsNotFound)
{
    EXPECT_EQ(makeHealthCheckResponse(makeRequest(http::verb::get, "/metrics"), true).result(), http::status::not_found);
    EXPECT_EQ(makeHealthCheckResponse(makeRequest(http::verb::post, "/"), true).result(), http::status::not_found);
}

TEST(HealthCheckResponseTest, Headers)
{
    auto const response = makeHealthCheckResponse(makeRequest(http::verb::get, "/"), true);
    EXPECT_EQ(response[http::field::server], util::build::getIndexerFullVersionString());
    EXPECT_EQ(response[http::field::content_type], "text/plain");
    EXPECT_EQ(response[http::field::content_length], "2");
    EXPECT_TRUE(response.keep_alive());
}

struct HealthCheckServerTest : NoLoggerFixture {
    boost::asio::io_context ioc_;
    std::atomic_bool healthy_ = true;
    std::shared_ptr<HealthCheckServer> server_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
    std::thread runner_;

    HealthCheckServerTest()
    {
        server_ = std::make_shared<HealthCheckServer>(
            ioc_, tcp::endpoint{boost::asio::ip::address_v4::loopback(), 0}, [this] { return healthy_.load(); }
        );
        server_->run();
        work_.emplace(ioc_.get_executor());
        runner_ = std::thread([this] { ioc_.run(); });
    }

    ~HealthCheckServerTest() override
    {
        work_.reset();
        ioc_.stop();
        runner_.join();
        server_->stop();
    }

    http::response<http::string_body>
    get(std::string const& target) const
    {
        boost::asio::io_context ioc;
        boost::beast::tcp_stream stream{ioc};
        stream.connect(tcp::endpoint{boost::asio::ip::address_v4::loopback(), server_->port()});

        auto request = makeRequest(http::verb::get, target);
        request.keep_alive(false);
        http::write(stream, request);

        boost::beast::flat_buffer buffer;
        http::response<http::string_body> response;
        http::read(stream, buffer, response);

        boost::beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        return response;
    }
};

TEST_F(HealthCheckServerTest, ListensOnAnEphemeralPort)
{
    EXPECT_NE(server_->port(), 0);
}

TEST_F(HealthCheckServerTest, ReportsTheProbe)
{
    auto response = get("/readiness");
    EXPECT_EQ(response.result(), http::status::ok);
    EXPECT_EQ(response.body(), "ok");

    healthy_ = false;
    response = get("/");
    EXPECT_EQ(response.result(), http::status::service_unavailable);
    EXPECT_EQ(response.body(), "unhealthy");
}

TEST_F(HealthCheckServerTest, ServesManyConnections)
{
    for (int i = 0; i < 5; ++i)
        EXPECT_EQ(get("/").result(), http::status::ok);

    EXPECT_EQ(get("/nothing").result(), http::status::not_found);
}

TEST_F(HealthCheckServerTest, BindingATakenPortThrows)
{
    boost::asio::io_context ioc;
    EXPECT_THROW(
        HealthCheckServer(ioc, tcp::endpoint{boost::asio::ip::address_v4::loopback(), server_->port()}, [] {
            return true;
        }),
        std::runtime_error
    );
}

TEST(MakeHealthCheckServerTest, NoPortNoServer)
{
    boost::asio::io_context ioc;
    EXPECT_EQ(makeHealthCheckServer(std::nullopt, ioc, [] { return true; }), nullptr);
}
