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

#include "util/SignalsHandler.hpp"

#include "util/Assert.hpp"
#include "util/config/ConfigDefinition.hpp"
#include "util/log/Logger.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/system/error_code.hpp>

#include <chrono>
#include <csignal>
#include <functional>
#include <utility>

namespace util {

namespace impl {

class SignalsHandlerStatic {
    static SignalsHandler* handler_;

public:
    static void
    registerHandler(SignalsHandler& handler)
    {
        ASSERT(handler_ == nullptr, "There could be only one instance of SignalsHandler");
        handler_ = &handler;
    }

    static void
    resetHandler()
    {
        handler_ = nullptr;
    }

    static void
    handleSignal(int signal)
    {
        ASSERT(handler_ != nullptr, "SignalsHandler is not initialized");
        handler_->stopHandler_(signal);
    }

    static void
    handleSecondSignal(int signal)
    {
        ASSERT(handler_ != nullptr, "SignalsHandler is not initialized");
        handler_->secondSignalHandler_(signal);
    }
};

SignalsHandler* SignalsHandlerStatic::handler_ = nullptr;

}  // namespace impl

SignalsHandler::SignalsHandler(
    util::config::IndexerConfigDefinition const& config,
    std::function<void()> forceExitHandler
)
    : gracefulPeriod_(util::config::IndexerConfigDefinition::toMilliseconds(config.get<double>("graceful_period")))
    , work_(boost::asio::make_work_guard(ioc_))
    , timer_(ioc_)
    , thread_([this] { ioc_.run(); })
    , stopHandler_([this, forceExitHandler](int) mutable {
        LOG(LogService::info()) << "Got stop signal. Stopping indexer. Graceful period is "
                                << std::chrono::duration_cast<std::chrono::milliseconds>(gracefulPeriod_).count()
                                << " milliseconds.";
        setHandler(impl::SignalsHandlerStatic::handleSecondSignal);

        boost::asio::post(ioc_, [this, forceExitHandler = std::move(forceExitHandler)]() mutable {
            timer_.expires_after(gracefulPeriod_);
            timer_.async_wait([forceExitHandler = std::move(forceExitHandler)](boost::system::error_code const& ec) {
                if (not ec) {
                    LOG(LogService::warn()) << "Force exit at the end of graceful period.";
                    forceExitHandler();
                }
            });
        });
        stopSignal_();
    })
    , secondSignalHandler_([this, forceExitHandler = std::move(forceExitHandler)](int) {
        LOG(LogService::warn()) << "Force exit on second signal.";
        forceExitHandler();
        cancelTimer();
        setHandler();
    })
{
    impl::SignalsHandlerStatic::registerHandler(*this);
    setHandler(impl::SignalsHandlerStatic::handleSignal);
}

SignalsHandler::~SignalsHandler()
{
    cancelTimer();
    setHandler();
    work_.reset();
    ioc_.stop();
    if (thread_.joinable())
        thread_.join();

    impl::SignalsHandlerStatic::resetHandler();  // This is needed mostly for tests to reset static state
}

void
SignalsHandler::cancelTimer()
{
    boost::asio::post(ioc_, [this] { timer_.cancel(); });
}

void
SignalsHandler::setHandler(void (*handler)(int))
{
    for (int const signal : kHANDLED_SIGNALS)
        std::signal(signal, handler == nullptr ? SIG_DFL : handler);
}

}  // namespace util
