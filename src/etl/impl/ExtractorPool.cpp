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

#include "etl/impl/ExtractorPool.hpp"

#include "etl/ETLHelpers.hpp"
#include "etl/ExtractionEngine.hpp"
#include "etl/Models.hpp"
#include "util/log/Logger.hpp"

#include <boost/asio/post.hpp>

#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <utility>

namespace etl::impl {

ExtractorPool::ExtractorPool(
    ExtractionEngine const& engine,
    ThreadSafeQueue<Transaction>& in,
    OutputQueueType& out,
    std::size_t numThreads
)
    : engine_{engine}, in_{in}, out_{out}, workers_{numThreads}
{
    dispatcher_ = std::thread([this]() { dispatch(); });
}

ExtractorPool::~ExtractorPool()
{
    if (dispatcher_.joinable())
        dispatcher_.join();
    workers_.join();
}

void
ExtractorPool::dispatch()
{
    std::size_t dispatched = 0;

    while (auto transaction = in_.get().pop()) {
        auto promise = std::make_shared<std::promise<ResultType>>();
        auto future = promise->get_future();

        boost::asio::post(
            workers_,
            [this, promise = std::move(promise), transaction = std::move(*transaction)]() {
                try {
                    promise->set_value(engine_.get().extract(transaction));
                } catch (...) {
                    promise->set_exception(std::current_exception());
                }
            }
        );

        if (not out_.get().push(std::move(future))) {
            LOG(log_.debug()) << "Output closed; stopping dispatch";
            break;
        }
        ++dispatched;
    }

    LOG(log_.debug()) << "Extraction dispatch finished after " << dispatched << " transactions";
    out_.get().close();
}

}  // namespace etl::impl
