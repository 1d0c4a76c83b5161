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

#include "data/Types.hpp"
#include "etl/Errors.hpp"
#include "etl/ExtractionEngine.hpp"
#include "etl/Models.hpp"
#include "etl/PipelineCoordinator.hpp"
#include "etl/PipelineSettings.hpp"
#include "etl/ProcessorRunSpec.hpp"
#include "util/FakeSource.hpp"
#include "util/FakeStore.hpp"
#include "util/LoggerFixtures.hpp"
#include "util/MockExtractor.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

using namespace etl;
using namespace std::chrono_literals;

namespace {

constexpr auto kPROCESSOR = "test_processor";
constexpr auto kALIAS = "test_backfill";

ProcessorRunSpec
tailing(Version start, std::optional<Version> end)
{
    return ProcessorRunSpec{
        .mode = ProcessorRunSpec::Mode::Tailing,
        .startingVersion = start,
        .endingVersion = end,
        .overwriteCheckpoint = false,
        .backfillAlias = {}
    };
}

ProcessorRunSpec
backfill(Version start, std::optional<Version> end)
{
    return ProcessorRunSpec{
        .mode = ProcessorRunSpec::Mode::Backfill,
        .startingVersion = start,
        .endingVersion = end,
        .overwriteCheckpoint = false,
        .backfillAlias = kALIAS
    };
}

}  // namespace

struct PipelineCoordinatorTest : NoLoggerFixture {
    std::shared_ptr<FakeSource> source_ = std::make_shared<FakeSource>();
    std::shared_ptr<FakeStore> store_ = std::make_shared<FakeStore>();
    std::shared_ptr<VersionExtractor> extractor_ = std::make_shared<VersionExtractor>();

    PipelineSettings settings_ = [] {
        PipelineSettings settings;
        settings.channelSize = 8;
        settings.maxBufferSize = 250;  // a handful of transactions per batch
        settings.uploadInterval = 10s;
        settings.extractorThreads = 3;
        settings.maxReconnects = 2;
        settings.reconnectDelay = 1ms;
        settings.reconnectMaxDelay = 2ms;
        settings.writeRetries = 2;
        settings.retryDelay = 1ms;
        settings.retryMaxDelay = 2ms;
        return settings;
    }();

    std::unique_ptr<PipelineCoordinator>
    makeCoordinator(ProcessorRunSpec const& runSpec)
    {
        auto engine = std::make_shared<ExtractionEngine const>(
            std::vector<std::shared_ptr<ExtractorInterface const>>{extractor_},
            settings_.tablesToWrite,
            settings_.failurePolicy
        );
        return std::make_unique<PipelineCoordinator>(
            settings_, runSpec, kPROCESSOR, source_, std::move(engine), store_, store_
        );
    }

    PipelineStatus
    runToCompletion(ProcessorRunSpec const& runSpec)
    {
        auto coordinator = makeCoordinator(runSpec);
        auto status = coordinator->run();
        EXPECT_EQ(coordinator->state(), PipelineCoordinator::State::Stopped);
        EXPECT_EQ(coordinator->isHealthy(), status.isSuccess());
        return status;
    }

    std::optional<std::int64_t>
    latestVersionRow() const
    {
        auto const rows = store_->rows("latest_version");
        if (rows.empty())
            return std::nullopt;
        return std::get<std::int64_t>(*rows.begin()->second.record.find("version"));
    }

    void
    expectContiguousCommits(Version first, Version last) const
    {
        auto const commits = store_->commits();
        ASSERT_FALSE(commits.empty());
        EXPECT_EQ(commits.front().startVersion, first);
        EXPECT_EQ(commits.back().endVersion, last);
        for (std::size_t i = 1; i < commits.size(); ++i)
            EXPECT_EQ(commits[i].startVersion, commits[i - 1].endVersion + 1);
    }
};

TEST_F(PipelineCoordinatorTest, BoundedTailingRunCommitsEveryVersion)
{
    auto const status = runToCompletion(tailing(0, 29));

    ASSERT_TRUE(status.isSuccess()) << status.message;
    EXPECT_FALSE(status.error.has_value());
    EXPECT_EQ(status.lastCommittedVersion, std::optional<Version>{29});
    EXPECT_EQ(store_->processorCheckpoint(kPROCESSOR), std::optional<Version>{29});
    EXPECT_EQ(store_->rowCount("versions"), 30);
    EXPECT_EQ(latestVersionRow(), 29);
    expectContiguousCommits(0, 29);
    EXPECT_GT(store_->commits().size(), 1);
    EXPECT_EQ(store_->fetchChainId().value(), std::optional<std::uint64_t>{1});
}

TEST_F(PipelineCoordinatorTest, ResumesAfterCheckpoint)
{
    store_->setProcessorCheckpoint(kPROCESSOR, 9);

    auto const status = runToCompletion(tailing(0, 19));

    ASSERT_TRUE(status.isSuccess()) << status.message;
    ASSERT_FALSE(source_->fetchStarts().empty());
    EXPECT_EQ(source_->fetchStarts().front(), 10);
    EXPECT_EQ(store_->rowCount("versions"), 10);
    expectContiguousCommits(10, 19);

    using Resume = std::pair<Version, std::optional<Version>>;
    EXPECT_EQ(store_->resumes(), (std::vector<Resume>{{10, 19}}));
}

TEST_F(PipelineCoordinatorTest, CheckpointPastTheEndIsNothingToDo)
{
    store_->setProcessorCheckpoint(kPROCESSOR, 19);

    auto const status = runToCompletion(tailing(0, 19));

    EXPECT_TRUE(status.isSuccess());
    EXPECT_EQ(status.lastCommittedVersion, std::optional<Version>{19});
    EXPECT_TRUE(source_->fetchStarts().empty());
    EXPECT_TRUE(store_->commits().empty());
}

TEST_F(PipelineCoordinatorTest, ReplayIsIdempotent)
{
    ASSERT_TRUE(runToCompletion(tailing(0, 19)).isSuccess());

    auto replay = tailing(0, 19);
    replay.overwriteCheckpoint = true;
    ASSERT_TRUE(runToCompletion(replay).isSuccess());

    EXPECT_EQ(source_->fetchStarts(), (std::vector<Version>{0, 0}));
    EXPECT_EQ(store_->rowCount("versions"), 20);
    EXPECT_EQ(store_->rowCount("latest_version"), 1);
    EXPECT_EQ(latestVersionRow(), 19);
    EXPECT_EQ(store_->processorCheckpoint(kPROCESSOR), std::optional<Version>{19});
}

TEST_F(PipelineCoordinatorTest, OverwriteStartsAtConfiguredVersionWithoutMovingCheckpointBack)
{
    store_->setProcessorCheckpoint(kPROCESSOR, 15);

    auto spec = tailing(5, 19);
    spec.overwriteCheckpoint = true;
    auto const status = runToCompletion(spec);

    ASSERT_TRUE(status.isSuccess()) << status.message;
    EXPECT_EQ(source_->fetchStarts().front(), 5);
    EXPECT_EQ(store_->processorCheckpoint(kPROCESSOR), std::optional<Version>{19});
    EXPECT_EQ(store_->rowCount("versions"), 15);
}

TEST_F(PipelineCoordinatorTest, SinkFailureIsRetried)
{
    store_->failNextCommits(2);

    auto const status = runToCompletion(tailing(0, 9));

    ASSERT_TRUE(status.isSuccess()) << status.message;
    EXPECT_EQ(store_->processorCheckpoint(kPROCESSOR), std::optional<Version>{9});
    EXPECT_EQ(store_->commitAttempts(), store_->commits().size() + 2);
    EXPECT_EQ(store_->rowCount("versions"), 10);
    EXPECT_EQ(store_->rowCount("latest_version"), 1);
    expectContiguousCommits(0, 9);
}

TEST_F(PipelineCoordinatorTest, SinkExhaustedLeavesCheckpointUntouched)
{
    store_->failNextCommits(1000);

    auto const status = runToCompletion(tailing(0, 9));

    ASSERT_FALSE(status.isSuccess());
    EXPECT_EQ(status.error, PipelineErrorCode::SinkExhausted);
    EXPECT_FALSE(status.lastCommittedVersion.has_value());
    EXPECT_FALSE(store_->processorCheckpoint(kPROCESSOR).has_value());
    EXPECT_EQ(store_->rowCount("versions"), 0);
    EXPECT_EQ(store_->commitAttempts(), settings_.writeRetries + 1);
}

TEST_F(PipelineCoordinatorTest, FatalExtractionPolicyStopsBeforeTheFailingVersion)
{
    settings_.failurePolicy = ExtractionFailurePolicy::Fatal;
    extractor_->failOn = {12};

    auto const status = runToCompletion(tailing(0, 29));

    ASSERT_FALSE(status.isSuccess());
    EXPECT_EQ(status.error, PipelineErrorCode::ExtractionError);
    EXPECT_THAT(status.message, testing::HasSubstr("version 12"));

    auto const checkpoint = store_->processorCheckpoint(kPROCESSOR);
    ASSERT_TRUE(checkpoint.has_value());
    EXPECT_LT(*checkpoint, 12);
    EXPECT_EQ(status.lastCommittedVersion, checkpoint);
    EXPECT_EQ(store_->rowCount("versions"), *checkpoint + 1);
}

TEST_F(PipelineCoordinatorTest, SkipPolicyAdvancesPastTheFailingVersion)
{
    extractor_->failOn = {12};

    auto const status = runToCompletion(tailing(0, 29));

    ASSERT_TRUE(status.isSuccess()) << status.message;
    EXPECT_EQ(store_->processorCheckpoint(kPROCESSOR), std::optional<Version>{29});
    EXPECT_EQ(store_->rowCount("versions"), 29);
    expectContiguousCommits(0, 29);
}

TEST_F(PipelineCoordinatorTest, TablesToWriteLimitsTheRows)
{
    settings_.tablesToWrite = {"latest_version"};

    ASSERT_TRUE(runToCompletion(tailing(0, 9)).isSuccess());
    EXPECT_EQ(store_->rowCount("versions"), 0);
    EXPECT_EQ(store_->rowCount("latest_version"), 1);
    EXPECT_EQ(store_->processorCheckpoint(kPROCESSOR), std::optional<Version>{9});
}

TEST_F(PipelineCoordinatorTest, SourceFailureKeepsWhatWasFetched)
{
    source_->state().fatalBefore = {6};

    auto const status = runToCompletion(tailing(0, 29));

    ASSERT_FALSE(status.isSuccess());
    EXPECT_EQ(status.error, PipelineErrorCode::SourceFailure);
    EXPECT_EQ(store_->processorCheckpoint(kPROCESSOR), std::optional<Version>{5});
    EXPECT_EQ(status.lastCommittedVersion, std::optional<Version>{5});
}

TEST_F(PipelineCoordinatorTest, GapIsAnOrderingViolation)
{
    source_->state().skipped = {7};

    auto const status = runToCompletion(tailing(0, 29));

    ASSERT_FALSE(status.isSuccess());
    EXPECT_EQ(status.error, PipelineErrorCode::OrderingViolation);
    EXPECT_EQ(store_->processorCheckpoint(kPROCESSOR), std::optional<Version>{6});
}

TEST_F(PipelineCoordinatorTest, TransportErrorsAreResumed)
{
    source_->state().breakBefore = {4, 11, 17};

    auto const status = runToCompletion(tailing(0, 19));

    ASSERT_TRUE(status.isSuccess()) << status.message;
    EXPECT_EQ(source_->fetchStarts(), (std::vector<Version>{0, 4, 11, 17}));
    EXPECT_EQ(store_->rowCount("versions"), 20);
}

TEST_F(PipelineCoordinatorTest, RangeBeyondHeadIsUnavailable)
{
    source_->state().head = 50;

    auto const status = runToCompletion(tailing(100, 120));

    ASSERT_FALSE(status.isSuccess());
    EXPECT_EQ(status.error, PipelineErrorCode::RangeUnavailable);
}

TEST_F(PipelineCoordinatorTest, ChainIdMismatch)
{
    store_->setChainId(2);

    auto const status = runToCompletion(tailing(0, 9));

    ASSERT_FALSE(status.isSuccess());
    EXPECT_EQ(status.error, PipelineErrorCode::ChainIdMismatch);
    EXPECT_TRUE(source_->fetchStarts().empty());
    EXPECT_TRUE(store_->commits().empty());
}

TEST_F(PipelineCoordinatorTest, TransientChainIdErrorsAreRetried)
{
    source_->state().chainIdErrors[0] = 2;

    auto const status = runToCompletion(tailing(0, 9));

    ASSERT_TRUE(status.isSuccess()) << status.message;
    EXPECT_EQ(store_->fetchChainId().value(), std::optional<std::uint64_t>{1});
}

TEST_F(PipelineCoordinatorTest, ChainIdUnreachable)
{
    source_->state().chainIdErrors[0] = 100;

    auto const status = runToCompletion(tailing(0, 9));

    ASSERT_FALSE(status.isSuccess());
    EXPECT_EQ(status.error, PipelineErrorCode::SourceExhausted);
}

TEST_F(PipelineCoordinatorTest, BackfillWritesItsOwnCheckpoint)
{
    auto const status = runToCompletion(backfill(0, 19));

    ASSERT_TRUE(status.isSuccess()) << status.message;
    EXPECT_FALSE(store_->processorCheckpoint(kPROCESSOR).has_value());

    auto const stored = store_->backfillStatus(kALIAS);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, data::BackfillStatus::Complete);
    EXPECT_EQ(stored->lastSuccessVersion, 19);
    EXPECT_EQ(stored->backfillStartVersion, 0);
    EXPECT_EQ(stored->backfillEndVersion, std::optional<Version>{19});

    auto const commits = store_->commits();
    ASSERT_GT(commits.size(), 1);
    for (std::size_t i = 0; i + 1 < commits.size(); ++i) {
        ASSERT_TRUE(commits[i].checkpoint.backfill.has_value());
        EXPECT_EQ(commits[i].checkpoint.backfill->status, data::BackfillStatus::InProgress);
        EXPECT_EQ(commits[i].checkpoint.name, kALIAS);
    }
}

TEST_F(PipelineCoordinatorTest, CompleteBackfillDoesNothing)
{
    store_->setBackfillCheckpoint(kALIAS, 19, data::BackfillStatus::Complete);

    auto const status = runToCompletion(backfill(0, 19));

    EXPECT_TRUE(status.isSuccess());
    EXPECT_FALSE(status.error.has_value());
    EXPECT_EQ(status.lastCommittedVersion, std::optional<Version>{19});
    EXPECT_TRUE(source_->fetchStarts().empty());
}

TEST_F(PipelineCoordinatorTest, BackfillResumesAfterItsCheckpoint)
{
    store_->setBackfillCheckpoint(kALIAS, 10, data::BackfillStatus::InProgress);

    auto const status = runToCompletion(backfill(0, 19));

    ASSERT_TRUE(status.isSuccess()) << status.message;
    EXPECT_EQ(source_->fetchStarts().front(), 11);
    EXPECT_EQ(store_->backfillStatus(kALIAS)->status, data::BackfillStatus::Complete);
}

TEST_F(PipelineCoordinatorTest, BackfillOverwriteStartsOver)
{
    store_->setBackfillCheckpoint(kALIAS, 10, data::BackfillStatus::Complete);

    auto spec = backfill(0, 19);
    spec.overwriteCheckpoint = true;
    auto const status = runToCompletion(spec);

    ASSERT_TRUE(status.isSuccess()) << status.message;
    EXPECT_EQ(source_->fetchStarts().front(), 0);
    EXPECT_EQ(store_->rowCount("versions"), 20);
    EXPECT_EQ(store_->backfillStatus(kALIAS)->lastSuccessVersion, 19);
}

TEST_F(PipelineCoordinatorTest, BackfillEndsAtTailingCheckpoint)
{
    store_->setProcessorCheckpoint(kPROCESSOR, 14);

    auto const status = runToCompletion(backfill(0, std::nullopt));

    ASSERT_TRUE(status.isSuccess()) << status.message;
    auto const stored = store_->backfillStatus(kALIAS);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->lastSuccessVersion, 14);
    EXPECT_EQ(stored->status, data::BackfillStatus::Complete);
    EXPECT_EQ(store_->processorCheckpoint(kPROCESSOR), std::optional<Version>{14});
}

TEST_F(PipelineCoordinatorTest, BackfillWithoutAnyEnd)
{
    auto const status = runToCompletion(backfill(0, std::nullopt));

    ASSERT_FALSE(status.isSuccess());
    EXPECT_EQ(status.error, PipelineErrorCode::RangeUnavailable);
    EXPECT_TRUE(source_->fetchStarts().empty());
}

TEST_F(PipelineCoordinatorTest, StopDrainsAndReportsCancelled)
{
    source_->state().head = 9;
    source_->state().waitAtHead = true;
    settings_.uploadInterval = 10ms;

    auto coordinator = makeCoordinator(tailing(0, std::nullopt));
    auto result = std::async(std::launch::async, [&coordinator]() { return coordinator->run(); });

    auto const deadline = std::chrono::steady_clock::now() + 10s;
    while (store_->processorCheckpoint(kPROCESSOR) != std::optional<Version>{9} and
           std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(5ms);

    coordinator->stop();
    auto const status = result.get();

    EXPECT_EQ(status.error, PipelineErrorCode::Cancelled);
    EXPECT_TRUE(status.isSuccess());
    EXPECT_EQ(status.lastCommittedVersion, std::optional<Version>{9});
    EXPECT_TRUE(coordinator->isHealthy());
    EXPECT_EQ(coordinator->state(), PipelineCoordinator::State::Stopped);
}

TEST_F(PipelineCoordinatorTest, StopBeforeRun)
{
    auto coordinator = makeCoordinator(tailing(0, 9));
    coordinator->stop();

    auto const status = coordinator->run();
    EXPECT_EQ(status.error, PipelineErrorCode::Cancelled);
    EXPECT_TRUE(source_->fetchStarts().empty());
}

TEST_F(PipelineCoordinatorTest, BackpressureBoundsTransactionsInFlight)
{
    settings_.channelSize = 4;
    settings_.maxBufferSize = 100'000;

    auto coordinator = makeCoordinator(tailing(0, 199));
    auto const status = coordinator->run();

    ASSERT_TRUE(status.isSuccess()) << status.message;
    EXPECT_LE(coordinator->inFlightPeak(), 4);
    EXPECT_GT(coordinator->inFlightPeak(), 0);
    EXPECT_EQ(store_->rowCount("versions"), 200);
}

TEST_F(PipelineCoordinatorTest, UploadIntervalFlushesOneBatch)
{
    source_->state().head = 12;
    source_->state().waitAtHead = true;
    settings_.maxBufferSize = 100'000;
    settings_.uploadInterval = 300ms;

    auto coordinator = makeCoordinator(tailing(10, std::nullopt));
    auto result = std::async(std::launch::async, [&coordinator]() { return coordinator->run(); });

    auto const deadline = std::chrono::steady_clock::now() + 10s;
    while (store_->processorCheckpoint(kPROCESSOR) != std::optional<Version>{12} and
           std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(5ms);

    coordinator->stop();
    EXPECT_TRUE(result.get().isSuccess());

    // nothing but the interval could have triggered this commit
    auto const commits = store_->commits();
    ASSERT_EQ(commits.size(), 1);
    EXPECT_EQ(commits.front().startVersion, 10);
    EXPECT_EQ(commits.front().endVersion, 12);
    EXPECT_EQ(store_->rowCount("versions"), 3);
    EXPECT_EQ(store_->processorCheckpoint(kPROCESSOR), std::optional<Version>{12});
}

TEST_F(PipelineCoordinatorTest, RestartAfterCrashMatchesAnUninterruptedRun)
{
    ASSERT_TRUE(runToCompletion(tailing(0, 29)).isSuccess());
    auto const uninterrupted = store_;

    store_ = std::make_shared<FakeStore>();
    store_->crashOnNextCommit();

    auto const crashed = runToCompletion(tailing(0, 29));
    ASSERT_FALSE(crashed.isSuccess());
    EXPECT_EQ(crashed.error, PipelineErrorCode::SinkExhausted);
    EXPECT_FALSE(store_->processorCheckpoint(kPROCESSOR).has_value());
    EXPECT_GT(store_->rowCount("versions"), 0);

    store_->restart();
    settings_.maxBufferSize = 120;  // the second run cuts its batches differently

    ASSERT_TRUE(runToCompletion(tailing(0, 29)).isSuccess());

    using Resume = std::pair<Version, std::optional<Version>>;
    EXPECT_EQ(store_->resumes(), (std::vector<Resume>{{0, 29}, {0, 29}}));
    EXPECT_EQ(store_->rowCount("versions"), uninterrupted->rowCount("versions"));
    EXPECT_EQ(store_->rowCount("latest_version"), uninterrupted->rowCount("latest_version"));
    EXPECT_EQ(latestVersionRow(), 29);
    EXPECT_EQ(store_->processorCheckpoint(kPROCESSOR), uninterrupted->processorCheckpoint(kPROCESSOR));
    expectContiguousCommits(0, 29);
}
