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

#include "etl/ExtractionEngine.hpp"
#include "etl/ExtractorInterface.hpp"
#include "etl/Models.hpp"
#include "util/LoggerFixtures.hpp"
#include "util/MockExtractor.hpp"
#include "util/TestTransactions.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <expected>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace etl;

namespace {

std::vector<std::string>
tablesOf(ExtractedTransaction const& extracted)
{
    std::vector<std::string> tables;
    for (auto const& record : extracted.records)
        tables.push_back(record.table);
    return tables;
}

}  // namespace

struct ExtractionEngineTest : LoggerFixture {
    std::shared_ptr<VersionExtractor> versions_ = std::make_shared<VersionExtractor>();
    std::shared_ptr<testing::StrictMock<MockExtractor>> mock_ = std::make_shared<testing::StrictMock<MockExtractor>>();
    std::vector<TableSpec> mockTables_{TableSpec{.name = "mock", .kind = MutationKind::InsertImmutable, .primaryKey = {"id"}, .columns = {}}};

    ExtractionEngineTest()
    {
        ON_CALL(*mock_, name).WillByDefault(testing::Return("mock"));
        ON_CALL(*mock_, tables).WillByDefault(testing::ReturnRef(mockTables_));
        EXPECT_CALL(*mock_, name).Times(testing::AnyNumber());
        EXPECT_CALL(*mock_, tables).Times(testing::AnyNumber());
    }

    ExtractionEngine
    makeEngine(ExtractionFailurePolicy policy, std::vector<std::string> const& tablesToWrite = {})
    {
        return ExtractionEngine{{versions_, mock_}, tablesToWrite, policy};
    }
};

TEST_F(ExtractionEngineTest, RecordsOfEveryExtractorInOrder)
{
    auto engine = makeEngine(ExtractionFailurePolicy::Skip);
    EXPECT_CALL(*mock_, extract).WillOnce(testing::Return(std::vector<ExtractedRecord>{
        ExtractedRecord{.table = "mock", .primaryKey = {"id"}, .kind = MutationKind::InsertImmutable, .fields = {}, .version = 4}
    }));

    auto const result = engine.extract(tests::util::makeTestTransaction(4));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->version, 4);
    EXPECT_EQ(tablesOf(*result), (std::vector<std::string>{"versions", "latest_version", "mock"}));
    EXPECT_EQ(engine.skippedCount(), 0);
}

TEST_F(ExtractionEngineTest, SkipPolicyDropsOnlyTheFailingExtractor)
{
    auto engine = makeEngine(ExtractionFailurePolicy::Skip);
    EXPECT_CALL(*mock_, extract).WillOnce(testing::Return(std::unexpected{std::string{"bad payload"}}));

    auto const result = engine.extract(tests::util::makeTestTransaction(4));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(tablesOf(*result), (std::vector<std::string>{"versions", "latest_version"}));
    EXPECT_EQ(engine.skippedCount(), 1);
    EXPECT_THAT(getLoggerString(), testing::HasSubstr("Extraction:WRN Skipping records of extractor mock for version 4"));
}

TEST_F(ExtractionEngineTest, FatalPolicyReportsTheFailure)
{
    versions_->failOn = {7};
    auto engine = makeEngine(ExtractionFailurePolicy::Fatal);

    auto const result = engine.extract(tests::util::makeTestTransaction(7));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().version, 7);
    EXPECT_EQ(result.error().extractor, "versions");
    EXPECT_EQ(result.error().message, "undecodable payload");
    EXPECT_EQ(engine.skippedCount(), 0);
}

TEST_F(ExtractionEngineTest, TablesToWriteFiltersRecords)
{
    auto engine = makeEngine(ExtractionFailurePolicy::Skip, {"latest_version"});
    EXPECT_CALL(*mock_, extract).WillOnce(testing::Return(std::vector<ExtractedRecord>{}));

    auto const result = engine.extract(tests::util::makeTestTransaction(2));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(tablesOf(*result), (std::vector<std::string>{"latest_version"}));

    auto const tables = engine.tables();
    ASSERT_EQ(tables.size(), 1);
    EXPECT_EQ(tables.front().name, "latest_version");
}

TEST_F(ExtractionEngineTest, EveryTableWhenNoFilter)
{
    auto const engine = makeEngine(ExtractionFailurePolicy::Skip);
    EXPECT_EQ(engine.tables().size(), 3);
}

TEST_F(ExtractionEngineTest, UnknownTableToWriteThrows)
{
    EXPECT_THROW(makeEngine(ExtractionFailurePolicy::Skip, {"versions", "nope"}), std::runtime_error);
}

TEST_F(ExtractionEngineTest, TransactionWithoutRecords)
{
    auto engine = ExtractionEngine{{mock_}, {}, ExtractionFailurePolicy::Fatal};
    EXPECT_CALL(*mock_, extract).WillOnce(testing::Return(std::vector<ExtractedRecord>{}));

    auto const tx = tests::util::makeTestTransaction(11);
    auto const result = engine.extract(tx);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->records.empty());
    EXPECT_EQ(result->timestamp, tx.timestamp);
}
