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
#include "data/parquet/ParquetSink.hpp"
#include "etl/Models.hpp"
#include "util/FakeStore.hpp"
#include "util/LoggerFixtures.hpp"

#include <arrow/filesystem/filesystem.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <parquet/file_reader.h>
#include <parquet/metadata.h>
#include <parquet/schema.h>

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <optional>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

using namespace data;
using namespace data::parquet;
using testing::_;
using testing::Field;
using testing::Return;
using testing::StrictMock;

namespace {

etl::TableSpec const kVERSIONS{
    .name = "versions",
    .kind = etl::MutationKind::InsertImmutable,
    .primaryKey = {"version"},
    .columns = {{.name = "version", .type = etl::ColumnType::Integer}, {.name = "success", .type = etl::ColumnType::Boolean}}
};

etl::TableSpec const kLATEST{
    .name = "latest_version",
    .kind = etl::MutationKind::UpsertCurrent,
    .primaryKey = {"id"},
    .columns = {{.name = "id", .type = etl::ColumnType::Text}, {.name = "version", .type = etl::ColumnType::Integer}}
};

etl::ExtractedRecord
makeVersionRecord(etl::Version version)
{
    return etl::ExtractedRecord{
        .table = "versions",
        .primaryKey = {"version"},
        .kind = etl::MutationKind::InsertImmutable,
        .fields = {{.name = "version", .value = static_cast<std::int64_t>(version)}, {.name = "success", .value = true}},
        .version = version
    };
}

etl::Batch
makeBatch(etl::Version start, etl::Version end)
{
    etl::Batch batch{.startVersion = start, .endVersion = end, .lastTransactionTimestamp = etl::Timestamp{}};
    for (auto v = start; v <= end; ++v)
        batch.tables["versions"].push_back(makeVersionRecord(v));

    batch.tables["latest_version"].push_back(etl::ExtractedRecord{
        .table = "latest_version",
        .primaryKey = {"id"},
        .kind = etl::MutationKind::UpsertCurrent,
        .fields = {{.name = "id", .value = std::string{"latest"}}, {.name = "version", .value = static_cast<std::int64_t>(end)}},
        .version = end
    });
    return batch;
}

}  // namespace

struct ParquetSinkTest : NoLoggerFixture {
    std::filesystem::path const dir_ = std::filesystem::temp_directory_path() /
        ("parquet_sink_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    std::shared_ptr<StrictMock<MockCheckpointStore>> checkpoints_ = std::make_shared<StrictMock<MockCheckpointStore>>();

    CheckpointUpdate const checkpoint_{.name = "parquet_processor", .version = 0};

    ParquetSinkTest()
    {
        std::filesystem::create_directories(dir_);
    }

    ~ParquetSinkTest() override
    {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    ParquetSink
    makeSink()
    {
        auto location = resolveLocation(dir_.string(), "bucket_root");
        EXPECT_TRUE(location.has_value());
        return ParquetSink{std::move(location).value(), {kVERSIONS, kLATEST}, checkpoints_};
    }

    static std::int64_t
    rowCount(std::string const& path)
    {
        auto reader = ::parquet::ParquetFileReader::OpenFile(path);
        return reader->metadata()->num_rows();
    }

    std::int64_t
    tableRowCount(std::string const& table) const
    {
        std::int64_t rows = 0;
        for (auto const& entry : std::filesystem::directory_iterator(dir_ / "bucket_root" / table)) {
            if (entry.path().extension() == ".parquet")
                rows += rowCount(entry.path().string());
        }
        return rows;
    }

    void
    touch(std::string const& table, std::string const& fileName) const
    {
        std::filesystem::create_directories(dir_ / "bucket_root" / table);
        std::ofstream{dir_ / "bucket_root" / table / fileName} << "partial";
    }

    bool
    exists(std::string const& table, std::string const& fileName) const
    {
        return std::filesystem::exists(dir_ / "bucket_root" / table / fileName);
    }

    static std::vector<std::string>
    columnNames(std::string const& path)
    {
        auto reader = ::parquet::ParquetFileReader::OpenFile(path);
        auto const* schema = reader->metadata()->schema();

        std::vector<std::string> names;
        for (int i = 0; i < schema->num_columns(); ++i)
            names.push_back(schema->Column(i)->name());
        return names;
    }
};

TEST_F(ParquetSinkTest, ResolveLocalPath)
{
    auto const location = resolveLocation(dir_.string() + "/", "/some/root/");
    ASSERT_TRUE(location.has_value());
    EXPECT_EQ(location->root, dir_.string() + "/some/root");
    EXPECT_EQ(location->fs->type_name(), "local");
}

TEST_F(ParquetSinkTest, ResolveWithoutRoot)
{
    auto const location = resolveLocation(dir_.string(), "");
    ASSERT_TRUE(location.has_value());
    EXPECT_EQ(location->root, dir_.string());
}

TEST_F(ParquetSinkTest, UnsupportedScheme)
{
    auto const location = resolveLocation("unknown-scheme://bucket", "root");
    ASSERT_FALSE(location.has_value());
    EXPECT_EQ(location.error().code, SinkError::Code::Io);
    EXPECT_THAT(location.error().message, testing::HasSubstr("unknown-scheme://bucket"));
}

TEST_F(ParquetSinkTest, FilePathNamesTheVersionRange)
{
    auto sink = makeSink();
    EXPECT_EQ(sink.filePath("versions", makeBatch(3, 7)), dir_.string() + "/bucket_root/versions/3_7.parquet");
}

TEST_F(ParquetSinkTest, CommitWritesOneFilePerTableThenTheCheckpoint)
{
    auto sink = makeSink();
    auto const batch = makeBatch(10, 14);

    EXPECT_CALL(*checkpoints_, writeCheckpoint(Field(&CheckpointUpdate::name, "parquet_processor")))
        .WillOnce(Return(std::expected<void, SinkError>{}));

    ASSERT_TRUE(sink.commit(batch, checkpoint_).has_value());

    auto const versions = sink.filePath("versions", batch);
    auto const latest = sink.filePath("latest_version", batch);
    ASSERT_TRUE(std::filesystem::exists(versions));
    ASSERT_TRUE(std::filesystem::exists(latest));
    EXPECT_FALSE(std::filesystem::exists(versions + ".tmp"));

    EXPECT_EQ(rowCount(versions), 5);
    EXPECT_EQ(rowCount(latest), 1);
    EXPECT_EQ(columnNames(versions), (std::vector<std::string>{"version", "success"}));
    EXPECT_EQ(
        columnNames(latest), (std::vector<std::string>{"id", "version", "last_transaction_version", "is_deleted"})
    );
}

TEST_F(ParquetSinkTest, ReplayReplacesTheFiles)
{
    auto sink = makeSink();
    auto const batch = makeBatch(1, 2);

    EXPECT_CALL(*checkpoints_, writeCheckpoint(_)).Times(2).WillRepeatedly(Return(std::expected<void, SinkError>{}));

    ASSERT_TRUE(sink.commit(batch, checkpoint_).has_value());
    ASSERT_TRUE(sink.commit(batch, checkpoint_).has_value());

    EXPECT_EQ(rowCount(sink.filePath("versions", batch)), 2);
}

TEST_F(ParquetSinkTest, EmptyBatchOnlyAdvancesTheCheckpoint)
{
    auto sink = makeSink();
    etl::Batch const batch{.startVersion = 4, .endVersion = 9};

    EXPECT_CALL(*checkpoints_, writeCheckpoint(_)).WillOnce(Return(std::expected<void, SinkError>{}));

    ASSERT_TRUE(sink.commit(batch, checkpoint_).has_value());
    EXPECT_FALSE(std::filesystem::exists(dir_ / "bucket_root" / "versions"));
}

TEST_F(ParquetSinkTest, UnknownTableFailsWithoutCheckpoint)
{
    auto sink = makeSink();
    auto batch = makeBatch(1, 1);
    batch.tables["not_a_table"].push_back(makeVersionRecord(1));

    auto const result = sink.commit(batch, checkpoint_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SinkError::Code::Invalid);
    EXPECT_EQ(result.error().message, "Unknown table not_a_table");
}

TEST_F(ParquetSinkTest, MismatchingValueTypeFails)
{
    auto sink = makeSink();
    auto batch = makeBatch(1, 1);
    batch.tables["versions"].front().fields.front().value = std::string{"one"};

    auto const result = sink.commit(batch, checkpoint_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SinkError::Code::Invalid);
    EXPECT_FALSE(result.error().isTransient());
    EXPECT_EQ(result.error().message, "Value of column version does not match its type");
}

TEST_F(ParquetSinkTest, CheckpointFailureIsReported)
{
    auto sink = makeSink();

    EXPECT_CALL(*checkpoints_, writeCheckpoint(_))
        .WillOnce(Return(std::unexpected{SinkError{.code = SinkError::Code::Connection, .message = "down"}}));

    auto const result = sink.commit(makeBatch(1, 1), checkpoint_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SinkError::Code::Connection);
}

TEST(ParquetFileNameTest, Parse)
{
    using Range = std::optional<std::pair<etl::Version, etl::Version>>;

    EXPECT_EQ(parseFileName("10_19.parquet"), (Range{{10, 19}}));
    EXPECT_EQ(parseFileName("0_0.parquet.tmp"), (Range{{0, 0}}));
    EXPECT_EQ(parseFileName("19_10.parquet"), std::nullopt);
    EXPECT_EQ(parseFileName("10_19.csv"), std::nullopt);
    EXPECT_EQ(parseFileName("10-19.parquet"), std::nullopt);
    EXPECT_EQ(parseFileName("a_19.parquet"), std::nullopt);
    EXPECT_EQ(parseFileName("_19.parquet"), std::nullopt);
}

TEST_F(ParquetSinkTest, ResumeAfterCrashDoesNotDuplicateRows)
{
    auto sink = makeSink();

    // the files of [1, 4] land but the process dies before the checkpoint
    EXPECT_CALL(*checkpoints_, writeCheckpoint(_))
        .WillOnce(Return(std::unexpected{SinkError{.code = SinkError::Code::Connection, .message = "down"}}))
        .WillRepeatedly(Return(std::expected<void, SinkError>{}));
    ASSERT_FALSE(sink.commit(makeBatch(1, 4), checkpoint_).has_value());
    ASSERT_EQ(tableRowCount("versions"), 4);

    // the next run resumes at 1 and cuts its batches differently
    ASSERT_TRUE(sink.prepareResume(1, std::nullopt).has_value());
    ASSERT_TRUE(sink.commit(makeBatch(1, 2), checkpoint_).has_value());
    ASSERT_TRUE(sink.commit(makeBatch(3, 4), checkpoint_).has_value());

    EXPECT_EQ(tableRowCount("versions"), 4);
    EXPECT_FALSE(exists("versions", "1_4.parquet"));
    EXPECT_TRUE(exists("versions", "1_2.parquet"));
    EXPECT_TRUE(exists("versions", "3_4.parquet"));
}

TEST_F(ParquetSinkTest, ResumeRemovesOnlyFilesInsideTheRange)
{
    touch("versions", "0_4.parquet");
    touch("versions", "5_9.parquet");
    touch("versions", "10_14.parquet.tmp");
    touch("versions", "20_24.parquet");
    touch("versions", "notes.txt");
    touch("latest_version", "5_9.parquet");

    auto sink = makeSink();
    ASSERT_TRUE(sink.prepareResume(5, 19).has_value());

    EXPECT_TRUE(exists("versions", "0_4.parquet"));
    EXPECT_FALSE(exists("versions", "5_9.parquet"));
    EXPECT_FALSE(exists("versions", "10_14.parquet.tmp"));
    EXPECT_TRUE(exists("versions", "20_24.parquet"));
    EXPECT_TRUE(exists("versions", "notes.txt"));
    EXPECT_FALSE(exists("latest_version", "5_9.parquet"));
}

TEST_F(ParquetSinkTest, ResumeWithoutAnyFiles)
{
    auto sink = makeSink();
    EXPECT_TRUE(sink.prepareResume(0, std::nullopt).has_value());
}
