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

#include "data/CheckpointStoreInterface.hpp"
#include "data/SinkInterface.hpp"
#include "data/Types.hpp"
#include "etl/Models.hpp"
#include "util/log/Logger.hpp"

#include <arrow/filesystem/filesystem.h>

#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace data::parquet {

/**
 * @brief A filesystem and the directory files go to
 */
struct Location {
    std::shared_ptr<arrow::fs::FileSystem> fs;
    std::string root;
};

/**
 * @brief Resolve the location of the files
 *
 * @param bucketName Filesystem URI understood by Arrow (gs://, s3://, file://) or a local path
 * @param bucketRoot Directory inside the bucket
 * @return The location; the error if the URI is not supported
 */
[[nodiscard]] std::expected<Location, SinkError>
resolveLocation(std::string const& bucketName, std::string const& bucketRoot);

/**
 * @brief Parse the version range out of a file name written by ParquetSink
 *
 * @param fileName A base name like 10_19.parquet or 10_19.parquet.tmp
 * @return The inclusive range; std::nullopt if the name is not one of ours
 */
[[nodiscard]] std::optional<std::pair<etl::Version, etl::Version>>
parseFileName(std::string const& fileName);

/**
 * @brief Columnar sink writing one Parquet file per table per batch
 *
 * Files are named <root>/<table>/<start>_<end>.parquet after the inclusive version range of the batch. A file is
 * written under a temporary name and moved in place once complete. The checkpoint is advanced in the checkpoint store
 * after every file of the batch is in place.
 *
 * A crash between the files and the checkpoint leaves files past the checkpoint whose range the next run will not
 * reproduce. prepareResume() deletes every file starting inside the range of the next run before it writes anything.
 */
class ParquetSink : public SinkInterface {
    util::Logger log_{"Sink"};

    Location location_;
    std::map<std::string, etl::TableSpec> tables_;
    std::shared_ptr<CheckpointStoreInterface> checkpoints_;

public:
    /**
     * @brief Create the sink
     *
     * @param location Where the files go
     * @param tables The tables batches may contain
     * @param checkpoints The store of the checkpoint
     */
    ParquetSink(
        Location location,
        std::vector<etl::TableSpec> const& tables,
        std::shared_ptr<CheckpointStoreInterface> checkpoints
    );

    [[nodiscard]] std::expected<void, SinkError>
    commit(etl::Batch const& batch, CheckpointUpdate const& checkpoint) override;

    [[nodiscard]] std::expected<void, SinkError>
    prepareResume(etl::Version startVersion, std::optional<etl::Version> endVersion) override;

    /**
     * @brief Path of the file holding a table of a batch
     *
     * @param table The table name
     * @param batch The batch
     * @return The path inside the filesystem
     */
    [[nodiscard]] std::string
    filePath(std::string const& table, etl::Batch const& batch) const;

private:
    [[nodiscard]] std::string
    tableDir(std::string const& table) const;

    void
    writeTable(etl::TableSpec const& table, std::vector<etl::ExtractedRecord> const& records, etl::Batch const& batch);
};

}  // namespace data::parquet
