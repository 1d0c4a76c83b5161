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

#include "data/parquet/ParquetSink.hpp"

#include "data/Types.hpp"
#include "etl/Models.hpp"
#include "util/OverloadSet.hpp"
#include "util/TimeUtils.hpp"
#include "util/log/Logger.hpp"

#include <arrow/array/builder_base.h>
#include <arrow/array/builder_binary.h>
#include <arrow/array/builder_primitive.h>
#include <arrow/filesystem/filesystem.h>
#include <arrow/memory_pool.h>
#include <arrow/result.h>
#include <arrow/status.h>
#include <arrow/table.h>
#include <arrow/type.h>
#include <fmt/core.h>
#include <parquet/arrow/writer.h>
#include <parquet/properties.h>

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace data::parquet {

namespace {

constexpr auto kLAST_TRANSACTION_VERSION = "last_transaction_version";
constexpr auto kIS_DELETED = "is_deleted";
constexpr std::string_view kEXTENSION = ".parquet";
constexpr std::string_view kTMP_EXTENSION = ".parquet.tmp";

/**
 * @brief A batch that does not fit the tables of the sink; writing it again gives the same result
 */
struct InvalidBatch : std::runtime_error {
    using std::runtime_error::runtime_error;
};

std::optional<etl::Version>
parseVersion(std::string_view text)
{
    etl::Version version = 0;
    auto const [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), version);
    if (ec != std::errc{} or ptr != text.data() + text.size() or text.empty())
        return std::nullopt;
    return version;
}

template <typename T>
T
unwrap(arrow::Result<T> result)
{
    if (not result.ok())
        throw std::runtime_error(result.status().ToString());
    return std::move(result).ValueUnsafe();
}

void
unwrap(arrow::Status const& status)
{
    if (not status.ok())
        throw std::runtime_error(status.ToString());
}

std::string
trimSlashes(std::string path)
{
    while (not path.empty() and path.back() == '/')
        path.pop_back();
    while (not path.empty() and path.front() == '/')
        path.erase(path.begin());
    return path;
}

std::shared_ptr<arrow::DataType>
arrowType(etl::ColumnType type)
{
    switch (type) {
        case etl::ColumnType::Boolean:
            return arrow::boolean();
        case etl::ColumnType::Integer:
            return arrow::int64();
        case etl::ColumnType::Double:
            return arrow::float64();
        case etl::ColumnType::Text:
            return arrow::utf8();
    }
    return arrow::utf8();
}

/**
 * @brief Builds one column out of the field values of the records
 */
class ColumnBuilder {
    etl::ColumnSpec spec_;
    std::unique_ptr<arrow::ArrayBuilder> builder_;

public:
    explicit ColumnBuilder(etl::ColumnSpec spec) : spec_{std::move(spec)}
    {
        builder_ = unwrap(arrow::MakeBuilder(arrowType(spec_.type)));
    }

    void
    append(etl::FieldValue const& value)
    {
        std::visit(
            util::OverloadSet{
                [this](std::monostate) { unwrap(builder_->AppendNull()); },
                [this](bool v) { unwrap(as<arrow::BooleanBuilder>(etl::ColumnType::Boolean).Append(v)); },
                [this](std::int64_t v) { unwrap(as<arrow::Int64Builder>(etl::ColumnType::Integer).Append(v)); },
                [this](double v) { unwrap(as<arrow::DoubleBuilder>(etl::ColumnType::Double).Append(v)); },
                [this](std::string const& v) { unwrap(as<arrow::StringBuilder>(etl::ColumnType::Text).Append(v)); },
            },
            value
        );
    }

    [[nodiscard]] std::shared_ptr<arrow::Field>
    field() const
    {
        return arrow::field(spec_.name, arrowType(spec_.type));
    }

    [[nodiscard]] std::shared_ptr<arrow::Array>
    finish()
    {
        return unwrap(builder_->Finish());
    }

private:
    template <typename BuilderType>
    BuilderType&
    as(etl::ColumnType expected)
    {
        if (spec_.type != expected)
            throw InvalidBatch(fmt::format("Value of column {} does not match its type", spec_.name));
        return static_cast<BuilderType&>(*builder_);
    }
};

}  // namespace

std::expected<Location, SinkError>
resolveLocation(std::string const& bucketName, std::string const& bucketRoot)
{
    std::string path;
    auto fs = arrow::fs::FileSystemFromUriOrPath(bucketName, &path);
    if (not fs.ok()) {
        return std::unexpected{SinkError{
            .code = SinkError::Code::Io,
            .message = fmt::format("Unsupported bucket {}: {}", bucketName, fs.status().ToString())
        }};
    }

    while (not path.empty() and path.back() == '/')
        path.pop_back();

    auto const root = trimSlashes(bucketRoot);
    if (not root.empty())
        path += "/" + root;

    return Location{.fs = std::move(fs).ValueUnsafe(), .root = std::move(path)};
}

ParquetSink::ParquetSink(
    Location location,
    std::vector<etl::TableSpec> const& tables,
    std::shared_ptr<CheckpointStoreInterface> checkpoints
)
    : location_{std::move(location)}, checkpoints_{std::move(checkpoints)}
{
    for (auto const& table : tables)
        tables_.emplace(table.name, table);

    LOG(log_.info()) << "Writing Parquet files under " << location_.root;
}

std::optional<std::pair<etl::Version, etl::Version>>
parseFileName(std::string const& fileName)
{
    std::string_view name{fileName};
    if (name.ends_with(kTMP_EXTENSION)) {
        name.remove_suffix(kTMP_EXTENSION.size());
    } else if (name.ends_with(kEXTENSION)) {
        name.remove_suffix(kEXTENSION.size());
    } else {
        return std::nullopt;
    }

    auto const separator = name.find('_');
    if (separator == std::string_view::npos)
        return std::nullopt;

    auto const start = parseVersion(name.substr(0, separator));
    auto const end = parseVersion(name.substr(separator + 1));
    if (not start.has_value() or not end.has_value() or *start > *end)
        return std::nullopt;

    return std::make_pair(*start, *end);
}

std::string
ParquetSink::filePath(std::string const& table, etl::Batch const& batch) const
{
    return fmt::format("{}/{}_{}{}", tableDir(table), batch.startVersion, batch.endVersion, kEXTENSION);
}

std::expected<void, SinkError>
ParquetSink::commit(etl::Batch const& batch, CheckpointUpdate const& checkpoint)
{
    try {
        auto const elapsed = util::timed([&]() {
            for (auto const& [name, records] : batch.tables) {
                if (records.empty())
                    continue;

                auto const it = tables_.find(name);
                if (it == tables_.end())
                    throw InvalidBatch("Unknown table " + name);

                writeTable(it->second, records, batch);
            }
        });

        LOG(log_.debug()) << "Wrote " << batch.recordCount() << " records of versions [" << batch.startVersion << ", "
                          << batch.endVersion << "] in " << elapsed << "ms";
    } catch (InvalidBatch const& e) {
        return std::unexpected{SinkError{.code = SinkError::Code::Invalid, .message = e.what()}};
    } catch (std::runtime_error const& e) {
        return std::unexpected{SinkError{.code = SinkError::Code::Io, .message = e.what()}};
    }

    return checkpoints_->writeCheckpoint(checkpoint);
}

std::expected<void, SinkError>
ParquetSink::prepareResume(etl::Version startVersion, std::optional<etl::Version> endVersion)
{
    std::size_t removed = 0;
    try {
        for (auto const& [name, table] : tables_) {
            arrow::fs::FileSelector selector;
            selector.base_dir = tableDir(name);
            selector.allow_not_found = true;

            for (auto const& file : unwrap(location_.fs->GetFileInfo(selector))) {
                if (not file.IsFile())
                    continue;

                auto const range = parseFileName(file.base_name());
                if (not range.has_value() or range->first < startVersion)
                    continue;
                if (endVersion.has_value() and range->first > *endVersion)
                    continue;

                LOG(log_.info()) << "Removing " << file.path() << " written past the checkpoint";
                unwrap(location_.fs->DeleteFile(file.path()));
                ++removed;
            }
        }
    } catch (std::runtime_error const& e) {
        return std::unexpected{SinkError{.code = SinkError::Code::Io, .message = e.what()}};
    }

    LOG(log_.debug()) << "Removed " << removed << " files before resuming at version " << startVersion;
    return {};
}

std::string
ParquetSink::tableDir(std::string const& table) const
{
    return fmt::format("{}/{}", location_.root, table);
}

void
ParquetSink::writeTable(etl::TableSpec const& table, std::vector<etl::ExtractedRecord> const& records, etl::Batch const& batch)
{
    std::vector<ColumnBuilder> columns;
    columns.reserve(table.columns.size() + 2);
    for (auto const& column : table.columns)
        columns.emplace_back(column);

    std::int64_t rows = 0;
    for (auto const& record : records) {
        for (std::size_t i = 0; i < table.columns.size(); ++i) {
            auto const* value = record.find(table.columns[i].name);
            columns[i].append(value != nullptr ? *value : etl::FieldValue{});
        }
        ++rows;
    }

    if (table.isCurrentState()) {
        ColumnBuilder version{{.name = kLAST_TRANSACTION_VERSION, .type = etl::ColumnType::Integer}};
        ColumnBuilder deleted{{.name = kIS_DELETED, .type = etl::ColumnType::Boolean}};
        for (auto const& record : records) {
            version.append(static_cast<std::int64_t>(record.version));
            deleted.append(record.kind == etl::MutationKind::DeleteMarker);
        }
        columns.push_back(std::move(version));
        columns.push_back(std::move(deleted));
    }

    arrow::FieldVector fields;
    arrow::ArrayVector arrays;
    for (auto& column : columns) {
        fields.push_back(column.field());
        arrays.push_back(column.finish());
    }

    auto const arrowTable = arrow::Table::Make(arrow::schema(fields), arrays, rows);

    auto const path = filePath(table.name, batch);
    auto const tmpPath = path + ".tmp";
    unwrap(location_.fs->CreateDir(tableDir(table.name), true));

    auto out = unwrap(location_.fs->OpenOutputStream(tmpPath));
    unwrap(::parquet::arrow::WriteTable(
        *arrowTable,
        arrow::default_memory_pool(),
        out,
        ::parquet::DEFAULT_MAX_ROW_GROUP_LENGTH,
        ::parquet::default_writer_properties()
    ));
    unwrap(out->Close());
    unwrap(location_.fs->Move(tmpPath, path));

    LOG(log_.trace()) << "Wrote " << rows << " rows to " << path;
}

}  // namespace data::parquet
