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

#include "etl/ExtractorInterface.hpp"
#include "etl/Models.hpp"

#include <gmock/gmock.h>

#include <cstdint>
#include <expected>
#include <set>
#include <string>
#include <string_view>
#include <vector>

struct MockExtractor : etl::ExtractorInterface {
    MOCK_METHOD(std::string_view, name, (), (const, override));
    MOCK_METHOD(std::vector<etl::TableSpec> const&, tables, (), (const, override));
    MOCK_METHOD(
        (std::expected<std::vector<etl::ExtractedRecord>, std::string>),
        extract,
        (etl::Transaction const&),
        (const, override)
    );
};

/**
 * @brief Writes one row per version into a versions table and the latest version into a current-state table
 *
 * Fails on the versions listed in failOn.
 */
class VersionExtractor : public etl::ExtractorInterface {
    std::vector<etl::TableSpec> tables_{
        etl::TableSpec{
            .name = "versions",
            .kind = etl::MutationKind::InsertImmutable,
            .primaryKey = {"version"},
            .columns = {{"version", etl::ColumnType::Integer}, {"parity", etl::ColumnType::Text}}
        },
        etl::TableSpec{
            .name = "latest_version",
            .kind = etl::MutationKind::UpsertCurrent,
            .primaryKey = {"id"},
            .columns = {{"id", etl::ColumnType::Integer}, {"version", etl::ColumnType::Integer}}
        },
    };

public:
    std::set<etl::Version> failOn;

    std::string_view
    name() const override
    {
        return "versions";
    }

    std::vector<etl::TableSpec> const&
    tables() const override
    {
        return tables_;
    }

    std::expected<std::vector<etl::ExtractedRecord>, std::string>
    extract(etl::Transaction const& transaction) const override
    {
        if (failOn.contains(transaction.version))
            return std::unexpected{std::string{"undecodable payload"}};

        auto const version = static_cast<std::int64_t>(transaction.version);
        return std::vector<etl::ExtractedRecord>{
            etl::ExtractedRecord{
                .table = "versions",
                .primaryKey = {"version"},
                .kind = etl::MutationKind::InsertImmutable,
                .fields = {{"version", version}, {"parity", std::string{version % 2 == 0 ? "even" : "odd"}}},
                .version = transaction.version
            },
            etl::ExtractedRecord{
                .table = "latest_version",
                .primaryKey = {"id"},
                .kind = etl::MutationKind::UpsertCurrent,
                .fields = {{"id", std::int64_t{1}}, {"version", version}},
                .version = transaction.version
            },
        };
    }
};
