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

#include "etl/ProcessorRegistry.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace etl;

namespace {

std::vector<std::string>
tableNames(ProcessorDefinition const& definition)
{
    std::vector<std::string> names;
    for (auto const& extractor : definition.extractors) {
        for (auto const& table : extractor->tables())
            names.push_back(table.name);
    }
    return names;
}

}  // namespace

struct ProcessorRegistryTestBundle {
    std::string testName;
    std::string type;
    SinkKind sink;
    std::vector<std::string> tables;
};

struct ProcessorRegistryTest : testing::TestWithParam<ProcessorRegistryTestBundle> {};

TEST_P(ProcessorRegistryTest, MakesDefinition)
{
    auto const& bundle = GetParam();
    auto const definition = makeProcessorDefinition(bundle.type);

    ASSERT_TRUE(definition.has_value()) << definition.error();
    EXPECT_EQ(definition->type, bundle.type);
    EXPECT_EQ(definition->sink, bundle.sink);
    EXPECT_EQ(tableNames(*definition), bundle.tables);
}

INSTANTIATE_TEST_SUITE_P(
    ProcessorRegistryGroup,
    ProcessorRegistryTest,
    testing::Values(
        ProcessorRegistryTestBundle{
            "Default", "default_processor", SinkKind::Postgres,
            {"transactions", "write_set_changes", "current_table_items"}
        },
        ProcessorRegistryTestBundle{"Events", "events_processor", SinkKind::Postgres, {"events"}},
        ProcessorRegistryTestBundle{
            "UserTransaction", "user_transaction_processor", SinkKind::Postgres, {"user_transactions"}
        },
        ProcessorRegistryTestBundle{
            "FungibleAsset", "fungible_asset_processor", SinkKind::Postgres,
            {"coin_balances", "current_coin_balances"}
        },
        ProcessorRegistryTestBundle{
            "AccountTransactions", "account_transactions_processor", SinkKind::Postgres, {"account_transactions"}
        },
        ProcessorRegistryTestBundle{"Objects", "objects_processor", SinkKind::Postgres, {"objects", "current_objects"}},
        ProcessorRegistryTestBundle{"ParquetEvents", "parquet_events_processor", SinkKind::Parquet, {"events"}},
        ProcessorRegistryTestBundle{
            "ParquetObjects", "parquet_objects_processor", SinkKind::Parquet, {"objects", "current_objects"}
        }
    ),
    [](testing::TestParamInfo<ProcessorRegistryTestBundle> const& info) { return info.param.testName; }
);

TEST(ProcessorRegistryErrorTest, UnknownType)
{
    auto const definition = makeProcessorDefinition("nft_processor");
    ASSERT_FALSE(definition.has_value());
    EXPECT_THAT(definition.error(), testing::HasSubstr("nft_processor"));
}

TEST(ProcessorRegistryErrorTest, PrefixAlone)
{
    EXPECT_FALSE(makeProcessorDefinition("parquet_").has_value());
}

TEST(ProcessorRegistryErrorTest, RequiredDatabaseType)
{
    EXPECT_STREQ(requiredDatabaseType(SinkKind::Postgres), "postgres_config");
    EXPECT_STREQ(requiredDatabaseType(SinkKind::Parquet), "parquet_config");
}
