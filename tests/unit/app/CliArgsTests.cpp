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

#include "app/CliArgs.hpp"

#include <boost/program_options/errors.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <array>
#include <cstdlib>
#include <string_view>

using namespace app;

struct CliArgsTests : testing::Test {
    testing::StrictMock<testing::MockFunction<int(CliArgs::Action::Run)>> onRunMock;
    testing::StrictMock<testing::MockFunction<int(CliArgs::Action::VerifyConfig)>> onVerifyMock;
    testing::StrictMock<testing::MockFunction<int(CliArgs::Action::Exit)>> onExitMock;

    int
    apply(CliArgs::Action const& action)
    {
        return action.apply(onRunMock.AsStdFunction(), onVerifyMock.AsStdFunction(), onExitMock.AsStdFunction());
    }
};

TEST_F(CliArgsTests, NoArgsRunsWithDefaultConfig)
{
    std::array argv{"indexer_processor"};
    auto const action = CliArgs::parse(argv.size(), argv.data());

    int const returnCode = 123;
    EXPECT_CALL(onRunMock, Call).WillOnce([](CliArgs::Action::Run const& run) {
        EXPECT_EQ(run.configPath, CliArgs::kDEFAULT_CONFIG_PATH);
        return returnCode;
    });
    EXPECT_EQ(apply(action), returnCode);
}

TEST_F(CliArgsTests, VersionAndHelpExit)
{
    for (auto& argv :
         {std::array{"indexer_processor", "--version"},
          std::array{"indexer_processor", "-v"},
          std::array{"indexer_processor", "--help"},
          std::array{"indexer_processor", "-h"}}) {
        auto const action = CliArgs::parse(argv.size(), const_cast<char const**>(argv.data()));

        EXPECT_CALL(onExitMock, Call).WillOnce([](CliArgs::Action::Exit const& exit) { return exit.exitCode; });
        EXPECT_EQ(apply(action), EXIT_SUCCESS);
    }
}

TEST_F(CliArgsTests, ConfigShortOption)
{
    std::string_view configPath = "indexer.json";
    std::array argv{"indexer_processor", "-c", configPath.data()};

    auto const action = CliArgs::parse(argv.size(), argv.data());

    EXPECT_CALL(onRunMock, Call).WillOnce([&configPath](CliArgs::Action::Run const& run) {
        EXPECT_EQ(run.configPath, configPath);
        return EXIT_SUCCESS;
    });
    EXPECT_EQ(apply(action), EXIT_SUCCESS);
}

TEST_F(CliArgsTests, ConfigPositional)
{
    std::string_view configPath = "/etc/indexer/backfill.json";
    std::array argv{"indexer_processor", configPath.data()};

    auto const action = CliArgs::parse(argv.size(), argv.data());

    EXPECT_CALL(onRunMock, Call).WillOnce([&configPath](CliArgs::Action::Run const& run) {
        EXPECT_EQ(run.configPath, configPath);
        return EXIT_FAILURE;
    });
    EXPECT_EQ(apply(action), EXIT_FAILURE);
}

TEST_F(CliArgsTests, ConfigLongOption)
{
    std::string_view configPath = "some_config_path";
    std::array argv{"indexer_processor", "--conf", configPath.data()};

    auto const action = CliArgs::parse(argv.size(), argv.data());

    EXPECT_CALL(onRunMock, Call).WillOnce([&configPath](CliArgs::Action::Run const& run) {
        EXPECT_EQ(run.configPath, configPath);
        return EXIT_SUCCESS;
    });
    EXPECT_EQ(apply(action), EXIT_SUCCESS);
}

TEST_F(CliArgsTests, VerifyConfig)
{
    std::string_view configPath = "events.json";
    std::array argv{"indexer_processor", "--verify-config", configPath.data()};

    auto const action = CliArgs::parse(argv.size(), argv.data());

    EXPECT_CALL(onVerifyMock, Call).WillOnce([&configPath](CliArgs::Action::VerifyConfig const& verify) {
        EXPECT_EQ(verify.configPath, configPath);
        return EXIT_SUCCESS;
    });
    EXPECT_EQ(apply(action), EXIT_SUCCESS);
}

TEST_F(CliArgsTests, VersionWinsOverVerifyConfig)
{
    std::array argv{"indexer_processor", "--verify-config", "--version"};
    auto const action = CliArgs::parse(argv.size(), argv.data());

    EXPECT_CALL(onExitMock, Call).WillOnce([](CliArgs::Action::Exit const& exit) { return exit.exitCode; });
    EXPECT_EQ(apply(action), EXIT_SUCCESS);
}

TEST_F(CliArgsTests, UnknownOptionThrows)
{
    std::array argv{"indexer_processor", "--no-such-option"};
    EXPECT_THROW([[maybe_unused]] auto const action = CliArgs::parse(argv.size(), argv.data()), boost::program_options::error);
}
