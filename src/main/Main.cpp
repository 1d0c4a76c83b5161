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
#include "app/IndexerApplication.hpp"
#include "util/config/ConfigDefinition.hpp"
#include "util/config/ConfigFileJson.hpp"
#include "util/log/Logger.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>

using namespace util::config;

namespace {

/**
 * @brief Read and validate the config file, printing every problem found
 *
 * @param path The config file
 * @return The validated config; nullopt if it can't be used
 */
std::optional<IndexerConfigDefinition>
loadConfig(std::string const& path)
{
    auto const json = ConfigFileJson::makeConfigFileJson(path);
    if (not json.has_value()) {
        std::cerr << json.error().error << std::endl;
        return std::nullopt;
    }

    auto config = getIndexerConfig();
    if (auto const errors = config.parse(json.value()); errors.has_value()) {
        for (auto const& err : errors.value())
            std::cerr << err.error << std::endl;
        return std::nullopt;
    }

    return config;
}

}  // namespace

int
main(int argc, char const* argv[])
try {
    auto const action = app::CliArgs::parse(argc, argv);
    return action.apply(
        [](app::CliArgs::Action::Exit const& exit) { return exit.exitCode; },
        [](app::CliArgs::Action::VerifyConfig const& verify) {
            auto const config = loadConfig(verify.configPath);
            if (not config.has_value())
                return EXIT_FAILURE;

            if (auto const res = app::verifyConfig(*config); not res.has_value()) {
                std::cerr << res.error() << std::endl;
                return EXIT_FAILURE;
            }

            std::cout << "Config " << verify.configPath << " is valid" << std::endl;
            return EXIT_SUCCESS;
        },
        [](app::CliArgs::Action::Run const& run) {
            auto const config = loadConfig(run.configPath);
            if (not config.has_value())
                return EXIT_FAILURE;

            util::LogService::init(*config);
            app::IndexerApplication indexer{*config};
            return indexer.run();
        }
    );
} catch (std::exception const& e) {
    LOG(util::LogService::fatal()) << "Exit on exception: " << e.what();
    return EXIT_FAILURE;
}
