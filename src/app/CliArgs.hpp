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

#include "util/OverloadSet.hpp"

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace app {

/**
 * @brief What the command line asks the processor to do
 */
class CliArgs {
public:
    static constexpr char kDEFAULT_CONFIG_PATH[] = "/etc/opt/indexer-processor/config.json";

    /**
     * @brief One of the actions the command line selects
     */
    class Action {
    public:
        /** @brief Run the processor with the given config file */
        struct Run {
            std::string configPath;
        };

        /** @brief Validate the config file and exit without connecting anywhere */
        struct VerifyConfig {
            std::string configPath;
        };

        /** @brief Exit right away, e.g. after printing help */
        struct Exit {
            int exitCode;
        };

        template <typename ActionType>
            requires std::is_same_v<ActionType, Run> or std::is_same_v<ActionType, VerifyConfig> or
            std::is_same_v<ActionType, Exit>
        explicit Action(ActionType&& action) : action_(std::forward<ActionType>(action))
        {
        }

        /**
         * @brief Hand the action to the processor matching its type
         *
         * @tparam Processors Callables taking one of the action types and returning the exit code
         * @param processors One processor per action type
         * @return The exit code
         */
        template <typename... Processors>
        int
        apply(Processors&&... processors) const
        {
            return std::visit(util::OverloadSet{std::forward<Processors>(processors)...}, action_);
        }

    private:
        std::variant<Run, VerifyConfig, Exit> action_;
    };

    /**
     * @brief Parse the command line
     *
     * Help and version are printed to stdout here and yield Exit.
     *
     * @param argc Number of arguments
     * @param argv The arguments
     * @return The selected action
     * @throws boost::program_options::error on unknown options or missing values
     */
    static Action
    parse(int argc, char const* argv[]);
};

}  // namespace app
