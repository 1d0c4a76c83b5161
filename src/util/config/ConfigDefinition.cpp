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

#include "util/config/ConfigDefinition.hpp"

#include "util/Assert.hpp"
#include "util/Constants.hpp"
#include "util/OverloadSet.hpp"
#include "util/config/Array.hpp"
#include "util/config/ConfigConstraints.hpp"
#include "util/config/ConfigFileInterface.hpp"
#include "util/config/ConfigValue.hpp"
#include "util/config/Error.hpp"
#include "util/config/Types.hpp"
#include "util/config/ValueView.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace util::config {

IndexerConfigDefinition::IndexerConfigDefinition(std::initializer_list<KeyValuePair> pair)
{
    for (auto const& [key, value] : pair) {
        if (key.contains("[]"))
            ASSERT(std::holds_alternative<Array>(value), "Value must be array if key has \"[]\"");
        map_.insert({key, value});
    }
}

bool
IndexerConfigDefinition::contains(std::string_view key) const
{
    return map_.contains(key);
}

ValueView
IndexerConfigDefinition::getValue(std::string_view fullKey) const
{
    ASSERT(map_.contains(fullKey), "key {} does not exist in config", fullKey);
    auto const& value = map_.at(fullKey);
    ASSERT(std::holds_alternative<ConfigValue>(value), "Value of key {} is an Array, not a value", fullKey);
    return ValueView{std::get<ConfigValue>(value)};
}

ValueView
IndexerConfigDefinition::getValueInArray(std::string_view fullKey, std::size_t index) const
{
    return ValueView{getArrayImpl(fullKey).at(index)};
}

std::size_t
IndexerConfigDefinition::arraySize(std::string_view prefix) const
{
    return getArrayImpl(prefix).size();
}

std::vector<std::string>
IndexerConfigDefinition::getStringArray(std::string_view prefix) const
{
    std::vector<std::string> result;
    for (auto const& value : getArrayImpl(prefix))
        result.push_back(ValueView{value}.asString());
    return result;
}

Array const&
IndexerConfigDefinition::getArrayImpl(std::string_view key) const
{
    auto const fullKey = addBracketsForArrayKey(key);
    auto const it = std::ranges::find_if(map_, [&fullKey](auto const& pair) { return pair.first == fullKey; });

    ASSERT(it != map_.end(), "key {} does not exist in config", fullKey);
    ASSERT(std::holds_alternative<Array>(it->second), "Value of {} is not an array", fullKey);
    return std::get<Array>(it->second);
}

std::chrono::milliseconds
IndexerConfigDefinition::toMilliseconds(double value)
{
    ASSERT(value >= 0.0, "Floating point value of seconds must be non-negative, got: {}", value);
    return std::chrono::milliseconds{std::llround(value * static_cast<double>(util::kMILLISECONDS_PER_SECOND))};
}

std::optional<std::vector<Error>>
IndexerConfigDefinition::parse(ConfigFileInterface const& config)
{
    std::vector<Error> listOfErrors;

    for (auto& [key, value] : map_) {
        if (!config.containsKey(key)) {
            std::visit(
                util::OverloadSet{
                    [&](ConfigValue const& val) {
                        if (!(val.isOptional() || val.hasValue()))
                            listOfErrors.emplace_back(key, "key is required in user Config");
                    },
                    [&](Array const& arr) {
                        if (!arr.getArrayPattern().isOptional())
                            listOfErrors.emplace_back(key, "key is required in user Config");
                    }
                },
                value
            );
            continue;
        }

        std::visit(
            util::OverloadSet{
                [&key, &config, &listOfErrors](ConfigValue& val) {
                    if (auto const maybeError = val.setValue(config.getValue(key), key); maybeError.has_value())
                        listOfErrors.emplace_back(maybeError.value());
                },
                [&key, &config, &listOfErrors](Array& arr) {
                    for (auto const& val : config.getArray(key)) {
                        if (auto const maybeError = arr.addValue(val, key); maybeError.has_value())
                            listOfErrors.emplace_back(maybeError.value());
                    }
                }
            },
            value
        );
    }

    if (!listOfErrors.empty())
        return listOfErrors;

    return std::nullopt;
}

IndexerConfigDefinition
getIndexerConfig()
{
    return IndexerConfigDefinition{
        {{"health_check_port", ConfigValue{ConfigType::Integer}.optional().withConstraint(validatePort)},
         {"graceful_period", ConfigValue{ConfigType::Double}.defaultValue(10.0).withConstraint(validatePositiveDouble)},

         {"processor_config.type", ConfigValue{ConfigType::String}.withConstraint(validateProcessorType)},
         {"processor_config.channel_size",
          ConfigValue{ConfigType::Integer}.defaultValue(100).withConstraint(validatePositiveUint32)},
         {"processor_config.max_buffer_size",
          ConfigValue{ConfigType::Integer}.defaultValue(100'000'000).withConstraint(validatePositiveUint32)},
         {"processor_config.upload_interval",
          ConfigValue{ConfigType::Double}.defaultValue(30.0).withConstraint(validatePositiveDouble)},
         {"processor_config.extractor_threads",
          ConfigValue{ConfigType::Integer}.defaultValue(2).withConstraint(validatePositiveUint32)},
         {"processor_config.extraction_failure_policy",
          ConfigValue{ConfigType::String}.defaultValue("skip").withConstraint(validateExtractionFailurePolicy)},
         {"processor_config.tables_to_write.[]", Array{ConfigValue{ConfigType::String}.optional()}},

         {"transaction_stream_config.indexer_grpc_data_service_address", ConfigValue{ConfigType::String}},
         {"transaction_stream_config.auth_token", ConfigValue{ConfigType::String}},
         {"transaction_stream_config.request_name_header", ConfigValue{ConfigType::String}},
         {"transaction_stream_config.request_timeout",
          ConfigValue{ConfigType::Double}.defaultValue(60.0).withConstraint(validatePositiveDouble)},
         {"transaction_stream_config.max_reconnects",
          ConfigValue{ConfigType::Integer}.defaultValue(5).withConstraint(validateUint32)},
         {"transaction_stream_config.reconnect_delay",
          ConfigValue{ConfigType::Double}.defaultValue(0.5).withConstraint(validatePositiveDouble)},
         {"transaction_stream_config.reconnect_max_delay",
          ConfigValue{ConfigType::Double}.defaultValue(30.0).withConstraint(validatePositiveDouble)},

         {"processor_mode.type", ConfigValue{ConfigType::String}.defaultValue("default").withConstraint(validateProcessorMode)},
         {"processor_mode.backfill_alias", ConfigValue{ConfigType::String}.optional()},
         {"processor_mode.initial_starting_version",
          ConfigValue{ConfigType::Integer}.defaultValue(0).withConstraint(validateVersion)},
         {"processor_mode.ending_version", ConfigValue{ConfigType::Integer}.optional().withConstraint(validateVersion)},
         {"processor_mode.overwrite_checkpoint", ConfigValue{ConfigType::Boolean}.defaultValue(false)},

         {"db_config.type", ConfigValue{ConfigType::String}.withConstraint(validateDatabaseType)},
         {"db_config.connection_string", ConfigValue{ConfigType::String}},
         {"db_config.db_pool_size", ConfigValue{ConfigType::Integer}.defaultValue(150).withConstraint(validatePositiveUint32)},
         {"db_config.statement_timeout",
          ConfigValue{ConfigType::Double}.defaultValue(30.0).withConstraint(validatePositiveDouble)},
         {"db_config.write_retries", ConfigValue{ConfigType::Integer}.defaultValue(5).withConstraint(validateUint32)},
         {"db_config.retry_delay", ConfigValue{ConfigType::Double}.defaultValue(0.5).withConstraint(validatePositiveDouble)},
         {"db_config.retry_max_delay",
          ConfigValue{ConfigType::Double}.defaultValue(30.0).withConstraint(validatePositiveDouble)},
         {"db_config.bucket_name", ConfigValue{ConfigType::String}.optional()},
         {"db_config.bucket_root", ConfigValue{ConfigType::String}.optional()},
         {"db_config.update_processor_status_interval",
          ConfigValue{ConfigType::Double}.optional().withConstraint(validatePositiveDouble)},

         {"log_channels.[].channel", Array{ConfigValue{ConfigType::String}.optional().withConstraint(validateChannelName)}},
         {"log_channels.[].log_level",
          Array{ConfigValue{ConfigType::String}.optional().withConstraint(validateLogLevelName)}},
         {"log_level", ConfigValue{ConfigType::String}.defaultValue("info").withConstraint(validateLogLevelName)},
         {"log_format",
          ConfigValue{ConfigType::String}.defaultValue(
              R"(%TimeStamp% (%SourceLocation%) [%ThreadID%] %Channel%:%Severity% %Message%)"
          )},
         {"log_to_console", ConfigValue{ConfigType::Boolean}.defaultValue(true)},
         {"log_directory", ConfigValue{ConfigType::String}.optional()},
         {"log_rotation_size", ConfigValue{ConfigType::Integer}.defaultValue(2048).withConstraint(validateUint32)},
         {"log_directory_max_size",
          ConfigValue{ConfigType::Integer}.defaultValue(50 * 1024).withConstraint(validateUint32)},
         {"log_rotation_hour_interval",
          ConfigValue{ConfigType::Integer}.defaultValue(12).withConstraint(validateUint32)}}
    };
}

}  // namespace util::config
