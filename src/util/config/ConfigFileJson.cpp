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

#include "util/config/ConfigFileJson.hpp"

#include "util/Assert.hpp"
#include "util/config/Error.hpp"
#include "util/config/Types.hpp"

#include <boost/filesystem/path.hpp>
#include <boost/json/array.hpp>
#include <boost/json/object.hpp>
#include <boost/json/parse.hpp>
#include <boost/json/parse_options.hpp>
#include <boost/json/value.hpp>
#include <fmt/core.h>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <expected>
#include <fstream>
#include <ios>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace util::config {

namespace {

Value
extractJsonValue(boost::json::value const& jsonValue)
{
    if (jsonValue.is_int64())
        return jsonValue.as_int64();
    if (jsonValue.is_uint64())
        return static_cast<int64_t>(jsonValue.as_uint64());
    if (jsonValue.is_string())
        return std::string{jsonValue.as_string()};
    if (jsonValue.is_bool())
        return jsonValue.as_bool();
    if (jsonValue.is_double())
        return jsonValue.as_double();

    // null and nested containers have no representation; an empty string fails every non-string type check
    return std::string{};
}

}  // namespace

ConfigFileJson::ConfigFileJson(boost::json::object jsonObj)
{
    flattenJson(jsonObj, "");
}

std::expected<ConfigFileJson, Error>
ConfigFileJson::makeConfigFileJson(boost::filesystem::path const& configFilePath)
{
    try {
        std::ifstream const in(configFilePath.string(), std::ios::in | std::ios::binary);
        if (!in)
            return std::unexpected<Error>({fmt::format("Could not open configuration file '{}'", configFilePath.string())});

        std::stringstream contents;
        contents << in.rdbuf();

        auto opts = boost::json::parse_options{};
        opts.allow_comments = true;
        opts.allow_trailing_commas = true;

        auto const parsed = boost::json::parse(contents.str(), {}, opts);
        if (!parsed.is_object())
            return std::unexpected<Error>({fmt::format("Configuration file '{}' must hold a JSON object", configFilePath.string())});

        return ConfigFileJson{parsed.as_object()};
    } catch (std::exception const& e) {
        return std::unexpected<Error>({fmt::format(
            "An error occurred while processing configuration file '{}': {}", configFilePath.string(), e.what()
        )});
    }
}

Value
ConfigFileJson::getValue(std::string_view key) const
{
    return extractJsonValue(jsonObject_.at(key));
}

std::vector<Value>
ConfigFileJson::getArray(std::string_view key) const
{
    ASSERT(jsonObject_.at(key).is_array(), "Key {} has value that is not an array", key);

    std::vector<Value> values;
    for (auto const& item : jsonObject_.at(key).as_array())
        values.push_back(extractJsonValue(item));

    return values;
}

bool
ConfigFileJson::containsKey(std::string_view key) const
{
    return jsonObject_.contains(key);
}

void
ConfigFileJson::flattenJson(boost::json::object const& obj, std::string const& prefix)
{
    for (auto const& [key, value] : obj) {
        auto const fullKey = prefix.empty() ? std::string{key} : fmt::format("{}.{}", prefix, std::string_view{key});

        if (value.is_object()) {
            flattenJson(value.as_object(), fullKey);
        } else if (value.is_array()) {
            auto const arrayKey = fullKey + ".[]";
            auto const& arr = value.as_array();

            // an array of primitives is stored as is; objects inside an array are flattened field by field
            boost::json::array primitives;
            for (auto const& item : arr) {
                if (item.is_object()) {
                    flattenJson(item.as_object(), arrayKey);
                } else {
                    primitives.push_back(item);
                }
            }
            if (!primitives.empty() || arr.empty())
                jsonObject_[arrayKey] = std::move(primitives);
        } else if (fullKey.contains(".[]")) {
            // field of an object inside an array; accumulate the values of every element
            if (auto it = jsonObject_.find(fullKey); it != jsonObject_.end()) {
                it->value().as_array().push_back(value);
            } else {
                boost::json::array newArray;
                newArray.push_back(value);
                jsonObject_[fullKey] = std::move(newArray);
            }
        } else {
            jsonObject_[fullKey] = value;
        }
    }
}

}  // namespace util::config
