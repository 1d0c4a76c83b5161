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

#include "util/Assert.hpp"
#include "util/config/Array.hpp"
#include "util/config/ConfigFileInterface.hpp"
#include "util/config/ConfigValue.hpp"
#include "util/config/Error.hpp"
#include "util/config/Types.hpp"
#include "util/config/ValueView.hpp"

#include <chrono>
#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace util::config {

/**
 * @brief All the config data will be stored and extracted from this class
 *
 * Lists every key the indexer understands together with its type, default and constraint. Keys containing "[]" are
 * arrays and must be described with an Array.
 */
class IndexerConfigDefinition {
public:
    using KeyValuePair = std::pair<std::string_view, std::variant<ConfigValue, Array>>;

    /**
     * @brief Constructs a new IndexerConfigDefinition
     *
     * @param pair A list of key-value pairs describing the accepted configuration
     */
    IndexerConfigDefinition(std::initializer_list<KeyValuePair> pair);

    /**
     * @brief Parses the configuration file
     *
     * Every missing required key and every value of the wrong type or outside its constraint is reported.
     *
     * @param config The configuration file interface
     * @return An optional vector of Error objects stating all the failures if parsing fails
     */
    [[nodiscard]] std::optional<std::vector<Error>>
    parse(ConfigFileInterface const& config);

    /**
     * @brief Returns the specified ValueView object associated with the key
     *
     * @param fullKey The config key to search for
     * @return ValueView associated with the given key
     */
    [[nodiscard]] ValueView
    getValue(std::string_view fullKey) const;

    /**
     * @brief Returns the specified ValueView object in an array with a given index
     *
     * @param fullKey The config key to search for
     * @param index The index of the config value inside the Array to get
     * @return ValueView associated with the given key
     */
    [[nodiscard]] ValueView
    getValueInArray(std::string_view fullKey, std::size_t index) const;

    /**
     * @brief Returns the size of an Array
     *
     * @param prefix The key of the array, with or without the trailing ".[]"
     * @return The number of values the user provided
     */
    [[nodiscard]] std::size_t
    arraySize(std::string_view prefix) const;

    /**
     * @brief Checks if a key is present in the definition
     *
     * @param key The key to search for
     * @return true if the key is present; false otherwise
     */
    [[nodiscard]] bool
    contains(std::string_view key) const;

    /**
     * @brief Get a value that always exists, either as a default or from the user's config
     *
     * @tparam T The type to read the value as
     * @param fullKey The config key
     * @return The value
     */
    template <typename T>
    [[nodiscard]] T
    get(std::string_view fullKey) const
    {
        return getValue(fullKey).getValueImpl<T>();
    }

    /**
     * @brief Get an optional value
     *
     * @tparam T The type to read the value as
     * @param fullKey The config key
     * @return The value if the user provided it or it has a default; nullopt otherwise
     */
    template <typename T>
    [[nodiscard]] std::optional<T>
    maybeValue(std::string_view fullKey) const
    {
        return getValue(fullKey).asOptional<T>();
    }

    /**
     * @brief Get every value of a string array
     *
     * @param prefix The key of the array
     * @return The values in the order the user listed them
     */
    [[nodiscard]] std::vector<std::string>
    getStringArray(std::string_view prefix) const;

    /**
     * @brief Method to convert a float seconds value to milliseconds.
     *
     * @param value The value to convert
     * @return The value in milliseconds
     */
    static std::chrono::milliseconds
    toMilliseconds(double value);

private:
    [[nodiscard]] Array const&
    getArrayImpl(std::string_view key) const;

    [[nodiscard]] static std::string
    addBracketsForArrayKey(std::string_view key)
    {
        std::string fullKey = std::string(key);
        if (!key.contains(".[]"))
            fullKey += ".[]";
        return fullKey;
    }

    std::unordered_map<std::string_view, std::variant<ConfigValue, Array>> map_;
};

/**
 * @brief Full indexer configuration definition.
 *
 * Those keys without default values and not marked optional must be present in the user's config file.
 *
 * @return A fresh definition that has not parsed anything yet
 */
[[nodiscard]] IndexerConfigDefinition
getIndexerConfig();

}  // namespace util::config
