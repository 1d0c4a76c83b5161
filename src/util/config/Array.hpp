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

#include "util/config/ConfigValue.hpp"
#include "util/config/Error.hpp"
#include "util/config/Types.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace util::config {

/**
 * @brief Array definition to store multiple values provided by the user from Json
 *
 * Used in IndexerConfigDefinition to represent multiple potential values (like tables_to_write). Is constructed with
 * one pattern element which states which type and constraint every element in the array must satisfy.
 */
class Array {
public:
    /**
     * @brief Constructs an Array with the pattern every element must follow
     *
     * @param arg The pattern; must not have a default value
     */
    Array(ConfigValue arg);

    /**
     * @brief Add a user provided value to the Array
     *
     * @param value The value to add
     * @param key optional string key to include that will show in error message
     * @return Error if the value does not follow the pattern; nullopt otherwise
     */
    [[nodiscard]] std::optional<Error>
    addValue(Value value, std::optional<std::string_view> key = std::nullopt);

    /** @return Number of values stored in the Array */
    [[nodiscard]] std::size_t
    size() const;

    /**
     * @brief Returns the ConfigValue at the specified index
     *
     * @param idx Index of the ConfigValue to retrieve
     * @return ConfigValue at the specified index
     */
    [[nodiscard]] ConfigValue const&
    at(std::size_t idx) const;

    /** @return The pattern every element follows */
    [[nodiscard]] ConfigValue const&
    getArrayPattern() const;

    [[nodiscard]] std::vector<ConfigValue>::const_iterator
    begin() const;

    [[nodiscard]] std::vector<ConfigValue>::const_iterator
    end() const;

private:
    ConfigValue itemPattern_;
    std::vector<ConfigValue> elements_;
};

}  // namespace util::config
