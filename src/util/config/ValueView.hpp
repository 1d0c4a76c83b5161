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
#include "util/config/ConfigValue.hpp"
#include "util/config/Types.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace util::config {

/**
 * @brief Provides a read-only view of a ConfigValue
 */
class ValueView {
public:
    /**
     * @brief Constructs a ValueView
     *
     * @param configVal The ConfigValue to view
     */
    ValueView(ConfigValue const& configVal);

    /** @return The value as a string; asserts if it is not one */
    [[nodiscard]] std::string
    asString() const;

    /** @return The value as a bool; asserts if it is not one */
    [[nodiscard]] bool
    asBool() const;

    /**
     * @brief Retrieves the value as an integral type
     *
     * @tparam T The integral type to convert to
     * @return The value converted to T
     */
    template <typename T>
    [[nodiscard]] T
    asIntType() const
    {
        ASSERT(type() == ConfigType::Integer && hasValue(), "Value view is not of Int type");

        auto const val = std::get<int64_t>(configVal_.get().getValue());
        if constexpr (std::is_unsigned_v<T>) {
            if (val < 0)
                ASSERT(false, "Int {} cannot be converted to the specified unsigned type", val);
        }
        return static_cast<T>(val);
    }

    /** @return The value as a double; integers are converted */
    [[nodiscard]] double
    asDouble() const;

    /** @return The type of the value */
    [[nodiscard]] ConfigType
    type() const
    {
        return configVal_.get().type();
    }

    /** @return true if the value is set */
    [[nodiscard]] bool
    hasValue() const
    {
        return configVal_.get().hasValue();
    }

    /** @return true if the value may be omitted from the config file */
    [[nodiscard]] bool
    isOptional() const
    {
        return configVal_.get().isOptional();
    }

    /**
     * @brief Get the value as the requested type
     *
     * @tparam T The type to get
     * @return The value
     */
    template <typename T>
    [[nodiscard]] T
    getValueImpl() const
    {
        if constexpr (std::is_same_v<T, bool>) {
            return asBool();
        } else if constexpr (std::is_integral_v<T>) {
            return asIntType<T>();
        } else if constexpr (std::is_same_v<T, std::string>) {
            return asString();
        } else {
            static_assert(std::is_floating_point_v<T>, "Unsupported config value type");
            return static_cast<T>(asDouble());
        }
    }

    /**
     * @brief Get the value if present
     *
     * @tparam T The type to get
     * @return The value, or nullopt if the user did not provide it and there is no default
     */
    template <typename T>
    [[nodiscard]] std::optional<T>
    asOptional() const
    {
        if (!hasValue())
            return std::nullopt;

        return std::make_optional(getValueImpl<T>());
    }

private:
    std::reference_wrapper<ConfigValue const> configVal_;
};

}  // namespace util::config
