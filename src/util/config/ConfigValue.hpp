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
#include "util/config/ConfigConstraints.hpp"
#include "util/config/Error.hpp"
#include "util/config/Types.hpp"

#include <fmt/core.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace util::config {

/**
 * @brief Represents one config value in the config definition
 *
 * Used in IndexerConfigDefinition to indicate the required type of value and whether it is mandatory to specify in
 * the configuration
 */
class ConfigValue {
public:
    /**
     * @brief Constructor initializing with the config type
     *
     * @param type The type of the config value
     */
    constexpr ConfigValue(ConfigType type) : type_(type)
    {
    }

    /**
     * @brief Sets the default value for the config
     *
     * @param value The default value
     * @return Reference to this ConfigValue
     */
    [[nodiscard]] ConfigValue&
    defaultValue(Value value)
    {
        if (auto const err = checkTypeConsistency(type_, value); err.has_value())
            ASSERT(false, "Default value has the wrong type: {}", err->error);
        value_ = std::move(value);
        return *this;
    }

    /**
     * @brief Sets the value given by the user's config file
     *
     * @param value The value to set
     * @param key The config key associated with the value; used in the error message
     * @return Error if the value is of the wrong type or does not satisfy the constraint; nullopt otherwise
     */
    [[nodiscard]] std::optional<Error>
    setValue(Value value, std::optional<std::string_view> key = std::nullopt)
    {
        auto err = checkTypeConsistency(type_, value);
        if (err.has_value()) {
            if (key.has_value())
                err->error = fmt::format("{} {}", key.value(), err->error);
            return err;
        }

        if (cons_.has_value()) {
            auto constraintCheck = cons_->get().checkConstraint(value);
            if (constraintCheck.has_value()) {
                if (key.has_value())
                    constraintCheck->error = fmt::format("{} {}", key.value(), constraintCheck->error);
                return constraintCheck;
            }
        }
        value_ = std::move(value);
        return std::nullopt;
    }

    /**
     * @brief Assigns a constraint to the ConfigValue.
     *
     * If the ConfigValue already holds a default value it must satisfy the constraint.
     *
     * @param cons The constraint to be applied to the ConfigValue.
     * @return A reference to the modified ConfigValue object.
     */
    [[nodiscard]] ConfigValue&
    withConstraint(Constraint const& cons)
    {
        cons_ = std::reference_wrapper<Constraint const>(cons);

        if (value_.has_value()) {
            if (auto const result = cons.checkConstraint(value_.value()); result.has_value())
                ASSERT(false, "Default value does not satisfy the set constraint: {}", result->error);
        }
        return *this;
    }

    /**
     * @brief Retrieves the constraint associated with this ConfigValue, if any.
     *
     * @return An optional reference to the associated Constraint.
     */
    [[nodiscard]] std::optional<std::reference_wrapper<Constraint const>>
    getConstraint() const
    {
        return cons_;
    }

    /** @return The config type */
    [[nodiscard]] constexpr ConfigType
    type() const
    {
        return type_;
    }

    /**
     * @brief Sets the config value as optional, meaning the user doesn't have to provide the value in their config
     *
     * @return Reference to this ConfigValue
     */
    [[nodiscard]] constexpr ConfigValue&
    optional()
    {
        optional_ = true;
        return *this;
    }

    /** @return true if optional, false otherwise */
    [[nodiscard]] constexpr bool
    isOptional() const
    {
        return optional_;
    }

    /** @return true if a default or user value is present */
    [[nodiscard]] constexpr bool
    hasValue() const
    {
        return value_.has_value();
    }

    /** @return The value held */
    [[nodiscard]] Value const&
    getValue() const
    {
        ASSERT(value_.has_value(), "ConfigValue does not hold a value");
        return value_.value();
    }

private:
    static std::optional<Error>
    checkTypeConsistency(ConfigType type, Value const& value)
    {
        if (type == ConfigType::String && !std::holds_alternative<std::string>(value))
            return Error{"value does not match type string"};
        if (type == ConfigType::Boolean && !std::holds_alternative<bool>(value))
            return Error{"value does not match type boolean"};
        // whole numbers in the config file are accepted where a double is expected
        if (type == ConfigType::Double && !std::holds_alternative<double>(value) &&
            !std::holds_alternative<int64_t>(value))
            return Error{"value does not match type double"};
        if (type == ConfigType::Integer && !std::holds_alternative<int64_t>(value))
            return Error{"value does not match type integer"};
        return std::nullopt;
    }

    ConfigType type_{};
    bool optional_{false};
    std::optional<Value> value_;
    std::optional<std::reference_wrapper<Constraint const>> cons_;
};

}  // namespace util::config
