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

#include "util/config/Error.hpp"
#include "util/config/Types.hpp"
#include "util/log/Logger.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace util::config {

/**
 * @brief specific values that are accepted for logger levels in config.
 */
static constexpr std::array<char const*, 7> kLOG_LEVELS = {
    "trace",
    "debug",
    "info",
    "warning",
    "warn",
    "error",
    "fatal",
};

/**
 * @brief Processor types known to the extractor registry.
 */
static constexpr std::array<char const*, 12> kPROCESSOR_TYPES = {
    "default_processor",
    "events_processor",
    "user_transaction_processor",
    "fungible_asset_processor",
    "account_transactions_processor",
    "objects_processor",
    "parquet_default_processor",
    "parquet_events_processor",
    "parquet_user_transaction_processor",
    "parquet_fungible_asset_processor",
    "parquet_account_transactions_processor",
    "parquet_objects_processor",
};

static constexpr std::array<char const*, 2> kPROCESSOR_MODES = {"default", "backfill"};

static constexpr std::array<char const*, 2> kDATABASE_TYPES = {"postgres_config", "parquet_config"};

static constexpr std::array<char const*, 2> kEXTRACTION_FAILURE_POLICIES = {"skip", "fatal"};

/**
 * @brief An interface to enforce constraints on certain values within the config definition.
 */
class Constraint {
public:
    constexpr virtual ~Constraint() noexcept = default;

    /**
     * @brief Check if the value meets the specific constraint.
     *
     * @param val The value to be checked
     * @return An Error object if the constraint is not met, nullopt otherwise
     */
    [[nodiscard]]
    std::optional<Error>
    checkConstraint(Value const& val) const
    {
        if (auto const maybeError = checkTypeImpl(val); maybeError.has_value())
            return maybeError;
        return checkValueImpl(val);
    }

protected:
    /**
     * @brief Creates an error message for all constraints that must satisfy certain hard-coded values.
     *
     * @tparam ArrSize the size of the array of hardcoded values
     * @param key The key to the value
     * @param value The value the user provided
     * @param arr The array with hard-coded values to add to error message
     * @return The error message specifying what the value of key must be
     */
    template <std::size_t ArrSize>
    constexpr std::string
    makeErrorMsg(std::string_view key, Value const& value, std::array<char const*, ArrSize> arr) const
    {
        auto const valueStr = std::visit([](auto const& v) { return fmt::format("{}", v); }, value);

        return fmt::format(
            R"(You provided value "{}". Key "{}"'s value must be one of the following: {})",
            valueStr,
            key,
            fmt::join(arr, ", ")
        );
    }

    /**
     * @brief Check if the value is of a correct type for the constraint.
     *
     * @param val The value type to be checked
     * @return An Error object if the constraint is not met, nullopt otherwise
     */
    virtual std::optional<Error>
    checkTypeImpl(Value const& val) const = 0;

    /**
     * @brief Check if the value is within the constraint.
     *
     * @param val The value type to be checked
     * @return An Error object if the constraint is not met, nullopt otherwise
     */
    virtual std::optional<Error>
    checkValueImpl(Value const& val) const = 0;
};

/**
 * @brief A constraint to ensure the port number is within a valid range.
 */
class PortConstraint final : public Constraint {
public:
    constexpr ~PortConstraint() noexcept override
    {
    }

private:
    [[nodiscard]] std::optional<Error>
    checkTypeImpl(Value const& port) const override;

    [[nodiscard]] std::optional<Error>
    checkValueImpl(Value const& port) const override;

    static constexpr uint32_t kPORT_MIN = 1;
    static constexpr uint32_t kPORT_MAX = 65535;
};

/**
 * @brief A constraint class to ensure the provided value is one of the specified values in an array.
 *
 * @tparam ArrSize The size of the array containing the valid values for the constraint
 */
template <std::size_t ArrSize>
class OneOf final : public Constraint {
public:
    /**
     * @brief Constructs a constraint where the value must be one of the values in the provided array.
     *
     * @param key The key of the ConfigValue that has this constraint
     * @param arr The value that has this constraint must be of the values in arr
     */
    constexpr OneOf(std::string_view key, std::array<char const*, ArrSize> arr) : key_{key}, arr_{arr}
    {
    }

    constexpr ~OneOf() noexcept override = default;

private:
    [[nodiscard]] std::optional<Error>
    checkTypeImpl(Value const& val) const override
    {
        if (!std::holds_alternative<std::string>(val))
            return Error{fmt::format(R"(Key "{}"'s value must be a string)", key_)};
        return std::nullopt;
    }

    [[nodiscard]] std::optional<Error>
    checkValueImpl(Value const& val) const override
    {
        auto const check = [&val](std::string_view name) { return std::get<std::string>(val) == name; };
        if (std::ranges::any_of(arr_, check))
            return std::nullopt;

        return Error{makeErrorMsg(key_, val, arr_)};
    }

    std::string_view key_;
    std::array<char const*, ArrSize> arr_;
};

/**
 * @brief A constraint class to ensure an integer value is between two numbers (inclusive)
 */
template <typename NumType>
class NumberValueConstraint final : public Constraint {
public:
    /**
     * @brief Constructs a constraint where the number must be between min and max.
     *
     * @param min the minimum number it can be to satisfy this constraint
     * @param max the maximum number it can be to satisfy this constraint
     */
    constexpr NumberValueConstraint(NumType min, NumType max) : min_{min}, max_{max}
    {
    }

    constexpr ~NumberValueConstraint() noexcept override = default;

private:
    [[nodiscard]] std::optional<Error>
    checkTypeImpl(Value const& num) const override
    {
        if (!std::holds_alternative<int64_t>(num))
            return Error{"Number must be of type integer"};
        return std::nullopt;
    }

    [[nodiscard]] std::optional<Error>
    checkValueImpl(Value const& num) const override
    {
        auto const numValue = std::get<int64_t>(num);
        if (numValue >= static_cast<int64_t>(min_) && numValue <= static_cast<int64_t>(max_))
            return std::nullopt;
        return Error{fmt::format("Number must be between {} and {}", min_, max_)};
    }

    NumType min_;
    NumType max_;
};

/**
 * @brief A constraint to ensure a double number is positive
 */
class PositiveDouble final : public Constraint {
public:
    constexpr ~PositiveDouble() noexcept override
    {
    }

private:
    [[nodiscard]] std::optional<Error>
    checkTypeImpl(Value const& num) const override;

    [[nodiscard]] std::optional<Error>
    checkValueImpl(Value const& num) const override;
};

static constexpr PortConstraint validatePort{};
static constexpr PositiveDouble validatePositiveDouble{};

static constexpr OneOf validateChannelName{"channel", Logger::kCHANNELS};
static constexpr OneOf validateLogLevelName{"log_level", kLOG_LEVELS};
static constexpr OneOf validateProcessorType{"processor_config.type", kPROCESSOR_TYPES};
static constexpr OneOf validateProcessorMode{"processor_mode.type", kPROCESSOR_MODES};
static constexpr OneOf validateDatabaseType{"db_config.type", kDATABASE_TYPES};
static constexpr OneOf validateExtractionFailurePolicy{
    "processor_config.extraction_failure_policy",
    kEXTRACTION_FAILURE_POLICIES
};

static constexpr NumberValueConstraint<uint32_t> validateUint32{
    std::numeric_limits<uint32_t>::min(),
    std::numeric_limits<uint32_t>::max()
};
static constexpr NumberValueConstraint<uint32_t> validatePositiveUint32{1, std::numeric_limits<uint32_t>::max()};
static constexpr NumberValueConstraint<int64_t> validateVersion{0, std::numeric_limits<int64_t>::max()};

}  // namespace util::config
