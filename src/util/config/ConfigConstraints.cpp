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

#include "util/config/ConfigConstraints.hpp"

#include "util/config/Error.hpp"
#include "util/config/Types.hpp"

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <variant>

namespace util::config {

std::optional<Error>
PortConstraint::checkTypeImpl(Value const& port) const
{
    if (!(std::holds_alternative<int64_t>(port) || std::holds_alternative<std::string>(port)))
        return Error{"Port must be a string or integer"};
    return std::nullopt;
}

std::optional<Error>
PortConstraint::checkValueImpl(Value const& port) const
{
    int64_t p = 0;
    if (std::holds_alternative<std::string>(port)) {
        auto const& str = std::get<std::string>(port);
        auto const [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), p);
        if (ec != std::errc{} || ptr != str.data() + str.size())
            return Error{"Port string must be an integer."};
    } else {
        p = std::get<int64_t>(port);
    }

    if (p >= kPORT_MIN && p <= kPORT_MAX)
        return std::nullopt;
    return Error{"Port does not satisfy the constraint bounds"};
}

std::optional<Error>
PositiveDouble::checkTypeImpl(Value const& num) const
{
    if (!(std::holds_alternative<double>(num) || std::holds_alternative<int64_t>(num)))
        return Error{"Double number must be of type int or double"};
    return std::nullopt;
}

std::optional<Error>
PositiveDouble::checkValueImpl(Value const& num) const
{
    auto const value = std::holds_alternative<double>(num) ? std::get<double>(num)
                                                           : static_cast<double>(std::get<int64_t>(num));
    if (value >= 0)
        return std::nullopt;
    return Error{"Double number must not be negative"};
}

}  // namespace util::config
