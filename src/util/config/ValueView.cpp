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

#include "util/config/ValueView.hpp"

#include "util/Assert.hpp"
#include "util/config/ConfigValue.hpp"
#include "util/config/Types.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace util::config {

ValueView::ValueView(ConfigValue const& configVal) : configVal_{configVal}
{
}

std::string
ValueView::asString() const
{
    ASSERT(type() == ConfigType::String && hasValue(), "Value view is not of String type");
    return std::get<std::string>(configVal_.get().getValue());
}

bool
ValueView::asBool() const
{
    ASSERT(type() == ConfigType::Boolean && hasValue(), "Value view is not of Bool type");
    return std::get<bool>(configVal_.get().getValue());
}

double
ValueView::asDouble() const
{
    ASSERT(
        (type() == ConfigType::Double || type() == ConfigType::Integer) && hasValue(),
        "Value view is not of Double type"
    );

    auto const& val = configVal_.get().getValue();
    if (std::holds_alternative<int64_t>(val))
        return static_cast<double>(std::get<int64_t>(val));
    return std::get<double>(val);
}

}  // namespace util::config
