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

#include "etl/Models.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace etl {

/**
 * @brief Maps one transaction to the records of the tables it owns
 *
 * Implementations keep no state between transactions so that several transactions can be extracted at once.
 */
class ExtractorInterface {
public:
    virtual ~ExtractorInterface() = default;

    /** @return Name of the extractor, used in logs and errors */
    [[nodiscard]] virtual std::string_view
    name() const = 0;

    /** @return The tables this extractor writes */
    [[nodiscard]] virtual std::vector<TableSpec> const&
    tables() const = 0;

    /**
     * @brief Extract the records of one transaction
     *
     * @param transaction The transaction
     * @return The records in the order they should be written; a description of the problem if the payload could not
     * be decoded
     */
    [[nodiscard]] virtual std::expected<std::vector<ExtractedRecord>, std::string>
    extract(Transaction const& transaction) const = 0;
};

}  // namespace etl
