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

#include "etl/Models.hpp"
#include "etl/extractors/ExtractorUtils.hpp"
#include "etl/extractors/Extractors.hpp"

#include <boost/json/object.hpp>
#include <fmt/core.h>

#include <indexer/v1/transaction.pb.h>

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace etl::extractors {

namespace {

using enum ColumnType;

constexpr std::string_view kOBJECT_CORE = "0x1::object::ObjectCore";

enum TableIndex { kOBJECTS, kCURRENT_OBJECTS };

std::vector<TableSpec>
makeTables()
{
    return {
        TableSpec{
            .name = "objects",
            .kind = MutationKind::InsertImmutable,
            .primaryKey = {"transaction_version", "write_set_change_index"},
            .columns =
                {{"transaction_version", Integer},
                 {"write_set_change_index", Integer},
                 {"object_address", Text},
                 {"owner_address", Text},
                 {"state_key_hash", Text},
                 {"guid_creation_num", Text},
                 {"allow_ungated_transfer", Boolean},
                 {"is_deleted", Boolean}}
        },
        TableSpec{
            .name = "current_objects",
            .kind = MutationKind::UpsertCurrent,
            .primaryKey = {"object_address"},
            .columns =
                {{"object_address", Text},
                 {"owner_address", Text},
                 {"state_key_hash", Text},
                 {"last_guid_creation_num", Text},
                 {"allow_ungated_transfer", Boolean}}
        },
    };
}

struct ObjectCore {
    std::string owner;
    std::string guidCreationNum;
    bool allowUngatedTransfer = false;
};

std::expected<ObjectCore, std::string>
parseObjectCore(std::string const& data)
{
    auto const object = parseObject(data);
    if (not object.has_value())
        return std::unexpected{object.error()};

    auto const* owner = object->if_contains("owner");
    auto const* allow = object->if_contains("allow_ungated_transfer");
    auto guid = decimalMember(*object, "guid_creation_num");
    if (owner == nullptr or not owner->is_string() or allow == nullptr or not allow->is_bool() or not guid)
        return std::unexpected{std::string{"Malformed ObjectCore"}};

    return ObjectCore{
        .owner = standardizeAddress(owner->as_string()),
        .guidCreationNum = std::move(*guid),
        .allowUngatedTransfer = allow->as_bool()
    };
}

}  // namespace

ObjectsExtractor::ObjectsExtractor() : TableExtractor{"objects", makeTables()}
{
}

std::expected<std::vector<ExtractedRecord>, std::string>
ObjectsExtractor::extract(Transaction const& transaction) const
{
    using indexer::v1::WriteSetChange;

    auto const& txn = *transaction.payload;
    auto const version = toBigInt(txn.version());
    if (not version)
        return std::unexpected{version.error()};

    std::vector<ExtractedRecord> records;

    for (int index = 0; index < txn.changes_size(); ++index) {
        auto const& change = txn.changes(index);
        if (change.resource_type() != kOBJECT_CORE)
            continue;

        auto const address = standardizeAddress(change.address());

        if (change.type() == WriteSetChange::TYPE_DELETE_RESOURCE) {
            records.push_back(makeRecord(
                table(kOBJECTS),
                transaction.version,
                {{"transaction_version", *version},
                 {"write_set_change_index", static_cast<std::int64_t>(index)},
                 {"object_address", address},
                 {"owner_address", std::monostate{}},
                 {"state_key_hash", change.state_key_hash()},
                 {"guid_creation_num", std::monostate{}},
                 {"allow_ungated_transfer", std::monostate{}},
                 {"is_deleted", true}}
            ));
            records.push_back(makeRecord(
                table(kCURRENT_OBJECTS),
                transaction.version,
                {{"object_address", address},
                 {"owner_address", std::monostate{}},
                 {"state_key_hash", change.state_key_hash()},
                 {"last_guid_creation_num", std::monostate{}},
                 {"allow_ungated_transfer", std::monostate{}}},
                MutationKind::DeleteMarker
            ));
            continue;
        }

        if (change.type() != WriteSetChange::TYPE_WRITE_RESOURCE)
            continue;

        auto const core = parseObjectCore(change.data());
        if (not core.has_value())
            return std::unexpected{fmt::format("Write set change {}: {}", index, core.error())};

        records.push_back(makeRecord(
            table(kOBJECTS),
            transaction.version,
            {{"transaction_version", *version},
             {"write_set_change_index", static_cast<std::int64_t>(index)},
             {"object_address", address},
             {"owner_address", core->owner},
             {"state_key_hash", change.state_key_hash()},
             {"guid_creation_num", core->guidCreationNum},
             {"allow_ungated_transfer", core->allowUngatedTransfer},
             {"is_deleted", false}}
        ));
        records.push_back(makeRecord(
            table(kCURRENT_OBJECTS),
            transaction.version,
            {{"object_address", address},
             {"owner_address", core->owner},
             {"state_key_hash", change.state_key_hash()},
             {"last_guid_creation_num", core->guidCreationNum},
             {"allow_ungated_transfer", core->allowUngatedTransfer}}
        ));
    }

    return records;
}

}  // namespace etl::extractors
