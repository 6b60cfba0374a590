//
// Multi-shard replication position (VGTID)
//

#include "Position.hpp"

#include <algorithm>
#include <tuple>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "base/Errors.hpp"
#include "utils/log.hpp"

#include "vstream.pb.h"

namespace shardstream::vstream {

    namespace {
        LoggerPtr logger = createLogger("Position");

        bool shardLess(const ShardPosition &a, const ShardPosition &b) {
            return std::tie(a.keyspace, a.shard) < std::tie(b.keyspace, b.shard);
        }

        std::string readStringMember(const nlohmann::json &obj, const char *key, bool required) {
            if (!obj.contains(key) || obj.at(key).is_null()) {
                if (required) {
                    throw MalformedPositionError(fmt::format("position entry is missing '{}'", key));
                }
                return std::string();
            }

            const auto &value = obj.at(key);
            if (!value.is_string()) {
                throw MalformedPositionError(fmt::format("position entry field '{}' must be a string", key));
            }

            return value.get<std::string>();
        }
    }

    const std::string Position::CURRENT_GTID = "current";

    bool ShardPosition::operator==(const ShardPosition &other) const {
        return keyspace == other.keyspace && shard == other.shard && gtid == other.gtid;
    }

    bool ShardPosition::operator!=(const ShardPosition &other) const {
        return !(*this == other);
    }

    Position::Position(std::vector<ShardPosition> entries):
        _entries(std::move(entries))
    {
    }

    Position Position::fromRawSnapshot(std::vector<ShardPosition> entries) {
        std::sort(entries.begin(), entries.end(), shardLess);

        auto duplicate = std::adjacent_find(entries.begin(), entries.end(), [](const auto &a, const auto &b) {
            return a.keyspace == b.keyspace && a.shard == b.shard;
        });

        if (duplicate != entries.end()) {
            throw MalformedPositionError(fmt::format(
                "duplicate position entry for keyspace '{}' shard '{}'",
                duplicate->keyspace, duplicate->shard
            ));
        }

        return Position(std::move(entries));
    }

    Position Position::fromProtobuf(const proto::VGtid &vgtid) {
        std::vector<ShardPosition> entries;
        entries.reserve(vgtid.shard_gtids_size());

        for (const auto &shardGtid: vgtid.shard_gtids()) {
            entries.push_back(ShardPosition { shardGtid.keyspace(), shardGtid.shard(), shardGtid.gtid() });
        }

        return fromRawSnapshot(std::move(entries));
    }

    Position Position::fromCanonicalString(const std::string &text) {
        auto document = nlohmann::json::parse(text, nullptr, false);
        if (document.is_discarded()) {
            throw MalformedPositionError(fmt::format("position is not valid JSON: {}", text));
        }

        if (!document.is_array()) {
            throw MalformedPositionError(fmt::format("position must be a JSON array: {}", text));
        }

        std::vector<ShardPosition> entries;
        for (const auto &item: document) {
            if (!item.is_object()) {
                throw MalformedPositionError(fmt::format("position entries must be objects: {}", text));
            }

            entries.push_back(ShardPosition {
                readStringMember(item, "keyspace", true),
                readStringMember(item, "shard", false),
                readStringMember(item, "gtid", true)
            });
        }

        return fromRawSnapshot(std::move(entries));
    }

    Position Position::defaultFor(const KeyspaceSelector &selector) {
        if (selector.shard.empty()) {
            auto position = Position({ ShardPosition { selector.keyspace, "", CURRENT_GTID } });
            logger->info("default position '{}' is set to the current gtid of all shards from keyspace: {}",
                         position.canonicalString(), selector.keyspace);
            return position;
        }

        const std::string gtid = selector.gtid.empty() ? CURRENT_GTID : selector.gtid;
        auto position = Position({ ShardPosition { selector.keyspace, selector.shard, gtid } });
        logger->info("position '{}' is set to the gtid {} for keyspace: {} shard: {}",
                     position.canonicalString(), gtid, selector.keyspace, selector.shard);
        return position;
    }

    bool Position::isResolved() const {
        if (_entries.empty()) {
            return false;
        }

        return std::none_of(_entries.begin(), _entries.end(), [](const auto &entry) {
            return entry.gtid == CURRENT_GTID;
        });
    }

    bool Position::empty() const {
        return _entries.empty();
    }

    const std::vector<ShardPosition> &Position::entries() const {
        return _entries;
    }

    std::string Position::canonicalString() const {
        auto array = nlohmann::ordered_json::array();

        for (const auto &entry: _entries) {
            nlohmann::ordered_json item;
            item["keyspace"] = entry.keyspace;
            item["shard"] = entry.shard;
            item["gtid"] = entry.gtid;
            array.push_back(std::move(item));
        }

        return array.dump();
    }

    void Position::toProtobuf(proto::VGtid *out) const {
        if (out == nullptr) {
            return;
        }

        out->Clear();
        for (const auto &entry: _entries) {
            auto *shardGtid = out->add_shard_gtids();
            shardGtid->set_keyspace(entry.keyspace);
            shardGtid->set_shard(entry.shard);
            shardGtid->set_gtid(entry.gtid);
        }
    }

    bool Position::operator==(const Position &other) const {
        return _entries == other._entries;
    }

    bool Position::operator!=(const Position &other) const {
        return !(*this == other);
    }
}
