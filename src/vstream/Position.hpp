//
// Multi-shard replication position (VGTID)
//

#ifndef SHARDSTREAM_VSTREAM_POSITION_HPP
#define SHARDSTREAM_VSTREAM_POSITION_HPP

#include <string>
#include <vector>

#include "vstream/proto/vstream_fwd.hpp"

namespace shardstream::vstream {

    /**
     * @brief position of a single shard
     * @note an empty shard name means "every shard of the keyspace".
     */
    struct ShardPosition {
        std::string keyspace;
        std::string shard;
        std::string gtid;

        bool operator==(const ShardPosition &other) const;
        bool operator!=(const ShardPosition &other) const;
    };

    /**
     * @brief what to replicate when no position is known yet
     */
    struct KeyspaceSelector {
        std::string keyspace;
        /** empty: all shards of the keyspace */
        std::string shard;
        /** only used together with shard */
        std::string gtid;
    };

    /**
     * @brief immutable set of per-shard positions.
     *
     * Entries are kept ordered by (keyspace, shard) with at most one entry per pair,
     * so structural equality and the canonical string do not depend on the order
     * the gateway listed the shards in.
     */
    class Position {
    public:
        /** sentinel gtid: "start from the current tail of the shard" */
        static const std::string CURRENT_GTID;

        Position() = default;

        /**
         * @throws MalformedPositionError if two entries name the same (keyspace, shard)
         */
        static Position fromRawSnapshot(std::vector<ShardPosition> entries);
        static Position fromProtobuf(const proto::VGtid &vgtid);

        /**
         * @brief parses a string produced by canonicalString() (e.g. a persisted offset)
         * @throws MalformedPositionError
         */
        static Position fromCanonicalString(const std::string &text);

        /**
         * @brief the position requesting the current tail of the selected keyspace / shard
         */
        static Position defaultFor(const KeyspaceSelector &selector);

        /**
         * @brief true if the position is non-empty and no entry holds CURRENT_GTID
         */
        bool isResolved() const;
        bool empty() const;

        const std::vector<ShardPosition> &entries() const;

        /**
         * @brief JSON array of {"keyspace","shard","gtid"} objects in (keyspace, shard) order
         */
        std::string canonicalString() const;

        void toProtobuf(proto::VGtid *out) const;

        bool operator==(const Position &other) const;
        bool operator!=(const Position &other) const;

    private:
        explicit Position(std::vector<ShardPosition> entries);

        std::vector<ShardPosition> _entries;
    };
}

#endif // SHARDSTREAM_VSTREAM_POSITION_HPP
