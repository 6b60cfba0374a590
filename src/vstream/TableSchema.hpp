//
// Column layout of one table on one shard
//

#ifndef SHARDSTREAM_VSTREAM_TABLESCHEMA_HPP
#define SHARDSTREAM_VSTREAM_TABLESCHEMA_HPP

#include <string>
#include <vector>

#include "vstream/ReplicationMessage.hpp"

namespace shardstream::vstream {

    /**
     * @brief (shard, keyspace, table); the same table on two shards is two schemas
     */
    struct TableId {
        std::string shard;
        std::string keyspace;
        std::string table;

        bool operator==(const TableId &other) const;
        bool operator<(const TableId &other) const;

        /** @brief "keyspace.table" */
        std::string qualifiedName() const;
    };

    struct ColumnDefinition {
        std::string name;
        ColumnType type;
        /** 1-based */
        int ordinalPosition;
    };

    class TableSchema {
    public:
        TableSchema(TableId id, std::vector<ColumnDefinition> columns);

        const TableId &id() const;
        const std::vector<ColumnDefinition> &columns() const;

        std::vector<std::string> columnNames() const;

        bool operator==(const TableSchema &other) const;

    private:
        TableId _id;
        std::vector<ColumnDefinition> _columns;
    };
}

#endif // SHARDSTREAM_VSTREAM_TABLESCHEMA_HPP
