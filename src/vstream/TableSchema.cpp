//
// Column layout of one table on one shard
//

#include "TableSchema.hpp"

#include <algorithm>
#include <iterator>
#include <tuple>

namespace shardstream::vstream {
    bool TableId::operator==(const TableId &other) const {
        return shard == other.shard && keyspace == other.keyspace && table == other.table;
    }

    bool TableId::operator<(const TableId &other) const {
        return std::tie(shard, keyspace, table) < std::tie(other.shard, other.keyspace, other.table);
    }

    std::string TableId::qualifiedName() const {
        return keyspace + "." + table;
    }

    TableSchema::TableSchema(TableId id, std::vector<ColumnDefinition> columns):
        _id(std::move(id)),
        _columns(std::move(columns))
    {
    }

    const TableId &TableSchema::id() const {
        return _id;
    }

    const std::vector<ColumnDefinition> &TableSchema::columns() const {
        return _columns;
    }

    std::vector<std::string> TableSchema::columnNames() const {
        std::vector<std::string> names;
        names.reserve(_columns.size());

        std::transform(_columns.begin(), _columns.end(), std::back_inserter(names), [](const auto &column) {
            return column.name;
        });

        return names;
    }

    bool TableSchema::operator==(const TableSchema &other) const {
        if (!(_id == other._id) || _columns.size() != other._columns.size()) {
            return false;
        }

        for (size_t i = 0; i < _columns.size(); i++) {
            const auto &a = _columns[i];
            const auto &b = other._columns[i];

            if (a.name != b.name || a.type != b.type || a.ordinalPosition != b.ordinalPosition) {
                return false;
            }
        }

        return true;
    }
}
