//
// Per-shard table schema cache fed by FIELD events
//

#include "SchemaRegistry.hpp"

#include <mutex>

#include <fmt/format.h>

#include "base/Errors.hpp"
#include "utils/StringUtil.hpp"

namespace shardstream::vstream {
    SchemaRegistry::SchemaRegistry():
        _logger(createLogger("SchemaRegistry"))
    {
    }

    std::shared_ptr<const TableSchema> SchemaRegistry::applySchemaEvent(const proto::FieldEvent &event) {
        auto [keyspace, table] = utility::splitTableName(event.table_name());
        if (keyspace.empty()) {
            keyspace = event.keyspace();
        }

        TableId tableId { event.shard(), keyspace, table };

        std::vector<ColumnDefinition> columns;
        columns.reserve(event.fields_size());

        int ordinalPosition = 1;
        for (const auto &field: event.fields()) {
            columns.push_back(ColumnDefinition { field.name(), field.type(), ordinalPosition++ });
        }

        auto schema = std::make_shared<const TableSchema>(tableId, std::move(columns));

        {
            std::unique_lock lock(_mutex);
            _schemas[tableId] = schema;
        }

        _logger->debug("schema of {} on shard {} set to [{}]",
                       tableId.qualifiedName(), tableId.shard, utility::join(schema->columnNames(), ", "));

        return schema;
    }

    Tuple SchemaRegistry::decodeRow(const std::string &shard, const std::string &keyspace, const std::string &table,
                                    const proto::Row &row) const {
        TableId tableId { shard, keyspace, table };
        auto schema = tableFor(tableId);

        if (schema == nullptr) {
            throw UnknownSchemaError(fmt::format(
                "no FIELD event received for table {} on shard {} before its ROW event",
                tableId.qualifiedName(), shard
            ));
        }

        const auto &columns = schema->columns();
        if (static_cast<size_t>(row.lengths_size()) != columns.size()) {
            throw SchemaMismatchError(fmt::format(
                "the number of columns in the ROW event ({}) for table {} on shard {} is different from "
                "the in-memory table schema ({} columns: {})",
                row.lengths_size(), tableId.qualifiedName(), shard,
                columns.size(), utility::join(schema->columnNames(), ", ")
            ));
        }

        const std::string &values = row.values();

        Tuple tuple;
        tuple.reserve(columns.size());

        size_t offset = 0;
        for (size_t i = 0; i < columns.size(); i++) {
            const auto length = row.lengths(static_cast<int>(i));

            if (length < 0) {
                tuple.emplace_back(columns[i].name, columns[i].type, std::nullopt);
                continue;
            }

            if (offset + static_cast<size_t>(length) > values.size()) {
                throw MalformedRowError(fmt::format(
                    "row of table {} on shard {} declares {} bytes for column {} but only {} remain",
                    tableId.qualifiedName(), shard, length, columns[i].name, values.size() - offset
                ));
            }

            tuple.emplace_back(columns[i].name, columns[i].type, values.substr(offset, length));
            offset += length;
        }

        return tuple;
    }

    std::shared_ptr<const TableSchema> SchemaRegistry::tableFor(const TableId &tableId) const {
        std::shared_lock lock(_mutex);

        auto it = _schemas.find(tableId);
        if (it == _schemas.end()) {
            return nullptr;
        }

        return it->second;
    }

    size_t SchemaRegistry::size() const {
        std::shared_lock lock(_mutex);
        return _schemas.size();
    }
}
