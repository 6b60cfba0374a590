//
// Per-shard table schema cache fed by FIELD events
//

#ifndef SHARDSTREAM_VSTREAM_SCHEMAREGISTRY_HPP
#define SHARDSTREAM_VSTREAM_SCHEMAREGISTRY_HPP

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>

#include "vstream/TableSchema.hpp"

#include "utils/log.hpp"

namespace shardstream::vstream {

    /**
     * @brief keeps the latest column layout per (shard, keyspace, table).
     *
     * Sharded clusters migrate one shard at a time, so the same logical table may have
     * different layouts on different shards at the same moment. Schemas are immutable
     * snapshots; a FIELD event swaps the whole snapshot for its key.
     */
    class SchemaRegistry {
    public:
        SchemaRegistry();

        /**
         * @brief installs (or replaces) the schema described by a FIELD event.
         * @note the table name may be qualified ("keyspace.table"); otherwise the event's keyspace is used.
         */
        std::shared_ptr<const TableSchema> applySchemaEvent(const proto::FieldEvent &event);

        /**
         * @brief zips a raw row image with the current schema of the table.
         * @throws UnknownSchemaError if no FIELD event was seen for the key
         * @throws SchemaMismatchError if the value count differs from the column count;
         *         the message lists every column known for the table
         * @throws MalformedRowError if the row lengths overrun its value buffer
         */
        Tuple decodeRow(const std::string &shard, const std::string &keyspace, const std::string &table,
                        const proto::Row &row) const;

        /**
         * @return nullptr if no schema is known for the key
         */
        std::shared_ptr<const TableSchema> tableFor(const TableId &tableId) const;

        size_t size() const;

    private:
        LoggerPtr _logger;

        mutable std::shared_mutex _mutex;
        std::map<TableId, std::shared_ptr<const TableSchema>> _schemas;
    };
}

#endif // SHARDSTREAM_VSTREAM_SCHEMAREGISTRY_HPP
