//
// Logical replication messages produced by the decoder
//

#ifndef SHARDSTREAM_VSTREAM_REPLICATIONMESSAGE_HPP
#define SHARDSTREAM_VSTREAM_REPLICATIONMESSAGE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "vstream.pb.h"

namespace shardstream::vstream {

    using ColumnType = proto::Field::Type;

    /**
     * @brief one decoded column of a row image
     *
     * The value keeps the textual encoding the gateway sent; typed accessors convert on demand.
     */
    class ReplicationMessageColumn {
    public:
        ReplicationMessageColumn(std::string name, ColumnType type, std::optional<std::string> value);

        const std::string &name() const;
        ColumnType type() const;

        bool isNull() const;

        /**
         * @throws std::logic_error if the column is NULL
         */
        const std::string &asString() const;
        int64_t asInt64() const;
        uint64_t asUInt64() const;
        double asDouble() const;

        /**
         * @brief true for integral and floating point column types
         */
        bool isNumeric() const;

        /**
         * @brief true for column types whose value is raw bytes (BINARY, VARBINARY, BLOB, BIT, GEOMETRY)
         */
        bool isBinary() const;

        bool operator==(const ReplicationMessageColumn &other) const;

    private:
        std::string _name;
        ColumnType _type;
        std::optional<std::string> _value;
    };

    using Tuple = std::vector<ReplicationMessageColumn>;

    class ReplicationMessage {
    public:
        enum Operation {
            INSERT,
            UPDATE,
            DELETE,
            BEGIN,
            COMMIT,
            DDL,
            OTHER
        };

        virtual ~ReplicationMessage() = default;

        virtual Operation operation() const = 0;

        /** @brief seconds since epoch, as stamped on the source event */
        int64_t commitTime() const;
        const std::string &transactionId() const;

        /** @brief "keyspace.table"; empty for non-row messages */
        virtual const std::string &table() const;
        virtual const std::string &shard() const;

        /** @brief DDL text; empty for other messages */
        virtual const std::string &statement() const;

        virtual const std::optional<Tuple> &oldTuple() const;
        virtual const std::optional<Tuple> &newTuple() const;

    protected:
        ReplicationMessage(int64_t commitTime, std::string transactionId);

    private:
        int64_t _commitTime;
        std::string _transactionId;
    };

    const char *operationName(ReplicationMessage::Operation operation);

    class TransactionalMessage final: public ReplicationMessage {
    public:
        TransactionalMessage(Operation operation, int64_t commitTime, std::string transactionId);

        Operation operation() const override;

    private:
        Operation _operation;
    };

    class RowChangeMessage final: public ReplicationMessage {
    public:
        RowChangeMessage(
            Operation operation,
            int64_t commitTime,
            std::string transactionId,
            std::string table,
            std::string shard,
            std::optional<Tuple> oldTuple,
            std::optional<Tuple> newTuple
        );

        Operation operation() const override;

        const std::string &table() const override;
        const std::string &shard() const override;

        const std::optional<Tuple> &oldTuple() const override;
        const std::optional<Tuple> &newTuple() const override;

    private:
        Operation _operation;

        std::string _table;
        std::string _shard;

        std::optional<Tuple> _oldTuple;
        std::optional<Tuple> _newTuple;
    };

    class DdlMessage final: public ReplicationMessage {
    public:
        DdlMessage(int64_t commitTime, std::string transactionId, std::string statement);

        Operation operation() const override;
        const std::string &statement() const override;

    private:
        std::string _statement;
    };

    /**
     * @brief heartbeats, version markers and every other payload-free event
     */
    class OtherMessage final: public ReplicationMessage {
    public:
        OtherMessage(int64_t commitTime, std::string transactionId);

        Operation operation() const override;
    };
}

#endif // SHARDSTREAM_VSTREAM_REPLICATIONMESSAGE_HPP
