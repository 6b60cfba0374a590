//
// Logical replication messages produced by the decoder
//

#include "ReplicationMessage.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace shardstream::vstream {

    namespace {
        const std::string emptyString;
        const std::optional<Tuple> noTuple;
    }

    ReplicationMessageColumn::ReplicationMessageColumn(std::string name, ColumnType type,
                                                       std::optional<std::string> value):
        _name(std::move(name)),
        _type(type),
        _value(std::move(value))
    {
    }

    const std::string &ReplicationMessageColumn::name() const {
        return _name;
    }

    ColumnType ReplicationMessageColumn::type() const {
        return _type;
    }

    bool ReplicationMessageColumn::isNull() const {
        return !_value.has_value();
    }

    const std::string &ReplicationMessageColumn::asString() const {
        if (!_value.has_value()) {
            throw std::logic_error(fmt::format("column {} is NULL", _name));
        }

        return *_value;
    }

    int64_t ReplicationMessageColumn::asInt64() const {
        return std::stoll(asString());
    }

    uint64_t ReplicationMessageColumn::asUInt64() const {
        return std::stoull(asString());
    }

    double ReplicationMessageColumn::asDouble() const {
        return std::stod(asString());
    }

    bool ReplicationMessageColumn::isNumeric() const {
        switch (_type) {
            case proto::Field::INT8:
            case proto::Field::UINT8:
            case proto::Field::INT16:
            case proto::Field::UINT16:
            case proto::Field::INT24:
            case proto::Field::UINT24:
            case proto::Field::INT32:
            case proto::Field::UINT32:
            case proto::Field::INT64:
            case proto::Field::UINT64:
            case proto::Field::YEAR:
            case proto::Field::FLOAT32:
            case proto::Field::FLOAT64:
            case proto::Field::DECIMAL:
                return true;
            default:
                return false;
        }
    }

    bool ReplicationMessageColumn::isBinary() const {
        switch (_type) {
            case proto::Field::BINARY:
            case proto::Field::VARBINARY:
            case proto::Field::BLOB:
            case proto::Field::BIT:
            case proto::Field::GEOMETRY:
                return true;
            default:
                return false;
        }
    }

    bool ReplicationMessageColumn::operator==(const ReplicationMessageColumn &other) const {
        return _name == other._name && _type == other._type && _value == other._value;
    }

    ReplicationMessage::ReplicationMessage(int64_t commitTime, std::string transactionId):
        _commitTime(commitTime),
        _transactionId(std::move(transactionId))
    {
    }

    int64_t ReplicationMessage::commitTime() const {
        return _commitTime;
    }

    const std::string &ReplicationMessage::transactionId() const {
        return _transactionId;
    }

    const std::string &ReplicationMessage::table() const {
        return emptyString;
    }

    const std::string &ReplicationMessage::shard() const {
        return emptyString;
    }

    const std::string &ReplicationMessage::statement() const {
        return emptyString;
    }

    const std::optional<Tuple> &ReplicationMessage::oldTuple() const {
        return noTuple;
    }

    const std::optional<Tuple> &ReplicationMessage::newTuple() const {
        return noTuple;
    }

    const char *operationName(ReplicationMessage::Operation operation) {
        switch (operation) {
            case ReplicationMessage::INSERT:
                return "INSERT";
            case ReplicationMessage::UPDATE:
                return "UPDATE";
            case ReplicationMessage::DELETE:
                return "DELETE";
            case ReplicationMessage::BEGIN:
                return "BEGIN";
            case ReplicationMessage::COMMIT:
                return "COMMIT";
            case ReplicationMessage::DDL:
                return "DDL";
            case ReplicationMessage::OTHER:
                return "OTHER";
        }

        return "UNKNOWN";
    }

    TransactionalMessage::TransactionalMessage(Operation operation, int64_t commitTime, std::string transactionId):
        ReplicationMessage(commitTime, std::move(transactionId)),
        _operation(operation)
    {
    }

    ReplicationMessage::Operation TransactionalMessage::operation() const {
        return _operation;
    }

    RowChangeMessage::RowChangeMessage(
        Operation operation,
        int64_t commitTime,
        std::string transactionId,
        std::string table,
        std::string shard,
        std::optional<Tuple> oldTuple,
        std::optional<Tuple> newTuple
    ):
        ReplicationMessage(commitTime, std::move(transactionId)),
        _operation(operation),
        _table(std::move(table)),
        _shard(std::move(shard)),
        _oldTuple(std::move(oldTuple)),
        _newTuple(std::move(newTuple))
    {
    }

    ReplicationMessage::Operation RowChangeMessage::operation() const {
        return _operation;
    }

    const std::string &RowChangeMessage::table() const {
        return _table;
    }

    const std::string &RowChangeMessage::shard() const {
        return _shard;
    }

    const std::optional<Tuple> &RowChangeMessage::oldTuple() const {
        return _oldTuple;
    }

    const std::optional<Tuple> &RowChangeMessage::newTuple() const {
        return _newTuple;
    }

    DdlMessage::DdlMessage(int64_t commitTime, std::string transactionId, std::string statement):
        ReplicationMessage(commitTime, std::move(transactionId)),
        _statement(std::move(statement))
    {
    }

    ReplicationMessage::Operation DdlMessage::operation() const {
        return DDL;
    }

    const std::string &DdlMessage::statement() const {
        return _statement;
    }

    OtherMessage::OtherMessage(int64_t commitTime, std::string transactionId):
        ReplicationMessage(commitTime, std::move(transactionId))
    {
    }

    ReplicationMessage::Operation OtherMessage::operation() const {
        return OTHER;
    }
}
