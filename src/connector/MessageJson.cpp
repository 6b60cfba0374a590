//
// JSON rendering of replication messages
//

#include "MessageJson.hpp"

#include "utils/StringUtil.hpp"

namespace shardstream::connector {

    namespace {
        nlohmann::ordered_json tupleToJson(const vstream::Tuple &tuple) {
            auto object = nlohmann::ordered_json::object();

            for (const auto &column: tuple) {
                if (column.isNull()) {
                    object[column.name()] = nullptr;
                } else if (column.isBinary()) {
                    object[column.name()] = utility::toHex(column.asString());
                } else {
                    object[column.name()] = column.asString();
                }
            }

            return object;
        }
    }

    nlohmann::ordered_json messageToJson(const vstream::ReplicationMessage &message,
                                         const std::optional<vstream::Position> &position) {
        using vstream::ReplicationMessage;

        nlohmann::ordered_json json;
        json["operation"] = vstream::operationName(message.operation());
        json["commitTime"] = message.commitTime();
        json["transactionId"] = message.transactionId();

        switch (message.operation()) {
            case ReplicationMessage::INSERT:
            case ReplicationMessage::UPDATE:
            case ReplicationMessage::DELETE:
                json["table"] = message.table();
                json["shard"] = message.shard();
                json["before"] = message.oldTuple().has_value() ?
                    tupleToJson(*message.oldTuple()) : nlohmann::ordered_json(nullptr);
                json["after"] = message.newTuple().has_value() ?
                    tupleToJson(*message.newTuple()) : nlohmann::ordered_json(nullptr);
                break;
            case ReplicationMessage::DDL:
                json["statement"] = message.statement();
                break;
            default:
                break;
        }

        if (position.has_value()) {
            json["position"] = nlohmann::ordered_json::parse(position->canonicalString());
        }

        return json;
    }

    std::string messageToJsonLine(const vstream::ReplicationMessage &message,
                                  const std::optional<vstream::Position> &position,
                                  bool isLastRowOfTransaction) {
        auto json = messageToJson(message, position);
        json["isLastRowOfTransaction"] = isLastRowOfTransaction;

        return json.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
    }
}
