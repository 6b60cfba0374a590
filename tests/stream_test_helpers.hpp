#pragma once

#include <chrono>
#include <condition_variable>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <grpcpp/support/status.h>

#include "../src/vstream/MessageDecoder.hpp"
#include "../src/vstream/Position.hpp"
#include "../src/vstream/ReplicationMessage.hpp"
#include "../src/vstream/StreamTransport.hpp"

#include "vstream.pb.h"

namespace shardstream::vstream::test_helpers {
    using Values = std::vector<std::optional<std::string>>;
    using Columns = std::vector<std::pair<std::string, proto::Field::Type>>;

    inline proto::Row makeRow(const Values &values) {
        proto::Row row;
        std::string buffer;

        for (const auto &value: values) {
            if (value.has_value()) {
                row.add_lengths(static_cast<int64_t>(value->size()));
                buffer += *value;
            } else {
                row.add_lengths(-1);
            }
        }

        row.set_values(buffer);
        return row;
    }

    inline proto::VEvent fieldEvent(const std::string &keyspace, const std::string &shard,
                                    const std::string &table, const Columns &columns) {
        proto::VEvent event;
        event.set_type(proto::VEvent::FIELD);

        auto *fieldEvent = event.mutable_field_event();
        fieldEvent->set_table_name(keyspace + "." + table);
        fieldEvent->set_keyspace(keyspace);
        fieldEvent->set_shard(shard);

        for (const auto &[name, type]: columns) {
            auto *field = fieldEvent->add_fields();
            field->set_name(name);
            field->set_type(type);
        }

        return event;
    }

    /**
     * @brief ROW event with one row change; an absent image is left unset
     */
    inline proto::VEvent rowEvent(const std::string &keyspace, const std::string &shard, const std::string &table,
                                  const std::optional<Values> &before, const std::optional<Values> &after,
                                  int64_t timestamp = 1700000000) {
        proto::VEvent event;
        event.set_type(proto::VEvent::ROW);
        event.set_timestamp(timestamp);

        auto *rowEvent = event.mutable_row_event();
        rowEvent->set_table_name(keyspace + "." + table);
        rowEvent->set_keyspace(keyspace);
        rowEvent->set_shard(shard);

        auto *change = rowEvent->add_row_changes();
        if (before.has_value()) {
            *change->mutable_before() = makeRow(*before);
        }
        if (after.has_value()) {
            *change->mutable_after() = makeRow(*after);
        }

        return event;
    }

    inline proto::VEvent insertEvent(const std::string &keyspace, const std::string &shard,
                                     const std::string &table, const Values &values) {
        return rowEvent(keyspace, shard, table, std::nullopt, values);
    }

    inline proto::VEvent typedEvent(proto::VEvent::Type type, int64_t timestamp = 1700000000) {
        proto::VEvent event;
        event.set_type(type);
        event.set_timestamp(timestamp);
        return event;
    }

    inline proto::VEvent ddlEvent(const std::string &statement) {
        auto event = typedEvent(proto::VEvent::DDL);
        event.set_statement(statement);
        return event;
    }

    inline proto::VEvent vgtidEvent(const std::vector<ShardPosition> &entries) {
        proto::VEvent event;
        event.set_type(proto::VEvent::VGTID);

        for (const auto &entry: entries) {
            auto *shardGtid = event.mutable_vgtid()->add_shard_gtids();
            shardGtid->set_keyspace(entry.keyspace);
            shardGtid->set_shard(entry.shard);
            shardGtid->set_gtid(entry.gtid);
        }

        return event;
    }

    inline proto::VStreamResponse makeResponse(std::initializer_list<proto::VEvent> events) {
        proto::VStreamResponse response;
        for (const auto &event: events) {
            *response.add_events() = event;
        }
        return response;
    }

    inline Position shardPosition(const std::string &gtid, const std::string &shard = "-80",
                                  const std::string &keyspace = "commerce") {
        return Position::fromRawSnapshot({ ShardPosition { keyspace, shard, gtid } });
    }

    /**
     * @brief a transaction batch: BEGIN, one INSERT per value list, VGTID, COMMIT
     */
    inline proto::VStreamResponse transactionResponse(const std::string &gtid, const std::vector<Values> &rows,
                                                      const std::string &shard = "-80",
                                                      const std::string &table = "customer") {
        proto::VStreamResponse response;
        *response.add_events() = typedEvent(proto::VEvent::BEGIN);
        for (const auto &row: rows) {
            *response.add_events() = insertEvent("commerce", shard, table, row);
        }
        *response.add_events() = vgtidEvent({ ShardPosition { "commerce", shard, gtid } });
        *response.add_events() = typedEvent(proto::VEvent::COMMIT);
        return response;
    }

    inline grpc::Status benignEofStatus() {
        return grpc::Status(grpc::StatusCode::UNKNOWN, "vttablet: rpc error: unexpected server EOF");
    }

    inline grpc::Status unavailableStatus() {
        return grpc::Status(grpc::StatusCode::UNAVAILABLE, "io exception: Connection refused");
    }

    struct RecordedMessage {
        ReplicationMessage::Operation operation;
        std::string table;
        std::string shard;
        std::string statement;
        std::string transactionId;
        int64_t commitTime;
        std::optional<Tuple> oldTuple;
        std::optional<Tuple> newTuple;
        std::optional<Position> position;
        bool isLastRowOfTransaction;
    };

    /**
     * @brief consumer that copies every message it receives; safe to share with a transport thread
     */
    class RecordingConsumer {
    public:
        void operator()(const ReplicationMessage &message, const std::optional<Position> &position,
                        bool isLastRowOfTransaction) {
            {
                std::lock_guard lock(_mutex);
                _messages.push_back(RecordedMessage {
                    message.operation(),
                    message.table(),
                    message.shard(),
                    message.statement(),
                    message.transactionId(),
                    message.commitTime(),
                    message.oldTuple(),
                    message.newTuple(),
                    position,
                    isLastRowOfTransaction
                });
            }
            _condvar.notify_all();
        }

        std::vector<RecordedMessage> messages() {
            std::lock_guard lock(_mutex);
            return _messages;
        }

        size_t count() {
            std::lock_guard lock(_mutex);
            return _messages.size();
        }

        bool waitForCount(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
            std::unique_lock lock(_mutex);
            return _condvar.wait_for(lock, timeout, [this, count] { return _messages.size() >= count; });
        }

    private:
        std::mutex _mutex;
        std::condition_variable _condvar;
        std::vector<RecordedMessage> _messages;
    };

    inline ReplicationMessageProcessor processorFor(const std::shared_ptr<RecordingConsumer> &consumer) {
        return [consumer](const ReplicationMessage &message, const std::optional<Position> &position,
                          bool isLastRowOfTransaction) {
            (*consumer)(message, position, isLastRowOfTransaction);
        };
    }
}
