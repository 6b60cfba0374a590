//
// Converts VStream events into replication messages
//

#include "MessageDecoder.hpp"

#include "utils/StringUtil.hpp"

namespace shardstream::vstream {
    MessageDecoder::MessageDecoder():
        _logger(createLogger("MessageDecoder"))
    {
    }

    void MessageDecoder::processEvent(const proto::VEvent &event,
                                      const ReplicationMessageProcessor &processor,
                                      const std::optional<Position> &position,
                                      bool isLastRowOfTransaction) {
        switch (event.type()) {
            case proto::VEvent::VGTID:
                // the batch position is extracted by the stream controller
                _logger->trace("VGTID event skipped by the decoder");
                break;
            case proto::VEvent::FIELD:
                _schemaRegistry.applySchemaEvent(event.field_event());
                break;
            case proto::VEvent::BEGIN:
                handleBeginMessage(event, processor, position);
                break;
            case proto::VEvent::COMMIT:
                handleCommitMessage(event, processor, position);
                break;
            case proto::VEvent::ROW:
                decodeRows(event, processor, position, isLastRowOfTransaction);
                break;
            case proto::VEvent::DDL:
                _logger->debug("DDL: {}", event.statement());
                processor(DdlMessage(event.timestamp(), _transactionId, event.statement()), position, false);
                break;
            default:
                _logger->trace("{} event forwarded as OTHER", proto::VEvent::Type_Name(event.type()));
                processor(OtherMessage(event.timestamp(), _transactionId), position, false);
                break;
        }
    }

    void MessageDecoder::handleBeginMessage(const proto::VEvent &event,
                                            const ReplicationMessageProcessor &processor,
                                            const std::optional<Position> &position) {
        // transaction ids are canonical positions, so an unresolved batch gets none
        if (!position.has_value() || !position->isResolved()) {
            _logger->debug("BEGIN skipped: the batch carries no resolved position");
            return;
        }

        _transactionId = position->canonicalString();
        _logger->trace("BEGIN {}", _transactionId);

        processor(TransactionalMessage(ReplicationMessage::BEGIN, event.timestamp(), _transactionId), position, false);
    }

    void MessageDecoder::handleCommitMessage(const proto::VEvent &event,
                                             const ReplicationMessageProcessor &processor,
                                             const std::optional<Position> &position) {
        if (!position.has_value() || !position->isResolved()) {
            _logger->debug("COMMIT skipped: the batch carries no resolved position");
            return;
        }

        _logger->trace("COMMIT {}", _transactionId);

        processor(TransactionalMessage(ReplicationMessage::COMMIT, event.timestamp(), _transactionId), position, false);
    }

    void MessageDecoder::decodeRows(const proto::VEvent &event,
                                    const ReplicationMessageProcessor &processor,
                                    const std::optional<Position> &position,
                                    bool isLastRowOfTransaction) {
        const auto &rowEvent = event.row_event();

        auto [keyspace, table] = utility::splitTableName(rowEvent.table_name());
        if (keyspace.empty()) {
            keyspace = rowEvent.keyspace();
        }
        const std::string &shard = rowEvent.shard();
        const std::string qualifiedName = keyspace + "." + table;

        for (const auto &rowChange: rowEvent.row_changes()) {
            std::optional<Tuple> oldTuple;
            std::optional<Tuple> newTuple;

            if (rowChange.has_before()) {
                oldTuple = _schemaRegistry.decodeRow(shard, keyspace, table, rowChange.before());
            }
            if (rowChange.has_after()) {
                newTuple = _schemaRegistry.decodeRow(shard, keyspace, table, rowChange.after());
            }

            ReplicationMessage::Operation operation;
            if (oldTuple.has_value() && newTuple.has_value()) {
                operation = ReplicationMessage::UPDATE;
            } else if (newTuple.has_value()) {
                operation = ReplicationMessage::INSERT;
            } else if (oldTuple.has_value()) {
                operation = ReplicationMessage::DELETE;
            } else {
                _logger->warn("row change without before and after image skipped (table {}, shard {})",
                              qualifiedName, shard);
                continue;
            }

            processor(
                RowChangeMessage(
                    operation,
                    event.timestamp(),
                    _transactionId,
                    qualifiedName,
                    shard,
                    std::move(oldTuple),
                    std::move(newTuple)
                ),
                position,
                isLastRowOfTransaction
            );
        }
    }

    const std::string &MessageDecoder::transactionId() const {
        return _transactionId;
    }

    SchemaRegistry &MessageDecoder::schemaRegistry() {
        return _schemaRegistry;
    }
}
