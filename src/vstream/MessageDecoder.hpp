//
// Converts VStream events into replication messages
//

#ifndef SHARDSTREAM_VSTREAM_MESSAGEDECODER_HPP
#define SHARDSTREAM_VSTREAM_MESSAGEDECODER_HPP

#include <functional>
#include <optional>
#include <string>

#include "vstream/Position.hpp"
#include "vstream/ReplicationMessage.hpp"
#include "vstream/SchemaRegistry.hpp"

#include "utils/log.hpp"

namespace shardstream::vstream {

    /**
     * @brief receives every decoded message together with the position of the batch it came from.
     * @note may throw; the exception propagates out of the decoder unchanged.
     */
    using ReplicationMessageProcessor = std::function<void(
        const ReplicationMessage &message,
        const std::optional<Position> &position,
        bool isLastRowOfTransaction
    )>;

    /**
     * @brief decodes the events of one stream, in order.
     *
     * One decoder serves one stream and is not shared between threads.
     */
    class MessageDecoder {
    public:
        MessageDecoder();

        /**
         * @param event          event to decode
         * @param processor      invoked once per row for ROW events, at most once for any other event
         * @param position       position of the batch the event belongs to, if the batch carried one
         * @param isLastRowOfTransaction passed through to the processor unchanged
         *
         * @throws UnknownSchemaError, SchemaMismatchError on undecodable ROW events
         */
        void processEvent(const proto::VEvent &event,
                          const ReplicationMessageProcessor &processor,
                          const std::optional<Position> &position,
                          bool isLastRowOfTransaction);

        const std::string &transactionId() const;

        SchemaRegistry &schemaRegistry();

    private:
        void handleBeginMessage(const proto::VEvent &event,
                                const ReplicationMessageProcessor &processor,
                                const std::optional<Position> &position);
        void handleCommitMessage(const proto::VEvent &event,
                                 const ReplicationMessageProcessor &processor,
                                 const std::optional<Position> &position);
        void decodeRows(const proto::VEvent &event,
                        const ReplicationMessageProcessor &processor,
                        const std::optional<Position> &position,
                        bool isLastRowOfTransaction);

        LoggerPtr _logger;

        SchemaRegistry _schemaRegistry;
        std::string _transactionId;
    };
}

#endif // SHARDSTREAM_VSTREAM_MESSAGEDECODER_HPP
