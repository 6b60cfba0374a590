//
// JSON rendering of replication messages
//

#ifndef SHARDSTREAM_CONNECTOR_MESSAGEJSON_HPP
#define SHARDSTREAM_CONNECTOR_MESSAGEJSON_HPP

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "vstream/Position.hpp"
#include "vstream/ReplicationMessage.hpp"

namespace shardstream::connector {
    /**
     * @brief {"operation", "commitTime", "transactionId", ...} with "table"/"shard"/"before"/"after"
     *        for row changes, "statement" for DDL and "position" when the batch carried one.
     *
     * Column values keep the gateway's textual encoding, except binary columns which are
     * rendered as upper-case hex; SQL NULL becomes JSON null.
     */
    nlohmann::ordered_json messageToJson(const vstream::ReplicationMessage &message,
                                         const std::optional<vstream::Position> &position);

    /**
     * @brief messageToJson() plus "isLastRowOfTransaction", serialized on one line.
     * @note bytes that are not valid UTF-8 in text columns are replaced with U+FFFD.
     */
    std::string messageToJsonLine(const vstream::ReplicationMessage &message,
                                  const std::optional<vstream::Position> &position,
                                  bool isLastRowOfTransaction);
}

#endif // SHARDSTREAM_CONNECTOR_MESSAGEJSON_HPP
