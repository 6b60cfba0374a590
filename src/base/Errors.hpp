//
// Exception hierarchy for the stream client
//

#ifndef SHARDSTREAM_BASE_ERRORS_HPP
#define SHARDSTREAM_BASE_ERRORS_HPP

#include <stdexcept>
#include <string>

#include <grpcpp/support/status_code_enum.h>

namespace shardstream {
    class ShardStreamError: public std::runtime_error {
    public:
        explicit ShardStreamError(const std::string &message):
            std::runtime_error(message)
        {
        }
    };

    /**
     * @brief the position handed to the client is malformed (duplicate shard entries, unparsable offset, ...)
     */
    class MalformedPositionError: public ShardStreamError {
    public:
        using ShardStreamError::ShardStreamError;
    };

    /**
     * @brief a ROW event arrived for a (shard, keyspace, table) that never received a FIELD event
     */
    class UnknownSchemaError: public ShardStreamError {
    public:
        using ShardStreamError::ShardStreamError;
    };

    /**
     * @brief a ROW event does not fit the schema currently known for its table
     */
    class SchemaMismatchError: public ShardStreamError {
    public:
        using ShardStreamError::ShardStreamError;
    };

    /**
     * @brief a raw row image is internally inconsistent (lengths overrun the value buffer)
     */
    class MalformedRowError: public SchemaMismatchError {
    public:
        using SchemaMismatchError::SchemaMismatchError;
    };

    /**
     * @brief the consumer failed to accept a decoded message
     */
    class ConsumerCallbackError: public ShardStreamError {
    public:
        using ShardStreamError::ShardStreamError;
    };

    /**
     * @brief a batch could not be processed; names keyspace, table filter and position.
     * @note the decode or consumer error that caused it is attached as the nested exception.
     */
    class StreamProcessingError: public ShardStreamError {
    public:
        using ShardStreamError::ShardStreamError;
    };

    /**
     * @brief the streaming call terminated with a non-OK status
     */
    class TransportError: public ShardStreamError {
    public:
        TransportError(grpc::StatusCode code, const std::string &message):
            ShardStreamError(message),
            _code(code)
        {
        }

        grpc::StatusCode code() const {
            return _code;
        }

    private:
        grpc::StatusCode _code;
    };

    /**
     * @brief the gateway could not be reached (connection refused and alike); retried by the host
     */
    class TransientTransportError: public TransportError {
    public:
        using TransportError::TransportError;
    };

    /**
     * @brief the gateway closed the stream with "unexpected server EOF"; handled by the reconnect policy
     */
    class BenignEofError: public TransportError {
    public:
        using TransportError::TransportError;
    };
}

#endif // SHARDSTREAM_BASE_ERRORS_HPP
