//
// Retry decisions for failed streaming calls
//

#ifndef SHARDSTREAM_VSTREAM_RETRYCLASSIFIER_HPP
#define SHARDSTREAM_VSTREAM_RETRYCLASSIFIER_HPP

#include <atomic>
#include <exception>
#include <string>

#include <grpcpp/support/status.h>

#include "utils/log.hpp"

namespace shardstream::vstream {

    /**
     * @brief true if the gateway closed the stream with its "unexpected server EOF" marker
     */
    bool isBenignEof(const grpc::Status &status);

    /**
     * @brief maps a terminal call status onto the exception hierarchy.
     *
     * UNKNOWN + "unexpected server EOF" becomes BenignEofError, UNAVAILABLE becomes
     * TransientTransportError, anything else TransportError. The message is
     * "<context>: <code>: <status message>".
     */
    std::exception_ptr makeTransportError(const grpc::Status &status, const std::string &context);

    /**
     * @brief decides whether a failed session may be retried.
     *
     * Every classification of a transient transport error is counted. Once the
     * counter reaches the ceiling the same error is reported as non-retriable,
     * regardless of how much time has passed.
     */
    class RetryClassifier {
    public:
        static constexpr int DEFAULT_MAX_RETRIES = 100;

        explicit RetryClassifier(int maxRetries = DEFAULT_MAX_RETRIES);

        bool isRetriable(const std::exception &error);
        bool isRetriable(const std::exception_ptr &error);

        int retries() const;
        int maxRetries() const;

    private:
        LoggerPtr _logger;

        const int _maxRetries;
        std::atomic<int> _retries{0};
    };
}

#endif // SHARDSTREAM_VSTREAM_RETRYCLASSIFIER_HPP
