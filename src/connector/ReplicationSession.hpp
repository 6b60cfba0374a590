//
// Host loop around the stream controller: retries transient failures from the last committed offset
//

#ifndef SHARDSTREAM_CONNECTOR_REPLICATIONSESSION_HPP
#define SHARDSTREAM_CONNECTOR_REPLICATIONSESSION_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

#include "metrics/PositionResetMetric.hpp"

#include "vstream/MessageDecoder.hpp"
#include "vstream/Position.hpp"
#include "vstream/RetryClassifier.hpp"
#include "vstream/StreamController.hpp"
#include "vstream/StreamTransport.hpp"

#include "utils/log.hpp"

namespace shardstream::connector {

    struct SessionOptions {
        vstream::StreamControllerOptions controller;

        int maxRetries = vstream::RetryClassifier::DEFAULT_MAX_RETRIES;
        std::chrono::milliseconds retryBackoff { 1000 };
    };

    /**
     * @brief runs stream controllers until the stream ends.
     *
     * Each attempt gets a fresh controller and error sink. When an attempt fails with a
     * retriable transport error the next one starts, after a backoff, from the position of
     * the last COMMIT the consumer accepted.
     */
    class ReplicationSession {
    public:
        ReplicationSession(SessionOptions options,
                           std::shared_ptr<vstream::IStreamTransportFactory> transportFactory,
                           std::shared_ptr<metrics::PositionResetMetric> resetMetric);

        /**
         * @brief blocks until stop() is called, the gateway completes the stream, or an attempt fails for good.
         * @throws the error that ended the session
         */
        void run(const vstream::Position &startPosition, vstream::ReplicationMessageProcessor consumer);

        /**
         * @brief ends run() from another thread
         */
        void stop();

        std::optional<vstream::Position> lastCommittedPosition() const;
        int attempts() const;

        const vstream::RetryClassifier &retryClassifier() const;

    private:
        /**
         * @return the error that ended the attempt, or nullptr on stop / stream completion
         */
        std::exception_ptr runAttempt(const vstream::Position &position,
                                      const vstream::ReplicationMessageProcessor &consumer);

        bool sleepUnlessStopped(std::chrono::milliseconds duration);

        LoggerPtr _logger;

        const SessionOptions _options;
        std::shared_ptr<vstream::IStreamTransportFactory> _transportFactory;
        std::shared_ptr<metrics::PositionResetMetric> _resetMetric;

        vstream::RetryClassifier _retryClassifier;

        mutable std::mutex _mutex;
        std::condition_variable _condvar;
        bool _stopRequested = false;
        std::shared_ptr<vstream::StreamController> _controller;
        std::optional<vstream::Position> _lastCommittedPosition;

        std::atomic<int> _attempts{0};
    };
}

#endif // SHARDSTREAM_CONNECTOR_REPLICATIONSESSION_HPP
