//
// VStream consumption, position tracking and reconnect state machine
//

#ifndef SHARDSTREAM_VSTREAM_STREAMCONTROLLER_HPP
#define SHARDSTREAM_VSTREAM_STREAMCONTROLLER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "base/TaskExecutor.hpp"
#include "metrics/PositionResetMetric.hpp"

#include "vstream/ErrorSink.hpp"
#include "vstream/MessageDecoder.hpp"
#include "vstream/Position.hpp"
#include "vstream/RecoveryPolicy.hpp"
#include "vstream/StreamTransport.hpp"
#include "vstream/TableFilter.hpp"

#include "utils/log.hpp"

namespace shardstream::vstream {

    enum class StreamState {
        IDLE,
        STREAMING,
        EOF_DETECTED,
        FATAL,
        RECONNECTING,
        CLOSED
    };

    const char *streamStateName(StreamState state);

    struct StreamControllerOptions {
        /** what to stream, and where RESET goes */
        KeyspaceSelector selector;

        proto::VStreamRequest::TabletType tabletType = proto::VStreamRequest::PRIMARY;

        std::vector<std::string> tableIncludeList;
        std::vector<std::string> tableExcludeList;

        bool stopOnReshard = false;

        int maxRestarts = RecoveryPolicy::DEFAULT_MAX_RESTARTS;
        /** allows RESET when the restart budget is exhausted without progress */
        bool eofHandlingEnabled = false;

        std::chrono::milliseconds closeTimeout { 5000 };
    };

    /**
     * @brief drives one logical VStream.
     *
     * Batches are processed on the transport thread, one at a time. When a call ends with
     * an error status, RecoveryPolicy decides between reconnecting from the last observed
     * position, resetting to the current tail, or failing; reconnects run on a dedicated
     * single worker.
     *
     * Must be owned by a std::shared_ptr: every open call keeps its controller alive.
     */
    class StreamController final:
        public IStreamObserver,
        public std::enable_shared_from_this<StreamController> {
    public:
        StreamController(StreamControllerOptions options,
                         std::shared_ptr<IStreamTransportFactory> transportFactory,
                         std::shared_ptr<metrics::PositionResetMetric> resetMetric);
        ~StreamController() override;

        /**
         * @brief opens the stream at the given position.
         *
         * @throws MalformedPositionError if the position is missing, empty or has incomplete entries
         * @throws std::logic_error if the controller was started or closed before
         */
        void start(const std::optional<Position> &initialPosition,
                   ReplicationMessageProcessor consumer,
                   std::shared_ptr<ErrorSink> errorSink);

        /**
         * @brief cancels the in-flight call and waits up to closeTimeout for it to finish.
         * @note idempotent; only the first call has an effect.
         */
        void close();

        StreamState state() const;
        bool waitForState(StreamState state, std::chrono::milliseconds timeout) const;

        /** @brief position of the last fully processed batch of the current call */
        std::optional<Position> lastObservedPosition() const;
        int restartsRemaining() const;

        void onNext(const proto::VStreamResponse &response) override;
        void onError(const grpc::Status &status) override;
        void onCompleted() override;

    private:
        static void validateStartPosition(const std::optional<Position> &position);

        proto::VStreamRequest buildRequest(const Position &position) const;

        /**
         * @brief replaces the transport with a new call at `position`.
         * @note _transportMutex must be held by the caller.
         */
        void openCall(const Position &position);

        void scheduleReconnect(const Position &position);
        void reconnect(const Position &position);

        /**
         * @brief publishes the error, enters FATAL and cancels the call
         */
        void fail(std::exception_ptr error);

        void setState(StreamState state);

        std::string describeContext(const std::optional<Position> &position) const;

        /**
         * @brief wraps the exception being handled in a StreamProcessingError carrying describeContext().
         * @note must be called from inside a catch block.
         */
        std::exception_ptr nestWithContext(const std::optional<Position> &position, const std::string &cause) const;

        static std::optional<Position> extractPosition(const proto::VStreamResponse &response,
                                                       const LoggerPtr &logger);

        LoggerPtr _logger;

        const StreamControllerOptions _options;
        const TableFilter _tableFilter;

        std::shared_ptr<IStreamTransportFactory> _transportFactory;
        std::shared_ptr<metrics::PositionResetMetric> _resetMetric;

        ReplicationMessageProcessor _consumer;
        std::shared_ptr<ErrorSink> _errorSink;

        MessageDecoder _decoder;
        RecoveryPolicy _recoveryPolicy;

        mutable std::mutex _stateMutex;
        mutable std::condition_variable _stateCondvar;
        StreamState _state = StreamState::IDLE;
        std::optional<Position> _callStartPosition;
        std::optional<Position> _lastObservedPosition;

        std::mutex _transportMutex;
        std::atomic<bool> _closed{false};
        std::unique_ptr<IStreamTransport> _transport;

        TaskExecutor _reconnectExecutor;
    };
}

#endif // SHARDSTREAM_VSTREAM_STREAMCONTROLLER_HPP
