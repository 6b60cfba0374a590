//
// Host loop around the stream controller: retries transient failures from the last committed offset
//

#include "ReplicationSession.hpp"

namespace shardstream::connector {

    namespace {
        constexpr std::chrono::milliseconds POLL_INTERVAL { 100 };
    }

    ReplicationSession::ReplicationSession(SessionOptions options,
                                           std::shared_ptr<vstream::IStreamTransportFactory> transportFactory,
                                           std::shared_ptr<metrics::PositionResetMetric> resetMetric):
        _logger(createLogger("ReplicationSession")),
        _options(std::move(options)),
        _transportFactory(std::move(transportFactory)),
        _resetMetric(std::move(resetMetric)),
        _retryClassifier(_options.maxRetries)
    {
    }

    void ReplicationSession::run(const vstream::Position &startPosition,
                                 vstream::ReplicationMessageProcessor consumer) {
        auto trackingConsumer = [this, consumer = std::move(consumer)](
            const vstream::ReplicationMessage &message,
            const std::optional<vstream::Position> &position,
            bool isLastRowOfTransaction
        ) {
            consumer(message, position, isLastRowOfTransaction);

            if (message.operation() == vstream::ReplicationMessage::COMMIT && position.has_value()) {
                std::lock_guard lock(_mutex);
                _lastCommittedPosition = position;
            }
        };

        auto position = startPosition;

        while (true) {
            auto error = runAttempt(position, trackingConsumer);
            if (error == nullptr) {
                return;
            }

            if (!_retryClassifier.isRetriable(error)) {
                std::rethrow_exception(error);
            }

            if (!sleepUnlessStopped(_options.retryBackoff)) {
                return;
            }

            if (auto committed = lastCommittedPosition(); committed.has_value()) {
                position = *committed;
            }

            _logger->info("retrying from {} (attempt {})", position.canonicalString(), attempts() + 1);
        }
    }

    std::exception_ptr ReplicationSession::runAttempt(const vstream::Position &position,
                                                      const vstream::ReplicationMessageProcessor &consumer) {
        auto errorSink = std::make_shared<vstream::ErrorSink>();
        auto controller = std::make_shared<vstream::StreamController>(
            _options.controller, _transportFactory, _resetMetric
        );

        {
            // stop() closes the published controller, so it must not see one that is not started yet
            std::lock_guard lock(_mutex);
            if (_stopRequested) {
                return nullptr;
            }

            _attempts++;
            controller->start(position, consumer, errorSink);
            _controller = controller;
        }

        std::exception_ptr error;
        while (true) {
            error = errorSink->waitFor(POLL_INTERVAL);
            if (error != nullptr) {
                break;
            }

            if (controller->state() == vstream::StreamState::CLOSED) {
                _logger->info("stream closed");
                break;
            }
        }

        controller->close();

        {
            std::lock_guard lock(_mutex);
            _controller.reset();
        }

        return error;
    }

    bool ReplicationSession::sleepUnlessStopped(std::chrono::milliseconds duration) {
        std::unique_lock lock(_mutex);
        return !_condvar.wait_for(lock, duration, [this] { return _stopRequested; });
    }

    void ReplicationSession::stop() {
        std::shared_ptr<vstream::StreamController> controller;

        {
            std::lock_guard lock(_mutex);
            _stopRequested = true;
            controller = _controller;
        }
        _condvar.notify_all();

        if (controller != nullptr) {
            controller->close();
        }
    }

    std::optional<vstream::Position> ReplicationSession::lastCommittedPosition() const {
        std::lock_guard lock(_mutex);
        return _lastCommittedPosition;
    }

    int ReplicationSession::attempts() const {
        return _attempts.load();
    }

    const vstream::RetryClassifier &ReplicationSession::retryClassifier() const {
        return _retryClassifier;
    }
}
