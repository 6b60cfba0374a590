//
// VStream consumption, position tracking and reconnect state machine
//

#include "StreamController.hpp"

#include <exception>
#include <stdexcept>

#include <fmt/format.h>

#include "base/Errors.hpp"
#include "vstream/RetryClassifier.hpp"

namespace shardstream::vstream {

    const char *streamStateName(StreamState state) {
        switch (state) {
            case StreamState::IDLE:
                return "IDLE";
            case StreamState::STREAMING:
                return "STREAMING";
            case StreamState::EOF_DETECTED:
                return "EOF_DETECTED";
            case StreamState::FATAL:
                return "FATAL";
            case StreamState::RECONNECTING:
                return "RECONNECTING";
            case StreamState::CLOSED:
                return "CLOSED";
        }
        return "UNKNOWN";
    }

    StreamController::StreamController(StreamControllerOptions options,
                                       std::shared_ptr<IStreamTransportFactory> transportFactory,
                                       std::shared_ptr<metrics::PositionResetMetric> resetMetric):
        _logger(createLogger("StreamController")),
        _options(std::move(options)),
        _tableFilter(_options.tableIncludeList, _options.tableExcludeList),
        _transportFactory(std::move(transportFactory)),
        _resetMetric(std::move(resetMetric)),
        _recoveryPolicy(_options.maxRestarts, _options.eofHandlingEnabled),
        _reconnectExecutor(1)
    {
        if (_transportFactory == nullptr) {
            throw std::invalid_argument("StreamController: transport factory must not be null");
        }
    }

    StreamController::~StreamController() {
        close();
        _reconnectExecutor.shutdown();
    }

    void StreamController::validateStartPosition(const std::optional<Position> &position) {
        if (!position.has_value()) {
            throw MalformedPositionError("start position must not be null");
        }

        if (position->empty()) {
            throw MalformedPositionError("start position has no shard entries");
        }

        for (const auto &entry: position->entries()) {
            if (entry.keyspace.empty()) {
                throw MalformedPositionError(fmt::format(
                    "start position entry for shard '{}' has no keyspace", entry.shard
                ));
            }
            if (entry.gtid.empty()) {
                throw MalformedPositionError(fmt::format(
                    "start position entry for {}/{} has no gtid", entry.keyspace, entry.shard
                ));
            }
        }
    }

    void StreamController::start(const std::optional<Position> &initialPosition,
                                 ReplicationMessageProcessor consumer,
                                 std::shared_ptr<ErrorSink> errorSink) {
        validateStartPosition(initialPosition);

        if (consumer == nullptr || errorSink == nullptr) {
            throw std::invalid_argument("StreamController: consumer and error sink are required");
        }

        {
            std::lock_guard lock(_stateMutex);
            if (_state != StreamState::IDLE) {
                throw std::logic_error(fmt::format(
                    "StreamController: start() in state {}", streamStateName(_state)
                ));
            }
        }

        _consumer = std::move(consumer);
        _errorSink = std::move(errorSink);

        _logger->info("eof handling enabled: {}", _options.eofHandlingEnabled);
        _logger->info(
            "starting VStream on {} for keyspace {} and tables {} at {}",
            _transportFactory->connectionString(),
            _options.selector.keyspace, _tableFilter.describe(),
            initialPosition->canonicalString()
        );

        std::lock_guard lock(_transportMutex);
        if (_closed) {
            throw std::logic_error("StreamController: start() after close()");
        }

        openCall(*initialPosition);
    }

    proto::VStreamRequest StreamController::buildRequest(const Position &position) const {
        proto::VStreamRequest request;

        request.set_tablet_type(_options.tabletType);
        position.toProtobuf(request.mutable_vgtid());
        request.mutable_flags()->set_stop_on_reshard(_options.stopOnReshard);

        if (!_tableFilter.empty()) {
            _tableFilter.toProtobuf(request.mutable_filter());
            for (const auto &rule: request.filter().rules()) {
                _logger->info("add vstream table filtering: {}", rule.match());
            }
        }

        return request;
    }

    void StreamController::openCall(const Position &position) {
        auto request = buildRequest(position);

        {
            std::lock_guard lock(_stateMutex);
            _callStartPosition = position;
            _lastObservedPosition.reset();
            _state = StreamState::STREAMING;
        }
        _stateCondvar.notify_all();

        _transport = _transportFactory->create();
        _transport->open(request, shared_from_this());
    }

    void StreamController::scheduleReconnect(const Position &position) {
        setState(StreamState::RECONNECTING);

        if (_closed) {
            return;
        }

        try {
            _reconnectExecutor.post<void>([this, position]() {
                reconnect(position);
            });
        } catch (const std::logic_error &e) {
            // executor already shut down: the controller is being destroyed
            _logger->debug("reconnect not scheduled: {}", e.what());
        }
    }

    void StreamController::reconnect(const Position &position) {
        std::unique_ptr<IStreamTransport> previous;

        try {
            std::lock_guard lock(_transportMutex);
            if (_closed) {
                _logger->info("controller closed, not reconnecting");
                return;
            }

            previous = std::move(_transport);
            _logger->info("reconnecting VStream for keyspace {} at {}",
                          _options.selector.keyspace, position.canonicalString());
            openCall(position);
        } catch (const std::exception &e) {
            _logger->error("reconnect failed for {}: {}", describeContext(position), e.what());
            fail(nestWithContext(position, e.what()));
        }
    }

    void StreamController::fail(std::exception_ptr error) {
        {
            std::lock_guard lock(_stateMutex);
            if (_state == StreamState::FATAL || _state == StreamState::CLOSED) {
                return;
            }
            _state = StreamState::FATAL;
        }
        _stateCondvar.notify_all();

        if (_errorSink != nullptr) {
            _errorSink->publish(error);
        }

        std::lock_guard lock(_transportMutex);
        if (_transport != nullptr) {
            _transport->cancel();
        }
    }

    void StreamController::close() {
        std::unique_ptr<IStreamTransport> transport;

        {
            std::lock_guard lock(_transportMutex);
            if (_closed) {
                return;
            }
            _closed = true;
            transport = std::move(_transport);
        }

        setState(StreamState::CLOSED);

        if (transport == nullptr) {
            return;
        }

        _logger->info("closing replication connection");
        transport->cancel();

        if (transport->awaitTermination(_options.closeTimeout)) {
            _logger->info("VStream call is shut down in time");
        } else {
            _logger->warn("VStream call is not shut down within {} ms, giving up waiting",
                          _options.closeTimeout.count());
        }
    }

    StreamState StreamController::state() const {
        std::lock_guard lock(_stateMutex);
        return _state;
    }

    bool StreamController::waitForState(StreamState state, std::chrono::milliseconds timeout) const {
        std::unique_lock lock(_stateMutex);
        return _stateCondvar.wait_for(lock, timeout, [this, state] { return _state == state; });
    }

    std::optional<Position> StreamController::lastObservedPosition() const {
        std::lock_guard lock(_stateMutex);
        return _lastObservedPosition;
    }

    int StreamController::restartsRemaining() const {
        return _recoveryPolicy.restartsRemaining();
    }

    void StreamController::setState(StreamState state) {
        {
            std::lock_guard lock(_stateMutex);
            if (_state == StreamState::CLOSED) {
                return;
            }
            _state = state;
        }
        _stateCondvar.notify_all();
    }

    std::string StreamController::describeContext(const std::optional<Position> &position) const {
        return fmt::format(
            "VStream streaming for keyspace {} and tables {} at position {}",
            _options.selector.keyspace,
            _tableFilter.describe(),
            position.has_value() ? position->canonicalString() : "(none)"
        );
    }

    std::exception_ptr StreamController::nestWithContext(const std::optional<Position> &position,
                                                         const std::string &cause) const {
        try {
            std::throw_with_nested(StreamProcessingError(
                fmt::format("{}: {}", describeContext(position), cause)
            ));
        } catch (const StreamProcessingError &) {
            return std::current_exception();
        }
    }

    std::optional<Position> StreamController::extractPosition(const proto::VStreamResponse &response,
                                                              const LoggerPtr &logger) {
        const proto::VGtid *last = nullptr;
        int count = 0;

        for (const auto &event: response.events()) {
            if (event.type() == proto::VEvent::VGTID) {
                last = &event.vgtid();
                count++;
            }
        }

        if (last == nullptr) {
            // batches carrying only a VERSION event, or the first batch after a restart
            logger->trace("no vgtid found in response of {} events", response.events_size());
            return std::nullopt;
        }

        if (count > 1) {
            logger->error("should only have 1 vgtid per VStreamResponse, but found {}; using the last one", count);
        }

        return Position::fromProtobuf(*last);
    }

    void StreamController::onNext(const proto::VStreamResponse &response) {
        if (_closed) {
            return;
        }

        {
            std::lock_guard lock(_stateMutex);
            if (_state == StreamState::FATAL) {
                return;
            }
        }

        _logger->debug("received {} VEvents in the VStreamResponse", response.events_size());

        std::optional<Position> position;

        try {
            position = extractPosition(response, _logger);

            int numberOfRowEvents = 0;
            for (const auto &event: response.events()) {
                if (event.type() == proto::VEvent::ROW) {
                    numberOfRowEvents++;
                }
            }

            int rowEventsSeen = 0;
            for (const auto &event: response.events()) {
                if (event.type() == proto::VEvent::ROW) {
                    rowEventsSeen++;
                }

                bool isLastRowOfTransaction =
                    position.has_value() && numberOfRowEvents != 0 && rowEventsSeen == numberOfRowEvents;

                _decoder.processEvent(event, _consumer, position, isLastRowOfTransaction);
            }

            if (position.has_value()) {
                std::lock_guard lock(_stateMutex);
                _lastObservedPosition = position;
            }
        } catch (const std::exception &e) {
            _logger->error("failed to process batch, {}: {}", describeContext(position), e.what());
            fail(nestWithContext(position, e.what()));
        } catch (...) {
            _logger->error("failed to process batch, {}: non-standard exception", describeContext(position));
            fail(nestWithContext(position, "non-standard exception"));
        }
    }

    void StreamController::onError(const grpc::Status &status) {
        std::optional<Position> callStart;
        std::optional<Position> lastObserved;

        {
            std::lock_guard lock(_stateMutex);
            if (_state == StreamState::FATAL || _state == StreamState::CLOSED) {
                _logger->debug("ignoring terminal status of a cancelled call: {}", status.error_message());
                return;
            }

            callStart = _callStartPosition;
            lastObserved = _lastObservedPosition;
        }

        const bool benignEof = isBenignEof(status);
        if (benignEof) {
            setState(StreamState::EOF_DETECTED);
        }

        const Position resume = lastObserved.has_value() ? *lastObserved : *callStart;
        const auto action = _recoveryPolicy.decide(benignEof, resume == *callStart);
        _logger->debug("recovery action for status {}: {}",
                       static_cast<int>(status.error_code()), recoveryActionName(action));

        if (benignEof) {
            _logger->warn(
                "call start position: {}, last observed position: {}, eof handling enabled: {}, "
                "restarts remaining: {}, keyspace: {}, tables: {}",
                callStart->canonicalString(),
                lastObserved.has_value() ? lastObserved->canonicalString() : "(none)",
                _options.eofHandlingEnabled,
                _recoveryPolicy.restartsRemaining(),
                _options.selector.keyspace,
                _tableFilter.describe()
            );
        }

        switch (action) {
            case RecoveryAction::RESUME:
                _logger->warn(
                    "VStream for keyspace {} and tables {} was closed ({}), restarting from {}; {} restarts remaining",
                    _options.selector.keyspace, _tableFilter.describe(), status.error_message(),
                    resume.canonicalString(), _recoveryPolicy.restartsRemaining()
                );
                scheduleReconnect(resume);
                break;

            case RecoveryAction::RESET: {
                auto latest = Position::defaultFor(_options.selector);
                _logger->warn(
                    "VStream for keyspace {} and tables {} was closed and did not recover; "
                    "position {} is probably expired, skipping to {}",
                    _options.selector.keyspace, _tableFilter.describe(),
                    callStart->canonicalString(), latest.canonicalString()
                );

                if (_resetMetric != nullptr) {
                    _resetMetric->incrementPositionResetCount();
                }
                scheduleReconnect(latest);
                break;
            }

            case RecoveryAction::FAIL: {
                auto error = makeTransportError(status, describeContext(resume));
                _logger->error("{} failed: code {}, {}",
                               describeContext(resume), static_cast<int>(status.error_code()), status.error_message());
                fail(error);
                break;
            }
        }
    }

    void StreamController::onCompleted() {
        _logger->error("VStream streaming completed");
        setState(StreamState::CLOSED);
    }
}
