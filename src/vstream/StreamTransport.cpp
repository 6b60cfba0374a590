//
// Streaming call abstraction between the controller and the gateway
//

#include "StreamTransport.hpp"

#include <stdexcept>

namespace shardstream::vstream {
    MockedStreamTransport::MockedStreamTransport(ScriptedCall call, std::shared_ptr<MockedStreamState> state):
        _call(std::move(call)),
        _state(std::move(state))
    {
    }

    MockedStreamTransport::~MockedStreamTransport() {
        cancel();

        if (!_thread.joinable()) {
            return;
        }

        if (_thread.get_id() == std::this_thread::get_id()) {
            // the observer released by run() was the last owner of this transport
            _thread.detach();
        } else {
            _thread.join();
        }
    }

    void MockedStreamTransport::open(const proto::VStreamRequest &request, std::shared_ptr<IStreamObserver> observer) {
        if (_thread.joinable()) {
            throw std::logic_error("MockedStreamTransport: call already opened");
        }

        if (_state != nullptr) {
            {
                std::lock_guard lock(_state->mutex);
                _state->requests.push_back(request);
            }
            _state->condvar.notify_all();
        }

        _thread = std::thread(&MockedStreamTransport::run, this, std::move(observer));
    }

    void MockedStreamTransport::cancel() {
        {
            std::lock_guard lock(_mutex);
            _cancelled = true;
        }
        _condvar.notify_all();
    }

    bool MockedStreamTransport::awaitTermination(std::chrono::milliseconds timeout) {
        std::unique_lock lock(_mutex);
        return _condvar.wait_for(lock, timeout, [this] { return _terminated; });
    }

    bool MockedStreamTransport::isCancelled() {
        std::lock_guard lock(_mutex);
        return _cancelled;
    }

    void MockedStreamTransport::run(std::shared_ptr<IStreamObserver> observer) {
        for (const auto &response: _call.responses) {
            if (isCancelled()) {
                break;
            }
            observer->onNext(response);
        }

        grpc::Status status;
        {
            std::unique_lock lock(_mutex);
            if (_call.hang) {
                _condvar.wait(lock, [this] { return _cancelled; });
            }

            status = _cancelled ?
                grpc::Status(grpc::StatusCode::CANCELLED, "Cancelled") :
                _call.status;
        }

        if (status.ok()) {
            observer->onCompleted();
        } else {
            observer->onError(status);
        }

        {
            std::lock_guard lock(_mutex);
            _terminated = true;
        }
        _condvar.notify_all();

        observer.reset();
    }

    MockedStreamTransportFactory::MockedStreamTransportFactory():
        _state(std::make_shared<MockedStreamState>())
    {
    }

    std::unique_ptr<IStreamTransport> MockedStreamTransportFactory::create() {
        ScriptedCall call;

        {
            std::lock_guard lock(_state->mutex);
            if (_state->calls.empty()) {
                call.hang = true;
            } else {
                call = std::move(_state->calls.front());
                _state->calls.pop_front();
            }
        }

        return std::make_unique<MockedStreamTransport>(std::move(call), _state);
    }

    std::string MockedStreamTransportFactory::connectionString() const {
        return "mocked vtgate connection";
    }

    void MockedStreamTransportFactory::addCall(ScriptedCall call) {
        std::lock_guard lock(_state->mutex);
        _state->calls.push_back(std::move(call));
    }

    std::vector<proto::VStreamRequest> MockedStreamTransportFactory::requests() const {
        std::lock_guard lock(_state->mutex);
        return _state->requests;
    }

    bool MockedStreamTransportFactory::waitForRequests(size_t count, std::chrono::milliseconds timeout) const {
        std::unique_lock lock(_state->mutex);
        return _state->condvar.wait_for(lock, timeout, [this, count] {
            return _state->requests.size() >= count;
        });
    }
}
