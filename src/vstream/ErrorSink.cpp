//
// First-error-wins slot shared between the stream controller and its host
//

#include "ErrorSink.hpp"

namespace shardstream::vstream {
    bool ErrorSink::publish(std::exception_ptr error) {
        if (error == nullptr) {
            return false;
        }

        {
            std::lock_guard lock(_mutex);
            if (_error != nullptr) {
                return false;
            }
            _error = std::move(error);
        }
        _condvar.notify_all();

        return true;
    }

    std::exception_ptr ErrorSink::get() const {
        std::lock_guard lock(_mutex);
        return _error;
    }

    bool ErrorSink::hasError() const {
        std::lock_guard lock(_mutex);
        return _error != nullptr;
    }

    std::exception_ptr ErrorSink::waitFor(std::chrono::milliseconds timeout) const {
        std::unique_lock lock(_mutex);
        _condvar.wait_for(lock, timeout, [this] { return _error != nullptr; });

        return _error;
    }

    void ErrorSink::rethrowIfSet() const {
        auto error = get();
        if (error != nullptr) {
            std::rethrow_exception(error);
        }
    }
}
