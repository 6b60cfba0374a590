//
// First-error-wins slot shared between the stream controller and its host
//

#ifndef SHARDSTREAM_VSTREAM_ERRORSINK_HPP
#define SHARDSTREAM_VSTREAM_ERRORSINK_HPP

#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>

namespace shardstream::vstream {
    class ErrorSink {
    public:
        /**
         * @return true if this error became the published one, false if an earlier error was kept
         */
        bool publish(std::exception_ptr error);

        /** @return the published error, or nullptr */
        std::exception_ptr get() const;
        bool hasError() const;

        /**
         * @brief blocks until an error is published or the timeout expires.
         * @return the published error, or nullptr on timeout
         */
        std::exception_ptr waitFor(std::chrono::milliseconds timeout) const;

        /**
         * @brief rethrows the published error, if any
         */
        void rethrowIfSet() const;

    private:
        mutable std::mutex _mutex;
        mutable std::condition_variable _condvar;
        std::exception_ptr _error;
    };
}

#endif // SHARDSTREAM_VSTREAM_ERRORSINK_HPP
