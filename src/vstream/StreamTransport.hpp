//
// Streaming call abstraction between the controller and the gateway
//

#ifndef SHARDSTREAM_VSTREAM_STREAMTRANSPORT_HPP
#define SHARDSTREAM_VSTREAM_STREAMTRANSPORT_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <grpcpp/support/status.h>

#include "vstream.pb.h"

namespace shardstream::vstream {

    /**
     * @brief receives the responses of one streaming call.
     *
     * onNext() is called once per batch, in order; the next batch is not read before it returns.
     * Exactly one of onError() / onCompleted() terminates the call.
     */
    class IStreamObserver {
    public:
        virtual ~IStreamObserver() = default;

        virtual void onNext(const proto::VStreamResponse &response) = 0;
        virtual void onError(const grpc::Status &status) = 0;
        virtual void onCompleted() = 0;
    };

    /**
     * @brief a single VStream call.
     */
    class IStreamTransport {
    public:
        virtual ~IStreamTransport() = default;

        /**
         * @brief starts the call and returns immediately; responses are delivered on a transport thread.
         * @note the observer is kept alive until the call terminated.
         */
        virtual void open(const proto::VStreamRequest &request, std::shared_ptr<IStreamObserver> observer) = 0;

        /**
         * @brief cancels the call. the observer receives onError(CANCELLED) unless the call already terminated.
         */
        virtual void cancel() = 0;

        /**
         * @return true if the call terminated (and its observer was notified) within the timeout
         */
        virtual bool awaitTermination(std::chrono::milliseconds timeout) = 0;
    };

    class IStreamTransportFactory {
    public:
        virtual ~IStreamTransportFactory() = default;

        virtual std::unique_ptr<IStreamTransport> create() = 0;
        virtual std::string connectionString() const = 0;
    };

    /**
     * @brief scripted call for tests
     */
    struct ScriptedCall {
        std::vector<proto::VStreamResponse> responses;
        /** terminal status; OK completes the call */
        grpc::Status status = grpc::Status::OK;
        /** keep the call open after the responses until it is cancelled */
        bool hang = false;
    };

    /**
     * @brief script and request log shared between a mocked factory and its transports
     */
    struct MockedStreamState {
        std::mutex mutex;
        std::condition_variable condvar;
        std::deque<ScriptedCall> calls;
        std::vector<proto::VStreamRequest> requests;
    };

    /**
     * @brief Mocked transport implementation for tests
     */
    class MockedStreamTransport final: public IStreamTransport {
    public:
        explicit MockedStreamTransport(ScriptedCall call, std::shared_ptr<MockedStreamState> state = nullptr);
        ~MockedStreamTransport() override;

        void open(const proto::VStreamRequest &request, std::shared_ptr<IStreamObserver> observer) override;
        void cancel() override;
        bool awaitTermination(std::chrono::milliseconds timeout) override;

        bool isCancelled();

    private:
        void run(std::shared_ptr<IStreamObserver> observer);

        ScriptedCall _call;
        std::shared_ptr<MockedStreamState> _state;

        std::mutex _mutex;
        std::condition_variable _condvar;
        bool _cancelled = false;
        bool _terminated = false;

        std::thread _thread;
    };

    /**
     * @brief hands out one MockedStreamTransport per scripted call, in order.
     *
     * Calls beyond the script hang until cancelled. Every request is recorded.
     */
    class MockedStreamTransportFactory final: public IStreamTransportFactory {
    public:
        MockedStreamTransportFactory();

        std::unique_ptr<IStreamTransport> create() override;
        std::string connectionString() const override;

        void addCall(ScriptedCall call);

        std::vector<proto::VStreamRequest> requests() const;

        /**
         * @return true if at least `count` calls were opened within the timeout
         */
        bool waitForRequests(size_t count, std::chrono::milliseconds timeout) const;

    private:
        std::shared_ptr<MockedStreamState> _state;
    };
}

#endif // SHARDSTREAM_VSTREAM_STREAMTRANSPORT_HPP
