//
// VStream over a plaintext gRPC channel to vtgate
//

#include "GrpcStreamTransport.hpp"

#include <condition_variable>
#include <mutex>

#include <fmt/format.h>

#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/generic/generic_stub.h>
#include <grpcpp/impl/codegen/proto_utils.h>
#include <grpcpp/security/credentials.h>
#include <grpcpp/support/channel_arguments.h>
#include <grpcpp/support/client_callback.h>
#include <grpcpp/support/stub_options.h>

namespace shardstream::vstream {
    using VStreamStub = grpc::TemplatedGenericStub<proto::VStreamRequest, proto::VStreamResponse>;

    const std::string GrpcStreamTransport::VSTREAM_METHOD = "/vtgateservice.Vitess/VStream";

    struct GrpcStreamTransport::CallState {
        std::mutex mutex;
        std::condition_variable condvar;

        bool done = false;
        /** valid while !done */
        CallReactor *reactor = nullptr;
    };

    /**
     * VStream is server-streaming; it is driven as a bidi call that writes the request
     * once and half-closes, so only the message types have to be generated.
     * The reactor deletes itself in OnDone().
     */
    class GrpcStreamTransport::CallReactor final:
        public grpc::ClientBidiReactor<proto::VStreamRequest, proto::VStreamResponse> {
    public:
        CallReactor(std::shared_ptr<CallState> state, std::shared_ptr<IStreamObserver> observer,
                    const proto::VStreamRequest &request):
            _state(std::move(state)),
            _observer(std::move(observer)),
            _request(request)
        {
        }

        grpc::ClientContext &context() {
            return _context;
        }

        void start(const std::shared_ptr<grpc::Channel> &channel) {
            VStreamStub stub(channel);
            stub.PrepareBidiStreamingCall(&_context, VSTREAM_METHOD, grpc::StubOptions(), this);

            StartWriteLast(&_request, grpc::WriteOptions());
            StartRead(&_response);
            StartCall();
        }

        void OnReadDone(bool ok) override {
            if (!ok) {
                // stream finished; the status arrives in OnDone()
                return;
            }

            _observer->onNext(_response);

            _response.Clear();
            StartRead(&_response);
        }

        void OnDone(const grpc::Status &status) override {
            if (status.ok()) {
                _observer->onCompleted();
            } else {
                _observer->onError(status);
            }

            {
                std::lock_guard lock(_state->mutex);
                _state->done = true;
                _state->reactor = nullptr;
            }
            _state->condvar.notify_all();

            _observer.reset();
            delete this;
        }

    private:
        std::shared_ptr<CallState> _state;
        std::shared_ptr<IStreamObserver> _observer;

        grpc::ClientContext _context;
        proto::VStreamRequest _request;
        proto::VStreamResponse _response;
    };

    GrpcStreamTransport::GrpcStreamTransport(std::shared_ptr<grpc::Channel> channel, const GatewayOptions &options):
        _logger(createLogger("GrpcStreamTransport")),
        _channel(std::move(channel)),
        _options(options)
    {
    }

    GrpcStreamTransport::~GrpcStreamTransport() {
        cancel();
    }

    void GrpcStreamTransport::open(const proto::VStreamRequest &request, std::shared_ptr<IStreamObserver> observer) {
        if (_callState != nullptr) {
            throw std::logic_error("GrpcStreamTransport: call already opened");
        }

        _callState = std::make_shared<CallState>();
        auto *reactor = new CallReactor(_callState, std::move(observer), request);

        auto &context = reactor->context();
        if (!_options.username.empty() && !_options.password.empty()) {
            _logger->info("using authenticated vtgate grpc");
            context.AddMetadata("username", _options.username);
            context.AddMetadata("password", _options.password);
        }

        if (!_options.grpcHeaders.empty()) {
            std::string headers;
            for (const auto &[key, value]: _options.grpcHeaders) {
                context.AddMetadata(key, value);
                headers += fmt::format("{}{}={}", headers.empty() ? "" : ", ", key, value);
            }
            _logger->info("setting VStream gRPC headers: {}", headers);
        }

        {
            std::lock_guard lock(_callState->mutex);
            _callState->reactor = reactor;
        }

        reactor->start(_channel);
    }

    void GrpcStreamTransport::cancel() {
        if (_callState == nullptr) {
            return;
        }

        std::lock_guard lock(_callState->mutex);
        if (!_callState->done && _callState->reactor != nullptr) {
            _callState->reactor->context().TryCancel();
        }
    }

    bool GrpcStreamTransport::awaitTermination(std::chrono::milliseconds timeout) {
        if (_callState == nullptr) {
            return true;
        }

        std::unique_lock lock(_callState->mutex);
        return _callState->condvar.wait_for(lock, timeout, [this] { return _callState->done; });
    }

    GrpcStreamTransportFactory::GrpcStreamTransportFactory(GatewayOptions options):
        _logger(createLogger("GrpcStreamTransportFactory")),
        _options(std::move(options))
    {
        grpc::ChannelArguments arguments;
        arguments.SetMaxReceiveMessageSize(_options.maxInboundMessageSize);
        if (_options.keepaliveIntervalMs > 0) {
            arguments.SetInt(GRPC_ARG_KEEPALIVE_TIME_MS, _options.keepaliveIntervalMs);
        }

        _channel = grpc::CreateCustomChannel(
            fmt::format("{}:{}", _options.host, _options.port),
            grpc::InsecureChannelCredentials(),
            arguments
        );

        _logger->info("created {}", connectionString());
    }

    std::unique_ptr<IStreamTransport> GrpcStreamTransportFactory::create() {
        return std::make_unique<GrpcStreamTransport>(_channel, _options);
    }

    std::string GrpcStreamTransportFactory::connectionString() const {
        return fmt::format("vtgate gRPC connection {}:{}", _options.host, _options.port);
    }
}
