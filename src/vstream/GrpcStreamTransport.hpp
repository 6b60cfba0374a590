//
// VStream over a plaintext gRPC channel to vtgate
//

#ifndef SHARDSTREAM_VSTREAM_GRPCSTREAMTRANSPORT_HPP
#define SHARDSTREAM_VSTREAM_GRPCSTREAMTRANSPORT_HPP

#include <climits>
#include <map>
#include <memory>
#include <string>

#include <grpcpp/channel.h>

#include "vstream/StreamTransport.hpp"

#include "utils/log.hpp"

namespace shardstream::vstream {

    struct GatewayOptions {
        std::string host;
        int port = 15991;

        /** static credentials, sent as call metadata when both are set */
        std::string username;
        std::string password;

        int maxInboundMessageSize = 4 * 1024 * 1024;
        int keepaliveIntervalMs = INT_MAX;

        /** extra metadata attached to every VStream call */
        std::map<std::string, std::string> grpcHeaders;
    };

    class GrpcStreamTransport final: public IStreamTransport {
    public:
        /** full method name of the streaming RPC */
        static const std::string VSTREAM_METHOD;

        GrpcStreamTransport(std::shared_ptr<grpc::Channel> channel, const GatewayOptions &options);
        ~GrpcStreamTransport() override;

        void open(const proto::VStreamRequest &request, std::shared_ptr<IStreamObserver> observer) override;
        void cancel() override;
        bool awaitTermination(std::chrono::milliseconds timeout) override;

    private:
        class CallReactor;
        struct CallState;

        LoggerPtr _logger;

        std::shared_ptr<grpc::Channel> _channel;
        GatewayOptions _options;

        std::shared_ptr<CallState> _callState;
    };

    /**
     * @brief owns the channel to vtgate; every create() is a new call on the same channel
     */
    class GrpcStreamTransportFactory final: public IStreamTransportFactory {
    public:
        explicit GrpcStreamTransportFactory(GatewayOptions options);

        std::unique_ptr<IStreamTransport> create() override;

        /**
         * @return "vtgate gRPC connection host:port"
         */
        std::string connectionString() const override;

    private:
        LoggerPtr _logger;

        GatewayOptions _options;
        std::shared_ptr<grpc::Channel> _channel;
    };
}

#endif // SHARDSTREAM_VSTREAM_GRPCSTREAMTRANSPORT_HPP
