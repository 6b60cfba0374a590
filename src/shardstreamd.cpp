#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <pthread.h>
#include <signal.h>

#include <fmt/format.h>

#include "base/Errors.hpp"
#include "config/ShardStreamConfig.hpp"
#include "connector/MessageJson.hpp"
#include "connector/OffsetStore.hpp"
#include "connector/ReplicationSession.hpp"
#include "metrics/PositionResetMetric.hpp"
#include "vstream/GrpcStreamTransport.hpp"
#include "utils/log.hpp"
#include "Application.hpp"


using namespace shardstream;


class ShardStreamApp: public shardstream::Application {
public:
    ShardStreamApp():
        Application(),

        _logger(createLogger("shardstreamd"))
    {
    }

    std::string optString() override {
        return "c:o:vVh";
    }

    int main() override {
        if (isArgSet('h')) {
            std::cout <<
            "shardstreamd - VStream change data capture client\n"
            "\n"
            "Usage: shardstreamd -c CONFIG_FILE [-o OFFSET_FILE] [-v|-V] [-h]\n"
            "\n"
            "Options:\n"
            "    -c file        JSON config file path (required)\n"
            "    -o file        offset file; overrides offsetFile of the config\n"
            "    -v             set logger level to DEBUG\n"
            "    -V             set logger level to TRACE\n"
            "    -h             print this help and exit\n"
            "\n"
            "Every decoded message is written to stdout as one JSON line.\n";

            return 0;
        }

        if (isArgSet('v')) {
            setLogLevel(spdlog::level::debug);
        }

        if (isArgSet('V')) {
            setLogLevel(spdlog::level::trace);
        }

        if (!argv().empty()) {
            _logger->error("unexpected argument: {}", argv().front());
            return 1;
        }

        if (!isArgSet('c')) {
            _logger->error("config file must be specified (-c)");
            return 1;
        }

        auto configOpt = config::ShardStreamConfig::loadFromFile(getArg('c'));
        if (!configOpt) {
            _logger->error("failed to load config file");
            return 1;
        }
        const auto &config = *configOpt;

        auto offsetPath = isArgSet('o') ? getArg('o') : config.offsetFile;
        if (!offsetPath.empty()) {
            _offsetStore = std::make_unique<connector::OffsetStore>(offsetPath);
        }

        vstream::KeyspaceSelector selector { config.source.keyspace, config.source.shard, config.source.gtid };

        std::optional<vstream::Position> startPosition;
        try {
            if (_offsetStore != nullptr) {
                startPosition = _offsetStore->load();
            }
        } catch (const MalformedPositionError &e) {
            _logger->error("stored offset in {} is unusable: {}", offsetPath, e.what());
            return 1;
        }

        if (!startPosition.has_value()) {
            startPosition = vstream::Position::defaultFor(selector);
        }

        connector::SessionOptions options;
        options.controller.selector = selector;
        options.controller.tabletType = static_cast<vstream::proto::VStreamRequest::TabletType>(
            *config::ShardStreamConfig::tabletTypeValue(config.source.tabletType)
        );
        options.controller.tableIncludeList = config.source.tableIncludeList;
        options.controller.tableExcludeList = config.source.tableExcludeList;
        options.controller.stopOnReshard = config.source.stopOnReshard;
        options.controller.maxRestarts = config.stream.maxRestarts;
        options.controller.eofHandlingEnabled = config.stream.eofHandlingEnabled;
        options.controller.closeTimeout = std::chrono::milliseconds(config.stream.closeTimeoutMs);
        options.maxRetries = config.stream.maxRetries;
        options.retryBackoff = std::chrono::milliseconds(config.stream.retryBackoffMs);

        vstream::GatewayOptions gateway;
        gateway.host = config.gateway.host;
        gateway.port = config.gateway.port;
        gateway.username = config.gateway.username;
        gateway.password = config.gateway.password;
        gateway.maxInboundMessageSize = config.gateway.maxInboundMessageSize;
        gateway.keepaliveIntervalMs = config.gateway.keepaliveIntervalMs;
        gateway.grpcHeaders = config.gateway.grpcHeaders;

        auto resetMetric = std::make_shared<metrics::PositionResetCounter>(
            "shardstreamd", config.source.keyspace, config.source.tableIncludeList
        );

        {
            std::lock_guard lock(_sessionMutex);
            if (_stopRequested) {
                return 0;
            }

            _session = std::make_shared<connector::ReplicationSession>(
                options,
                std::make_shared<vstream::GrpcStreamTransportFactory>(gateway),
                resetMetric
            );
        }

        int exitCode = 0;
        try {
            _session->run(*startPosition, [this](const auto &message, const auto &position, bool isLast) {
                handleMessage(message, position, isLast);
            });
            _logger->info("session ended");
        } catch (const std::exception &e) {
            _logger->error("session failed: {}", e.what());
            exitCode = 1;
        }

        if (resetMetric->numberOfPositionResets() > 0) {
            const auto &tags = resetMetric->tags();
            _logger->warn("position was reset {} time(s) during this run (taskId: {}, keyspace: {}, tables: {})",
                          resetMetric->numberOfPositionResets(),
                          tags.at("taskId"), tags.at("keyspace"), tags.at("tables"));
        }

        return exitCode;
    }

    void requestStopFromSignal() {
        std::shared_ptr<connector::ReplicationSession> session;
        {
            std::lock_guard lock(_sessionMutex);
            _stopRequested = true;
            session = _session;
        }

        _logger->info("stop requested");
        if (session != nullptr) {
            session->stop();
        }
    }

private:
    void handleMessage(const vstream::ReplicationMessage &message,
                       const std::optional<vstream::Position> &position,
                       bool isLastRowOfTransaction) {
        std::cout << connector::messageToJsonLine(message, position, isLastRowOfTransaction) << std::endl;

        if (message.operation() == vstream::ReplicationMessage::COMMIT &&
            position.has_value() && _offsetStore != nullptr) {
            try {
                _offsetStore->save(*position);
            } catch (const std::runtime_error &e) {
                throw ConsumerCallbackError(fmt::format("failed to store offset: {}", e.what()));
            }
        }
    }

    LoggerPtr _logger;

    std::unique_ptr<connector::OffsetStore> _offsetStore;

    std::mutex _sessionMutex;
    bool _stopRequested = false;
    std::shared_ptr<connector::ReplicationSession> _session;
};

int main(int argc, char **argv) {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    ShardStreamApp application;
    std::thread signalThread([&application, signals]() mutable {
        int sig = 0;
        if (sigwait(&signals, &sig) == 0) {
            application.requestStopFromSignal();
        }
    });
    signalThread.detach();

    return application.exec(argc, argv);
}
