//
// JSON configuration of the stream client and its daemon
//

#ifndef SHARDSTREAM_CONFIG_SHARDSTREAMCONFIG_HPP
#define SHARDSTREAM_CONFIG_SHARDSTREAMCONFIG_HPP

#include <climits>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace shardstream::config {

    struct GatewayConfig {
        std::string host = "localhost";
        int port = 15991;
        std::string username;
        std::string password;
        int maxInboundMessageSize = 4 * 1024 * 1024;
        int keepaliveIntervalMs = INT_MAX;
        std::map<std::string, std::string> grpcHeaders;
    };

    struct SourceConfig {
        std::string keyspace;  // required
        std::string shard;     // empty = all shards
        std::string gtid = "current";
        std::string tabletType = "MASTER";  // "MASTER" | "PRIMARY" | "REPLICA" | "RDONLY"
        std::vector<std::string> tableIncludeList;
        std::vector<std::string> tableExcludeList;
        bool stopOnReshard = false;
    };

    struct StreamConfig {
        int maxRestarts = 5;
        bool eofHandlingEnabled = false;
        int closeTimeoutMs = 5000;
        int maxRetries = 100;
        int retryBackoffMs = 1000;
    };

    struct ShardStreamConfig {
        GatewayConfig gateway;
        SourceConfig source;
        StreamConfig stream;
        std::string offsetFile;

        static std::optional<ShardStreamConfig> loadFromFile(const std::string &path);
        static std::optional<ShardStreamConfig> loadFromString(const std::string &jsonStr);

        /**
         * @return VStream tablet type number for a configured name (MASTER/PRIMARY = 1, REPLICA = 2, RDONLY = 3)
         */
        static std::optional<int> tabletTypeValue(const std::string &name);
    };

} // namespace shardstream::config

#endif // SHARDSTREAM_CONFIG_SHARDSTREAMCONFIG_HPP
