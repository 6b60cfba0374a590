//
// JSON configuration of the stream client and its daemon
//

#include "config/ShardStreamConfig.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>

#include "utils/log.hpp"
#include "utils/StringUtil.hpp"

namespace shardstream::config {

    namespace {
        LoggerPtr logger = createLogger("ShardStreamConfig");

        std::string getEnvString(const char *name) {
            const char *value = std::getenv(name);
            if (value == nullptr) {
                return {};
            }
            return std::string(value);
        }

        bool parseIntString(const std::string &value, int &out) {
            try {
                size_t idx = 0;
                long long parsed = std::stoll(value, &idx);
                if (idx != value.size()) {
                    return false;
                }
                if (parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
                    return false;
                }
                out = static_cast<int>(parsed);
                return true;
            } catch (const std::exception &) {
                return false;
            }
        }

        /**
         * @return false if a required field is missing or null; `present` tells whether there is a value to read
         */
        bool checkPresence(const nlohmann::json &obj, const char *key, const std::string &path,
                           bool required, bool &present) {
            present = false;

            if (!obj.contains(key)) {
                if (required) {
                    logger->error("missing required field: {}", path);
                    return false;
                }
                return true;
            }

            if (obj.at(key).is_null()) {
                if (required) {
                    logger->error("required field is null: {}", path);
                    return false;
                }
                return true;
            }

            present = true;
            return true;
        }

        bool readStringField(const nlohmann::json &obj, const char *key, std::string &out,
                             const std::string &path, bool required) {
            bool present = false;
            if (!checkPresence(obj, key, path, required, present)) {
                return false;
            }
            if (!present) {
                return true;
            }

            const auto &value = obj.at(key);
            if (!value.is_string()) {
                logger->error("field must be a string: {}", path);
                return false;
            }

            out = value.get<std::string>();
            if (required && out.empty()) {
                logger->error("required field is empty: {}", path);
                return false;
            }
            return true;
        }

        bool readBoolField(const nlohmann::json &obj, const char *key, bool &out,
                           const std::string &path, bool required) {
            bool present = false;
            if (!checkPresence(obj, key, path, required, present)) {
                return false;
            }
            if (!present) {
                return true;
            }

            const auto &value = obj.at(key);
            if (!value.is_boolean()) {
                logger->error("field must be a boolean: {}", path);
                return false;
            }

            out = value.get<bool>();
            return true;
        }

        bool readIntField(const nlohmann::json &obj, const char *key, int &out,
                          const std::string &path, bool required) {
            bool present = false;
            if (!checkPresence(obj, key, path, required, present)) {
                return false;
            }
            if (!present) {
                return true;
            }

            const auto &value = obj.at(key);
            if (value.is_number_integer()) {
                auto parsed = value.get<long long>();
                if (parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
                    logger->error("field out of range: {}", path);
                    return false;
                }
                out = static_cast<int>(parsed);
                return true;
            }

            if (value.is_number_unsigned()) {
                auto parsed = value.get<unsigned long long>();
                if (parsed > static_cast<unsigned long long>(std::numeric_limits<int>::max())) {
                    logger->error("field out of range: {}", path);
                    return false;
                }
                out = static_cast<int>(parsed);
                return true;
            }

            if (value.is_string()) {
                auto text = value.get<std::string>();
                if (!parseIntString(text, out)) {
                    logger->error("field must be an integer: {}", path);
                    return false;
                }
                return true;
            }

            logger->error("field must be an integer: {}", path);
            return false;
        }

        /**
         * accepts a JSON array of strings, or a single comma separated string
         */
        bool readStringList(const nlohmann::json &obj, const char *key,
                            std::vector<std::string> &out, const std::string &path) {
            bool present = false;
            if (!checkPresence(obj, key, path, false, present)) {
                return false;
            }
            if (!present) {
                return true;
            }

            const auto &value = obj.at(key);
            std::vector<std::string> entries;

            if (value.is_string()) {
                for (const auto &item: utility::split(value.get<std::string>(), ',')) {
                    auto name = utility::trim(item);
                    if (!name.empty()) {
                        entries.emplace_back(std::move(name));
                    }
                }
            } else if (value.is_array()) {
                for (const auto &item: value) {
                    if (!item.is_string()) {
                        logger->error("array elements must be strings: {}", path);
                        return false;
                    }
                    entries.emplace_back(item.get<std::string>());
                }
            } else {
                logger->error("field must be an array: {}", path);
                return false;
            }

            out = std::move(entries);
            return true;
        }

        bool readStringMap(const nlohmann::json &obj, const char *key,
                           std::map<std::string, std::string> &out, const std::string &path) {
            bool present = false;
            if (!checkPresence(obj, key, path, false, present)) {
                return false;
            }
            if (!present) {
                return true;
            }

            const auto &value = obj.at(key);
            if (!value.is_object()) {
                logger->error("field must be an object: {}", path);
                return false;
            }

            std::map<std::string, std::string> entries;
            for (auto it = value.begin(); it != value.end(); ++it) {
                if (!it.value().is_string()) {
                    logger->error("{} values must be strings: {}", path, it.key());
                    return false;
                }
                entries.emplace(it.key(), it.value().get<std::string>());
            }

            out = std::move(entries);
            return true;
        }

        const nlohmann::json *sectionOf(const nlohmann::json &document, const char *key, bool &ok) {
            ok = true;
            if (!document.contains(key)) {
                return nullptr;
            }

            const auto &section = document.at(key);
            if (!section.is_object()) {
                logger->error("field must be an object: {}", key);
                ok = false;
                return nullptr;
            }

            return &section;
        }
    } // namespace

    std::optional<int> ShardStreamConfig::tabletTypeValue(const std::string &name) {
        auto upper = utility::toUpper(utility::trim(name));

        if (upper == "MASTER" || upper == "PRIMARY") {
            return 1;
        }
        if (upper == "REPLICA") {
            return 2;
        }
        if (upper == "RDONLY") {
            return 3;
        }

        return std::nullopt;
    }

    std::optional<ShardStreamConfig> ShardStreamConfig::loadFromFile(const std::string &path) {
        std::ifstream inputStream(path);
        if (!inputStream.is_open()) {
            logger->error("failed to open config file: {}", path);
            return std::nullopt;
        }

        std::stringstream buffer;
        buffer << inputStream.rdbuf();
        inputStream.close();

        return loadFromString(buffer.str());
    }

    std::optional<ShardStreamConfig> ShardStreamConfig::loadFromString(const std::string &jsonStr) {
        using nlohmann::json;

        auto document = json::parse(jsonStr, nullptr, false);
        if (document.is_discarded()) {
            logger->error("failed to parse config JSON");
            return std::nullopt;
        }

        if (!document.is_object()) {
            logger->error("config JSON must be an object");
            return std::nullopt;
        }

        ShardStreamConfig config;

        bool hostProvided = false;
        bool portProvided = false;
        bool userProvided = false;
        bool passwordProvided = false;

        bool ok = true;
        if (const auto *gatewayObj = sectionOf(document, "gateway", ok)) {
            hostProvided = gatewayObj->contains("host");
            portProvided = gatewayObj->contains("port");
            userProvided = gatewayObj->contains("username");
            passwordProvided = gatewayObj->contains("password");

            if (!readStringField(*gatewayObj, "host", config.gateway.host, "gateway.host", false)) {
                return std::nullopt;
            }
            if (!readIntField(*gatewayObj, "port", config.gateway.port, "gateway.port", false)) {
                return std::nullopt;
            }
            if (!readStringField(*gatewayObj, "username", config.gateway.username, "gateway.username", false)) {
                return std::nullopt;
            }
            if (!readStringField(*gatewayObj, "password", config.gateway.password, "gateway.password", false)) {
                return std::nullopt;
            }
            if (!readIntField(*gatewayObj, "maxInboundMessageSize", config.gateway.maxInboundMessageSize,
                              "gateway.maxInboundMessageSize", false)) {
                return std::nullopt;
            }
            if (!readIntField(*gatewayObj, "keepaliveIntervalMs", config.gateway.keepaliveIntervalMs,
                              "gateway.keepaliveIntervalMs", false)) {
                return std::nullopt;
            }
            if (!readStringMap(*gatewayObj, "grpcHeaders", config.gateway.grpcHeaders, "gateway.grpcHeaders")) {
                return std::nullopt;
            }

            if (!config.gateway.password.empty()) {
                logger->warn("gateway.password is stored in plain text in config JSON");
            }
        } else if (!ok) {
            return std::nullopt;
        }

        if (const auto *sourceObj = sectionOf(document, "source", ok)) {
            if (!readStringField(*sourceObj, "keyspace", config.source.keyspace, "source.keyspace", true)) {
                return std::nullopt;
            }
            if (!readStringField(*sourceObj, "shard", config.source.shard, "source.shard", false)) {
                return std::nullopt;
            }
            if (!readStringField(*sourceObj, "gtid", config.source.gtid, "source.gtid", false)) {
                return std::nullopt;
            }
            if (!readStringField(*sourceObj, "tabletType", config.source.tabletType, "source.tabletType", false)) {
                return std::nullopt;
            }
            if (!readStringList(*sourceObj, "tableIncludeList", config.source.tableIncludeList,
                                "source.tableIncludeList")) {
                return std::nullopt;
            }
            if (!readStringList(*sourceObj, "tableExcludeList", config.source.tableExcludeList,
                                "source.tableExcludeList")) {
                return std::nullopt;
            }
            if (!readBoolField(*sourceObj, "stopOnReshard", config.source.stopOnReshard,
                               "source.stopOnReshard", false)) {
                return std::nullopt;
            }

            if (!tabletTypeValue(config.source.tabletType).has_value()) {
                logger->error("source.tabletType must be one of MASTER, PRIMARY, REPLICA, RDONLY (got '{}')",
                              config.source.tabletType);
                return std::nullopt;
            }

            if (config.source.gtid.empty()) {
                logger->error("source.gtid must not be empty");
                return std::nullopt;
            }
        } else {
            if (ok) {
                logger->error("missing required field: source.keyspace");
            }
            return std::nullopt;
        }

        if (const auto *streamObj = sectionOf(document, "stream", ok)) {
            if (!readIntField(*streamObj, "maxRestarts", config.stream.maxRestarts, "stream.maxRestarts", false)) {
                return std::nullopt;
            }
            if (!readBoolField(*streamObj, "eofHandlingEnabled", config.stream.eofHandlingEnabled,
                               "stream.eofHandlingEnabled", false)) {
                return std::nullopt;
            }
            if (!readIntField(*streamObj, "closeTimeoutMs", config.stream.closeTimeoutMs,
                              "stream.closeTimeoutMs", false)) {
                return std::nullopt;
            }
            if (!readIntField(*streamObj, "maxRetries", config.stream.maxRetries, "stream.maxRetries", false)) {
                return std::nullopt;
            }
            if (!readIntField(*streamObj, "retryBackoffMs", config.stream.retryBackoffMs,
                              "stream.retryBackoffMs", false)) {
                return std::nullopt;
            }

            if (config.stream.maxRestarts < 0 || config.stream.maxRetries < 0 ||
                config.stream.closeTimeoutMs < 0 || config.stream.retryBackoffMs < 0) {
                logger->error("stream.* values must not be negative");
                return std::nullopt;
            }
        } else if (!ok) {
            return std::nullopt;
        }

        if (!readStringField(document, "offsetFile", config.offsetFile, "offsetFile", false)) {
            return std::nullopt;
        }

        if (!hostProvided) {
            auto envHost = getEnvString("VTGATE_HOST");
            if (!envHost.empty()) {
                config.gateway.host = envHost;
            }
        }

        if (!portProvided) {
            auto envPort = getEnvString("VTGATE_PORT");
            if (!envPort.empty()) {
                int parsedPort = 0;
                if (!parseIntString(envPort, parsedPort)) {
                    logger->error("VTGATE_PORT must be an integer");
                    return std::nullopt;
                }
                config.gateway.port = parsedPort;
            }
        }

        if (!userProvided) {
            auto envUser = getEnvString("VTGATE_USER");
            if (!envUser.empty()) {
                config.gateway.username = envUser;
            }
        }

        if (!passwordProvided) {
            auto envPassword = getEnvString("VTGATE_PASSWORD");
            if (!envPassword.empty()) {
                config.gateway.password = envPassword;
            }
        }

        if (config.gateway.port <= 0 || config.gateway.port > 65535) {
            logger->error("gateway.port out of range: {}", config.gateway.port);
            return std::nullopt;
        }

        if (config.gateway.maxInboundMessageSize <= 0) {
            logger->error("gateway.maxInboundMessageSize must be positive");
            return std::nullopt;
        }

        return config;
    }

} // namespace shardstream::config
