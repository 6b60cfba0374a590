//
// Named spdlog loggers sharing a single stderr sink
//

#include "log.hpp"

#include <map>
#include <mutex>

namespace {
    struct LoggerRegistry {
        std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> sink;
        std::map<std::string, LoggerPtr> loggers;
        std::mutex mutex;

        LoggerRegistry():
            sink(std::make_shared<spdlog::sinks::stderr_color_sink_mt>())
        {
            sink->set_level(spdlog::level::info);
        }
    };

    // loggers are created from other translation units' static initializers
    LoggerRegistry &registry() {
        static LoggerRegistry instance;
        return instance;
    }
}

LoggerPtr createLogger(const std::string &name) {
    auto &reg = registry();
    std::scoped_lock lock(reg.mutex);

    auto it = reg.loggers.find(name);
    if (it == reg.loggers.end()) {
        auto logger = std::make_shared<spdlog::logger>(name, reg.sink);

        logger->set_level(reg.sink->level());
        it = reg.loggers.emplace(name, std::move(logger)).first;
    }

    return it->second;
}

void setLogLevel(spdlog::level::level_enum level) {
    auto &reg = registry();
    std::scoped_lock lock(reg.mutex);
    reg.sink->set_level(level);

    for (auto &pair: reg.loggers) {
        pair.second->set_level(level);
    }
}
