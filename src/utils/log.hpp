//
// Named spdlog loggers sharing a single stderr sink
//

#ifndef SHARDSTREAM_LOG_HPP
#define SHARDSTREAM_LOG_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

using LoggerPtr = std::shared_ptr<spdlog::logger>;

/**
 * @brief returns the logger registered under the given name, creating it on first use.
 */
LoggerPtr createLogger(const std::string &name);

/**
 * @brief changes the level of the shared sink and of every logger created so far.
 */
void setLogLevel(spdlog::level::level_enum level);

#endif //SHARDSTREAM_LOG_HPP
