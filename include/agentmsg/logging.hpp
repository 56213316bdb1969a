#pragma once
/**
 * @file logging.hpp
 * @brief Structured logging helpers on top of spdlog.
 *
 * Call sites pass a short message plus key=value fields:
 * @code
 *   AGENTMSG_LOG_WARN("dropping malformed datagram", {agentmsg::str_field("error", e.what())});
 * @endcode
 * which renders as `dropping malformed datagram error=...`.
 *
 * init_logging() is optional. Library code always logs through spdlog's
 * default logger, so an embedding program that configured spdlog itself keeps
 * its own sinks.
 */

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace agentmsg {

struct LoggingConfig;

struct LogField {
  std::string key;
  std::string value;
};

LogField str_field(std::string_view key, std::string_view value);
LogField int_field(std::string_view key, std::int64_t value);
LogField num_field(std::string_view key, double value);

/**
 * @brief Install the `agentmsg` stderr logger as spdlog's default.
 *
 * Level and pattern come from AGENTMSG_LOG_LEVEL / AGENTMSG_LOG_PATTERN if set,
 * else from @p config, else `info` and an ISO-8601 pattern.
 */
void init_logging(const LoggingConfig& config);
void shutdown_logging();

void log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields = {});

inline void log_debug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  log(spdlog::level::debug, message, fields);
}

inline void log_info(std::string_view message, std::initializer_list<LogField> fields = {}) {
  log(spdlog::level::info, message, fields);
}

inline void log_warn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  log(spdlog::level::warn, message, fields);
}

inline void log_error(std::string_view message, std::initializer_list<LogField> fields = {}) {
  log(spdlog::level::err, message, fields);
}

} // namespace agentmsg

#define AGENTMSG_LOG_DEBUG(message, ...) ::agentmsg::log_debug((message), ##__VA_ARGS__)
#define AGENTMSG_LOG_INFO(message, ...)  ::agentmsg::log_info((message), ##__VA_ARGS__)
#define AGENTMSG_LOG_WARN(message, ...)  ::agentmsg::log_warn((message), ##__VA_ARGS__)
#define AGENTMSG_LOG_ERROR(message, ...) ::agentmsg::log_error((message), ##__VA_ARGS__)
