#include "agentmsg/logging.hpp"
#include "agentmsg/config.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace agentmsg {
namespace {

constexpr const char* kDefaultLevel   = "info";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e [%^%l%$] %v";

std::string resolve_level(const LoggingConfig& config) {
  if (const char* level = std::getenv("AGENTMSG_LOG_LEVEL"); level && *level) {
    return level;
  }
  if (!config.level.empty()) {
    return config.level;
  }
  return kDefaultLevel;
}

std::string resolve_pattern(const LoggingConfig& config) {
  if (const char* pattern = std::getenv("AGENTMSG_LOG_PATTERN"); pattern && *pattern) {
    return pattern;
  }
  if (!config.pattern.empty()) {
    return config.pattern;
  }
  return kDefaultPattern;
}

std::string serialize_fields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=' << field.value;
  }
  return out.str();
}

} // namespace

LogField str_field(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField int_field(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField num_field(std::string_view key, double value) {
  std::ostringstream out;
  out << value;
  return {std::string(key), out.str()};
}

void init_logging(const LoggingConfig& config) {
  auto logger = spdlog::get("agentmsg");
  if (!logger) {
    logger = spdlog::stderr_color_mt("agentmsg");
  }
  logger->set_pattern(resolve_pattern(config));
  logger->set_level(spdlog::level::from_str(resolve_level(config)));
  spdlog::set_default_logger(logger);
  spdlog::flush_on(spdlog::level::warn);
}

void shutdown_logging() {
  spdlog::shutdown();
}

void log(spdlog::level::level_enum level, std::string_view message,
         std::initializer_list<LogField> fields) {
  auto serialized = serialize_fields(fields);
  if (!serialized.empty()) {
    spdlog::log(level, "{} {}", message, serialized);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace agentmsg
