// -----------------------------------------------------------------------------
// config.cpp — JSON config overlay
//
// Unknown keys are ignored. A present key with the wrong JSON type throws
// ConfigError.
// -----------------------------------------------------------------------------
#include "agentmsg/config.hpp"
#include "agentmsg/errors.hpp"

#include <cstdlib>
#include <fstream>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace agentmsg {

namespace {

// Fetch `key` from `j` as T when present. Throws ConfigError on type mismatch.
template <typename T>
std::optional<T> get_opt(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return std::nullopt;
  try {
    return it->get<T>();
  } catch (const json::exception& e) {
    throw ConfigError(std::string("config key '") + key + "': " + e.what());
  }
}

const json* get_section(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return nullptr;
  if (!it->is_object()) throw ConfigError(std::string("config key '") + key + "' must be an object");
  return &*it;
}

std::chrono::milliseconds from_seconds(double s) {
  return std::chrono::milliseconds(static_cast<int64_t>(s * 1000.0));
}

} // namespace

AppConfig config_from_json(const json& j) {
  if (!j.is_object()) throw ConfigError("config root must be a JSON object");

  AppConfig cfg;
  MessengerConfig& m = cfg.messenger;

  if (auto v = get_opt<std::string>(j, "uuid"); v && !v->empty())     m.identity = *v;
  if (auto v = get_opt<std::string>(j, "file_dir"); v && !v->empty()) m.shared_dir = *v;

  if (auto v = get_opt<double>(j, "heartbeat_interval_s")) m.heartbeat_interval = from_seconds(*v);
  if (auto v = get_opt<double>(j, "peer_timeout_s"))       m.peer_timeout = from_seconds(*v);
  if (auto v = get_opt<int64_t>(j, "receive_timeout_ms"))  m.receive_timeout = std::chrono::milliseconds(*v);
  if (auto v = get_opt<int64_t>(j, "join_timeout_ms"))     m.join_timeout = std::chrono::milliseconds(*v);

  if (const json* mc = get_section(j, "multicast")) {
    if (auto v = get_opt<std::string>(*mc, "group")) m.udp.group = *v;
    if (auto v = get_opt<uint16_t>(*mc, "port"))     m.udp.port = *v;
    if (auto v = get_opt<uint8_t>(*mc, "ttl"))       m.udp.ttl = *v;
    if (auto v = get_opt<bool>(*mc, "loopback"))     m.udp.loopback = *v;
    if (auto v = get_opt<std::string>(*mc, "interface")) m.udp.interface_addr = *v;
  }

  if (const json* fc = get_section(j, "file")) {
    if (auto v = get_opt<int64_t>(*fc, "poll_interval_ms")) m.shared.poll_interval = std::chrono::milliseconds(*v);
    if (auto v = get_opt<double>(*fc, "message_ttl_s"))     m.shared.message_ttl = from_seconds(*v);
    if (auto v = get_opt<double>(*fc, "cleanup_interval_s")) m.shared.cleanup_interval = from_seconds(*v);
  }

  if (const json* lc = get_section(j, "log")) {
    if (auto v = get_opt<std::string>(*lc, "level"))   cfg.logging.level = *v;
    if (auto v = get_opt<std::string>(*lc, "pattern")) cfg.logging.pattern = *v;
  }

  return cfg;
}

AppConfig load_config_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw ConfigError("cannot open config file " + path);

  json j;
  try {
    in >> j;
  } catch (const json::parse_error& e) {
    throw ConfigError("invalid JSON in " + path + ": " + e.what());
  }
  return config_from_json(j);
}

void apply_environment(MessengerConfig& config) {
  if (config.shared_dir) return;
  if (const char* dir = std::getenv("AGENTMSG_FILE_DIR"); dir && *dir) {
    config.shared_dir = dir;
  }
}

} // namespace agentmsg
