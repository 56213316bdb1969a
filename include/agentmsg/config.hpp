#pragma once
/**
 * @file config.hpp
 * @brief Tunables for the Messenger, its transports, and logging.
 *
 * Defaults are the deployment constants; every participant on one segment or
 * one shared directory must agree on the multicast endpoint and the file
 * retention window. Intervals are exposed mainly so tests can run fast.
 *
 * A config file is a small JSON document, every key optional:
 * @code
 * {
 *   "uuid": "build-agent-3",
 *   "file_dir": "/shared/agentmsg",
 *   "heartbeat_interval_s": 5,
 *   "peer_timeout_s": 15,
 *   "receive_timeout_ms": 1000,
 *   "join_timeout_ms": 2000,
 *   "multicast": { "group": "239.255.42.1", "port": 5007, "ttl": 1, "loopback": true,
 *                  "interface": "0.0.0.0" },
 *   "file": { "poll_interval_ms": 500, "message_ttl_s": 60, "cleanup_interval_s": 30 },
 *   "log": { "level": "info", "pattern": "%H:%M:%S %v" }
 * }
 * @endcode
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace agentmsg {

/// UDP multicast endpoint. One per deployment.
struct UdpConfig {
  std::string group{"239.255.42.1"};
  uint16_t    port{5007};
  uint8_t     ttl{1};              ///< hop limit: local segment only
  bool        loopback{true};      ///< sender receives its own datagrams
  std::size_t buffer_size{65535};  ///< max datagram accepted by recv()
  std::string interface_addr{"0.0.0.0"};  ///< local interface for join and send; 0.0.0.0 lets the kernel pick
};

/// Shared-directory fallback transport timing.
struct SharedDirConfig {
  std::chrono::milliseconds poll_interval{500};
  std::chrono::milliseconds message_ttl{60000};      ///< retention window
  std::chrono::milliseconds cleanup_interval{30000};
  std::size_t               inbox_cap{1024};
};

struct MessengerConfig {
  std::optional<std::string> identity;               ///< generated when empty
  std::optional<std::string> shared_dir;             ///< set => file transport

  std::chrono::milliseconds heartbeat_interval{5000};
  std::chrono::milliseconds peer_timeout{15000};     ///< 3 x heartbeat
  std::chrono::milliseconds receive_timeout{1000};
  std::chrono::milliseconds join_timeout{2000};

  UdpConfig       udp{};
  SharedDirConfig shared{};
};

struct LoggingConfig {
  std::string level;     ///< empty => env or "info"
  std::string pattern;   ///< empty => env or default pattern
};

struct AppConfig {
  MessengerConfig messenger{};
  LoggingConfig   logging{};
};

/**
 * @brief Overlay a parsed JSON document onto the defaults.
 * @throws ConfigError if a present key has the wrong JSON type.
 */
AppConfig config_from_json(const nlohmann::json& j);

/**
 * @brief Read and parse a JSON config file.
 * @throws ConfigError if the file cannot be read or is not valid JSON.
 */
AppConfig load_config_file(const std::string& path);

/// Fill shared_dir from AGENTMSG_FILE_DIR when it is still unset.
void apply_environment(MessengerConfig& config);

} // namespace agentmsg
