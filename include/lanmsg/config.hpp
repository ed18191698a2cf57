/**
 * @file config.hpp
 * @brief Runtime configuration: defaults, validation, JSON file load/save.
 *
 * @details
 * The file lives at `$XDG_CONFIG_HOME/lanmsg/config.json` (falling back to
 * `~/.config/lanmsg/config.json`). Every key is optional; a missing key keeps
 * its default, unknown keys are ignored. Saves are atomic (temp file +
 * rename), so a crash mid-write never leaves a half file behind.
 *
 * @par Example file
 * ```json
 * {
 *   "username": "alice",
 *   "hostname": "alice-laptop",
 *   "udp_port": 2425,
 *   "heartbeat_interval_s": 30,
 *   "peer_timeout_s": 180,
 *   "tcp_port_start": 8000,
 *   "tcp_port_end": 9000,
 *   "auto_accept_files": false,
 *   "file_save_dir": "/home/alice/Downloads",
 *   "log_level": "info"
 * }
 * ```
 *
 * @par Validation rules
 * | rule                                   | status                       |
 * |----------------------------------------|------------------------------|
 * | udp_port != 0                          | BadUdpPort                   |
 * | 1024 <= tcp_port_start < tcp_port_end  | BadTcpRange                  |
 * | peer_timeout_s > heartbeat_interval_s  | TimeoutNotAboveHeartbeat     |
 * | bind_ip not empty                      | EmptyBindIp                  |
 * | username not empty                     | EmptyUsername                |
 * | 1 <= poll_timeout_ms <= 1000           | BadPollTimeout               |
 * | log_level recognised                   | BadLogLevel                  |
 * | bind_attempts >= 1                     | BadBindAttempts              |
 */
#ifndef LANMSG_CONFIG_HPP
#define LANMSG_CONFIG_HPP

#include <stdint.h>
#include <string>

#include <nlohmann/json.hpp>

namespace lanmsg {

enum class ConfigStatus : uint8_t {
  Ok = 0,
  BadUdpPort,
  BadTcpRange,
  TimeoutNotAboveHeartbeat,
  EmptyBindIp,
  EmptyUsername,
  BadPollTimeout,
  BadLogLevel,
  BadBindAttempts,
  IoError,
  ParseError
};

struct Config {
  std::string username;
  std::string hostname;
  std::string user_id;
  std::string bind_ip{"0.0.0.0"};
  std::string broadcast_ip{"255.255.255.255"};
  uint16_t    udp_port{2425};
  int         bind_attempts{10};
  uint16_t    tcp_port_start{8000};
  uint16_t    tcp_port_end{9000};
  uint32_t    heartbeat_interval_s{30};
  uint32_t    peer_timeout_s{180};
  int         poll_timeout_ms{100};
  uint32_t    rate_limit_ms{1000};
  bool        auto_accept_files{false};
  std::string file_save_dir;
  std::string log_level{"info"};
  bool        vendor_announce{true};
};

/// Defaults plus username from $USER and hostname from gethostname().
Config default_config();

ConfigStatus validate(const Config& cfg);
const char* config_status_name(ConfigStatus s);

/// `$XDG_CONFIG_HOME/lanmsg` or `~/.config/lanmsg`.
std::string default_config_dir();
std::string default_config_path();

/**
 * @brief Overlay the file at `path` onto `cfg`.
 * @return Ok if the file is missing (cfg untouched); ParseError on bad JSON
 *         or wrong value types; IoError if it exists but cannot be read.
 */
ConfigStatus load_config(const std::string& path, Config& cfg);

/// Write atomically, creating parent directories.
ConfigStatus save_config(const std::string& path, const Config& cfg);

nlohmann::json config_to_json(const Config& cfg);

/// Pretty-print `j` to `path` via a temp file + rename; false (logged) on any failure.
bool write_json_atomic(const std::string& path, const nlohmann::json& j);

/// Overlay present keys of an object (anything else is ignored); throws nlohmann::json::exception on type mismatch.
void config_from_json(const nlohmann::json& j, Config& cfg);

} // namespace lanmsg

#endif // LANMSG_CONFIG_HPP
