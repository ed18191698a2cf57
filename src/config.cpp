// -----------------------------------------------------------------------------
// config.cpp - defaults, validation, and the JSON config file
//
// API: include/lanmsg/config.hpp
// -----------------------------------------------------------------------------
#include "lanmsg/config.hpp"
#include "lanmsg/log.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <unistd.h>   // gethostname

namespace fs = std::filesystem;
using nlohmann::json;

namespace lanmsg {

Config default_config() {
  Config cfg;
  if (const char* u = std::getenv("USER"); u && *u) cfg.username = u;
  else cfg.username = "lanmsg";

  char host[256] = {0};
  if (::gethostname(host, sizeof(host) - 1) == 0 && host[0]) cfg.hostname = host;
  else cfg.hostname = "localhost";
  return cfg;
}

ConfigStatus validate(const Config& cfg) {
  if (cfg.udp_port == 0)                                   return ConfigStatus::BadUdpPort;
  if (cfg.tcp_port_start < 1024 ||
      cfg.tcp_port_start >= cfg.tcp_port_end)              return ConfigStatus::BadTcpRange;
  if (cfg.peer_timeout_s <= cfg.heartbeat_interval_s)      return ConfigStatus::TimeoutNotAboveHeartbeat;
  if (cfg.bind_ip.empty())                                 return ConfigStatus::EmptyBindIp;
  if (cfg.username.empty())                                return ConfigStatus::EmptyUsername;
  if (cfg.poll_timeout_ms < 1 || cfg.poll_timeout_ms > 1000) return ConfigStatus::BadPollTimeout;
  LogLevel lvl;
  if (!parse_log_level(cfg.log_level, lvl))                return ConfigStatus::BadLogLevel;
  if (cfg.bind_attempts < 1)                               return ConfigStatus::BadBindAttempts;
  return ConfigStatus::Ok;
}

const char* config_status_name(ConfigStatus s) {
  switch (s) {
    case ConfigStatus::Ok:                       return "ok";
    case ConfigStatus::BadUdpPort:               return "bad_udp_port";
    case ConfigStatus::BadTcpRange:              return "bad_tcp_range";
    case ConfigStatus::TimeoutNotAboveHeartbeat: return "timeout_not_above_heartbeat";
    case ConfigStatus::EmptyBindIp:              return "empty_bind_ip";
    case ConfigStatus::EmptyUsername:            return "empty_username";
    case ConfigStatus::BadPollTimeout:           return "bad_poll_timeout";
    case ConfigStatus::BadLogLevel:              return "bad_log_level";
    case ConfigStatus::BadBindAttempts:          return "bad_bind_attempts";
    case ConfigStatus::IoError:                  return "io_error";
    case ConfigStatus::ParseError:               return "parse_error";
  }
  return "unknown";
}

std::string default_config_dir() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && *xdg) return (fs::path(xdg) / "lanmsg").string();
  const char* home = std::getenv("HOME");
  return (fs::path(home ? home : ".") / ".config" / "lanmsg").string();
}

std::string default_config_path() {
  return (fs::path(default_config_dir()) / "config.json").string();
}

json config_to_json(const Config& cfg) {
  json j;
  j["username"]             = cfg.username;
  j["hostname"]             = cfg.hostname;
  j["user_id"]              = cfg.user_id;
  j["bind_ip"]              = cfg.bind_ip;
  j["broadcast_ip"]         = cfg.broadcast_ip;
  j["udp_port"]             = cfg.udp_port;
  j["bind_attempts"]        = cfg.bind_attempts;
  j["tcp_port_start"]       = cfg.tcp_port_start;
  j["tcp_port_end"]         = cfg.tcp_port_end;
  j["heartbeat_interval_s"] = cfg.heartbeat_interval_s;
  j["peer_timeout_s"]       = cfg.peer_timeout_s;
  j["poll_timeout_ms"]      = cfg.poll_timeout_ms;
  j["rate_limit_ms"]        = cfg.rate_limit_ms;
  j["auto_accept_files"]    = cfg.auto_accept_files;
  j["file_save_dir"]        = cfg.file_save_dir;
  j["log_level"]            = cfg.log_level;
  j["vendor_announce"]      = cfg.vendor_announce;
  return j;
}

void config_from_json(const json& j, Config& cfg) {
  if (!j.is_object()) return;
  cfg.username             = j.value("username", cfg.username);
  cfg.hostname             = j.value("hostname", cfg.hostname);
  cfg.user_id              = j.value("user_id", cfg.user_id);
  cfg.bind_ip              = j.value("bind_ip", cfg.bind_ip);
  cfg.broadcast_ip         = j.value("broadcast_ip", cfg.broadcast_ip);
  cfg.udp_port             = j.value("udp_port", cfg.udp_port);
  cfg.bind_attempts        = j.value("bind_attempts", cfg.bind_attempts);
  cfg.tcp_port_start       = j.value("tcp_port_start", cfg.tcp_port_start);
  cfg.tcp_port_end         = j.value("tcp_port_end", cfg.tcp_port_end);
  cfg.heartbeat_interval_s = j.value("heartbeat_interval_s", cfg.heartbeat_interval_s);
  cfg.peer_timeout_s       = j.value("peer_timeout_s", cfg.peer_timeout_s);
  cfg.poll_timeout_ms      = j.value("poll_timeout_ms", cfg.poll_timeout_ms);
  cfg.rate_limit_ms        = j.value("rate_limit_ms", cfg.rate_limit_ms);
  cfg.auto_accept_files    = j.value("auto_accept_files", cfg.auto_accept_files);
  cfg.file_save_dir        = j.value("file_save_dir", cfg.file_save_dir);
  cfg.log_level            = j.value("log_level", cfg.log_level);
  cfg.vendor_announce      = j.value("vendor_announce", cfg.vendor_announce);
}

ConfigStatus load_config(const std::string& path, Config& cfg) {
  std::error_code ec;
  if (!fs::exists(path, ec)) return ConfigStatus::Ok;

  std::ifstream in(path);
  if (!in) {
    log(LogLevel::Warn, "config").kv("status", "open_failed").kv("path", path);
    return ConfigStatus::IoError;
  }
  try {
    json j;
    in >> j;
    if (!j.is_object()) {
      log(LogLevel::Warn, "config").kv("status", "parse_error").kv("path", path).kv("reason", "root_not_object");
      return ConfigStatus::ParseError;
    }
    Config next = cfg;
    config_from_json(j, next);
    cfg = next;
  } catch (const json::exception& e) {
    log(LogLevel::Warn, "config").kv("status", "parse_error").kv("path", path).kv("reason", e.what());
    return ConfigStatus::ParseError;
  }
  return ConfigStatus::Ok;
}

// -----------------------------------------------------------------------------
// write_json_atomic()
// POLICY: write <path>.tmp, flush, rename over <path>. Readers see either the
//         old file or the new one, never a prefix. On failure the temp file
//         is removed and <path> is left as it was.
// -----------------------------------------------------------------------------
bool write_json_atomic(const std::string& path, const json& j) {
  const fs::path p(path);
  std::error_code ec;
  if (p.has_parent_path()) {
    fs::create_directories(p.parent_path(), ec);
    if (ec) {
      log(LogLevel::Warn, "config").kv("status", "mkdir_failed").kv("path", path).kv("reason", ec.message());
      return false;
    }
  }

  fs::path tmp = p;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      log(LogLevel::Warn, "config").kv("status", "open_failed").kv("path", tmp.string());
      return false;
    }
    out << j.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    out.flush();
    if (!out) {
      log(LogLevel::Warn, "config").kv("status", "write_failed").kv("path", tmp.string());
      fs::remove(tmp, ec);
      return false;
    }
  }
  fs::rename(tmp, p, ec);
  if (ec) {
    log(LogLevel::Warn, "config").kv("status", "rename_failed").kv("path", path).kv("reason", ec.message());
    fs::remove(tmp, ec);
    return false;
  }
  return true;
}

ConfigStatus save_config(const std::string& path, const Config& cfg) {
  return write_json_atomic(path, config_to_json(cfg)) ? ConfigStatus::Ok : ConfigStatus::IoError;
}

} // namespace lanmsg
