// ============================================================================
// peer_registry.cpp - implementation for peer_registry.hpp
// For the file format see the matching .hpp. For usage, check tests/.
// ============================================================================

#include "lanmsg/peer_registry.hpp"
#include "lanmsg/config.hpp"   // write_json_atomic(), default_config_dir()
#include "lanmsg/log.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;
using nlohmann::json;

namespace lanmsg {

namespace {

int64_t to_unix_ms(TimePoint t) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

TimePoint from_unix_ms(int64_t ms) {
  return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms)));
}

} // namespace

// -------- json mapping --------

json peer_to_json(const PeerRecord& p) {
  json j;
  j["ip"]        = p.ip;
  j["port"]      = p.port;
  j["username"]  = p.username;
  j["hostname"]  = p.hostname;
  j["nickname"]  = p.nickname;
  j["last_seen"] = to_unix_ms(p.last_seen);
  return j;
}

/*
 * peer_from_json()
 * ----------------
 * Lenient on optional text fields, strict on the key: an entry without a
 * string "ip" is skipped rather than guessed at.
 */
std::optional<PeerRecord> peer_from_json(const json& j) {
  if (!j.is_object() || !j.contains("ip") || !j["ip"].is_string()) return std::nullopt;
  try {
    PeerRecord p;
    p.ip        = j.at("ip").get<std::string>();
    p.port      = j.value("port", uint16_t{0});
    p.username  = j.value("username", std::string());
    p.hostname  = j.value("hostname", std::string());
    p.nickname  = j.value("nickname", std::string());
    p.last_seen = from_unix_ms(j.value("last_seen", int64_t{0}));
    if (p.ip.empty()) return std::nullopt;
    return p;
  } catch (const json::exception&) {
    return std::nullopt;
  }
}

std::string default_registry_path() {
  return (fs::path(default_config_dir()) / "peers.json").string();
}

// -------- registry --------

JsonPeerRegistry::JsonPeerRegistry(std::string path, NowFn now)
: path_(std::move(path)),
  now_(now ? std::move(now) : NowFn([] { return Clock::now(); })) {}

bool JsonPeerRegistry::load() {
  std::lock_guard<std::mutex> lock(mu_);
  peers_.clear();

  std::error_code ec;
  if (!fs::exists(path_, ec)) return true;          // first run: nothing yet

  std::ifstream in(path_);
  if (!in) {
    log(LogLevel::Warn, "registry").kv("status", "open_failed").kv("path", path_);
    return false;
  }
  try {
    json j;
    in >> j;
    if (!j.is_array()) {
      log(LogLevel::Warn, "registry").kv("status", "bad_format").kv("path", path_);
      return false;
    }
    size_t skipped = 0;
    for (const auto& e : j) {
      auto p = peer_from_json(e);
      if (p) peers_[p->ip] = *p;
      else ++skipped;
    }
    log(LogLevel::Debug, "registry").kv("event", "loaded").kv("peers", peers_.size())
        .kv("skipped", skipped);
  } catch (const json::exception& e) {
    log(LogLevel::Warn, "registry").kv("status", "parse_error").kv("path", path_).kv("reason", e.what());
    peers_.clear();
    return false;
  }
  return true;
}

bool JsonPeerRegistry::upsert_peer(const PeerRecord& peer) {
  if (peer.ip.empty()) return false;
  std::lock_guard<std::mutex> lock(mu_);
  peers_[peer.ip] = peer;
  return flush_locked();
}

std::optional<PeerRecord> JsonPeerRegistry::find_peer_by_ip(const std::string& ip) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = peers_.find(ip);
  if (it == peers_.end()) return std::nullopt;
  return it->second;
}

std::vector<PeerRecord> JsonPeerRegistry::find_online_peers(std::chrono::seconds timeout) const {
  const TimePoint now = now_();
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<PeerRecord> out;
  for (const auto& kv : peers_) {
    if (is_online_at(kv.second, now, timeout)) out.push_back(kv.second);
  }
  return out;
}

bool JsonPeerRegistry::remove_peer(const std::string& ip) {
  std::lock_guard<std::mutex> lock(mu_);
  if (peers_.erase(ip) == 0) return false;
  return flush_locked();
}

std::vector<PeerRecord> JsonPeerRegistry::all() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<PeerRecord> out;
  out.reserve(peers_.size());
  for (const auto& kv : peers_) out.push_back(kv.second);
  return out;
}

// flush_locked() - caller holds mu_.
bool JsonPeerRegistry::flush_locked() const {
  json arr = json::array();
  for (const auto& kv : peers_) arr.push_back(peer_to_json(kv.second));
  return write_json_atomic(path_, arr);
}

} // namespace lanmsg
