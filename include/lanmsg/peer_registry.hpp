/**
 * @file peer_registry.hpp
 * @brief JsonPeerRegistry - file-backed IPeerRepository (`peers.json`).
 *
 * @details
 * PURPOSE
 * -------
 * The presence directory lives in memory and forgets everything on exit.
 * This registry is the small persistent roster behind it: every upsert the
 * directory mirrors lands here, and on the next start the engine seeds the
 * directory from the peers that were still fresh.
 *
 * FILE FORMAT
 * -----------
 * A plain JSON array, human-editable:
 * ```json
 * [
 *   {"ip":"10.0.0.7","port":2425,"username":"bob","hostname":"bob-pc",
 *    "nickname":"","last_seen":1761386707000}
 * ]
 * ```
 * `last_seen` is unix milliseconds.
 *
 * RELIABILITY AND TRADE-OFFS
 * --------------------------
 * - The whole file is rewritten (temp + rename) on each upsert. Rosters are
 *   tens of entries; this is simpler than any incremental format.
 * - A corrupt or missing file loads as an empty roster with a warning; the
 *   LAN refills it within one heartbeat.
 * - Online state is never stored; find_online_peers() derives it from
 *   last_seen like the directory does.
 */
#ifndef LANMSG_PEER_REGISTRY_HPP
#define LANMSG_PEER_REGISTRY_HPP

#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "peer.hpp"

namespace lanmsg {

class JsonPeerRegistry : public IPeerRepository {
public:
  explicit JsonPeerRegistry(std::string path, NowFn now = nullptr);

  /// Read the file; false if it exists but cannot be parsed (roster left empty).
  bool load();

  bool upsert_peer(const PeerRecord& peer) override;
  std::optional<PeerRecord> find_peer_by_ip(const std::string& ip) const override;
  std::vector<PeerRecord> find_online_peers(std::chrono::seconds timeout) const override;

  bool remove_peer(const std::string& ip);
  std::vector<PeerRecord> all() const;
  const std::string& path() const { return path_; }

private:
  bool flush_locked() const;

  std::string                       path_;
  NowFn                             now_;
  mutable std::mutex                mu_;
  std::map<std::string, PeerRecord> peers_;
};

nlohmann::json peer_to_json(const PeerRecord& p);
std::optional<PeerRecord> peer_from_json(const nlohmann::json& j);

/// `<config dir>/peers.json`.
std::string default_registry_path();

} // namespace lanmsg

#endif // LANMSG_PEER_REGISTRY_HPP
