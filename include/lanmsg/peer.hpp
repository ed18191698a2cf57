/**
 * @file peer.hpp
 * @brief PeerRecord and the persistence interface the directory mirrors into.
 */
#ifndef LANMSG_PEER_HPP
#define LANMSG_PEER_HPP

#include <stdint.h>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lanmsg {

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFn     = std::function<TimePoint()>;

/**
 * @brief One peer, keyed by IPv4 address.
 *
 * There is no online flag. Whether a peer is online is always computed
 * from `last_seen` against a timeout at the moment somebody asks.
 */
struct PeerRecord {
  std::string ip;
  uint16_t    port{0};
  std::string username;
  std::string hostname;
  std::string nickname;     ///< local display override; never learned from the wire
  TimePoint   last_seen{};

  /// nickname, else username, else hostname, else ip.
  const std::string& display_name() const {
    if (!nickname.empty()) return nickname;
    if (!username.empty()) return username;
    if (!hostname.empty()) return hostname;
    return ip;
  }
};

/// Online iff `now - last_seen < timeout`.
inline bool is_online_at(const PeerRecord& p, TimePoint now, std::chrono::seconds timeout) {
  return now - p.last_seen < timeout;
}

/**
 * @brief Storage-side view of peers (implemented by the collaborator layer).
 */
class IPeerRepository {
public:
  virtual ~IPeerRepository() = default;
  virtual bool upsert_peer(const PeerRecord& peer) = 0;
  virtual std::optional<PeerRecord> find_peer_by_ip(const std::string& ip) const = 0;
  virtual std::vector<PeerRecord> find_online_peers(std::chrono::seconds timeout) const = 0;
};

} // namespace lanmsg

#endif // LANMSG_PEER_HPP
