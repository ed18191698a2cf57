/**
 * @file presence.hpp
 * @brief PresenceDirectory - the authoritative peer table with timeout-derived liveness.
 *
 * @details
 * ## Field Brief
 * A LAN messenger never gets a reliable "I'm gone" from its peers. Laptops
 * sleep, cables get pulled, processes get killed. So this directory does not
 * store an online flag at all. It stores *when we last heard from a peer*
 * and answers "is it online?" by comparing that against a timeout, at the
 * moment the question is asked.
 *
 * ---
 *
 * @par Operational Model
 * ```
 *   BR_ENTRY  from 10.0.0.7 ──► upsert(10.0.0.7) ──► ANSENTRY back to 10.0.0.7
 *   ANSENTRY  from 10.0.0.9 ──► upsert(10.0.0.9)     (no reply: that would ping-pong)
 *   BR_ABSENCE from 10.0.0.7 ─► upsert(10.0.0.7)     (status change, still alive)
 *   BR_EXIT   from 10.0.0.7 ──► log only             (record ages out on its own)
 *
 *   is_online(p) := now - p.last_seen < timeout
 * ```
 * The announce/answer pair is what makes discovery converge: a newcomer's
 * broadcast reaches everyone, and everyone answers it by unicast, so the
 * newcomer learns the whole LAN from one broadcast even where its own
 * broadcasts cannot be received back.
 *
 * ---
 *
 * @par Invariants
 * - One record per IP. A second upsert for the same IP replaces username,
 *   hostname, port and last_seen; the local nickname survives.
 * - Reads never mutate records. Asking twice gives the same answer unless
 *   time moved across the boundary.
 * - A timeout never deletes a record. Only remove() does.
 *
 * ---
 *
 * @par Events
 * - PeerOnline when a peer is first seen, or seen again after it had been
 *   reported offline.
 * - PeerOffline from sweep(), once per online → offline derivation. The
 *   set used to remember "already reported" is event bookkeeping only and
 *   never consulted by is_online().
 *
 * ---
 *
 * @par Threading
 * One std::mutex guards the table. The repository mirror and the answer
 * send happen after the lock is released.
 *
 * @par Minimal Usage Example
 * @code
 * lanmsg::PresenceDirectory dir(messenger, std::chrono::seconds(180), &events);
 * dir.on_presence_frame(frame, sender);          // from the receive loop
 * for (const auto& p : dir.online()) { ... }     // anytime, any thread
 * dir.sweep();                                   // periodically: emits PeerOffline
 * @endcode
 */
#ifndef LANMSG_PRESENCE_HPP
#define LANMSG_PRESENCE_HPP

#include <stdint.h>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "events.hpp"
#include "frame.hpp"
#include "messenger.hpp"
#include "peer.hpp"

namespace lanmsg {

enum class PresenceOutcome : uint8_t {
  Joined,     ///< new record (or back after being reported offline)
  Refreshed,  ///< existing online record refreshed
  Exited,     ///< exit frame logged; record untouched
  Ignored     ///< not a presence frame, or exit from an unknown peer
};

class PresenceDirectory {
public:
  static constexpr std::chrono::seconds DEFAULT_TIMEOUT{180};

  /**
   * @param out      Used for the entry answer.
   * @param timeout  Online window; must exceed the re-announce interval.
   * @param events   May be null.
   * @param now      Clock; defaults to system_clock::now.
   */
  PresenceDirectory(Messenger& out, std::chrono::seconds timeout,
                    IEventSink* events = nullptr, NowFn now = nullptr);

  /// Mirror every upsert into `repo` (may be null to stop mirroring).
  void set_repository(IPeerRepository* repo);

  /// Also answer vendor-layout announcements in vendor layout.
  void set_vendor_answer(bool on, const std::string& mac);

  /**
   * @brief Apply one presence-class frame.
   * @param layout  Layout the frame arrived in (decides the answer layout).
   */
  PresenceOutcome on_presence_frame(const ProtocolFrame& frame, const Endpoint& sender,
                                    Layout layout = Layout::Canonical);

  /// Insert or refresh a record directly (administrative path, tests, seeding).
  PresenceOutcome upsert(const PeerRecord& rec);

  /// Restore records loaded from storage; emits nothing.
  void seed(const std::vector<PeerRecord>& records);

  bool remove(const std::string& ip);
  bool set_nickname(const std::string& ip, const std::string& nickname);

  // -------- queries (all relative to now) --------

  bool is_online(const PeerRecord& p) const;
  bool is_online(const std::string& ip) const;
  std::optional<PeerRecord> find(const std::string& ip) const;
  std::vector<PeerRecord> list() const;
  std::vector<PeerRecord> online() const;
  size_t count() const;
  size_t online_count() const;

  /**
   * @brief Report peers that went offline since the last sweep.
   * @return the records newly derived offline (also raised as PeerOffline).
   */
  std::vector<PeerRecord> sweep();

  std::chrono::seconds timeout() const { return timeout_; }
  TimePoint now() const { return now_(); }

private:
  void mirror(const PeerRecord& rec);
  void raise(EventType type, const PeerRecord& rec);

  Messenger&                        out_;
  const std::chrono::seconds        timeout_;
  IEventSink*                       events_;
  NowFn                             now_;
  IPeerRepository*                  repo_{nullptr};
  bool                              vendor_answer_{false};
  std::string                       vendor_mac_;

  mutable std::mutex                mu_;
  std::map<std::string, PeerRecord> peers_;
  std::set<std::string>             reported_online_;
};

} // namespace lanmsg

#endif // LANMSG_PRESENCE_HPP
