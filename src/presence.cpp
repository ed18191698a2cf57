// -----------------------------------------------------------------------------
// presence.cpp - Implementation of PresenceDirectory
//
// API & invariants: include/lanmsg/presence.hpp
// Tests:            tests/test_presence.cpp
//
// NOTE: every public method takes mu_ for the table work only. Sends,
// repository writes and event delivery happen after the lock is dropped,
// so a slow collaborator can never stall the receive loop on our mutex.
// -----------------------------------------------------------------------------
#include "lanmsg/presence.hpp"
#include "lanmsg/log.hpp"

namespace lanmsg {

// ---------- public ----------

PresenceDirectory::PresenceDirectory(Messenger& out, std::chrono::seconds timeout,
                                     IEventSink* events, NowFn now)
: out_(out),
  timeout_(timeout),
  events_(events),
  now_(now ? std::move(now) : NowFn([] { return Clock::now(); })) {}

void PresenceDirectory::set_repository(IPeerRepository* repo) {
  repo_ = repo;
}

void PresenceDirectory::set_vendor_answer(bool on, const std::string& mac) {
  vendor_answer_ = on;
  vendor_mac_    = mac;
}

// -----------------------------------------------------------------------------
// on_presence_frame()
// PRE:    frame decoded Ok; sender is the datagram source.
// POLICY:
//   - entry / entry-answer / absence: upsert keyed by sender IP.
//   - only entry gets an answer. It goes out before the upsert, so the
//     repository write never delays it.
//   - exit: log only; liveness is purely age-derived.
// OUT:    outcome for the caller's bookkeeping; events raised as a side effect.
// -----------------------------------------------------------------------------
PresenceOutcome PresenceDirectory::on_presence_frame(const ProtocolFrame& frame,
                                                     const Endpoint& sender,
                                                     Layout layout) {
  const Mode m = frame.mode();

  if (m == Mode::BrExit) {
    const bool known = find(sender.ip.c_str()).has_value();
    log(LogLevel::Info, "presence").kv("event", "peer_exit").kv("ip", sender.ip.c_str())
        .kv("user", frame.sender_name).kv("known", known);
    return known ? PresenceOutcome::Exited : PresenceOutcome::Ignored;
  }

  if (m != Mode::BrEntry && m != Mode::AnsEntry && m != Mode::BrAbsence) {
    return PresenceOutcome::Ignored;
  }

  if (m == Mode::BrEntry) {
    ProtocolFrame answer = out_.make_frame(bits::pack(Mode::AnsEntry, opt::UTF8),
                                           out_.identity().username);
    bool sent = out_.send(answer, sender);
    if (layout == Layout::Vendor && vendor_answer_) {
      sent = out_.send_vendor(answer, vendor_mac_, sender) || sent;
    }
    if (!sent) {
      log(LogLevel::Warn, "presence").kv("status", "answer_failed").kv("ip", sender.ip.c_str());
    }
  }

  PeerRecord rec;
  rec.ip        = sender.ip.c_str();
  rec.port      = sender.port;
  rec.username  = frame.sender_name;
  rec.hostname  = frame.sender_host;
  rec.last_seen = now_();
  const PresenceOutcome outcome = upsert(rec);

  if (bits::is_absent(frame.kind)) {
    log(LogLevel::Debug, "presence").kv("event", "peer_absent").kv("ip", sender.ip.c_str());
  }
  return outcome;
}

// upsert() - one record per IP; latest metadata wins, nickname is local and kept.
PresenceOutcome PresenceDirectory::upsert(const PeerRecord& rec) {
  PeerRecord stored;
  bool became_online = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = peers_.find(rec.ip);
    if (it == peers_.end()) {
      it = peers_.emplace(rec.ip, rec).first;
    } else {
      PeerRecord& p = it->second;
      if (rec.port)              p.port     = rec.port;
      if (!rec.username.empty()) p.username = rec.username;
      if (!rec.hostname.empty()) p.hostname = rec.hostname;
      if (!rec.nickname.empty()) p.nickname = rec.nickname;
      if (rec.last_seen > p.last_seen) p.last_seen = rec.last_seen;
    }
    stored = it->second;
    if (is_online_at(stored, now_(), timeout_)) {
      became_online = reported_online_.insert(rec.ip).second;
    }
  }

  mirror(stored);
  if (became_online) {
    log(LogLevel::Info, "presence").kv("event", "peer_online").kv("ip", stored.ip)
        .kv("user", stored.username).kv("host", stored.hostname);
    raise(EventType::PeerOnline, stored);
    return PresenceOutcome::Joined;
  }
  return PresenceOutcome::Refreshed;
}

void PresenceDirectory::seed(const std::vector<PeerRecord>& records) {
  std::lock_guard<std::mutex> lock(mu_);
  for (const auto& r : records) {
    auto it = peers_.find(r.ip);
    if (it == peers_.end() || r.last_seen > it->second.last_seen) peers_[r.ip] = r;
  }
}

bool PresenceDirectory::remove(const std::string& ip) {
  std::lock_guard<std::mutex> lock(mu_);
  reported_online_.erase(ip);
  return peers_.erase(ip) > 0;
}

bool PresenceDirectory::set_nickname(const std::string& ip, const std::string& nickname) {
  PeerRecord stored;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = peers_.find(ip);
    if (it == peers_.end()) return false;
    it->second.nickname = nickname;
    stored = it->second;
  }
  mirror(stored);
  return true;
}

// ---------- queries ----------

bool PresenceDirectory::is_online(const PeerRecord& p) const {
  return is_online_at(p, now_(), timeout_);
}

bool PresenceDirectory::is_online(const std::string& ip) const {
  auto p = find(ip);
  return p && is_online(*p);
}

std::optional<PeerRecord> PresenceDirectory::find(const std::string& ip) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = peers_.find(ip);
  if (it == peers_.end()) return std::nullopt;
  return it->second;
}

std::vector<PeerRecord> PresenceDirectory::list() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<PeerRecord> out;
  out.reserve(peers_.size());
  for (const auto& kv : peers_) out.push_back(kv.second);
  return out;
}

std::vector<PeerRecord> PresenceDirectory::online() const {
  const TimePoint now = now_();
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<PeerRecord> out;
  for (const auto& kv : peers_) {
    if (is_online_at(kv.second, now, timeout_)) out.push_back(kv.second);
  }
  return out;
}

size_t PresenceDirectory::count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return peers_.size();
}

size_t PresenceDirectory::online_count() const {
  const TimePoint now = now_();
  std::lock_guard<std::mutex> lock(mu_);
  size_t n = 0;
  for (const auto& kv : peers_) if (is_online_at(kv.second, now, timeout_)) ++n;
  return n;
}

// sweep() - compare derived state against what was last reported.
std::vector<PeerRecord> PresenceDirectory::sweep() {
  std::vector<PeerRecord> gone;
  {
    const TimePoint now = now_();
    std::lock_guard<std::mutex> lock(mu_);
    for (auto it = reported_online_.begin(); it != reported_online_.end();) {
      auto p = peers_.find(*it);
      if (p == peers_.end()) { it = reported_online_.erase(it); continue; }
      if (!is_online_at(p->second, now, timeout_)) {
        gone.push_back(p->second);
        it = reported_online_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (const auto& p : gone) {
    log(LogLevel::Info, "presence").kv("event", "peer_offline").kv("ip", p.ip).kv("user", p.username);
    raise(EventType::PeerOffline, p);
  }
  return gone;
}

// ---------- private ----------

void PresenceDirectory::mirror(const PeerRecord& rec) {
  if (!repo_) return;
  if (!repo_->upsert_peer(rec)) {
    log(LogLevel::Warn, "presence").kv("status", "repository_upsert_failed").kv("ip", rec.ip);
  }
}

void PresenceDirectory::raise(EventType type, const PeerRecord& rec) {
  if (!events_) return;
  Event ev;
  ev.type         = type;
  ev.peer_ip      = rec.ip;
  ev.peer_port    = rec.port;
  ev.peer_name    = rec.display_name();
  ev.timestamp_ms = unix_ms_now();
  events_->on_event(ev);
}

} // namespace lanmsg
