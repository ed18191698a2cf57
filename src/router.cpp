// -----------------------------------------------------------------------------
// router.cpp - Implementation of MessageRouter
//
// API & dispatch table: include/lanmsg/router.hpp
// Tests:                tests/test_router.cpp
// -----------------------------------------------------------------------------
#include "lanmsg/router.hpp"
#include "lanmsg/log.hpp"
#include "lanmsg/protocol.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace lanmsg {

const char* route_outcome_name(RouteOutcome o) {
  switch (o) {
    case RouteOutcome::Presence:    return "presence";
    case RouteOutcome::RateLimited: return "rate_limited";
    case RouteOutcome::Delivered:   return "delivered";
    case RouteOutcome::AckReceived: return "ack_received";
    case RouteOutcome::FileOffer:   return "file_offer";
    case RouteOutcome::FileAnswer:  return "file_answer";
    case RouteOutcome::PassThrough: return "pass_through";
    case RouteOutcome::Stub:        return "stub";
    case RouteOutcome::Ignored:     return "ignored";
    case RouteOutcome::SelfEcho:    return "self_echo";
    case RouteOutcome::Dropped:     return "dropped";
    case RouteOutcome::Unknown:     return "unknown";
  }
  return "unknown";
}

namespace {

bool is_blank(const std::string& s) {
  return std::all_of(s.begin(), s.end(),
                     [](unsigned char c) { return std::isspace(c) || c == '\0'; });
}

// Ack content is the original packet id in decimal; some senders pad it.
std::optional<uint64_t> parse_ack_id(const std::string& content) {
  size_t b = 0, e = content.size();
  while (b < e && std::isspace(static_cast<unsigned char>(content[b]))) ++b;
  while (e > b && (content[e - 1] == '\0' || std::isspace(static_cast<unsigned char>(content[e - 1])))) --e;
  if (b == e) return std::nullopt;
  const std::string digits = content.substr(b, e - b);
  if (!std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
    return std::nullopt;
  }
  errno = 0;
  const unsigned long long v = std::strtoull(digits.c_str(), nullptr, 10);
  if (errno == ERANGE) return std::nullopt;
  return static_cast<uint64_t>(v);
}

} // namespace

// ---------- public ----------

MessageRouter::MessageRouter(Messenger& out, PresenceDirectory& presence,
                             FileTransferCoordinator& transfers, IEventSink& events)
: out_(out), presence_(presence), transfers_(transfers), events_(events) {}

void MessageRouter::set_vendor_announce(bool on, const std::string& mac) {
  vendor_announce_ = on;
  vendor_mac_      = mac;
}

// -----------------------------------------------------------------------------
// handle_incoming_frame()
// PRE:    frame decoded Ok.
// POLICY: every outcome is final for this frame; nothing here throws and
//         nothing is retried.
// OUT:    RouteOutcome for logging/tests.
// -----------------------------------------------------------------------------
RouteOutcome MessageRouter::handle_incoming_frame(const ProtocolFrame& frame, const Endpoint& sender,
                                                  const std::string& local_ip, Layout layout) {
  if (sender.ip == local_ip.c_str() && sender.port == out_.local_port()) {
    return RouteOutcome::SelfEcho;
  }

  const Mode m = frame.mode();
  log(LogLevel::Trace, "router").kv("mode", mode_name(frame.kind)).kv("ip", sender.ip.c_str())
      .kv("port", sender.port).kv("packet_id", frame.packet_id);

  switch (m) {
    case Mode::BrEntry:
      if (!limiter_.allow(sender.ip.c_str(), presence_.now())) {
        log(LogLevel::Debug, "router").kv("status", "rate_limited").kv("ip", sender.ip.c_str());
        return RouteOutcome::RateLimited;
      }
      presence_.on_presence_frame(frame, sender, layout);
      return RouteOutcome::Presence;

    case Mode::BrExit:
    case Mode::AnsEntry:
    case Mode::BrAbsence:
      presence_.on_presence_frame(frame, sender, layout);
      return RouteOutcome::Presence;

    case Mode::SendMsg:
      return on_text(frame, sender);

    case Mode::RecvMsg:
      return on_ack(frame, sender);

    case Mode::GetFileData:
      return transfers_.on_incoming_offer(frame, sender) ? RouteOutcome::FileOffer
                                                         : RouteOutcome::Dropped;

    case Mode::ReleaseFiles: {
      const TransferResult r = transfers_.on_incoming_answer(frame, sender);
      if (r == TransferResult::BadPayload) return RouteOutcome::Dropped;
      if (r != TransferResult::Ok) {
        log(LogLevel::Debug, "router").kv("status", "answer_unapplied")
            .kv("reason", transfer_result_name(r)).kv("ip", sender.ip.c_str());
      }
      return RouteOutcome::FileAnswer;
    }

    case Mode::ReadMsg:
    case Mode::DelMsg:
    case Mode::AnsReadMsg:
      log(LogLevel::Info, "router").kv("event", "pass_through").kv("mode", mode_name(frame.kind))
          .kv("ip", sender.ip.c_str()).kv("content", frame.content);
      return RouteOutcome::PassThrough;

    case Mode::BrIsGetList:
    case Mode::OkGetList:
    case Mode::GetList:
    case Mode::AnsList:
    case Mode::BrIsGetList2:
    case Mode::GetInfo:
    case Mode::SendInfo:
    case Mode::GetAbsenceInfo:
    case Mode::SendAbsenceInfo:
    case Mode::GetDirFiles:
    case Mode::GetPubKey:
    case Mode::AnsPubKey:
      log(LogLevel::Debug, "router").kv("status", "not_implemented").kv("mode", mode_name(frame.kind))
          .kv("ip", sender.ip.c_str());
      return RouteOutcome::Stub;

    case Mode::NoOperation:
      return RouteOutcome::Ignored;

    case Mode::Unknown:
      log(LogLevel::Info, "router").kv("status", "unknown_mode")
          .kv("mode", static_cast<unsigned>(frame.mode_raw())).kv("ip", sender.ip.c_str());
      return RouteOutcome::Unknown;
  }
  return RouteOutcome::Unknown;
}

std::optional<uint64_t> MessageRouter::send_text(const Endpoint& to, const std::string& text,
                                                 bool request_ack) {
  if (is_blank(text)) {
    log(LogLevel::Warn, "router").kv("status", "reject").kv("reason", "empty_text");
    raise_error(ErrorKind::Validation, to, "message text is empty");
    return std::nullopt;
  }
  if (text.size() > MAX_CONTENT_SIZE) {
    log(LogLevel::Warn, "router").kv("status", "reject").kv("reason", "text_too_large")
        .kv("size", text.size());
    raise_error(ErrorKind::Validation, to, "message text exceeds the content limit");
    return std::nullopt;
  }

  uint32_t opts = opt::UTF8;
  if (request_ack) opts |= opt::SENDCHECK;
  ProtocolFrame frame = out_.make_frame(bits::pack(Mode::SendMsg, opts), text);

  const std::string ip = to.ip.c_str();
  const bool offline = !presence_.is_online(ip);
  if (!out_.send(frame, to)) {
    raise_error(ErrorKind::Network, to, "message could not be sent");
    return std::nullopt;
  }

  Event ev;
  ev.type         = EventType::MessageSent;
  ev.peer_ip      = ip;
  ev.peer_port    = to.port;
  if (auto p = presence_.find(ip)) ev.peer_name = p->display_name();
  ev.packet_id    = frame.packet_id;
  ev.text         = text;
  ev.is_offline   = offline;
  ev.timestamp_ms = unix_ms_now();
  events_.on_event(ev);

  log(LogLevel::Info, "router").kv("event", "message_sent").kv("ip", ip)
      .kv("packet_id", frame.packet_id).kv("ack", request_ack).kv("offline", offline);
  return frame.packet_id;
}

bool MessageRouter::announce() {
  ProtocolFrame f = out_.make_frame(bits::pack(Mode::BrEntry, opt::UTF8), out_.identity().username);
  bool ok = out_.broadcast(f);
  if (vendor_announce_) ok = out_.broadcast_vendor(f, vendor_mac_) || ok;
  return ok;
}

bool MessageRouter::announce_to(const Endpoint& to) {
  ProtocolFrame f = out_.make_frame(bits::pack(Mode::BrEntry, opt::UTF8), out_.identity().username);
  bool ok = out_.send(f, to);
  if (vendor_announce_) ok = out_.send_vendor(f, vendor_mac_, to) || ok;
  return ok;
}

bool MessageRouter::announce_exit() {
  ProtocolFrame f = out_.make_frame(bits::pack(Mode::BrExit, opt::UTF8), out_.identity().username);
  bool ok = out_.broadcast(f);
  if (vendor_announce_) ok = out_.broadcast_vendor(f, vendor_mac_) || ok;
  return ok;
}

// ---------- private ----------

RouteOutcome MessageRouter::on_text(const ProtocolFrame& frame, const Endpoint& sender) {
  Event ev;
  ev.type         = EventType::MessageReceived;
  ev.peer_ip      = sender.ip.c_str();
  ev.peer_port    = sender.port;
  ev.peer_name    = frame.sender_name;
  ev.packet_id    = frame.packet_id;
  ev.text         = frame.content;
  ev.is_offline   = !presence_.is_online(ev.peer_ip);
  ev.timestamp_ms = unix_ms_now();
  events_.on_event(ev);

  log(LogLevel::Info, "router").kv("event", "message_received").kv("ip", ev.peer_ip)
      .kv("from", frame.sender_name).kv("packet_id", frame.packet_id)
      .kv("ack_requested", frame.requests_ack());

  if (frame.requests_ack()) {
    ProtocolFrame ack = out_.make_frame(bits::pack(Mode::RecvMsg, 0),
                                        std::to_string(frame.packet_id));
    if (!out_.send(ack, sender)) {
      log(LogLevel::Warn, "router").kv("status", "ack_send_failed").kv("ip", ev.peer_ip)
          .kv("packet_id", frame.packet_id);
    }
  }
  return RouteOutcome::Delivered;
}

RouteOutcome MessageRouter::on_ack(const ProtocolFrame& frame, const Endpoint& sender) {
  auto ref = parse_ack_id(frame.content);
  if (!ref) {
    log(LogLevel::Warn, "router").kv("status", "drop").kv("reason", "bad_ack_id")
        .kv("ip", sender.ip.c_str()).kv("content", frame.content);
    return RouteOutcome::Dropped;
  }

  Event ev;
  ev.type         = EventType::MessageAck;
  ev.peer_ip      = sender.ip.c_str();
  ev.peer_port    = sender.port;
  ev.peer_name    = frame.sender_name;
  ev.packet_id    = *ref;
  ev.timestamp_ms = unix_ms_now();
  events_.on_event(ev);

  log(LogLevel::Debug, "router").kv("event", "ack").kv("ip", ev.peer_ip).kv("packet_id", *ref);
  return RouteOutcome::AckReceived;
}

void MessageRouter::raise_error(ErrorKind kind, const Endpoint& peer, const std::string& text) {
  Event ev;
  ev.type         = EventType::Error;
  ev.error        = kind;
  ev.peer_ip      = peer.ip.c_str();
  ev.peer_port    = peer.port;
  ev.text         = text;
  ev.timestamp_ms = unix_ms_now();
  events_.on_event(ev);
}

} // namespace lanmsg
