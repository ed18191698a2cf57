// -----------------------------------------------------------------------------
// messenger.cpp - frame factory + encode/send funnel
//
// API: include/lanmsg/messenger.hpp
// -----------------------------------------------------------------------------
#include "lanmsg/messenger.hpp"
#include "lanmsg/events.hpp"
#include "lanmsg/log.hpp"

namespace lanmsg {

Messenger::Messenger(transport::IDatagramPort& port, LocalIdentity identity,
                     uint32_t first_packet_id)
: port_(port),
  identity_(std::move(identity)),
  next_id_(first_packet_id == 0 || first_packet_id > MAX_OWN_PACKET_ID ? 1 : first_packet_id) {}

uint32_t Messenger::next_packet_id() {
  uint32_t id = next_id_.load();
  uint32_t after = 0;
  do {
    after = id >= MAX_OWN_PACKET_ID ? 1 : id + 1;
  } while (!next_id_.compare_exchange_weak(id, after));
  return id;
}

ProtocolFrame Messenger::make_frame(uint32_t kind, std::string content) {
  ProtocolFrame f;
  f.version     = PROTOCOL_VERSION;
  f.packet_id   = next_packet_id();
  f.sender_name = identity_.username;
  f.sender_host = identity_.hostname;
  f.kind        = kind;
  f.content     = std::move(content);
  return f;
}

bool Messenger::send(const ProtocolFrame& frame, const Endpoint& to) {
  std::vector<uint8_t> bytes;
  const FrameStatus st = codec::encode(frame, bytes);
  if (st != FrameStatus::Ok) {
    log(LogLevel::Warn, "messenger").kv("status", "encode_failed")
        .kv("reason", codec::status_name(st)).kv("mode", mode_name(frame.kind));
    return false;
  }
  const auto tx = port_.send_to(bytes.data(), bytes.size(), to);
  log(LogLevel::Trace, "messenger").kv("event", "sent").kv("mode", mode_name(frame.kind))
      .kv("ip", to.ip.c_str()).kv("port", to.port).kv("packet_id", frame.packet_id);
  return tx == transport::TxResult::Ok;
}

bool Messenger::broadcast(const ProtocolFrame& frame) {
  std::vector<uint8_t> bytes;
  const FrameStatus st = codec::encode(frame, bytes);
  if (st != FrameStatus::Ok) {
    log(LogLevel::Warn, "messenger").kv("status", "encode_failed")
        .kv("reason", codec::status_name(st)).kv("mode", mode_name(frame.kind));
    return false;
  }
  if (port_.broadcast(bytes.data(), bytes.size()) != transport::TxResult::Ok) {
    log(LogLevel::Warn, "messenger").kv("status", "broadcast_failed").kv("mode", mode_name(frame.kind));
    return false;
  }
  return true;
}

bool Messenger::broadcast_vendor(const ProtocolFrame& frame, const std::string& mac) {
  std::vector<uint8_t> bytes;
  const auto now_s = static_cast<uint64_t>(unix_ms_now() / 1000);
  const FrameStatus st = codec::encode_vendor(frame, mac, port_.port(), now_s, bytes);
  if (st != FrameStatus::Ok) {
    log(LogLevel::Warn, "messenger").kv("status", "encode_failed")
        .kv("reason", codec::status_name(st)).kv("layout", "vendor");
    return false;
  }
  return port_.broadcast(bytes.data(), bytes.size()) == transport::TxResult::Ok;
}

bool Messenger::send_vendor(const ProtocolFrame& frame, const std::string& mac, const Endpoint& to) {
  std::vector<uint8_t> bytes;
  const auto now_s = static_cast<uint64_t>(unix_ms_now() / 1000);
  const FrameStatus st = codec::encode_vendor(frame, mac, port_.port(), now_s, bytes);
  if (st != FrameStatus::Ok) {
    log(LogLevel::Warn, "messenger").kv("status", "encode_failed")
        .kv("reason", codec::status_name(st)).kv("layout", "vendor");
    return false;
  }
  return port_.send_to(bytes.data(), bytes.size(), to) == transport::TxResult::Ok;
}

} // namespace lanmsg
