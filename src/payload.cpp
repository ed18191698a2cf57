// -----------------------------------------------------------------------------
// payload.cpp - file offer / answer bodies and event JSON (nlohmann::json)
// -----------------------------------------------------------------------------
#include "lanmsg/payload.hpp"
#include "lanmsg/log.hpp"

namespace lanmsg {

using nlohmann::json;

std::string to_json(const FileOfferPayload& p) {
  json j;
  j["name"] = p.name;
  j["size"] = p.size;
  j["hash"] = p.hash;
  return dump_text(j);
}

std::string to_json(const FileAnswerPayload& p) {
  json j;
  j["accept"] = p.accept;
  if (p.accept && p.port) j["port"] = *p.port;
  return dump_text(j);
}

// -----------------------------------------------------------------------------
// offer_from_json()
// POLICY: name and size required; hash falls back to the legacy "md5" key,
//         and may be absent (then empty: receiver skips verification).
// -----------------------------------------------------------------------------
std::optional<FileOfferPayload> offer_from_json(const std::string& text) {
  try {
    const json j = json::parse(text);
    if (!j.is_object() || !j.contains("name") || !j.contains("size")) return std::nullopt;
    if (!j["size"].is_number_unsigned()) return std::nullopt;

    FileOfferPayload p;
    p.name = j.at("name").get<std::string>();
    p.size = j.at("size").get<uint64_t>();
    if (j.contains("hash"))      p.hash = j.at("hash").get<std::string>();
    else if (j.contains("md5"))  p.hash = j.at("md5").get<std::string>();
    if (p.name.empty()) return std::nullopt;
    return p;
  } catch (const json::exception& e) {
    log(LogLevel::Debug, "payload").kv("status", "bad_offer").kv("reason", e.what());
    return std::nullopt;
  }
}

std::optional<FileAnswerPayload> answer_from_json(const std::string& text) {
  try {
    const json j = json::parse(text);
    if (!j.is_object() || !j.contains("accept")) return std::nullopt;

    FileAnswerPayload p;
    p.accept = j.at("accept").get<bool>();
    if (j.contains("port") && !j["port"].is_null()) {
      const auto port = j.at("port").get<uint32_t>();
      if (port == 0 || port > 0xFFFF) return std::nullopt;
      p.port = static_cast<uint16_t>(port);
    }
    return p;
  } catch (const json::exception& e) {
    log(LogLevel::Debug, "payload").kv("status", "bad_answer").kv("reason", e.what());
    return std::nullopt;
  }
}

json event_json(const Event& ev) {
  json j;
  j["type"] = event_type_name(ev.type);
  j["ts"]   = ev.timestamp_ms;
  if (!ev.peer_ip.empty())   j["ip"]        = ev.peer_ip;
  if (ev.peer_port)          j["port"]      = ev.peer_port;
  if (!ev.peer_name.empty()) j["name"]      = ev.peer_name;
  if (ev.packet_id)          j["packet_id"] = ev.packet_id;
  if (!ev.text.empty())      j["text"]      = ev.text;
  if (!ev.ref_id.empty())    j["ref"]       = ev.ref_id;
  if (ev.total) {
    j["bytes"] = ev.bytes;
    j["total"] = ev.total;
  }
  if (ev.type == EventType::MessageSent) j["offline"] = ev.is_offline;
  if (ev.error != ErrorKind::None)       j["error"]   = error_kind_name(ev.error);
  return j;
}

std::string dump_text(const json& j, int indent) {
  return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

} // namespace lanmsg
