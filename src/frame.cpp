// -----------------------------------------------------------------------------
// frame.cpp - wire codec for ProtocolFrame
//
// API & layouts: include/lanmsg/frame.hpp
// Tests:         tests/test_codec.cpp
//
// NOTE: decode() is fed raw datagrams from anyone on the LAN. Every branch
// returns a status; nothing here throws or trusts a length.
// -----------------------------------------------------------------------------
#include "lanmsg/frame.hpp"
#include "lanmsg/log.hpp"
#include "lanmsg/text_encoding.hpp"

#include <chrono>
#include <cstdlib>

namespace lanmsg {
namespace codec {

namespace {

bool all_digits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) if (c < '0' || c > '9') return false;
  return true;
}

// parse_u64() - strict decimal; no sign, no spaces, no overflow.
bool parse_u64(const std::string& s, uint64_t& out) {
  if (!all_digits(s) || s.size() > 20) return false;
  uint64_t v = 0;
  for (char c : s) {
    const uint64_t d = static_cast<uint64_t>(c - '0');
    if (v > (UINT64_MAX - d) / 10) return false;   // would overflow
    v = v * 10 + d;
  }
  out = v;
  return true;
}

uint64_t unix_now_s() {
  using namespace std::chrono;
  return static_cast<uint64_t>(duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

std::vector<std::string> split(const std::string& s, char delim) {
  std::vector<std::string> parts;
  size_t start = 0;
  for (size_t i = 0; i <= s.size(); ++i) {
    if (i == s.size() || s[i] == delim) {
      parts.emplace_back(s, start, i - start);
      start = i + 1;
    }
  }
  return parts;
}

std::string join_from(const std::vector<std::string>& parts, size_t first, char delim) {
  std::string out;
  for (size_t i = first; i < parts.size(); ++i) {
    if (i > first) out += delim;
    out += parts[i];
  }
  return out;
}

// strip_vendor_header() - keep only the colon section after the vendor header.
// POLICY: the header ends before the first ':'; a '#' later on belongs to
// content and must not be mistaken for a header.
bool strip_vendor_header(std::string& text) {
  const size_t first_colon = text.find(FIELD_DELIMITER);
  const size_t scan_end    = (first_colon == std::string::npos) ? text.size() : first_colon;
  const size_t last_hash   = text.rfind('#', scan_end == 0 ? 0 : scan_end - 1);
  if (last_hash == std::string::npos || last_hash >= scan_end) return false;
  text.erase(0, last_hash + 1);
  return true;
}

void to_bytes(const std::string& s, std::vector<uint8_t>& out) {
  out.assign(s.begin(), s.end());
}

FrameStatus validate_for_encode(const ProtocolFrame& f) {
  if (f.version != PROTOCOL_VERSION)  return FrameStatus::VersionMismatch;
  if (f.packet_id > MAX_PACKET_ID)    return FrameStatus::PacketIdRange;
  if (f.sender_name.empty())          return FrameStatus::EmptySender;
  if (f.sender_host.empty())          return FrameStatus::EmptyHost;
  if (f.sender_name.find(FIELD_DELIMITER) != std::string::npos ||
      f.sender_host.find(FIELD_DELIMITER) != std::string::npos) {
    return FrameStatus::DelimiterInField;
  }
  if (f.content.size() > MAX_CONTENT_SIZE) return FrameStatus::ContentTooLarge;
  return FrameStatus::Ok;
}

} // namespace

// ---------- escaping ----------

std::string escape_delimiters(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c == '\\')                 out += "\\\\";
    else if (c == FIELD_DELIMITER) out += "\\:";
    else                           out += c;
  }
  return out;
}

std::string unescape_delimiters(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '\\' && i + 1 < text.size() &&
        (text[i + 1] == '\\' || text[i + 1] == FIELD_DELIMITER)) {
      out += text[++i];
      continue;
    }
    out += c;
  }
  return out;
}

// ---------- decode ----------

// -----------------------------------------------------------------------------
// decode() - bytes -> frame
// PRE:   none; `data` may be anything a LAN host chose to send.
// POLICY:
//   - UTF-8 first, GBK second.
//   - Vendor layout is chosen by the shape of field[1] alone.
//   - Vendor presence frames carry the username in content; only for those
//     is content moved into sender_name. Other vendor frames keep content
//     and use the host as the display name.
// OUT:   DecodeResult with status, frame, layout and detected encoding.
// -----------------------------------------------------------------------------
DecodeResult decode(const uint8_t* data, size_t len, uint64_t now_unix_s) {
  DecodeResult r;

  // (a) text encoding
  std::string text;
  if (is_valid_utf8(data, len)) {
    text.assign(reinterpret_cast<const char*>(data), len);
    r.encoding = TextEncoding::Utf8;
  } else if (auto gbk = gbk_to_utf8(data, len)) {
    text = std::move(*gbk);
    r.encoding = TextEncoding::Gbk;
  } else {
    r.status = FrameStatus::Undecodable;
    return r;
  }

  // (b) vendor header
  const bool had_vendor_header = strip_vendor_header(text);

  // (c) fields
  std::vector<std::string> fields = split(text, FIELD_DELIMITER);
  if (fields.size() < MIN_FIELD_COUNT) {
    r.status = FrameStatus::TooFewFields;
    return r;
  }

  // (d) layout
  const bool vendor = fields[1].size() == 10 && all_digits(fields[1]);
  r.layout = vendor ? Layout::Vendor : Layout::Canonical;
  if (had_vendor_header && !vendor) {
    log(LogLevel::Debug, "codec").kv("note", "vendor_header_canonical_section");
  }

  ProtocolFrame& f = r.frame;

  // kind is in the same place in both layouts
  uint64_t kind = 0;
  if (!parse_u64(fields[4], kind) || kind > 0xFFFFFFFFull) {
    r.status = FrameStatus::BadKind;
    return r;
  }
  f.kind = static_cast<uint32_t>(kind);

  // (e) content, re-joined
  std::string content = join_from(fields, 5, FIELD_DELIMITER);

  if (vendor) {
    f.version = PROTOCOL_VERSION;                 // field[0] is not a version here
    f.user_id = fields[2];
    uint64_t pid = 0;
    if (parse_u64(fields[2], pid) && pid <= MAX_PACKET_ID) {
      f.packet_id = pid;
    } else {
      f.packet_id = now_unix_s ? now_unix_s : unix_now_s();   // timestamp-derived fallback
    }
    f.sender_host = fields[3];
    if (is_presence(classify(f.kind))) {
      f.sender_name = content;                    // username rides in content
      f.content.clear();
    } else {
      f.sender_name = fields[3];
      f.content     = std::move(content);
    }
  } else {
    uint64_t ver = 0;
    if (!parse_u64(fields[0], ver) || ver > 0xFF) {
      r.status = FrameStatus::BadVersion;
      return r;
    }
    f.version = static_cast<uint8_t>(ver);
    if (f.version != PROTOCOL_VERSION) {
      r.version_mismatch = true;
      log(LogLevel::Warn, "codec").kv("status", "accept").kv("reason", "version_mismatch")
          .kv("version", static_cast<unsigned>(f.version));
    }

    uint64_t pid = 0;
    if (!parse_u64(fields[1], pid)) {
      r.status = FrameStatus::BadPacketId;
      return r;
    }
    if (pid > MAX_PACKET_ID) {
      r.status = FrameStatus::PacketIdRange;
      return r;
    }
    f.packet_id   = pid;
    f.sender_name = fields[2];
    f.sender_host = fields[3];
    f.content     = unescape_delimiters(content);
  }

  // (f) validation
  if (f.sender_name.empty()) { r.status = FrameStatus::EmptySender; return r; }
  if (f.sender_host.empty()) { r.status = FrameStatus::EmptyHost;   return r; }
  if (f.content.size() > MAX_CONTENT_SIZE) {
    r.status = FrameStatus::ContentTooLarge;
    return r;
  }

  r.status = FrameStatus::Ok;
  return r;
}

DecodeResult decode(const std::vector<uint8_t>& data, uint64_t now_unix_s) {
  return decode(data.data(), data.size(), now_unix_s);
}

DecodeResult decode(const std::string& text, uint64_t now_unix_s) {
  return decode(reinterpret_cast<const uint8_t*>(text.data()), text.size(), now_unix_s);
}

// ---------- encode ----------

FrameStatus encode(const ProtocolFrame& f, std::vector<uint8_t>& out) {
  const FrameStatus st = validate_for_encode(f);
  if (st != FrameStatus::Ok) return st;

  std::string s;
  s.reserve(32 + f.sender_name.size() + f.sender_host.size() + f.content.size());
  s += std::to_string(static_cast<unsigned>(f.version));
  s += FIELD_DELIMITER;
  s += std::to_string(f.packet_id);
  s += FIELD_DELIMITER;
  s += f.sender_name;
  s += FIELD_DELIMITER;
  s += f.sender_host;
  s += FIELD_DELIMITER;
  s += std::to_string(f.kind);
  s += FIELD_DELIMITER;
  s += escape_delimiters(f.content);

  to_bytes(s, out);
  return FrameStatus::Ok;
}

FrameStatus encode_vendor(const ProtocolFrame& f, const std::string& mac,
                          uint16_t port, uint64_t unix_time, std::vector<uint8_t>& out) {
  const FrameStatus st = validate_for_encode(f);
  if (st != FrameStatus::Ok) return st;

  const bool entry = classify(f.kind) == Mode::BrEntry || classify(f.kind) == Mode::AnsEntry;
  const std::string& user = (entry && !f.content.empty()) ? f.content : f.sender_name;

  std::string s = "1_lbt6_0#128#";
  s += mac;
  s += '#';
  s += std::to_string(port);
  s += "#0#";
  s += std::to_string(f.packet_id);
  s += FIELD_DELIMITER;
  s += std::to_string(unix_time);
  s += FIELD_DELIMITER;
  s += user;
  s += FIELD_DELIMITER;
  s += f.sender_host;
  s += FIELD_DELIMITER;
  s += std::to_string(f.kind);
  s += FIELD_DELIMITER;
  s += f.content;

  to_bytes(s, out);
  return FrameStatus::Ok;
}

const char* status_name(FrameStatus s) {
  switch (s) {
    case FrameStatus::Ok:               return "ok";
    case FrameStatus::Undecodable:      return "undecodable";
    case FrameStatus::TooFewFields:     return "too_few_fields";
    case FrameStatus::BadVersion:       return "bad_version";
    case FrameStatus::BadPacketId:      return "bad_packet_id";
    case FrameStatus::PacketIdRange:    return "packet_id_range";
    case FrameStatus::EmptySender:      return "empty_sender";
    case FrameStatus::EmptyHost:        return "empty_host";
    case FrameStatus::BadKind:          return "bad_kind";
    case FrameStatus::ContentTooLarge:  return "content_too_large";
    case FrameStatus::DelimiterInField: return "delimiter_in_field";
    case FrameStatus::VersionMismatch:  return "version_mismatch";
  }
  return "unknown";
}

} // namespace codec
} // namespace lanmsg
