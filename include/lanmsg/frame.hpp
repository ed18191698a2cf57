/**
 * @file frame.hpp
 * @brief ProtocolFrame and the wire codec (canonical + vendor layouts, UTF-8 + GBK).
 *
 * @details
 * ## What a frame looks like on the wire
 *
 * Canonical layout, colon-delimited text:
 * ```
 *   1:42:alice:alice-pc:8388896:hello there
 *   │ │  │     │        │       └─ content (may itself contain ':')
 *   │ │  │     │        └───────── kind = mode | options (decimal)
 *   │ │  │     └────────────────── sender host
 *   │ │  └──────────────────────── sender name
 *   │ └─────────────────────────── packet id (sender-local counter)
 *   └───────────────────────────── version
 * ```
 *
 * Vendor hybrid layout: a `#`-separated vendor header, then a colon section
 * whose *second* field is a 10-digit unix timestamp:
 * ```
 *   1_lbt6_0#128#5C60BA7361C6#1944#0#0#4001#9:1765442982:T0170006:HOST-N:6291459:Bob
 *   └──────────── vendor header ────────────┘└─ version:time:packet_id:host:kind:content
 * ```
 * In that layout the username travels in *content* on presence frames.
 *
 * ---
 *
 * @par Decode pipeline
 * 1. Strict UTF-8; if that fails, GBK. Both failing is `Undecodable`.
 * 2. Vendor header: if the segment before the first ':' contains '#',
 *    drop everything up to and including its last '#'.
 * 3. Split on ':'; fewer than 6 fields is `TooFewFields`.
 * 4. field[1] is exactly 10 ASCII digits => vendor layout, else canonical.
 * 5. Fields past index 5 are re-joined with ':' into content.
 * 6. Validate (packet id range, non-empty name/host, content cap).
 *
 * A version other than PROTOCOL_VERSION is accepted with a warning; third
 * party clients are inconsistent about it.
 *
 * @par Failure model
 * `decode()` never throws. A bad datagram yields a non-Ok `FrameStatus`
 * and the receive loop moves on to the next one.
 */
#ifndef LANMSG_FRAME_HPP
#define LANMSG_FRAME_HPP

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

#include "protocol.hpp"

namespace lanmsg {

/// Result of encode/decode. Everything except Ok is a Protocol-class error.
enum class FrameStatus : uint8_t {
  Ok = 0,
  Undecodable,        ///< neither UTF-8 nor GBK
  TooFewFields,       ///< fewer than MIN_FIELD_COUNT fields
  BadVersion,         ///< canonical version field not a small integer
  BadPacketId,        ///< canonical packet id not numeric
  PacketIdRange,      ///< packet id above MAX_PACKET_ID
  EmptySender,
  EmptyHost,
  BadKind,            ///< kind field not a decimal u32
  ContentTooLarge,
  DelimiterInField,   ///< encode: ':' inside name or host
  VersionMismatch     ///< encode: version is not PROTOCOL_VERSION
};

enum class Layout : uint8_t { Canonical, Vendor };
enum class TextEncoding : uint8_t { Utf8, Gbk };

/**
 * @brief One protocol message, text already decoded to UTF-8.
 */
struct ProtocolFrame {
  uint8_t     version{PROTOCOL_VERSION};
  uint64_t    packet_id{0};
  std::string user_id;        ///< vendor layout only: raw third field (per-user token)
  std::string sender_name;
  std::string sender_host;
  uint32_t    kind{0};        ///< mode | options
  std::string content;

  Mode     mode() const { return classify(kind); }
  uint8_t  mode_raw() const { return bits::mode(kind); }
  uint32_t options() const { return bits::options(kind); }
  bool     has_option(uint32_t flag) const { return bits::has_option(kind, flag); }
  bool     requests_ack() const { return bits::requests_ack(kind); }

  bool operator==(const ProtocolFrame& o) const {
    return version == o.version && packet_id == o.packet_id && user_id == o.user_id &&
           sender_name == o.sender_name && sender_host == o.sender_host &&
           kind == o.kind && content == o.content;
  }
  bool operator!=(const ProtocolFrame& o) const { return !(*this == o); }
};

/// Decode outcome: status plus what was detected about the buffer.
struct DecodeResult {
  FrameStatus   status{FrameStatus::Undecodable};
  ProtocolFrame frame;
  Layout        layout{Layout::Canonical};
  TextEncoding  encoding{TextEncoding::Utf8};
  bool          version_mismatch{false};

  bool ok() const { return status == FrameStatus::Ok; }
};

namespace codec {

/**
 * @brief Decode one datagram.
 * @param now_unix_s  Seconds used for the vendor packet-id fallback; 0 = system clock.
 */
DecodeResult decode(const uint8_t* data, size_t len, uint64_t now_unix_s = 0);
DecodeResult decode(const std::vector<uint8_t>& data, uint64_t now_unix_s = 0);
DecodeResult decode(const std::string& text, uint64_t now_unix_s = 0);

/**
 * @brief Encode canonical layout into `out` (cleared first).
 * @return Ok, or the first validation failure; `out` is untouched on failure.
 */
FrameStatus encode(const ProtocolFrame& frame, std::vector<uint8_t>& out);

/**
 * @brief Encode the vendor hybrid layout (used for announcements).
 *
 * `1_lbt6_0#128#<mac>#<port>#0#<packet_id>:<unix_time>:<user>:<host>:<kind>:<content>`
 * where `<user>` is content for entry frames and sender_name otherwise.
 */
FrameStatus encode_vendor(const ProtocolFrame& frame, const std::string& mac,
                          uint16_t port, uint64_t unix_time, std::vector<uint8_t>& out);

/// `\` -> `\\`, `:` -> `\:`
std::string escape_delimiters(const std::string& text);
/// Inverse of escape_delimiters(); a lone trailing `\` is kept.
std::string unescape_delimiters(const std::string& text);

const char* status_name(FrameStatus s);

} // namespace codec
} // namespace lanmsg

#endif // LANMSG_FRAME_HPP
