/**
 * @file protocol.hpp
 * @brief Mode catalog, option flags and the 32-bit `kind` bit helpers.
 *
 * @details
 * Every frame on the wire carries one unsigned 32-bit `kind`:
 *
 * ```
 *  31                                 8 7            0
 * +------------------------------------+--------------+
 * |        option flags (24 bits)      | mode (8 bits)|
 * +------------------------------------+--------------+
 * ```
 *
 * - The **mode** says what the frame *is* (announce, text message, ack,
 *   file request ...). It is one of a closed catalog; anything outside the
 *   catalog classifies as `Mode::Unknown` but the raw bits are kept.
 * - The **options** modify the mode. Two catalogs share the same bit
 *   positions: the *global* options (absence, file-attached, UTF-8 ...) and
 *   the *send-context* options (send-check, secret, broadcast ...). For
 *   example 0x100 means "absent" on an entry frame and "please acknowledge"
 *   on a text message. Options therefore only make sense after the mode has
 *   been extracted; the context-aware helpers below (`requests_ack`,
 *   `is_absent`) do that for you.
 *
 * @par Example
 * @code
 * uint32_t k = lanmsg::bits::pack(lanmsg::Mode::SendMsg,
 *                                 lanmsg::opt::SENDCHECK | lanmsg::opt::UTF8);
 * lanmsg::bits::mode(k);                 // 0x20
 * lanmsg::bits::requests_ack(k);         // true
 * lanmsg::explain(k);  // "IPMSG_SENDMSG (0x00800120 = mode: 0x20 | [UTF8 | SENDCHECK])"
 * @endcode
 */
#ifndef LANMSG_PROTOCOL_HPP
#define LANMSG_PROTOCOL_HPP

#include <stddef.h>
#include <stdint.h>
#include <string>

namespace lanmsg {

// ---------- wire constants ----------

constexpr uint8_t  PROTOCOL_VERSION = 1;          ///< only version we emit
constexpr uint16_t DEFAULT_UDP_PORT = 2425;       ///< well-known LAN messenger port
constexpr size_t   MIN_FIELD_COUNT  = 6;          ///< version..content
constexpr uint64_t MAX_PACKET_ID    = 0xFFFFFFFFull;   ///< largest id decode accepts
/// Largest id we emit. A ten-digit field[1] is read as a vendor timestamp,
/// so our own counter wraps back to 1 before reaching 1,000,000,000.
constexpr uint32_t MAX_OWN_PACKET_ID = 999999999u;
constexpr size_t   MAX_CONTENT_SIZE = 1024 * 1024;
constexpr char     FIELD_DELIMITER  = ':';

/**
 * @brief Closed catalog of modes (low 8 bits of `kind`).
 *
 * `Unknown` is not a wire value; `classify()` returns it for any raw mode
 * outside the catalog. Switches over Mode are written without `default:`
 * so a newly added enumerator is flagged by the compiler.
 */
enum class Mode : uint8_t {
  NoOperation     = 0x00,
  BrEntry         = 0x01,
  BrExit          = 0x02,
  AnsEntry        = 0x03,
  BrAbsence       = 0x04,
  BrIsGetList     = 0x10,
  OkGetList       = 0x11,
  GetList         = 0x12,
  AnsList         = 0x13,
  BrIsGetList2    = 0x18,
  SendMsg         = 0x20,
  RecvMsg         = 0x21,
  ReadMsg         = 0x30,
  DelMsg          = 0x31,
  AnsReadMsg      = 0x32,
  GetInfo         = 0x40,
  SendInfo        = 0x41,
  GetAbsenceInfo  = 0x50,
  SendAbsenceInfo = 0x51,
  GetFileData     = 0x60,
  ReleaseFiles    = 0x61,
  GetDirFiles     = 0x62,
  GetPubKey       = 0x72,
  AnsPubKey       = 0x73,
  Unknown         = 0xFF
};

/// Option flags. Global and send-context names alias the same bits.
namespace opt {
  // global (presence / any mode)
  constexpr uint32_t ABSENCE    = 0x00000100;
  constexpr uint32_t SERVER     = 0x00000200;
  constexpr uint32_t DIALUP     = 0x00010000;
  constexpr uint32_t FILEATTACH = 0x00200000;
  constexpr uint32_t ENCRYPT    = 0x00400000;
  constexpr uint32_t UTF8       = 0x00800000;
  // send-context (text messages)
  constexpr uint32_t SENDCHECK  = 0x00000100;
  constexpr uint32_t SECRET     = 0x00000200;
  constexpr uint32_t BROADCAST  = 0x00000400;
  constexpr uint32_t MULTICAST  = 0x00000800;
  constexpr uint32_t NOPOPUP    = 0x00001000;
  constexpr uint32_t AUTORET    = 0x00002000;
  constexpr uint32_t RETRY      = 0x00004000;
  constexpr uint32_t PASSWORD   = 0x00008000;
  constexpr uint32_t NOLOG      = 0x00020000;
} // namespace opt

namespace bits {

/// Low 8 bits.
constexpr uint8_t mode(uint32_t kind) { return static_cast<uint8_t>(kind & 0xFFu); }

/// High 24 bits, still in place (not shifted).
constexpr uint32_t options(uint32_t kind) { return kind & 0xFFFFFF00u; }

constexpr bool has_option(uint32_t kind, uint32_t flag) {
  return flag != 0 && (options(kind) & flag) == flag;
}

constexpr uint32_t pack(uint8_t mode_raw, uint32_t opts) {
  return (opts & 0xFFFFFF00u) | mode_raw;
}

constexpr uint32_t pack(Mode m, uint32_t opts) {
  return pack(static_cast<uint8_t>(m), opts);
}

/// Text message that asks the receiver for a receive-ack.
bool requests_ack(uint32_t kind);

/// Presence frame that carries the absence flag.
bool is_absent(uint32_t kind);

} // namespace bits

/// Map raw kind to the catalog; out-of-catalog modes become Mode::Unknown.
Mode classify(uint32_t kind);

/// Entry, exit, entry-answer and absence broadcasts.
bool is_presence(Mode m);

/// "IPMSG_SENDMSG", "IPMSG_BR_ENTRY", ... or "UNKNOWN".
const char* mode_name(uint32_t kind);

/// Human-readable mode plus the flags that are meaningful for that mode.
std::string explain(uint32_t kind);

} // namespace lanmsg

#endif // LANMSG_PROTOCOL_HPP
