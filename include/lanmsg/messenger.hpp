/**
 * @file messenger.hpp
 * @brief Outbound side: builds frames with the local identity and sends them.
 *
 * @details
 * Every component that talks back to the LAN (presence answers, acks, file
 * offers, announcements) goes through one Messenger so that:
 * - packet ids come from one sender-local counter (starts at 1, wraps
 *   after MAX_OWN_PACKET_ID so field[1] never looks like a vendor stamp);
 * - sender name and host are always the local identity;
 * - encode failures and send failures are logged in one place.
 *
 * Sends are fire-and-forget; the return value only says whether the
 * datagram left the host.
 */
#ifndef LANMSG_MESSENGER_HPP
#define LANMSG_MESSENGER_HPP

#include <stdint.h>
#include <atomic>
#include <string>

#include "frame.hpp"
#include "transport/transport_base.hpp"

namespace lanmsg {

using transport::Endpoint;

/// Who we are on the wire.
struct LocalIdentity {
  std::string username;
  std::string hostname;
  std::string user_id;    ///< optional; used as the vendor user token
};

class Messenger {
public:
  Messenger(transport::IDatagramPort& port, LocalIdentity identity,
            uint32_t first_packet_id = 1);

  /// Next sender-local packet id (1, 2, ... MAX_OWN_PACKET_ID, 1, ...).
  uint32_t next_packet_id();

  /// Frame stamped with our version, a fresh packet id and our identity.
  ProtocolFrame make_frame(uint32_t kind, std::string content);

  /// Encode canonical and send; false on encode or transport failure.
  bool send(const ProtocolFrame& frame, const Endpoint& to);

  /// Encode canonical and broadcast; failure is logged and tolerated.
  bool broadcast(const ProtocolFrame& frame);

  /// Encode in the vendor hybrid layout and broadcast.
  bool broadcast_vendor(const ProtocolFrame& frame, const std::string& mac);

  /// Same as broadcast_vendor() but unicast.
  bool send_vendor(const ProtocolFrame& frame, const std::string& mac, const Endpoint& to);

  const LocalIdentity& identity() const { return identity_; }
  uint16_t local_port() const { return port_.port(); }

private:
  transport::IDatagramPort& port_;
  LocalIdentity             identity_;
  std::atomic<uint32_t>     next_id_;
};

} // namespace lanmsg

#endif // LANMSG_MESSENGER_HPP
