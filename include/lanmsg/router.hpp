/**
 * @file router.hpp
 * @brief MessageRouter - per-kind dispatch of decoded frames, plus the outbound text/announce API.
 *
 * @details
 * ## Field Brief
 * The router is a dispatch table, not a state machine. Each decoded frame
 * is routed by its mode; the only per-message state it looks at is whether
 * the sender asked for an acknowledgment.
 *
 * @par Dispatch
 * ```
 *   mode                         action                             outcome
 *   ---------------------------  ---------------------------------  --------------
 *   (from our own endpoint)      dropped                            SelfEcho
 *   BR_ENTRY/ANSENTRY/ABSENCE/   PresenceDirectory                  Presence
 *     BR_EXIT                    (entries rate limited per IP)      RateLimited
 *   SENDMSG                      message-received event,            Delivered
 *                                RECVMSG ack if SENDCHECK set
 *   RECVMSG                      message-ack event                  AckReceived
 *   GETFILEDATA                  coordinator: incoming offer        FileOffer
 *   RELEASEFILES                 coordinator: offer answer          FileAnswer
 *   READMSG/DELMSG/ANSREADMSG    logged                             PassThrough
 *   list/info/absence/dir/key    logged as not implemented          Stub
 *   NOOP                         nothing                            Ignored
 *   anything else                logged                             Unknown
 * ```
 * The switch over `Mode` has no default branch, so adding a catalog entry
 * without deciding where it goes is a compiler warning, not a silent drop.
 *
 * ---
 *
 * @par Acknowledgment
 * The RECVMSG reply carries the original packet id as decimal text and is
 * sent before handle_incoming_frame() returns. It is never retried.
 *
 * @par Offline delivery
 * send_text() always sends. The message-sent event records whether the
 * target was offline per PresenceDirectory at that moment, so the
 * collaborator layer can mark it for later display.
 */
#ifndef LANMSG_ROUTER_HPP
#define LANMSG_ROUTER_HPP

#include <stdint.h>
#include <chrono>
#include <optional>
#include <string>

#include "events.hpp"
#include "file_transfer.hpp"
#include "frame.hpp"
#include "messenger.hpp"
#include "presence.hpp"
#include "rate_limiter.hpp"

namespace lanmsg {

enum class RouteOutcome : uint8_t {
  Presence,
  RateLimited,
  Delivered,
  AckReceived,
  FileOffer,
  FileAnswer,
  PassThrough,
  Stub,
  Ignored,
  SelfEcho,
  Dropped,      ///< known kind, unusable content (bad ack id, bad payload)
  Unknown
};

const char* route_outcome_name(RouteOutcome o);

class MessageRouter {
public:
  MessageRouter(Messenger& out, PresenceDirectory& presence,
                FileTransferCoordinator& transfers, IEventSink& events);

  /// Minimum spacing between accepted entry announcements per IP (0 = off).
  void set_rate_limit(std::chrono::milliseconds window) { limiter_.set_window(window); }

  /// Also emit announcements in the vendor hybrid layout.
  void set_vendor_announce(bool on, const std::string& mac);

  /**
   * @brief Route one decoded frame.
   * @param sender    datagram source (ip + port)
   * @param local_ip  our own IPv4, for self-echo filtering
   * @param layout    wire layout the frame arrived in
   */
  RouteOutcome handle_incoming_frame(const ProtocolFrame& frame, const Endpoint& sender,
                                     const std::string& local_ip,
                                     Layout layout = Layout::Canonical);

  /**
   * @brief Send a text message.
   * @return the packet id used, or nullopt if the text was empty/blank,
   *         too large, or the send failed.
   */
  std::optional<uint64_t> send_text(const Endpoint& to, const std::string& text, bool request_ack);

  /// Broadcast our entry (and the vendor variant when enabled).
  bool announce();

  /// Unicast our entry to one address (seeding discovery across subnets).
  bool announce_to(const Endpoint& to);

  /// Broadcast our exit.
  bool announce_exit();

private:
  RouteOutcome on_text(const ProtocolFrame& frame, const Endpoint& sender);
  RouteOutcome on_ack(const ProtocolFrame& frame, const Endpoint& sender);
  void raise_error(ErrorKind kind, const Endpoint& peer, const std::string& text);

  Messenger&               out_;
  PresenceDirectory&       presence_;
  FileTransferCoordinator& transfers_;
  IEventSink&              events_;
  RateLimiter              limiter_;
  bool                     vendor_announce_{false};
  std::string              vendor_mac_;
};

} // namespace lanmsg

#endif // LANMSG_ROUTER_HPP
