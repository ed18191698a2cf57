/**
 * @file udp_transport.hpp
 * @brief IPv4 UDP socket: bind-with-retry, broadcast, timed receive.
 *
 * @details
 * PURPOSE
 * -------
 * The only socket the presence and messaging layers use. One instance is
 * bound at startup and lives until shutdown.
 *
 * BEHAVIOUR
 * ---------
 * - bind_with_retry(): tries preferred, preferred+1, ... until one binds or
 *   `max_attempts` is exhausted. Exhaustion throws std::runtime_error; a
 *   messenger that cannot bind cannot do anything useful.
 * - enable_broadcast(): SO_BROADCAST can fail on hosts with VPN or
 *   container adapters. The failure is logged and returned, never thrown;
 *   unicast answers still let discovery converge.
 * - receive(): poll(2) bounded by timeout_ms, so a caller can interleave a
 *   re-announce timer with the receive loop.
 *
 * THREADING
 * ---------
 * send_to()/broadcast() may be called from any thread (sendto on a UDP
 * socket is atomic per datagram). receive() belongs to one thread.
 */
#ifndef LANMSG_UDP_TRANSPORT_HPP
#define LANMSG_UDP_TRANSPORT_HPP

#include <memory>
#include <string>

#include "transport_base.hpp"

namespace lanmsg::transport {

constexpr std::size_t UDP_BUFFER_SIZE = 65535;
constexpr const char* LIMITED_BROADCAST = "255.255.255.255";

class UdpTransport : public IDatagramPort {
  // Only bind_with_retry() can make one of these.
  struct BoundSocket { explicit BoundSocket() = default; };

public:
  /**
   * @brief Bind the first free port starting at `preferred` (DEFAULT_UDP_PORT when 0).
   * @throws std::runtime_error when socket() fails or every attempt fails.
   */
  static std::unique_ptr<UdpTransport> bind_with_retry(const std::string& bind_ip,
                                                       uint16_t preferred,
                                                       int max_attempts);

  /// Adopts an already bound descriptor; use bind_with_retry().
  UdpTransport(BoundSocket, int fd, uint16_t port) : fd_(fd), port_(port) {}
  ~UdpTransport() override;
  UdpTransport(const UdpTransport&) = delete;
  UdpTransport& operator=(const UdpTransport&) = delete;

  /// Turn on SO_BROADCAST. false is a warning, not an error.
  bool enable_broadcast();

  /// Where broadcast() sends; defaults to 255.255.255.255.
  void set_broadcast_address(const std::string& ip) { broadcast_ip_ = ip; }
  const std::string& broadcast_address() const { return broadcast_ip_; }

  TxResult send_to(const uint8_t* data, std::size_t len, const Endpoint& to) override;
  TxResult broadcast(const uint8_t* data, std::size_t len) override;
  RxResult receive(std::vector<uint8_t>& out, Endpoint& from, int timeout_ms) override;
  uint16_t port() const override { return port_; }
  const char* name() const override { return "udp"; }

  int fd() const { return fd_; }

private:
  int         fd_{-1};
  uint16_t    port_{0};
  std::string broadcast_ip_{LIMITED_BROADCAST};
};

/**
 * @brief Primary local IPv4 address (the one used for the default route).
 *
 * Uses the connected-UDP trick: connect() on a datagram socket selects a
 * source address without sending anything. Falls back to "127.0.0.1".
 */
std::string detect_local_ipv4();

/// Pseudo MAC derived from the local address, as the vendor header expects 12 hex digits.
std::string pseudo_mac(const std::string& ipv4, uint16_t port);

} // namespace lanmsg::transport

#endif // LANMSG_UDP_TRANSPORT_HPP
