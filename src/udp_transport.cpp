// ============================================================================
// udp_transport.cpp - implementation for transport/udp_transport.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "lanmsg/transport/udp_transport.hpp"
#include "lanmsg/log.hpp"
#include "lanmsg/protocol.hpp"

#include <arpa/inet.h>     // inet_pton, inet_ntop, htons
#include <netinet/in.h>    // sockaddr_in, INADDR_ANY, IP_ADD_MEMBERSHIP
#include <poll.h>          // poll(2) for the bounded receive
#include <sys/socket.h>    // socket, bind, sendto, recvfrom, setsockopt
#include <unistd.h>        // close
#include <cerrno>
#include <cstdio>
#include <cstring>         // strerror
#include <stdexcept>

namespace lanmsg::transport {

namespace {

// ---------------------------------------------------------------------------
// fill_addr()
// -----------
// Dotted-quad + port into sockaddr_in. Empty or "0.0.0.0" means any.
// Returns false for text that is not an IPv4 address.
// ---------------------------------------------------------------------------
bool fill_addr(const char* ip, uint16_t port, sockaddr_in& addr) {
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port   = htons(port);
  if (!ip || !*ip) {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    return true;
  }
  return ::inet_pton(AF_INET, ip, &addr.sin_addr) == 1;
}

} // namespace

// ---------------------------------------------------------------------------
// bind_with_retry()
// -----------------
// One socket, several bind() attempts on successive ports.
// - SO_REUSEADDR is deliberately not set: two messengers must not share
//   2425 on one host, the second should move on to 2426.
// - Ports wrap at 65535 back to 1024.
// ---------------------------------------------------------------------------
std::unique_ptr<UdpTransport> UdpTransport::bind_with_retry(const std::string& bind_ip,
                                                            uint16_t preferred,
                                                            int max_attempts) {
  const uint16_t start = preferred ? preferred : DEFAULT_UDP_PORT;
  if (max_attempts < 1) max_attempts = 1;

  sockaddr_in probe{};
  if (!fill_addr(bind_ip.c_str(), 0, probe)) {
    throw std::runtime_error("invalid bind address: " + bind_ip);
  }

  uint16_t port = start;
  int last_errno = 0;
  for (int attempt = 0; attempt < max_attempts; ++attempt) {
    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) {
      throw std::runtime_error(std::string("udp socket() failed: ") + std::strerror(errno));
    }

    sockaddr_in addr{};
    fill_addr(bind_ip.c_str(), port, addr);
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
      // read back the real port (matters when the caller asked for an ephemeral one)
      sockaddr_in bound{};
      socklen_t blen = sizeof(bound);
      uint16_t actual = port;
      if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &blen) == 0) {
        actual = ntohs(bound.sin_port);
      }
      if (attempt > 0) {
        log(LogLevel::Info, "udp").kv("event", "bind_fallback")
            .kv("preferred", start).kv("port", actual);
      }
      return std::make_unique<UdpTransport>(BoundSocket{}, fd, actual);
    }

    last_errno = errno;
    ::close(fd);
    log(LogLevel::Debug, "udp").kv("status", "bind_retry").kv("port", port)
        .kv("reason", std::strerror(last_errno));
    port = (port == 65535) ? 1024 : static_cast<uint16_t>(port + 1);
  }

  throw std::runtime_error("udp bind failed after " + std::to_string(max_attempts) +
                           " attempts from port " + std::to_string(start) + ": " +
                           std::strerror(last_errno));
}

UdpTransport::~UdpTransport() {
  if (fd_ >= 0) ::close(fd_);
}

bool UdpTransport::enable_broadcast() {
  int on = 1;
  if (::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on)) != 0) {
    log(LogLevel::Warn, "udp").kv("status", "broadcast_disabled")
        .kv("reason", std::strerror(errno));
    return false;
  }
  return true;
}

// ---------------------------------------------------------------------------
// send_to()
// ---------
// One datagram, one sendto(2). A short send on UDP means the kernel dropped
// it, so anything other than the full length is an error.
// ---------------------------------------------------------------------------
TxResult UdpTransport::send_to(const uint8_t* data, std::size_t len, const Endpoint& to) {
  if (len > UDP_BUFFER_SIZE) return TxResult::TooLarge;
  sockaddr_in addr{};
  if (!fill_addr(to.ip.c_str(), to.port, addr)) return TxResult::Error;

  const ssize_t n = ::sendto(fd_, data, len, 0, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
  if (n != static_cast<ssize_t>(len)) {
    log(LogLevel::Warn, "udp").kv("status", "send_failed").kv("ip", to.ip.c_str())
        .kv("port", to.port).kv("reason", std::strerror(errno));
    return TxResult::Error;
  }
  return TxResult::Ok;
}

TxResult UdpTransport::broadcast(const uint8_t* data, std::size_t len) {
  return send_to(data, len, make_endpoint(broadcast_ip_, port_));
}

// ---------------------------------------------------------------------------
// receive()
// ---------
// poll() for at most timeout_ms, then one recvfrom().
// - None on timeout or EINTR (the loop just goes round again).
// - Rejected for non-IPv4 peers; the protocol is IPv4 only.
// ---------------------------------------------------------------------------
RxResult UdpTransport::receive(std::vector<uint8_t>& out, Endpoint& from, int timeout_ms) {
  pollfd pfd{fd_, POLLIN, 0};
  const int pr = ::poll(&pfd, 1, timeout_ms);
  if (pr == 0) return RxResult::None;
  if (pr < 0)  return (errno == EINTR) ? RxResult::None : RxResult::Error;
  if (!(pfd.revents & POLLIN)) return RxResult::Error;

  out.resize(UDP_BUFFER_SIZE);
  sockaddr_storage ss{};
  socklen_t slen = sizeof(ss);
  const ssize_t n = ::recvfrom(fd_, out.data(), out.size(), 0,
                               reinterpret_cast<sockaddr*>(&ss), &slen);
  if (n < 0) {
    out.clear();
    return (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) ? RxResult::None
                                                                       : RxResult::Error;
  }
  out.resize(static_cast<std::size_t>(n));

  if (ss.ss_family != AF_INET) {
    out.clear();
    return RxResult::Rejected;
  }

  const auto* sin = reinterpret_cast<const sockaddr_in*>(&ss);
  char buf[INET_ADDRSTRLEN] = {0};
  ::inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
  from.ip   = buf;
  from.port = ntohs(sin->sin_port);
  return RxResult::Ok;
}

// ---------- free helpers ----------

std::string detect_local_ipv4() {
  int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd < 0) return "127.0.0.1";

  sockaddr_in remote{};
  fill_addr("192.0.2.1", 9, remote);             // TEST-NET-1; nothing is sent
  std::string result = "127.0.0.1";
  if (::connect(fd, reinterpret_cast<sockaddr*>(&remote), sizeof(remote)) == 0) {
    sockaddr_in local{};
    socklen_t len = sizeof(local);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&local), &len) == 0) {
      char buf[INET_ADDRSTRLEN] = {0};
      if (::inet_ntop(AF_INET, &local.sin_addr, buf, sizeof(buf)) && local.sin_addr.s_addr != 0) {
        result = buf;
      }
    }
  }
  ::close(fd);
  return result;
}

std::string pseudo_mac(const std::string& ipv4, uint16_t port) {
  in_addr a{};
  uint8_t b[4] = {0, 0, 0, 0};
  if (::inet_pton(AF_INET, ipv4.c_str(), &a) == 1) {
    std::memcpy(b, &a.s_addr, 4);                // network order: b[0] is the first octet
  }
  char mac[13];
  std::snprintf(mac, sizeof(mac), "%02X%02X%02X%02X%02X%02X",
                b[0] ^ 0x02, b[1], b[2], b[3],   // locally administered bit
                static_cast<unsigned>(port >> 8), static_cast<unsigned>(port & 0xFF));
  return mac;
}

} // namespace lanmsg::transport
