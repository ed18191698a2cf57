#pragma once
/**
 * @file transport_base.hpp
 * @brief Datagram port interface the engine components talk through.
 *
 * The router, presence directory and transfer coordinator never touch a
 * socket. They hand bytes to an IDatagramPort. Production code plugs in
 * UdpTransport; tests plug in a recording fake.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "etl/string.h"

namespace lanmsg::transport {

/// Dotted-quad IPv4 text, at most "255.255.255.255".
using IpStr = etl::string<15>;

struct Endpoint {
  IpStr    ip;
  uint16_t port{0};

  bool operator==(const Endpoint& o) const { return ip == o.ip && port == o.port; }
  bool operator!=(const Endpoint& o) const { return !(*this == o); }
};

inline Endpoint make_endpoint(const std::string& ip, uint16_t port) {
  Endpoint ep;
  ep.ip.assign(ip.c_str(), ip.size() < ep.ip.max_size() ? ip.size() : ep.ip.max_size());
  ep.port = port;
  return ep;
}

enum class TxResult : uint8_t { Ok = 0, Error = 1, TooLarge = 2 };
enum class RxResult : uint8_t { None = 0, Ok = 1, Error = 2, Rejected = 3 };

/**
 * @brief Contract:
 *  - send_to() transmits one datagram; never blocks for long.
 *  - broadcast() sends to the configured broadcast address on port().
 *  - receive() waits at most timeout_ms; None on timeout, Rejected for
 *    senders outside IPv4.
 */
class IDatagramPort {
public:
  virtual ~IDatagramPort() = default;
  virtual TxResult send_to(const uint8_t* data, std::size_t len, const Endpoint& to) = 0;
  virtual TxResult broadcast(const uint8_t* data, std::size_t len) = 0;
  virtual RxResult receive(std::vector<uint8_t>& out, Endpoint& from, int timeout_ms) = 0;
  virtual uint16_t port() const = 0;
  virtual const char* name() const = 0;
};

} // namespace lanmsg::transport
