/**
 * @file rate_limiter.hpp
 * @brief Per-IP minimum spacing between entry announcements.
 *
 * @details
 * A peer stuck in a restart loop, or a misconfigured host re-broadcasting on
 * every tick, would otherwise make us answer every announcement. The limiter
 * remembers when each IP was last let through and refuses anything that
 * arrives inside the window.
 *
 * The table is a fixed-capacity `etl::deque`; when it is full the oldest
 * entry is forgotten (worst case: that IP gets one extra answer).
 * A window of 0 lets everything through.
 */
#ifndef LANMSG_RATE_LIMITER_HPP
#define LANMSG_RATE_LIMITER_HPP

#include <chrono>
#include <mutex>
#include <string>

#include "etl/deque.h"

#include "peer.hpp"
#include "transport/transport_base.hpp"

namespace lanmsg {

class RateLimiter {
public:
  static constexpr size_t CAPACITY = 256;

  explicit RateLimiter(std::chrono::milliseconds window = std::chrono::milliseconds(1000))
  : window_(window) {}

  void set_window(std::chrono::milliseconds window) {
    std::lock_guard<std::mutex> lock(mu_);
    window_ = window;
  }

  /// True if `ip` may pass at `now`; records the pass.
  bool allow(const std::string& ip, TimePoint now) {
    std::lock_guard<std::mutex> lock(mu_);
    if (window_.count() <= 0) return true;

    for (auto& e : seen_) {
      if (e.ip != ip.c_str()) continue;
      if (now - e.at < window_) return false;
      e.at = now;
      return true;
    }
    if (seen_.full()) seen_.pop_front();
    seen_.push_back(Entry{transport::IpStr(ip.c_str()), now});
    return true;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return seen_.size();
  }

private:
  struct Entry {
    transport::IpStr ip;
    TimePoint        at;
  };

  mutable std::mutex               mu_;
  std::chrono::milliseconds        window_;
  etl::deque<Entry, CAPACITY>      seen_;
};

} // namespace lanmsg

#endif // LANMSG_RATE_LIMITER_HPP
