// ============================================================================
// tcp_stream.cpp - implementation for transport/tcp_stream.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "lanmsg/transport/tcp_stream.hpp"
#include "lanmsg/log.hpp"

#include <arpa/inet.h>     // inet_pton, htons
#include <fcntl.h>         // fcntl, O_NONBLOCK for the bounded connect
#include <netinet/in.h>    // sockaddr_in
#include <poll.h>          // poll(2) for accept/connect timeouts
#include <sys/socket.h>    // socket, bind, listen, accept, connect, send, recv, shutdown
#include <sys/time.h>      // timeval for SO_RCVTIMEO / SO_SNDTIMEO
#include <unistd.h>        // close
#include <cerrno>
#include <cstring>         // memset, strerror
#include <fstream>
#include <vector>

namespace lanmsg::transport {

namespace {

bool fill_addr(const std::string& ip, uint16_t port, sockaddr_in& addr) {
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port   = htons(port);
  if (ip.empty()) { addr.sin_addr.s_addr = htonl(INADDR_ANY); return true; }
  return ::inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) == 1;
}

bool timed_out(int err) {
  return err == EAGAIN || err == EWOULDBLOCK;
}

// write_all() - loop until every byte is written; EINTR is retried.
StreamStatus write_all(int fd, const char* data, std::size_t len) {
  std::size_t off = 0;
  while (off < len) {
    const ssize_t n = ::send(fd, data + off, len - off, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return timed_out(errno) ? StreamStatus::TimedOut : StreamStatus::WriteFailed;
    }
    off += static_cast<std::size_t>(n);
  }
  return StreamStatus::Ok;
}

// set_idle_timeout() - bound every blocking recv/send on fd.
bool set_idle_timeout(int fd, int timeout_ms) {
  if (timeout_ms <= 0) return true;
  timeval tv{};
  tv.tv_sec  = timeout_ms / 1000;
  tv.tv_usec = (timeout_ms % 1000) * 1000;
  return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
         ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

bool set_nonblocking(int fd, bool on) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0) return false;
  flags = on ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  return ::fcntl(fd, F_SETFL, flags) == 0;
}

} // namespace

// ---------------------------------------------------------------------------
// bind_available()
// ----------------
// Walk the range once. SO_REUSEADDR lets a port in TIME_WAIT from a previous
// transfer be reused immediately.
// ---------------------------------------------------------------------------
int bind_available(const std::string& ip, uint16_t start, uint16_t end, uint16_t& bound) {
  for (uint32_t p = start; p <= end; ++p) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;                              // no point trying more ports

    int on = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) != 0) {
      log(LogLevel::Debug, "tcp").kv("status", "reuseaddr_failed").kv("reason", std::strerror(errno));
    }

    sockaddr_in addr{};
    if (!fill_addr(ip, static_cast<uint16_t>(p), addr)) { ::close(fd); return -1; }
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
        ::listen(fd, 1) == 0) {
      bound = static_cast<uint16_t>(p);
      return fd;
    }
    ::close(fd);
  }
  log(LogLevel::Warn, "tcp").kv("status", "no_free_port").kv("start", start).kv("end", end);
  return -1;
}

int accept_stream(int listen_fd, int timeout_ms) {
  pollfd pfd{listen_fd, POLLIN, 0};
  int pr;
  do { pr = ::poll(&pfd, 1, timeout_ms); } while (pr < 0 && errno == EINTR);
  if (pr <= 0) return -1;                               // timeout or poll error
  return ::accept(listen_fd, nullptr, nullptr);
}

// ---------------------------------------------------------------------------
// connect_stream()
// ----------------
// Non-blocking connect + poll for writability, then back to blocking mode
// for the transfer itself.
// ---------------------------------------------------------------------------
int connect_stream(const std::string& ip, uint16_t port, int timeout_ms) {
  sockaddr_in addr{};
  if (!fill_addr(ip, port, addr)) return -1;

  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) return -1;
  if (!set_nonblocking(fd, true)) { ::close(fd); return -1; }

  int rc = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
  if (rc != 0 && errno != EINPROGRESS) { ::close(fd); return -1; }

  if (rc != 0) {
    pollfd pfd{fd, POLLOUT, 0};
    int pr;
    do { pr = ::poll(&pfd, 1, timeout_ms); } while (pr < 0 && errno == EINTR);
    if (pr <= 0) { ::close(fd); return -1; }

    int err = 0;
    socklen_t len = sizeof(err);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0 || err != 0) {
      ::close(fd);
      return -1;
    }
  }

  if (!set_nonblocking(fd, false)) { ::close(fd); return -1; }
  return fd;
}

// ---------------------------------------------------------------------------
// send_stream()
// -------------
// file -> socket in CHUNK_SIZE pieces.
// - progress fires after each chunk that was fully written.
// - shutdown(SHUT_WR) is the flush: the receiver sees EOF only after the
//   last byte has been queued.
// ---------------------------------------------------------------------------
StreamResult send_stream(int fd, const std::string& path, const ProgressFn& progress,
                         int idle_timeout_ms) {
  StreamResult r;
  std::ifstream in(path, std::ios::binary);
  if (!in) { r.status = StreamStatus::OpenFailed; return r; }
  if (!set_idle_timeout(fd, idle_timeout_ms)) {
    log(LogLevel::Warn, "tcp").kv("status", "timeout_setup_failed").kv("reason", std::strerror(errno));
    r.status = StreamStatus::WriteFailed;
    return r;
  }

  in.seekg(0, std::ios::end);
  const uint64_t total = static_cast<uint64_t>(in.tellg());
  in.seekg(0, std::ios::beg);

  std::vector<char> buf(CHUNK_SIZE);
  while (in) {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const std::streamsize got = in.gcount();
    if (got <= 0) break;                                // EOF
    const StreamStatus ws = write_all(fd, buf.data(), static_cast<std::size_t>(got));
    if (ws != StreamStatus::Ok) {
      r.status = ws;
      return r;
    }
    r.bytes += static_cast<uint64_t>(got);
    if (progress) progress(r.bytes, total);
  }
  if (in.bad()) { r.status = StreamStatus::ReadFailed; return r; }

  if (::shutdown(fd, SHUT_WR) != 0) {
    r.status = StreamStatus::FlushFailed;
    return r;
  }
  return r;
}

// ---------------------------------------------------------------------------
// receive_stream()
// ----------------
// socket -> file, never reading past `expected`.
// ---------------------------------------------------------------------------
StreamResult receive_stream(int fd, const std::string& path, uint64_t expected,
                            const ProgressFn& progress, int idle_timeout_ms) {
  StreamResult r;
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) { r.status = StreamStatus::OpenFailed; return r; }
  if (!set_idle_timeout(fd, idle_timeout_ms)) {
    log(LogLevel::Warn, "tcp").kv("status", "timeout_setup_failed").kv("reason", std::strerror(errno));
    r.status = StreamStatus::ReadFailed;
    return r;
  }

  std::vector<char> buf(CHUNK_SIZE);
  while (r.bytes < expected) {
    const uint64_t want64 = expected - r.bytes;
    const std::size_t want = want64 < buf.size() ? static_cast<std::size_t>(want64) : buf.size();
    const ssize_t n = ::recv(fd, buf.data(), want, 0);
    if (n < 0) {
      if (errno == EINTR) continue;
      r.status = timed_out(errno) ? StreamStatus::TimedOut : StreamStatus::ReadFailed;
      return r;
    }
    if (n == 0) break;                                  // peer closed
    out.write(buf.data(), n);
    if (!out) { r.status = StreamStatus::WriteFailed; return r; }
    r.bytes += static_cast<uint64_t>(n);
    if (progress) progress(r.bytes, expected);
  }

  out.flush();
  if (!out) { r.status = StreamStatus::FlushFailed; return r; }
  out.close();
  if (out.fail()) { r.status = StreamStatus::FlushFailed; return r; }

  if (r.bytes < expected) r.status = StreamStatus::Truncated;
  return r;
}

bool interrupt_stream(int fd) {
  return fd >= 0 && ::shutdown(fd, SHUT_RDWR) == 0;
}

void close_stream(int fd) {
  if (fd >= 0) ::close(fd);
}

const char* stream_status_name(StreamStatus s) {
  switch (s) {
    case StreamStatus::Ok:          return "ok";
    case StreamStatus::OpenFailed:  return "open_failed";
    case StreamStatus::ReadFailed:  return "read_failed";
    case StreamStatus::WriteFailed: return "write_failed";
    case StreamStatus::Truncated:   return "truncated";
    case StreamStatus::FlushFailed: return "flush_failed";
    case StreamStatus::TimedOut:    return "timed_out";
  }
  return "unknown";
}

} // namespace lanmsg::transport
