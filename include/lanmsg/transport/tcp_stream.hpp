/**
 * @file tcp_stream.hpp
 * @brief TCP data channel for file transfers: listen, connect, chunked send/receive.
 *
 * @details
 * PURPOSE
 * -------
 * The UDP side only negotiates a transfer. The bytes move over one TCP
 * connection per file: the receiver listens on a port from the configured
 * range and advertises it in its answer; the sender connects and streams.
 *
 * ROLE
 * ----
 * - bind_available: first free listening port in [start, end].
 * - accept_stream / connect_stream: one connection, bounded by a timeout.
 * - send_stream: file -> socket in CHUNK_SIZE pieces, progress per chunk.
 * - receive_stream: socket -> file until the expected size or EOF.
 * - interrupt_stream: wake a thread blocked on a descriptor (shutdown).
 * - close_stream: close a descriptor.
 *
 * DESIGN CHOICES
 * --------------
 * Free functions over plain descriptors, like the rest of the POSIX layer.
 * The caller owns every descriptor returned here and must close_stream() it.
 * Both stream functions arm SO_RCVTIMEO/SO_SNDTIMEO on the data socket, so a
 * peer that stops moving bytes for idle_timeout_ms ends the call with
 * TimedOut instead of blocking the transfer thread.
 *
 * EXAMPLE
 * -------
 * @code
 *   uint16_t port = 0;
 *   int lfd = lanmsg::transport::bind_available("0.0.0.0", 8000, 9000, port);
 *   // advertise `port` to the sender ...
 *   int fd = lanmsg::transport::accept_stream(lfd, 30000);
 *   auto r = lanmsg::transport::receive_stream(fd, "/tmp/out.bin", expected, nullptr);
 *   lanmsg::transport::close_stream(fd);
 *   lanmsg::transport::close_stream(lfd);
 * @endcode
 *
 * LIMITATIONS
 * -----------
 * No resume, no integrity check at this layer; the coordinator verifies the
 * content hash after a download.
 */
#ifndef LANMSG_TCP_STREAM_HPP
#define LANMSG_TCP_STREAM_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace lanmsg::transport {

constexpr std::size_t CHUNK_SIZE = 4096;
constexpr int IDLE_TIMEOUT_MS = 30000;   ///< longest wait for one chunk

/// Called after every chunk with (bytes so far, expected total).
using ProgressFn = std::function<void(uint64_t done, uint64_t total)>;

enum class StreamStatus : uint8_t {
  Ok = 0,
  OpenFailed,     ///< local file could not be opened
  ReadFailed,     ///< local file or socket read error
  WriteFailed,    ///< socket or local file write error
  Truncated,      ///< peer closed before the expected byte count
  FlushFailed,    ///< final flush / shutdown failed
  TimedOut        ///< no bytes moved for idle_timeout_ms
};

struct StreamResult {
  StreamStatus status{StreamStatus::Ok};
  uint64_t     bytes{0};
  bool ok() const { return status == StreamStatus::Ok; }
};

/**
 * @brief Bind and listen on the first free port in [start, end].
 * @param bound  Receives the chosen port on success.
 * @return listening descriptor, or -1 if every port is taken.
 */
int bind_available(const std::string& ip, uint16_t start, uint16_t end, uint16_t& bound);

/// Accept one connection; -1 on timeout or error.
int accept_stream(int listen_fd, int timeout_ms);

/// Connect to ip:port; -1 on failure or after timeout_ms.
int connect_stream(const std::string& ip, uint16_t port, int timeout_ms);

/**
 * @brief Stream a whole file to `fd`, then shut down the write side.
 * @param progress  May be empty.
 */
StreamResult send_stream(int fd, const std::string& path, const ProgressFn& progress,
                         int idle_timeout_ms = IDLE_TIMEOUT_MS);

/**
 * @brief Receive up to `expected` bytes into `path` (truncated/created).
 *
 * Stops at `expected` or EOF; EOF before `expected` is Truncated. The file
 * is flushed and closed before Ok is returned.
 */
StreamResult receive_stream(int fd, const std::string& path, uint64_t expected,
                            const ProgressFn& progress, int idle_timeout_ms = IDLE_TIMEOUT_MS);

/// shutdown(2) both directions; a blocked accept/recv/send returns at once.
/// False if fd is invalid or not connected.
bool interrupt_stream(int fd);

/// Close a descriptor if valid (>= 0).
void close_stream(int fd);

const char* stream_status_name(StreamStatus s);

} // namespace lanmsg::transport

#endif // LANMSG_TCP_STREAM_HPP
