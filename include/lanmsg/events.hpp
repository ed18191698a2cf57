/**
 * @file events.hpp
 * @brief Push-style events from the engine to the collaborator layer.
 *
 * @details
 * The engine never calls into storage or UI code directly. It raises an
 * `Event` on an `IEventSink`, and whatever sits above (the CLI, a GUI, a
 * database writer) decides what to do with it.
 *
 * | type              | filled fields                                         |
 * |-------------------|-------------------------------------------------------|
 * | PeerOnline        | peer_ip, peer_port, peer_name                         |
 * | PeerOffline       | peer_ip, peer_name (derived from last_seen age)       |
 * | MessageReceived   | peer_ip, peer_port, peer_name, packet_id, text        |
 * | MessageSent       | peer_ip, packet_id, text, is_offline                  |
 * | MessageAck        | peer_ip, packet_id (the acknowledged id)              |
 * | FileOfferReceived | peer_ip, peer_name, ref_id (offer id), text (name), total |
 * | TransferProgress  | ref_id (task id), bytes, total                        |
 * | TransferFinished  | ref_id, text (status name), bytes, total, error       |
 * | Error             | error, text                                           |
 *
 * Sinks are called from the engine's I/O, worker and data-channel threads
 * and must be thread-safe.
 */
#ifndef LANMSG_EVENTS_HPP
#define LANMSG_EVENTS_HPP

#include <stdint.h>
#include <mutex>
#include <string>
#include <vector>

#include "etl/deque.h"

namespace lanmsg {

/// Error taxonomy carried on Error and TransferFinished events.
enum class ErrorKind : uint8_t {
  None = 0,
  Network,
  Protocol,
  FileTransfer,
  Timeout,
  Config,
  Validation,
  PeerNotFound
};

enum class EventType : uint8_t {
  PeerOnline,
  PeerOffline,
  MessageReceived,
  MessageSent,
  MessageAck,
  FileOfferReceived,
  TransferProgress,
  TransferFinished,
  Error
};

struct Event {
  EventType   type{EventType::Error};
  std::string peer_ip;
  uint16_t    peer_port{0};
  std::string peer_name;
  uint64_t    packet_id{0};
  std::string text;
  std::string ref_id;
  uint64_t    bytes{0};
  uint64_t    total{0};
  bool        is_offline{false};
  ErrorKind   error{ErrorKind::None};
  int64_t     timestamp_ms{0};   ///< unix ms, stamped by the raiser
};

const char* event_type_name(EventType t);
const char* error_kind_name(ErrorKind k);

/// Current wall-clock time in unix milliseconds.
int64_t unix_ms_now();

class IEventSink {
public:
  virtual ~IEventSink() = default;
  virtual void on_event(const Event& ev) = 0;
};

/// Sink that drops everything.
class NullEventSink : public IEventSink {
public:
  void on_event(const Event&) override {}
};

/**
 * @brief Bounded, thread-safe event queue for pollers.
 *
 * When full, the oldest event is dropped to make room; a slow poller loses
 * history, never the most recent state.
 */
class EventBuffer : public IEventSink {
public:
  static constexpr size_t CAPACITY = 1000;

  void on_event(const Event& ev) override;

  /// Pop the oldest event; false when empty.
  bool poll(Event& out);

  /// Move everything out, oldest first.
  std::vector<Event> drain();

  size_t size() const;
  uint64_t dropped() const;

private:
  mutable std::mutex mu_;
  etl::deque<Event, CAPACITY> events_;
  uint64_t dropped_{0};
};

} // namespace lanmsg

#endif // LANMSG_EVENTS_HPP
