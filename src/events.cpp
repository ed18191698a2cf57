// -----------------------------------------------------------------------------
// events.cpp - event names and the bounded EventBuffer
//
// API: include/lanmsg/events.hpp
// -----------------------------------------------------------------------------
#include "lanmsg/events.hpp"

#include <chrono>

namespace lanmsg {

const char* event_type_name(EventType t) {
  switch (t) {
    case EventType::PeerOnline:        return "peer-online";
    case EventType::PeerOffline:       return "peer-offline";
    case EventType::MessageReceived:   return "message-received";
    case EventType::MessageSent:       return "message-sent";
    case EventType::MessageAck:        return "message-ack";
    case EventType::FileOfferReceived: return "file-offer-received";
    case EventType::TransferProgress:  return "transfer-progress";
    case EventType::TransferFinished:  return "transfer-finished";
    case EventType::Error:             return "error";
  }
  return "error";
}

const char* error_kind_name(ErrorKind k) {
  switch (k) {
    case ErrorKind::None:         return "none";
    case ErrorKind::Network:      return "network";
    case ErrorKind::Protocol:     return "protocol";
    case ErrorKind::FileTransfer: return "file_transfer";
    case ErrorKind::Timeout:      return "timeout";
    case ErrorKind::Config:       return "config";
    case ErrorKind::Validation:   return "validation";
    case ErrorKind::PeerNotFound: return "peer_not_found";
  }
  return "none";
}

int64_t unix_ms_now() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// ---------- EventBuffer ----------

void EventBuffer::on_event(const Event& ev) {
  std::lock_guard<std::mutex> lock(mu_);
  if (events_.full()) {                 // make room: oldest goes first
    events_.pop_front();
    ++dropped_;
  }
  events_.push_back(ev);
}

bool EventBuffer::poll(Event& out) {
  std::lock_guard<std::mutex> lock(mu_);
  if (events_.empty()) return false;
  out = events_.front();
  events_.pop_front();
  return true;
}

std::vector<Event> EventBuffer::drain() {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<Event> out;
  out.reserve(events_.size());
  while (!events_.empty()) {
    out.push_back(events_.front());
    events_.pop_front();
  }
  return out;
}

size_t EventBuffer::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return events_.size();
}

uint64_t EventBuffer::dropped() const {
  std::lock_guard<std::mutex> lock(mu_);
  return dropped_;
}

} // namespace lanmsg
