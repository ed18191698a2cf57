// -----------------------------------------------------------------------------
// file_transfer.cpp - Implementation of FileTransferCoordinator
//
// API & state machine: include/lanmsg/file_transfer.hpp
// Tests:               tests/test_file_transfer.cpp
//
// Lock discipline: mu_ is held only while reading or mutating tasks_/offers_.
// Frames, sockets, hashing, callbacks and events all run after it is released.
// -----------------------------------------------------------------------------
#include "lanmsg/file_transfer.hpp"
#include "lanmsg/content_hash.hpp"
#include "lanmsg/log.hpp"
#include "lanmsg/payload.hpp"
#include "lanmsg/protocol.hpp"
#include "lanmsg/text_encoding.hpp"
#include "lanmsg/transport/tcp_stream.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace lanmsg {

// ---------- names ----------

const char* direction_name(Direction d) {
  return d == Direction::Upload ? "upload" : "download";
}

const char* transfer_status_name(TransferStatus s) {
  switch (s) {
    case TransferStatus::Pending:   return "pending";
    case TransferStatus::Active:    return "active";
    case TransferStatus::Paused:    return "paused";
    case TransferStatus::Completed: return "completed";
    case TransferStatus::Failed:    return "failed";
    case TransferStatus::Cancelled: return "cancelled";
  }
  return "unknown";
}

const char* transfer_result_name(TransferResult r) {
  switch (r) {
    case TransferResult::Ok:                return "ok";
    case TransferResult::NotFound:          return "not_found";
    case TransferResult::Duplicate:         return "duplicate";
    case TransferResult::InvalidTransition: return "invalid_transition";
    case TransferResult::FileNotFound:      return "file_not_found";
    case TransferResult::HashFailed:        return "hash_failed";
    case TransferResult::SendFailed:        return "send_failed";
    case TransferResult::StreamFailed:      return "stream_failed";
    case TransferResult::BadPayload:        return "bad_payload";
  }
  return "unknown";
}

// ---------- helpers ----------

namespace {

// Strip any directory part a remote sender put in the name.
std::string safe_file_name(const std::string& name) {
  const std::string base = fs::path(name).filename().string();
  if (base.empty() || base == "." || base == "..") return {};
  return base;
}

// Name as it goes on the wire: UTF-8. A GBK name from a local disk is
// transcoded; anything else is left for dump_text() to replace.
std::string wire_file_name(const std::string& local) {
  const auto* bytes = reinterpret_cast<const uint8_t*>(local.data());
  if (is_valid_utf8(bytes, local.size())) return local;
  if (auto utf8 = gbk_to_utf8(bytes, local.size())) return *utf8;
  return local;
}

bool hex_equal(const std::string& a, const std::string& b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) return false;
  }
  return true;
}

Event task_event(EventType type, const TransferTask& t) {
  Event ev;
  ev.type         = type;
  ev.peer_ip      = t.peer_ip;
  ev.peer_port    = t.peer_port;
  ev.ref_id       = t.id;
  ev.text         = t.file_name;
  ev.bytes        = t.transferred_bytes;
  ev.total        = t.file_size;
  ev.timestamp_ms = unix_ms_now();
  return ev;
}

} // namespace

// ---------- public ----------

FileTransferCoordinator::FileTransferCoordinator(Messenger& out, IEventSink* events, NowFn now)
: out_(out),
  events_(events),
  now_(now ? std::move(now) : NowFn([] { return Clock::now(); })),
  rng_(std::random_device{}()) {}

void FileTransferCoordinator::set_save_dir(const std::string& dir) {
  std::lock_guard<std::mutex> lock(mu_);
  save_dir_ = dir.empty() ? std::string(".") : dir;
}

void FileTransferCoordinator::on_upload_ready(UploadReadyFn fn) {
  std::lock_guard<std::mutex> lock(mu_);
  upload_ready_ = std::move(fn);
}

std::string FileTransferCoordinator::new_id() {
  static const char* digits = "0123456789abcdef";
  std::lock_guard<std::mutex> lock(mu_);
  std::string id;
  id.reserve(32);
  for (int half = 0; half < 2; ++half) {
    uint64_t v = rng_();
    for (int i = 0; i < 16; ++i) { id.push_back(digits[v & 0x0F]); v >>= 4; }
  }
  return id;
}

// -----------------------------------------------------------------------------
// offer()
// PRE:    path names a readable regular file.
// POLICY: hash first; nothing is sent and no task exists if hashing fails.
//         The task is created even if the send fails, then marked Failed, so
//         the caller sees the attempt in snapshot().
// -----------------------------------------------------------------------------
TransferResult FileTransferCoordinator::offer(const std::string& path, const Endpoint& target,
                                              std::string& task_id) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    log(LogLevel::Warn, "transfer").kv("status", "file_not_found").kv("path", path);
    return TransferResult::FileNotFound;
  }

  uint64_t size = 0;
  auto hash = md5_file_hex(path, &size);
  if (!hash) return TransferResult::HashFailed;

  TransferTask t;
  t.id           = new_id();
  t.direction    = Direction::Upload;
  t.peer_ip      = target.ip.c_str();
  t.peer_port    = target.port;
  t.file_path    = path;
  t.file_name    = wire_file_name(fs::path(path).filename().string());
  t.file_size    = size;
  t.content_hash = *hash;
  t.created_at   = t.updated_at = now_();
  task_id = t.id;

  FileOfferPayload body{t.file_name, t.file_size, t.content_hash};
  ProtocolFrame frame = out_.make_frame(bits::pack(Mode::GetFileData, opt::UTF8 | opt::FILEATTACH),
                                        to_json(body));
  {
    std::lock_guard<std::mutex> lock(mu_);
    tasks_.emplace(t.id, t);
  }

  log(LogLevel::Info, "transfer").kv("event", "offer").kv("task", t.id).kv("file", t.file_name)
      .kv("size", t.file_size).kv("ip", t.peer_ip);

  if (!out_.send(frame, target)) {
    finish(t.id, TransferStatus::Failed, "offer could not be sent");
    return TransferResult::SendFailed;
  }
  return TransferResult::Ok;
}

std::optional<PendingFileOffer> FileTransferCoordinator::on_incoming_offer(const ProtocolFrame& frame,
                                                                           const Endpoint& sender) {
  auto body = offer_from_json(frame.content);
  if (!body) {
    log(LogLevel::Warn, "transfer").kv("status", "drop").kv("reason", "bad_offer_payload")
        .kv("ip", sender.ip.c_str());
    return std::nullopt;
  }

  PendingFileOffer o;
  o.id           = new_id();
  o.sender_ip    = sender.ip.c_str();
  o.sender_port  = sender.port;
  o.sender_name  = frame.sender_name;
  o.file_name    = body->name;
  o.file_size    = body->size;
  o.content_hash = body->hash;
  o.created_at   = now_();
  {
    std::lock_guard<std::mutex> lock(mu_);
    offers_.emplace(o.id, o);
  }

  log(LogLevel::Info, "transfer").kv("event", "offer_received").kv("offer", o.id)
      .kv("file", o.file_name).kv("size", o.file_size).kv("ip", o.sender_ip);

  Event ev;
  ev.type         = EventType::FileOfferReceived;
  ev.peer_ip      = o.sender_ip;
  ev.peer_port    = o.sender_port;
  ev.peer_name    = o.sender_name;
  ev.packet_id    = frame.packet_id;
  ev.ref_id       = o.id;
  ev.text         = o.file_name;
  ev.total        = o.file_size;
  ev.timestamp_ms = unix_ms_now();
  raise(ev);
  return o;
}

// -----------------------------------------------------------------------------
// on_incoming_answer()
// POLICY: the answer carries no task id, so it applies to the oldest Pending
//         upload addressed to the answering IP.
//   accept + port → Active, upload-ready callback fires
//   reject        → Cancelled
//   accept, no port → BadPayload (task left Pending)
// -----------------------------------------------------------------------------
TransferResult FileTransferCoordinator::on_incoming_answer(const ProtocolFrame& frame,
                                                           const Endpoint& sender) {
  auto body = answer_from_json(frame.content);
  if (!body) {
    log(LogLevel::Warn, "transfer").kv("status", "drop").kv("reason", "bad_answer_payload")
        .kv("ip", sender.ip.c_str());
    return TransferResult::BadPayload;
  }

  std::string task_id;
  {
    std::lock_guard<std::mutex> lock(mu_);
    const TransferTask* oldest = nullptr;
    for (const auto& kv : tasks_) {
      const TransferTask& t = kv.second;
      if (t.direction != Direction::Upload || t.status != TransferStatus::Pending) continue;
      if (t.peer_ip != sender.ip.c_str()) continue;
      if (!oldest || t.created_at < oldest->created_at) oldest = &t;
    }
    if (oldest) task_id = oldest->id;
  }
  if (task_id.empty()) {
    log(LogLevel::Debug, "transfer").kv("status", "unmatched_answer").kv("ip", sender.ip.c_str());
    return TransferResult::NotFound;
  }

  if (!body->accept) {
    log(LogLevel::Info, "transfer").kv("event", "rejected").kv("task", task_id);
    return cancel(task_id);
  }
  if (!body->port) return TransferResult::BadPayload;

  const TransferResult r = activate(task_id, *body->port);
  if (r != TransferResult::Ok) return r;

  UploadReadyFn cb;
  std::optional<TransferTask> task;
  {
    std::lock_guard<std::mutex> lock(mu_);
    cb = upload_ready_;
    auto it = tasks_.find(task_id);
    if (it != tasks_.end()) task = it->second;
  }
  if (cb && task) cb(*task);
  return TransferResult::Ok;
}

TransferResult FileTransferCoordinator::decide(const std::string& offer_id, bool accept,
                                               std::optional<uint16_t> data_port,
                                               std::string* task_id) {
  PendingFileOffer o;
  std::string save_dir;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = offers_.find(offer_id);
    if (it == offers_.end()) return TransferResult::NotFound;
    o = it->second;
    offers_.erase(it);
    save_dir = save_dir_;
  }

  const std::string name = safe_file_name(o.file_name);
  const bool unusable_name = accept && name.empty();
  if (unusable_name) {
    log(LogLevel::Warn, "transfer").kv("status", "reject").kv("reason", "unusable_file_name")
        .kv("offer", o.id);
    accept = false;
  }

  FileAnswerPayload body;
  body.accept = accept;
  if (accept) body.port = data_port;

  Endpoint to = transport::make_endpoint(o.sender_ip, o.sender_port ? o.sender_port : DEFAULT_UDP_PORT);
  ProtocolFrame frame = out_.make_frame(bits::pack(Mode::ReleaseFiles, opt::UTF8), to_json(body));
  const bool sent = out_.send(frame, to);

  log(LogLevel::Info, "transfer").kv("event", accept ? "accepted" : "rejected").kv("offer", o.id)
      .kv("file", o.file_name).kv("sent", sent);

  if (!sent && !accept) return TransferResult::SendFailed;
  if (unusable_name) return TransferResult::BadPayload;   // answered with a reject, no task
  if (!accept) return TransferResult::Ok;

  TransferTask t;
  t.id           = new_id();
  t.direction    = Direction::Download;
  t.peer_ip      = o.sender_ip;
  t.peer_port    = o.sender_port;
  t.file_path    = (fs::path(save_dir) / name).string();
  t.file_name    = o.file_name;
  t.file_size    = o.file_size;
  t.content_hash = o.content_hash;
  t.created_at   = t.updated_at = now_();
  if (task_id) *task_id = t.id;
  {
    std::lock_guard<std::mutex> lock(mu_);
    tasks_.emplace(t.id, t);
  }

  if (!sent) {
    finish(t.id, TransferStatus::Failed, "answer could not be sent");
    return TransferResult::SendFailed;
  }
  return TransferResult::Ok;
}

// ---------- transitions ----------

TransferResult FileTransferCoordinator::activate(const std::string& task_id, uint16_t port) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) return TransferResult::NotFound;
  if (it->second.status != TransferStatus::Pending) return TransferResult::InvalidTransition;
  it->second.status     = TransferStatus::Active;
  it->second.port       = port;
  it->second.updated_at = now_();
  return TransferResult::Ok;
}

// progress() - absolute byte count; max() keeps it monotonic, min() caps it.
TransferResult FileTransferCoordinator::progress(const std::string& task_id, uint64_t bytes) {
  std::optional<Event> ev;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) return TransferResult::NotFound;
    TransferTask& t = it->second;
    if (t.status != TransferStatus::Active) return TransferResult::InvalidTransition;

    const uint64_t next = std::max(t.transferred_bytes, std::min(bytes, t.file_size));
    if (next == t.transferred_bytes) return TransferResult::Ok;
    const unsigned before = t.progress_percent();
    t.transferred_bytes = next;
    t.updated_at        = now_();
    // one event per whole percent, plus the final byte
    if (t.progress_percent() != before || next == t.file_size) {
      ev = task_event(EventType::TransferProgress, t);
    }
  }
  if (ev) raise(*ev);
  return TransferResult::Ok;
}

TransferResult FileTransferCoordinator::pause(const std::string& task_id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) return TransferResult::NotFound;
  if (it->second.status != TransferStatus::Active) return TransferResult::InvalidTransition;
  it->second.status     = TransferStatus::Paused;
  it->second.updated_at = now_();
  return TransferResult::Ok;
}

TransferResult FileTransferCoordinator::resume(const std::string& task_id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) return TransferResult::NotFound;
  if (it->second.status != TransferStatus::Paused) return TransferResult::InvalidTransition;
  it->second.status     = TransferStatus::Active;
  it->second.updated_at = now_();
  return TransferResult::Ok;
}

TransferResult FileTransferCoordinator::complete(const std::string& task_id) {
  return finish(task_id, TransferStatus::Completed, {});
}

TransferResult FileTransferCoordinator::fail(const std::string& task_id, const std::string& reason) {
  return finish(task_id, TransferStatus::Failed, reason.empty() ? std::string("unknown error") : reason);
}

TransferResult FileTransferCoordinator::cancel(const std::string& task_id) {
  return finish(task_id, TransferStatus::Cancelled, {});
}

size_t FileTransferCoordinator::cleanup() {
  std::lock_guard<std::mutex> lock(mu_);
  size_t n = 0;
  for (auto it = tasks_.begin(); it != tasks_.end();) {
    if (it->second.is_finished()) { it = tasks_.erase(it); ++n; }
    else ++it;
  }
  return n;
}

TransferResult FileTransferCoordinator::add_task(TransferTask task) {
  if (task.id.empty()) task.id = new_id();
  if (task.created_at == TimePoint{}) task.created_at = now_();
  if (task.updated_at == TimePoint{}) task.updated_at = task.created_at;
  std::lock_guard<std::mutex> lock(mu_);
  if (!tasks_.emplace(task.id, task).second) return TransferResult::Duplicate;
  return TransferResult::Ok;
}

// ---------- data channel ----------

// -----------------------------------------------------------------------------
// send_file()
// PRE:    Upload task, Active, port set by the accepted answer.
// OUT:    Completed on full stream + flush; Failed with the stream reason
//         otherwise. A task cancelled mid-stream stays Cancelled.
// -----------------------------------------------------------------------------
TransferResult FileTransferCoordinator::send_file(const std::string& task_id, int connect_timeout_ms) {
  auto t = find(task_id);
  if (!t) return TransferResult::NotFound;
  if (t->direction != Direction::Upload || t->status != TransferStatus::Active || t->port == 0) {
    return TransferResult::InvalidTransition;
  }

  const int fd = transport::connect_stream(t->peer_ip, t->port, connect_timeout_ms);
  if (fd < 0) {
    fail(task_id, "data channel connect failed");
    return TransferResult::StreamFailed;
  }
  if (!track_stream(fd)) {
    transport::close_stream(fd);
    fail(task_id, "data channel closed for shutdown");
    return TransferResult::StreamFailed;
  }
  auto res = transport::send_stream(fd, t->file_path,
                                    [&](uint64_t done, uint64_t) { progress(task_id, done); });
  release_stream(fd);

  if (!res.ok()) {
    fail(task_id, std::string("send: ") + transport::stream_status_name(res.status));
    return TransferResult::StreamFailed;
  }
  log(LogLevel::Info, "transfer").kv("event", "sent").kv("task", task_id).kv("bytes", res.bytes);
  const TransferResult r = complete(task_id);
  return r == TransferResult::InvalidTransition ? r : TransferResult::Ok;
}

TransferResult FileTransferCoordinator::receive_file(const std::string& task_id, int listen_fd,
                                                     int accept_timeout_ms) {
  auto t = find(task_id);
  if (!t) {
    transport::close_stream(listen_fd);
    return TransferResult::NotFound;
  }
  if (t->direction != Direction::Download || t->status != TransferStatus::Active ||
      t->file_path.empty()) {
    transport::close_stream(listen_fd);
    return TransferResult::InvalidTransition;
  }

  if (!track_stream(listen_fd)) {
    transport::close_stream(listen_fd);
    fail(task_id, "data channel closed for shutdown");
    return TransferResult::StreamFailed;
  }
  const int fd = transport::accept_stream(listen_fd, accept_timeout_ms);
  release_stream(listen_fd);                 // one transfer per listener
  if (fd < 0) {
    fail(task_id, "data channel accept timed out");
    return TransferResult::StreamFailed;
  }
  if (!track_stream(fd)) {
    transport::close_stream(fd);
    fail(task_id, "data channel closed for shutdown");
    return TransferResult::StreamFailed;
  }
  auto res = transport::receive_stream(fd, t->file_path, t->file_size,
                                       [&](uint64_t done, uint64_t) { progress(task_id, done); });
  release_stream(fd);

  if (!res.ok()) {
    fail(task_id, std::string("receive: ") + transport::stream_status_name(res.status));
    return TransferResult::StreamFailed;
  }

  if (!t->content_hash.empty()) {
    auto got = md5_file_hex(t->file_path);
    if (!got || !hex_equal(*got, t->content_hash)) {
      fail(task_id, "content hash mismatch");
      return TransferResult::HashFailed;
    }
  }
  log(LogLevel::Info, "transfer").kv("event", "received").kv("task", task_id)
      .kv("bytes", res.bytes).kv("path", t->file_path);
  const TransferResult r = complete(task_id);
  return r == TransferResult::InvalidTransition ? r : TransferResult::Ok;
}

size_t FileTransferCoordinator::interrupt_streams() {
  std::lock_guard<std::mutex> lock(mu_);
  streams_closed_ = true;
  size_t n = 0;
  for (int fd : live_fds_) {
    if (transport::interrupt_stream(fd)) ++n;
  }
  log(LogLevel::Info, "transfer").kv("event", "streams_interrupted").kv("open", live_fds_.size())
      .kv("interrupted", n);
  return n;
}

// track_stream() - false once interrupt_streams() has run; the caller closes fd.
bool FileTransferCoordinator::track_stream(int fd) {
  std::lock_guard<std::mutex> lock(mu_);
  if (streams_closed_) return false;
  live_fds_.insert(fd);
  return true;
}

// release_stream() - untrack and close under mu_, so interrupt_streams()
// never touches a descriptor number that has been reused.
void FileTransferCoordinator::release_stream(int fd) {
  std::lock_guard<std::mutex> lock(mu_);
  live_fds_.erase(fd);
  transport::close_stream(fd);
}

// ---------- queries ----------

std::optional<TransferTask> FileTransferCoordinator::find(const std::string& task_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = tasks_.find(task_id);
  if (it == tasks_.end()) return std::nullopt;
  return it->second;
}

std::vector<TransferTask> FileTransferCoordinator::snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<TransferTask> out;
  out.reserve(tasks_.size());
  for (const auto& kv : tasks_) out.push_back(kv.second);
  std::sort(out.begin(), out.end(),
            [](const TransferTask& a, const TransferTask& b) { return a.created_at < b.created_at; });
  return out;
}

std::vector<TransferTask> FileTransferCoordinator::tasks_by_peer(const std::string& ip) const {
  std::vector<TransferTask> out;
  for (auto& t : snapshot()) if (t.peer_ip == ip) out.push_back(std::move(t));
  return out;
}

std::vector<TransferTask> FileTransferCoordinator::tasks_by_status(TransferStatus status) const {
  std::vector<TransferTask> out;
  for (auto& t : snapshot()) if (t.status == status) out.push_back(std::move(t));
  return out;
}

std::vector<PendingFileOffer> FileTransferCoordinator::pending_offers() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<PendingFileOffer> out;
  out.reserve(offers_.size());
  for (const auto& kv : offers_) out.push_back(kv.second);
  return out;
}

size_t FileTransferCoordinator::expire_offers(std::chrono::seconds max_age) {
  const TimePoint now = now_();
  std::lock_guard<std::mutex> lock(mu_);
  size_t n = 0;
  for (auto it = offers_.begin(); it != offers_.end();) {
    if (now - it->second.created_at >= max_age) { it = offers_.erase(it); ++n; }
    else ++it;
  }
  return n;
}

// ---------- private ----------

TransferResult FileTransferCoordinator::finish(const std::string& task_id, TransferStatus to,
                                               const std::string& reason) {
  Event ev;
  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) return TransferResult::NotFound;
    TransferTask& t = it->second;
    if (t.is_finished()) return TransferResult::InvalidTransition;
    t.status     = to;
    t.updated_at = now_();
    if (to == TransferStatus::Failed)    t.error = reason;
    if (to == TransferStatus::Completed) t.transferred_bytes = t.file_size;
    ev = task_event(EventType::TransferFinished, t);
    if (to == TransferStatus::Failed) {
      ev.error = ErrorKind::FileTransfer;
      ev.text  = t.file_name + ": " + reason;
    }
  }

  {
    auto line = log(to == TransferStatus::Failed ? LogLevel::Warn : LogLevel::Info, "transfer");
    line.kv("event", "finished").kv("task", task_id).kv("status", transfer_status_name(to));
    if (!reason.empty()) line.kv("reason", reason);
  }
  raise(ev);
  return TransferResult::Ok;
}

void FileTransferCoordinator::raise(const Event& ev) {
  if (events_) events_->on_event(ev);
}

} // namespace lanmsg
