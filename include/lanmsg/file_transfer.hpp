/**
 * @file file_transfer.hpp
 * @brief FileTransferCoordinator - offers, answers, and the transfer task table.
 *
 * @details
 * ## Field Brief
 * A file transfer is negotiated over UDP and carried over TCP:
 *
 * ```
 *   uploader                                   downloader
 *   --------                                   ----------
 *   offer(path, peer)
 *     md5 + size, task[Upload,Pending]
 *     GETFILEDATA {name,size,hash} ───────────► on_incoming_offer()
 *                                                 PendingFileOffer (no task yet)
 *                                               decide(offer, accept, port)
 *                                                 task[Download,Pending]
 *   on_incoming_answer() ◄────────── RELEASEFILES {accept,port}
 *     accept: activate(port) → upload-ready
 *     reject: cancel
 *   send_file(): connect ip:port ════ TCP ════► receive_file(): accept, write,
 *     stream, complete / fail                     verify md5, complete / fail
 * ```
 *
 * ---
 *
 * @par Task state machine
 * ```
 *   Pending ──activate──► Active ◄──resume── Paused
 *      │                    │  └──pause──────►  │
 *      └────────┬───────────┴───────────────────┘
 *               ▼  complete / fail(reason) / cancel
 *      Completed | Failed | Cancelled          (terminal, no way back)
 * ```
 * - progress(n) only moves `transferred_bytes` forward and never past
 *   `file_size`.
 * - `error` is set only by fail().
 * - cleanup() is the only thing that removes tasks, and only terminal ones.
 *
 * ---
 *
 * @par Error policy
 * Nothing here throws. Hashing or stream failures mark the task Failed with a
 * readable reason and come back as a TransferResult; the process carries on.
 *
 * @par Threading
 * One std::mutex guards tasks and pending offers. send_file()/receive_file()
 * block on sockets and are meant to run on their own thread; they re-enter
 * the table only through the public transition methods. Every descriptor
 * they hold is registered so interrupt_streams() can wake them on shutdown.
 */
#ifndef LANMSG_FILE_TRANSFER_HPP
#define LANMSG_FILE_TRANSFER_HPP

#include <stdint.h>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <vector>

#include "events.hpp"
#include "frame.hpp"
#include "messenger.hpp"
#include "peer.hpp"

namespace lanmsg {

enum class Direction : uint8_t { Upload, Download };

enum class TransferStatus : uint8_t {
  Pending,
  Active,
  Paused,
  Completed,
  Failed,
  Cancelled
};

enum class TransferResult : uint8_t {
  Ok = 0,
  NotFound,           ///< no task / offer with that id (or no matching upload)
  Duplicate,          ///< add_task() with an id already present
  InvalidTransition,  ///< move not allowed from the current state
  FileNotFound,       ///< offer(): path missing or not a regular file
  HashFailed,         ///< hashing failed, or received data did not match
  SendFailed,         ///< control frame could not be sent
  StreamFailed,       ///< data channel connect/accept/stream error
  BadPayload          ///< offer/answer JSON unusable
};

inline bool is_terminal(TransferStatus s) {
  return s == TransferStatus::Completed || s == TransferStatus::Failed ||
         s == TransferStatus::Cancelled;
}

const char* direction_name(Direction d);
const char* transfer_status_name(TransferStatus s);
const char* transfer_result_name(TransferResult r);

struct TransferTask {
  std::string    id;
  Direction      direction{Direction::Upload};
  std::string    peer_ip;
  uint16_t       peer_port{0};
  std::string    file_path;          ///< local path; empty until accepted for downloads
  std::string    file_name;
  uint64_t       file_size{0};
  std::string    content_hash;
  TransferStatus status{TransferStatus::Pending};
  uint64_t       transferred_bytes{0};
  uint16_t       port{0};            ///< data-channel port, set by activate()
  std::string    error;              ///< only set on Failed
  TimePoint      created_at{};
  TimePoint      updated_at{};

  /// Fraction done in [0,1]; an empty file counts as done once completed.
  double progress() const {
    if (file_size == 0) return status == TransferStatus::Completed ? 1.0 : 0.0;
    return static_cast<double>(transferred_bytes) / static_cast<double>(file_size);
  }
  unsigned progress_percent() const { return static_cast<unsigned>(progress() * 100.0); }
  bool is_finished() const { return is_terminal(status); }
};

struct PendingFileOffer {
  std::string id;
  std::string sender_ip;
  uint16_t    sender_port{0};
  std::string sender_name;
  std::string file_name;
  uint64_t    file_size{0};
  std::string content_hash;
  TimePoint   created_at{};
};

class FileTransferCoordinator {
public:
  using UploadReadyFn = std::function<void(const TransferTask&)>;

  explicit FileTransferCoordinator(Messenger& out, IEventSink* events = nullptr,
                                   NowFn now = nullptr);

  /// Directory accepted downloads are written into (default ".").
  void set_save_dir(const std::string& dir);

  /// Called (outside the lock) when an upload's answer arrives with a port.
  void on_upload_ready(UploadReadyFn fn);

  // -------- handshake --------

  /**
   * @brief Hash `path`, send the offer to `target`, create an Upload task.
   * @param task_id  receives the new task id on Ok.
   */
  TransferResult offer(const std::string& path, const Endpoint& target, std::string& task_id);

  /// Parse an incoming GETFILEDATA frame into a pending offer (no task yet).
  std::optional<PendingFileOffer> on_incoming_offer(const ProtocolFrame& frame,
                                                    const Endpoint& sender);

  /// Apply a RELEASEFILES answer to the oldest pending upload for that peer.
  TransferResult on_incoming_answer(const ProtocolFrame& frame, const Endpoint& sender);

  /**
   * @brief Answer a pending offer and consume it.
   *
   * An accept for a name that reduces to nothing (".", "..", "dir/") is sent
   * as a reject and returns BadPayload; no task is created.
   * @param task_id  receives the Download task id when accepted (may be null).
   */
  TransferResult decide(const std::string& offer_id, bool accept,
                        std::optional<uint16_t> data_port, std::string* task_id = nullptr);

  // -------- transitions --------

  TransferResult activate(const std::string& task_id, uint16_t port);
  TransferResult progress(const std::string& task_id, uint64_t bytes);
  TransferResult pause(const std::string& task_id);
  TransferResult resume(const std::string& task_id);
  TransferResult complete(const std::string& task_id);
  TransferResult fail(const std::string& task_id, const std::string& reason);
  TransferResult cancel(const std::string& task_id);

  /// Drop terminal tasks; returns how many were removed.
  size_t cleanup();

  /// Insert a prebuilt task (restoring state, tests).
  TransferResult add_task(TransferTask task);

  // -------- data channel (blocking; run on a worker thread) --------

  /// Connect to the peer's advertised port and stream the file.
  TransferResult send_file(const std::string& task_id, int connect_timeout_ms = 5000);

  /// Accept on `listen_fd` (always closed here), write to disk, verify the hash.
  TransferResult receive_file(const std::string& task_id, int listen_fd,
                              int accept_timeout_ms = 30000);

  /**
   * @brief Shut down every open data-channel socket and refuse new ones.
   *
   * Blocked send_file()/receive_file() calls return promptly and fail their
   * task. Called once on shutdown; there is no way to re-open.
   * @return number of sockets interrupted.
   */
  size_t interrupt_streams();

  // -------- queries --------

  std::optional<TransferTask> find(const std::string& task_id) const;
  std::vector<TransferTask> snapshot() const;
  std::vector<TransferTask> tasks_by_peer(const std::string& ip) const;
  std::vector<TransferTask> tasks_by_status(TransferStatus status) const;
  std::vector<PendingFileOffer> pending_offers() const;

  /// Forget unanswered offers older than max_age; returns how many.
  size_t expire_offers(std::chrono::seconds max_age);

  /// 32 lowercase hex characters.
  std::string new_id();

private:
  TransferResult finish(const std::string& task_id, TransferStatus to, const std::string& reason);
  void raise(const Event& ev);
  bool track_stream(int fd);
  void release_stream(int fd);

  Messenger&    out_;
  IEventSink*   events_;
  NowFn         now_;
  std::string   save_dir_{"."};
  UploadReadyFn upload_ready_;

  mutable std::mutex                      mu_;
  std::map<std::string, TransferTask>     tasks_;
  std::map<std::string, PendingFileOffer> offers_;
  std::mt19937_64                         rng_;
  std::set<int>                           live_fds_;
  bool                                    streams_closed_{false};
};

} // namespace lanmsg

#endif // LANMSG_FILE_TRANSFER_HPP
