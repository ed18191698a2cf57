/**
 * @file engine.hpp
 * @brief Engine - wires transport, codec, presence, router and transfers into a running node.
 *
 * @details
 * ## Field Brief
 * Everything below the engine is single-purpose and socket-free. The engine
 * owns the socket and the threads:
 *
 * ```
 *   I/O thread                                    worker thread
 *   ----------                                    -------------
 *   loop while running:                           loop while running:
 *     receive(poll_timeout_ms)                      wait on channel
 *     decode ── bad ──► log + drop                  router.handle_incoming_frame()
 *     presence frame ─► router (inline: answer        (events, acks, offers,
 *                        goes out immediately)         answers)
 *     other frame ───► channel (bounded, 64) ───►
 *     every heartbeat: announce + sweep + expire offers
 *
 *   transfer threads: one per data channel, joined by the I/O thread each
 *   second once finished
 * ```
 * Presence and acknowledgment sends never wait behind slow downstream work:
 * presence is answered on the I/O thread, acks on the worker, and nothing
 * either thread does touches storage beyond the registry mirror.
 *
 * ---
 *
 * @par Lifecycle
 * - start(): bind with retry (throws std::runtime_error when exhausted),
 *   enable broadcast (failure tolerated), seed peers from the repository,
 *   announce, spawn threads.
 * - stop(): broadcast exit, clear the running flag, join the loops, shut down
 *   every open data-channel socket, join the transfer threads. Also run by
 *   the destructor. No transfer thread is started after stop() begins.
 *
 * @par Auto-accept
 * With `auto_accept_files`, every incoming offer is accepted into
 * `file_save_dir` as soon as it is reported.
 */
#ifndef LANMSG_ENGINE_HPP
#define LANMSG_ENGINE_HPP

#include <stdint.h>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "etl/deque.h"

#include "config.hpp"
#include "events.hpp"
#include "file_transfer.hpp"
#include "frame.hpp"
#include "messenger.hpp"
#include "peer.hpp"
#include "presence.hpp"
#include "router.hpp"
#include "transport/udp_transport.hpp"

namespace lanmsg {

class Engine {
public:
  static constexpr size_t CHANNEL_CAPACITY = 64;
  static constexpr std::chrono::seconds OFFER_TTL{600};

  /**
   * @param cfg     validated configuration
   * @param events  receives every event (must outlive the engine)
   * @param repo    optional persistence mirror/seed source
   */
  Engine(Config cfg, IEventSink& events, IPeerRepository* repo = nullptr);
  ~Engine();

  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  /// Bind and start the loops. Throws std::runtime_error on bind failure.
  void start();

  /// Announce exit and join all threads. Safe to call twice.
  void stop();

  bool running() const { return running_; }

  /// Data-channel threads not yet joined (finished ones are reaped each second).
  size_t transfer_threads() const;

  // -------- commands --------

  std::optional<uint64_t> send_text(const std::string& ip, uint16_t port,
                                    const std::string& text, bool request_ack);

  TransferResult offer_file(const std::string& path, const std::string& ip, uint16_t port,
                            std::string& task_id);

  /**
   * @brief Accept (opening a data-channel listener) or reject an offer.
   * @param task_id  receives the download task id on accept (may be null)
   */
  TransferResult decide_offer(const std::string& offer_id, bool accept,
                              std::string* task_id = nullptr);

  /// Unicast our entry to one address (peers outside broadcast reach).
  bool announce_to(const std::string& ip, uint16_t port);

  // -------- collaborator surface --------

  RouteOutcome handle_incoming_frame(const ProtocolFrame& frame, const Endpoint& sender,
                                     const std::string& local_ip);

  std::vector<PeerRecord> peers_snapshot() const;
  std::vector<TransferTask> transfer_tasks_snapshot() const;
  std::vector<PendingFileOffer> pending_offers() const;

  uint16_t port() const;
  const std::string& local_ip() const { return local_ip_; }
  const Config& config() const { return cfg_; }

private:
  struct InboundItem {
    ProtocolFrame frame;
    Endpoint      from;
    Layout        layout{Layout::Canonical};
  };

  // One data-channel thread; `done` is set as its last action.
  struct TransferJob {
    std::thread       thread;
    std::atomic<bool> done{false};
  };

  // Forwards to the caller's sink and applies auto-accept.
  class EventTap : public IEventSink {
  public:
    explicit EventTap(Engine& owner) : owner_(owner) {}
    void on_event(const Event& ev) override;
  private:
    Engine& owner_;
  };

  void io_loop();
  void worker_loop();
  void on_tick();
  bool spawn_transfer(std::function<void()> job);
  size_t reap_transfers();
  void join_transfers();

  Config             cfg_;
  IEventSink&        events_;
  IPeerRepository*   repo_;
  EventTap           tap_;
  std::string        local_ip_;
  std::string        vendor_mac_;

  std::unique_ptr<transport::UdpTransport>   udp_;
  std::unique_ptr<Messenger>                 messenger_;
  std::unique_ptr<PresenceDirectory>         presence_;
  std::unique_ptr<FileTransferCoordinator>   transfers_;
  std::unique_ptr<MessageRouter>             router_;

  std::atomic<bool>  running_{false};
  std::thread        io_thread_;
  std::thread        worker_thread_;

  std::mutex                                  chan_mu_;
  std::condition_variable                     chan_cv_;
  etl::deque<InboundItem, CHANNEL_CAPACITY>   channel_;

  mutable std::mutex         xfer_mu_;
  std::list<TransferJob>     xfer_jobs_;      // list: nodes stay put while threads run
};

} // namespace lanmsg

#endif // LANMSG_ENGINE_HPP
