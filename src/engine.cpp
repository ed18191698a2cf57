// -----------------------------------------------------------------------------
// engine.cpp - Implementation of Engine (socket, threads, wiring)
//
// API & thread model: include/lanmsg/engine.hpp
// Tests:              tests/test_engine_loopback.cpp
// -----------------------------------------------------------------------------
#include "lanmsg/engine.hpp"
#include "lanmsg/log.hpp"
#include "lanmsg/protocol.hpp"
#include "lanmsg/transport/tcp_stream.hpp"

#include <chrono>
#include <iterator>
#include <stdexcept>

namespace lanmsg {

namespace {
constexpr std::chrono::seconds SWEEP_INTERVAL{1};
constexpr int RX_ERROR_BACKOFF_MS = 10;
} // namespace

// ---------- lifecycle ----------

Engine::Engine(Config cfg, IEventSink& events, IPeerRepository* repo)
: cfg_(std::move(cfg)), events_(events), repo_(repo), tap_(*this) {}

Engine::~Engine() {
  stop();
}

// -----------------------------------------------------------------------------
// start()
// PRE:    not running.
// POLICY: everything that can fail fatally (config, bind) happens before any
//         thread exists, so a throw leaves nothing to clean up.
// -----------------------------------------------------------------------------
void Engine::start() {
  if (running_) return;

  const ConfigStatus st = validate(cfg_);
  if (st != ConfigStatus::Ok) {
    throw std::runtime_error(std::string("invalid configuration: ") + config_status_name(st));
  }

  udp_ = transport::UdpTransport::bind_with_retry(cfg_.bind_ip, cfg_.udp_port, cfg_.bind_attempts);
  udp_->set_broadcast_address(cfg_.broadcast_ip);
  udp_->enable_broadcast();                       // false is logged inside; discovery still converges

  local_ip_   = cfg_.bind_ip == "0.0.0.0" ? transport::detect_local_ipv4() : cfg_.bind_ip;
  vendor_mac_ = transport::pseudo_mac(local_ip_, udp_->port());

  const auto timeout = std::chrono::seconds(cfg_.peer_timeout_s);
  messenger_ = std::make_unique<Messenger>(*udp_, LocalIdentity{cfg_.username, cfg_.hostname, cfg_.user_id});

  presence_ = std::make_unique<PresenceDirectory>(*messenger_, timeout, &tap_);
  presence_->set_vendor_answer(cfg_.vendor_announce, vendor_mac_);
  if (repo_) {
    presence_->seed(repo_->find_online_peers(timeout));
    presence_->set_repository(repo_);
  }

  transfers_ = std::make_unique<FileTransferCoordinator>(*messenger_, &tap_);
  transfers_->set_save_dir(cfg_.file_save_dir);
  transfers_->on_upload_ready([this](const TransferTask& t) {
    const std::string id = t.id;
    if (!spawn_transfer([this, id] { transfers_->send_file(id); }) &&
        transfers_->fail(id, "engine stopped") != TransferResult::Ok) {
      log(LogLevel::Debug, "engine").kv("status", "upload_already_finished").kv("task", id);
    }
  });

  router_ = std::make_unique<MessageRouter>(*messenger_, *presence_, *transfers_, tap_);
  router_->set_rate_limit(std::chrono::milliseconds(cfg_.rate_limit_ms));
  router_->set_vendor_announce(cfg_.vendor_announce, vendor_mac_);

  {
    std::lock_guard<std::mutex> lock(chan_mu_);
    channel_.clear();
  }
  running_       = true;
  io_thread_     = std::thread(&Engine::io_loop, this);
  worker_thread_ = std::thread(&Engine::worker_loop, this);

  log(LogLevel::Info, "engine").kv("event", "started").kv("ip", local_ip_).kv("port", udp_->port())
      .kv("user", cfg_.username).kv("host", cfg_.hostname);
  router_->announce();
}

void Engine::stop() {
  if (!running_) return;

  router_->announce_exit();
  {
    std::lock_guard<std::mutex> lock(chan_mu_);
    running_ = false;
  }
  chan_cv_.notify_all();

  if (io_thread_.joinable())     io_thread_.join();
  if (worker_thread_.joinable()) worker_thread_.join();
  transfers_->interrupt_streams();
  join_transfers();

  log(LogLevel::Info, "engine").kv("event", "stopped");
}

// ---------- commands ----------

std::optional<uint64_t> Engine::send_text(const std::string& ip, uint16_t port,
                                          const std::string& text, bool request_ack) {
  if (!router_) return std::nullopt;
  return router_->send_text(transport::make_endpoint(ip, port ? port : DEFAULT_UDP_PORT), text,
                            request_ack);
}

TransferResult Engine::offer_file(const std::string& path, const std::string& ip, uint16_t port,
                                  std::string& task_id) {
  if (!transfers_) return TransferResult::NotFound;
  return transfers_->offer(path, transport::make_endpoint(ip, port ? port : DEFAULT_UDP_PORT), task_id);
}

// -----------------------------------------------------------------------------
// decide_offer()
// POLICY: on accept the listener is bound before the answer goes out, so the
//         uploader can connect the moment it reads the port. No free port in
//         the configured range turns the accept into a reject.
// -----------------------------------------------------------------------------
TransferResult Engine::decide_offer(const std::string& offer_id, bool accept, std::string* task_id) {
  if (!transfers_) return TransferResult::NotFound;
  if (!accept) return transfers_->decide(offer_id, false, std::nullopt);

  uint16_t data_port = 0;
  const int listen_fd = transport::bind_available(cfg_.bind_ip, cfg_.tcp_port_start,
                                                  cfg_.tcp_port_end, data_port);
  if (listen_fd < 0) {
    log(LogLevel::Warn, "engine").kv("status", "no_data_port").kv("offer", offer_id);
    const TransferResult r = transfers_->decide(offer_id, false, std::nullopt);
    return r == TransferResult::Ok ? TransferResult::StreamFailed : r;
  }

  std::string id;
  TransferResult r = transfers_->decide(offer_id, true, data_port, &id);
  if (r == TransferResult::Ok) r = transfers_->activate(id, data_port);
  if (r != TransferResult::Ok) {
    transport::close_stream(listen_fd);
    return r;
  }

  if (!spawn_transfer([this, id, listen_fd] { transfers_->receive_file(id, listen_fd); })) {
    transport::close_stream(listen_fd);
    const TransferResult fr = transfers_->fail(id, "engine stopped");
    return fr == TransferResult::Ok ? TransferResult::StreamFailed : fr;
  }
  if (task_id) *task_id = id;
  return TransferResult::Ok;
}

bool Engine::announce_to(const std::string& ip, uint16_t port) {
  if (!router_) return false;
  return router_->announce_to(transport::make_endpoint(ip, port ? port : DEFAULT_UDP_PORT));
}

// ---------- collaborator surface ----------

RouteOutcome Engine::handle_incoming_frame(const ProtocolFrame& frame, const Endpoint& sender,
                                           const std::string& local_ip) {
  if (!router_) return RouteOutcome::Dropped;
  return router_->handle_incoming_frame(frame, sender, local_ip);
}

std::vector<PeerRecord> Engine::peers_snapshot() const {
  return presence_ ? presence_->list() : std::vector<PeerRecord>{};
}

std::vector<TransferTask> Engine::transfer_tasks_snapshot() const {
  return transfers_ ? transfers_->snapshot() : std::vector<TransferTask>{};
}

std::vector<PendingFileOffer> Engine::pending_offers() const {
  return transfers_ ? transfers_->pending_offers() : std::vector<PendingFileOffer>{};
}

uint16_t Engine::port() const {
  return udp_ ? udp_->port() : 0;
}

// ---------- threads ----------

// -----------------------------------------------------------------------------
// io_loop()
// One receive per iteration, bounded by poll_timeout_ms, then the timers.
// A bad datagram costs exactly that datagram.
// -----------------------------------------------------------------------------
void Engine::io_loop() {
  using steady = std::chrono::steady_clock;
  const auto heartbeat = std::chrono::seconds(cfg_.heartbeat_interval_s);
  auto next_announce = steady::now() + heartbeat;
  auto next_sweep    = steady::now() + SWEEP_INTERVAL;

  std::vector<uint8_t> buf;
  Endpoint from;
  while (running_) {
    const transport::RxResult rx = udp_->receive(buf, from, cfg_.poll_timeout_ms);

    if (rx == transport::RxResult::Ok) {
      const auto now_s = static_cast<uint64_t>(unix_ms_now() / 1000);
      DecodeResult r = codec::decode(buf, now_s);
      if (!r.ok()) {
        log(LogLevel::Debug, "engine").kv("status", "drop").kv("reason", codec::status_name(r.status))
            .kv("ip", from.ip.c_str()).kv("bytes", buf.size());
      } else if (is_presence(r.frame.mode())) {
        router_->handle_incoming_frame(r.frame, from, local_ip_, r.layout);
      } else {
        bool queued = false;
        {
          std::lock_guard<std::mutex> lock(chan_mu_);
          if (!channel_.full()) {
            channel_.push_back(InboundItem{std::move(r.frame), from, r.layout});
            queued = true;
          }
        }
        if (queued) {
          chan_cv_.notify_one();
        } else {
          log(LogLevel::Warn, "engine").kv("status", "drop").kv("reason", "channel_full")
              .kv("ip", from.ip.c_str());
        }
      }
    } else if (rx == transport::RxResult::Error) {
      std::this_thread::sleep_for(std::chrono::milliseconds(RX_ERROR_BACKOFF_MS));
    }

    const auto now = steady::now();
    if (now >= next_sweep) {
      presence_->sweep();
      reap_transfers();
      next_sweep = now + SWEEP_INTERVAL;
    }
    if (now >= next_announce) {
      on_tick();
      next_announce = now + heartbeat;
    }
  }
}

void Engine::worker_loop() {
  for (;;) {
    InboundItem item;
    {
      std::unique_lock<std::mutex> lock(chan_mu_);
      chan_cv_.wait(lock, [this] { return !running_ || !channel_.empty(); });
      if (channel_.empty()) return;                 // stopped and drained
      item = std::move(channel_.front());
      channel_.pop_front();
    }
    const RouteOutcome o = router_->handle_incoming_frame(item.frame, item.from, local_ip_, item.layout);
    log(LogLevel::Trace, "engine").kv("event", "routed").kv("outcome", route_outcome_name(o));
  }
}

// on_tick() - heartbeat: re-announce, forget stale offers.
void Engine::on_tick() {
  router_->announce();
  const size_t expired = transfers_->expire_offers(OFFER_TTL);
  if (expired) log(LogLevel::Info, "engine").kv("event", "offers_expired").kv("count", expired);
}

// -----------------------------------------------------------------------------
// spawn_transfer()
// POLICY: refused once stop() has begun. The running_ check and the insert
//         share xfer_mu_ with join_transfers(), so no thread is started after
//         the final join has taken the list.
// -----------------------------------------------------------------------------
bool Engine::spawn_transfer(std::function<void()> job) {
  std::lock_guard<std::mutex> lock(xfer_mu_);
  if (!running_) {
    log(LogLevel::Warn, "engine").kv("status", "transfer_refused").kv("reason", "stopped");
    return false;
  }
  xfer_jobs_.emplace_back();
  TransferJob& slot = xfer_jobs_.back();
  slot.thread = std::thread([&slot, job = std::move(job)] {
    job();
    slot.done = true;
  });
  return true;
}

// reap_transfers() - join threads whose job has returned; the rest keep running.
size_t Engine::reap_transfers() {
  std::list<TransferJob> finished;
  {
    std::lock_guard<std::mutex> lock(xfer_mu_);
    for (auto it = xfer_jobs_.begin(); it != xfer_jobs_.end();) {
      auto next = std::next(it);
      if (it->done) finished.splice(finished.end(), xfer_jobs_, it);
      it = next;
    }
  }
  for (auto& j : finished) if (j.thread.joinable()) j.thread.join();
  if (!finished.empty()) {
    log(LogLevel::Debug, "engine").kv("event", "transfers_reaped").kv("count", finished.size());
  }
  return finished.size();
}

void Engine::join_transfers() {
  std::list<TransferJob> jobs;
  {
    std::lock_guard<std::mutex> lock(xfer_mu_);
    jobs.swap(xfer_jobs_);
  }
  for (auto& j : jobs) if (j.thread.joinable()) j.thread.join();
}

size_t Engine::transfer_threads() const {
  std::lock_guard<std::mutex> lock(xfer_mu_);
  return xfer_jobs_.size();
}

// ---------- event tap ----------

void Engine::EventTap::on_event(const Event& ev) {
  owner_.events_.on_event(ev);
  if (ev.type != EventType::FileOfferReceived || !owner_.cfg_.auto_accept_files) return;

  std::string task_id;
  const TransferResult r = owner_.decide_offer(ev.ref_id, true, &task_id);
  log(r == TransferResult::Ok ? LogLevel::Info : LogLevel::Warn, "engine")
      .kv("event", "auto_accept").kv("offer", ev.ref_id).kv("result", transfer_result_name(r))
      .kv("task", task_id);
}

} // namespace lanmsg
