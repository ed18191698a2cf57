/**
 * @file main.cpp
 * @brief lanmsg CLI - run a LAN messenger node, or do one thing and exit.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11); global options override the JSON config file.
 *  - Load/validate config from $XDG_CONFIG_HOME/lanmsg/config.json.
 *  - Subcommands:
 *      run      start the engine, print events until SIGINT/SIGTERM
 *      send     send one text message, optionally wait for the ack
 *      offer    offer one file and serve it once accepted
 *      peers    list the persisted roster with derived online state
 *      decode   decode a datagram given as text or hex and explain it
 *      config   print the effective config, or write it with --init
 *
 * Exit codes: 0 ok, 1 runtime failure, 2 usage/config error, 3 timed out.
 *
 * Notes:
 *  - `send` and `offer` bind the configured port or the next free one, so
 *    they work next to a running daemon; acks are addressed to the sending
 *    socket, not to the well-known port.
 *  - --format json prints one JSON object per line (events, peers, frames).
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"
#include "nlohmann/json.hpp"

#include "lanmsg/config.hpp"
#include "lanmsg/engine.hpp"
#include "lanmsg/events.hpp"
#include "lanmsg/frame.hpp"
#include "lanmsg/log.hpp"
#include "lanmsg/payload.hpp"
#include "lanmsg/peer_registry.hpp"
#include "lanmsg/protocol.hpp"

using json = nlohmann::json;
using namespace lanmsg;

// ---------- small utilities ----------

static std::atomic<bool> g_stop{false};

static void on_signal(int) { g_stop = true; }

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold (const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim  (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red  (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
  std::string green(const std::string& s) const { return enabled ? "\033[32m"+s+"\033[0m" : s; }
};

static int64_t now_ms_system() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// "D6D0 CE C4" / "d6d0cec4" -> bytes; false on odd length or non-hex
static bool parse_hex(const std::string& text, std::vector<uint8_t>& out) {
  std::string digits;
  for (char c : text) if (c != ' ' && c != ':') digits.push_back(c);
  if (digits.size() % 2) return false;
  out.clear();
  for (size_t i = 0; i < digits.size(); i += 2) {
    char* end = nullptr;
    const std::string pair = digits.substr(i, 2);
    const long v = std::strtol(pair.c_str(), &end, 16);
    if (*end != '\0') return false;
    out.push_back(static_cast<uint8_t>(v));
  }
  return true;
}

static void print_event(const Event& ev, bool as_json, const Ansi& ansi) {
  if (as_json) { std::cout << dump_text(event_json(ev)) << "\n" << std::flush; return; }

  const std::string who = ev.peer_name.empty() ? ev.peer_ip : ev.peer_name + " (" + ev.peer_ip + ")";
  std::cout << ansi.dim("[" + std::string(event_type_name(ev.type)) + "] ");
  switch (ev.type) {
    case EventType::PeerOnline:        std::cout << ansi.green(who) << " online"; break;
    case EventType::PeerOffline:       std::cout << who << " offline"; break;
    case EventType::MessageReceived:   std::cout << ansi.bold(who) << ": " << ev.text; break;
    case EventType::MessageSent:       std::cout << "to " << who << " #" << ev.packet_id
                                                 << (ev.is_offline ? ansi.dim(" (peer offline)") : ""); break;
    case EventType::MessageAck:        std::cout << who << " received #" << ev.packet_id; break;
    case EventType::FileOfferReceived: std::cout << who << " offers " << ansi.bold(ev.text) << " ("
                                                 << ev.total << " bytes) offer=" << ev.ref_id; break;
    case EventType::TransferProgress:  std::cout << ev.text << " " << ev.bytes << "/" << ev.total; break;
    case EventType::TransferFinished:  std::cout << ev.text << " task=" << ev.ref_id
                                                 << (ev.error != ErrorKind::None ? ansi.red(" failed") : ""); break;
    case EventType::Error:             std::cout << ansi.red(error_kind_name(ev.error)) << " " << ev.text; break;
  }
  std::cout << "\n" << std::flush;
}

// Sleep-poll the buffer until pred(event) says stop, the deadline passes, or SIGINT.
template <typename Pred>
static bool wait_for(EventBuffer& buf, std::chrono::milliseconds limit, bool as_json,
                     const Ansi& ansi, Pred pred) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (!g_stop && std::chrono::steady_clock::now() < deadline) {
    Event ev;
    while (buf.poll(ev)) {
      print_event(ev, as_json, ansi);
      if (pred(ev)) return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }
  return false;
}

// ---------- main ----------

int main(int argc, char** argv) {
  // global options
  std::string opt_config;
  std::string opt_format = "pretty";   // pretty|json
  std::string opt_log_level;
  bool        opt_no_color = false;
  uint16_t    opt_port = 0;
  std::string opt_bind;
  std::string opt_user;
  std::string opt_host;

  // subcommand options
  bool        opt_auto_accept = false;
  std::string opt_save_dir;
  std::string opt_target;
  uint16_t    opt_target_port = DEFAULT_UDP_PORT;
  std::string opt_text;
  bool        opt_ack = false;
  uint32_t    opt_wait_ms = 3000;
  std::string opt_file;
  uint32_t    opt_wait_s = 120;
  std::string opt_frame;
  bool        opt_hex = false;
  bool        opt_init = false;

  CLI::App app{"lanmsg - LAN messenger node (IPMsg / FeiQ compatible)"};
  app.require_subcommand(1);
  app.add_option("--config", opt_config, "Config file (default: $XDG_CONFIG_HOME/lanmsg/config.json)");
  app.add_option("--format", opt_format, "Output format: pretty|json")->check(CLI::IsMember({"pretty","json"}));
  app.add_option("--log-level", opt_log_level, "trace|debug|info|warn|error|off")
      ->check(CLI::IsMember({"trace","debug","info","warn","error","off"}));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");
  app.add_option("--port", opt_port, "UDP port to bind (first try)");
  app.add_option("--bind", opt_bind, "Local IPv4 to bind");
  app.add_option("--user", opt_user, "User name to announce");
  app.add_option("--host", opt_host, "Host name to announce");

  auto* run = app.add_subcommand("run", "Run a node and print events until interrupted");
  run->add_flag("--auto-accept", opt_auto_accept, "Accept every incoming file offer");
  run->add_option("--save-dir", opt_save_dir, "Where accepted files are written");

  auto* send = app.add_subcommand("send", "Send one text message");
  send->add_option("ip", opt_target, "Peer IPv4")->required();
  send->add_option("text", opt_text, "Message text")->required();
  send->add_option("--to-port", opt_target_port, "Peer UDP port")->capture_default_str();
  send->add_flag("--ack", opt_ack, "Request and wait for an acknowledgment");
  send->add_option("--wait-ms", opt_wait_ms, "Ack wait in ms")->capture_default_str();

  auto* offer = app.add_subcommand("offer", "Offer a file and serve it once accepted");
  offer->add_option("ip", opt_target, "Peer IPv4")->required();
  offer->add_option("file", opt_file, "File to send")->required()->check(CLI::ExistingFile);
  offer->add_option("--to-port", opt_target_port, "Peer UDP port")->capture_default_str();
  offer->add_option("--wait-s", opt_wait_s, "Give up after this many seconds")->capture_default_str();

  auto* peers = app.add_subcommand("peers", "List known peers");

  auto* decode = app.add_subcommand("decode", "Decode and explain one datagram");
  decode->add_option("frame", opt_frame, "Datagram text (or hex with --hex)")->required();
  decode->add_flag("--hex", opt_hex, "Input is hex bytes");

  auto* config = app.add_subcommand("config", "Print the effective config");
  config->add_flag("--init", opt_init, "Write the effective config to the config file");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  const bool as_json = opt_format == "json";
  Ansi ansi;
  ansi.enabled = !opt_no_color && is_tty_stdout() && !as_json;

  // ---- effective config: defaults < file < flags ----
  const std::string config_path = opt_config.empty() ? default_config_path() : opt_config;
  Config cfg = default_config();
  if (const ConfigStatus st = load_config(config_path, cfg); st != ConfigStatus::Ok) {
    std::cerr << ansi.red("error: ") << "config " << config_path << ": " << config_status_name(st) << "\n";
    return 2;
  }
  if (!opt_log_level.empty()) cfg.log_level = opt_log_level;
  if (opt_port)               cfg.udp_port  = opt_port;
  if (!opt_bind.empty())      cfg.bind_ip   = opt_bind;
  if (!opt_user.empty())      cfg.username  = opt_user;
  if (!opt_host.empty())      cfg.hostname  = opt_host;
  if (opt_auto_accept)        cfg.auto_accept_files = true;
  if (!opt_save_dir.empty())  cfg.file_save_dir = opt_save_dir;

  if (const ConfigStatus st = validate(cfg); st != ConfigStatus::Ok) {
    std::cerr << ansi.red("error: ") << "invalid config: " << config_status_name(st) << "\n";
    return 2;
  }
  LogLevel level = LogLevel::Info;
  parse_log_level(cfg.log_level, level);        // validated above
  set_log_level(level);

  // ---- offline subcommands ----
  if (*config) {
    if (opt_init) {
      if (save_config(config_path, cfg) != ConfigStatus::Ok) {
        std::cerr << ansi.red("error: ") << "could not write " << config_path << "\n";
        return 1;
      }
      std::cerr << ansi.dim("wrote " + config_path) << "\n";
    }
    std::cout << dump_text(config_to_json(cfg), 2) << "\n";
    return 0;
  }

  if (*decode) {
    DecodeResult r;
    if (opt_hex) {
      std::vector<uint8_t> bytes;
      if (!parse_hex(opt_frame, bytes)) {
        std::cerr << ansi.red("error: ") << "bad hex input\n";
        return 2;
      }
      r = codec::decode(bytes, static_cast<uint64_t>(now_ms_system() / 1000));
    } else {
      r = codec::decode(opt_frame, static_cast<uint64_t>(now_ms_system() / 1000));
    }

    json j;
    j["status"] = codec::status_name(r.status);
    if (r.ok()) {
      const ProtocolFrame& f = r.frame;
      j["layout"]      = r.layout == Layout::Vendor ? "vendor" : "canonical";
      j["encoding"]    = r.encoding == TextEncoding::Gbk ? "gbk" : "utf8";
      j["version"]     = f.version;
      j["packet_id"]   = f.packet_id;
      j["user_id"]     = f.user_id;
      j["sender_name"] = f.sender_name;
      j["sender_host"] = f.sender_host;
      j["kind"]        = explain(f.kind);
      j["content"]     = f.content;
    }
    if (as_json) {
      std::cout << dump_text(j) << "\n";
    } else {
      for (auto it = j.begin(); it != j.end(); ++it) {
        std::cout << "  " << std::left << std::setw(12) << it.key() << " "
                  << (it->is_string() ? it->get<std::string>() : dump_text(*it)) << "\n";
      }
    }
    return r.ok() ? 0 : 1;
  }

  JsonPeerRegistry registry(default_registry_path());
  if (!registry.load()) {
    std::cerr << ansi.dim("warning: peer registry unreadable, starting empty") << "\n";
  }

  if (*peers) {
    const auto now = Clock::now();
    const auto timeout = std::chrono::seconds(cfg.peer_timeout_s);
    for (const auto& p : registry.all()) {
      const bool online = is_online_at(p, now, timeout);
      if (as_json) {
        json j = peer_to_json(p);
        j["online"] = online;
        std::cout << dump_text(j) << "\n";
      } else {
        std::cout << (online ? ansi.green("* ") : ansi.dim("- "))
                  << std::left << std::setw(16) << p.ip << " " << std::setw(6) << p.port << " "
                  << p.display_name() << ansi.dim(" @" + p.hostname) << "\n";
      }
    }
    return 0;
  }

  // ---- network subcommands ----
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  EventBuffer events;
  Engine engine(cfg, events, &registry);
  try {
    engine.start();
  } catch (const std::runtime_error& e) {
    std::cerr << ansi.red("error: ") << e.what() << "\n";
    lanmsg::log(LogLevel::Error, "cli").kv("status", "error").kv("reason", e.what());
    return 1;
  }

  int rc = 0;
  if (*run) {
    if (!as_json) {
      std::cout << ansi.bold(cfg.username) << "@" << cfg.hostname << "  "
                << engine.local_ip() << ":" << engine.port()
                << ansi.dim("  (Ctrl-C to stop)") << "\n";
    }
    wait_for(events, std::chrono::hours(24 * 365), as_json, ansi, [](const Event&) { return false; });

  } else if (*send) {
    auto id = engine.send_text(opt_target, opt_target_port, opt_text, opt_ack);
    if (!id) {
      std::cerr << ansi.red("error: ") << "message not sent\n";
      rc = 1;
    } else if (opt_ack) {
      const uint64_t want = *id;
      const bool acked = wait_for(events, std::chrono::milliseconds(opt_wait_ms), as_json, ansi,
                                  [&](const Event& ev) {
                                    return ev.type == EventType::MessageAck && ev.packet_id == want;
                                  });
      if (!acked) {
        std::cerr << ansi.red("timeout: ") << "no acknowledgment for #" << want << "\n";
        rc = 3;
      }
    } else {
      Event ev;
      while (events.poll(ev)) print_event(ev, as_json, ansi);
    }

  } else if (*offer) {
    std::string task_id;
    const TransferResult r = engine.offer_file(opt_file, opt_target, opt_target_port, task_id);
    if (r != TransferResult::Ok) {
      std::cerr << ansi.red("error: ") << "offer failed: " << transfer_result_name(r) << "\n";
      rc = 1;
    } else {
      const bool done = wait_for(events, std::chrono::seconds(opt_wait_s), as_json, ansi,
                                 [&](const Event& ev) {
                                   return ev.type == EventType::TransferFinished && ev.ref_id == task_id;
                                 });
      if (!done) {
        std::cerr << ansi.red("timeout: ") << "transfer did not finish\n";
        rc = 3;
      } else {
        for (const auto& t : engine.transfer_tasks_snapshot()) {
          if (t.id != task_id) continue;
          if (t.status != TransferStatus::Completed) {
            std::cerr << ansi.red("error: ") << transfer_status_name(t.status)
                      << (t.error.empty() ? "" : ": " + t.error) << "\n";
            rc = 1;
          }
        }
      }
    }
  }

  engine.stop();
  return rc;
}
