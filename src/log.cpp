// -----------------------------------------------------------------------------
// log.cpp - key=value line logger
//
// API: include/lanmsg/log.hpp
//
// One global level, one output stream, one mutex. Lines are assembled in a
// private buffer and written in a single insertion so concurrent threads
// never interleave inside a line.
// -----------------------------------------------------------------------------
#include "lanmsg/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace lanmsg {

namespace {

std::atomic<uint8_t> g_level{static_cast<uint8_t>(LogLevel::Info)};
std::mutex           g_mu;                 // guards g_stream and the write itself
std::ostream*        g_stream = nullptr;   // nullptr => std::cerr

bool needs_quotes(const std::string& v) {
  if (v.empty()) return true;
  for (char c : v) {
    if (c == ' ' || c == '\t' || c == '"' || c == '=') return true;
  }
  return false;
}

} // namespace

// ---------- level ----------

void set_log_level(LogLevel level) {
  g_level.store(static_cast<uint8_t>(level));
}

LogLevel log_level() {
  return static_cast<LogLevel>(g_level.load());
}

bool parse_log_level(const std::string& text, LogLevel& out) {
  if (text == "trace") { out = LogLevel::Trace; return true; }
  if (text == "debug") { out = LogLevel::Debug; return true; }
  if (text == "info")  { out = LogLevel::Info;  return true; }
  if (text == "warn")  { out = LogLevel::Warn;  return true; }
  if (text == "error") { out = LogLevel::Error; return true; }
  if (text == "off")   { out = LogLevel::Off;   return true; }
  return false;
}

const char* log_level_name(LogLevel level) {
  switch (level) {
    case LogLevel::Trace: return "trace";
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
    case LogLevel::Off:   return "off";
  }
  return "off";
}

void set_log_stream(std::ostream* os) {
  std::lock_guard<std::mutex> lock(g_mu);
  g_stream = os;
}

// ---------- LogLine ----------

LogLine::LogLine(LogLevel level, const char* component)
: enabled_(level != LogLevel::Off && static_cast<uint8_t>(level) >= g_level.load()) {
  if (enabled_) {
    buf_ << "level=" << log_level_name(level) << " comp=" << (component ? component : "-");
  }
}

LogLine::LogLine(LogLine&& other) noexcept
: enabled_(other.enabled_), buf_(std::move(other.buf_)) {
  other.enabled_ = false;           // moved-from line must not emit
}

LogLine::~LogLine() {
  if (!enabled_) return;
  buf_ << '\n';
  const std::string line = buf_.str();
  std::lock_guard<std::mutex> lock(g_mu);
  std::ostream& os = g_stream ? *g_stream : std::cerr;
  os << line;
  os.flush();
}

LogLine& LogLine::kv(const char* key, const std::string& value) {
  if (!enabled_) return *this;
  buf_ << ' ' << key << '=';
  if (needs_quotes(value)) buf_ << '"' << value << '"';
  else                     buf_ << value;
  return *this;
}

LogLine& LogLine::kv(const char* key, const char* value) {
  return kv(key, std::string(value ? value : ""));
}

LogLine& LogLine::kv(const char* key, bool value) {
  if (enabled_) buf_ << ' ' << key << '=' << (value ? "true" : "false");
  return *this;
}

} // namespace lanmsg
