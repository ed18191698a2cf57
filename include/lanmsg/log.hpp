/**
 * @file log.hpp
 * @brief Key=value line logger used by every lanmsg component.
 *
 * @details
 * Every diagnostic in lanmsg is one line on stderr made of `key=value`
 * tokens, the same shape the CLI uses for its `status=error reason=...`
 * replies. Lines are greppable, diffable and trivially machine-parsed:
 *
 * ```
 * level=warn comp=codec status=drop reason=too_few_fields ip=10.0.0.7
 * level=info comp=presence event=peer_online ip=10.0.0.7 user=bob
 * ```
 *
 * @par Usage
 * @code
 * lanmsg::log(lanmsg::LogLevel::Warn, "udp")
 *     .kv("status", "send_failed")
 *     .kv("ip", ep.ip.c_str())
 *     .kv("errno", errno);
 * // line is written when the temporary goes out of scope
 * @endcode
 *
 * @par Threading
 * A single mutex serializes writes, so lines from the I/O thread, the
 * worker and the data-channel threads never interleave mid-line.
 *
 * @par Levels
 * trace < debug < info < warn < error < off. Lines below the global level
 * cost one atomic load and are never formatted.
 */
#ifndef LANMSG_LOG_HPP
#define LANMSG_LOG_HPP

#include <stdint.h>
#include <ostream>
#include <sstream>
#include <string>

namespace lanmsg {

enum class LogLevel : uint8_t { Trace = 0, Debug, Info, Warn, Error, Off };

/// Set the global threshold; lines below it are discarded.
void set_log_level(LogLevel level);
LogLevel log_level();

/// Parse "trace|debug|info|warn|error|off" (case-sensitive). Returns false on anything else.
bool parse_log_level(const std::string& text, LogLevel& out);
const char* log_level_name(LogLevel level);

/// Redirect output (tests). Passing nullptr restores std::cerr.
void set_log_stream(std::ostream* os);

/**
 * @brief One log line under construction. Emits on destruction.
 *
 * Values containing spaces are quoted so a line always splits cleanly on
 * whitespace.
 */
class LogLine {
public:
  LogLine(LogLevel level, const char* component);
  ~LogLine();

  LogLine(const LogLine&) = delete;
  LogLine& operator=(const LogLine&) = delete;
  LogLine(LogLine&& other) noexcept;

  LogLine& kv(const char* key, const std::string& value);
  LogLine& kv(const char* key, const char* value);
  LogLine& kv(const char* key, bool value);

  template <typename T>
  LogLine& kv(const char* key, T value) {
    if (enabled_) buf_ << ' ' << key << '=' << value;
    return *this;
  }

private:
  bool enabled_;
  std::ostringstream buf_;
};

/// Start a line for `component` at `level`.
inline LogLine log(LogLevel level, const char* component) {
  return LogLine(level, component);
}

} // namespace lanmsg

#endif // LANMSG_LOG_HPP
