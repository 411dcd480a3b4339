/**
 * @file log.hpp
 * @brief udpx logging: plain line output with a config-gated debug channel, plus the fatal path.
 *
 * Lines are written exactly as a shell script would want to grep them:
 *
 *     udpx tool                  <- info()
 *     error: bad magic hex       <- error()
 *     chonkle from=1.2.3.4:1000  <- debug(), only when Config::debug_logs
 *
 * The debug switch is read from the `Config` handed to the constructor. There
 * is no process-wide logger; whoever owns the config owns the logger.
 *
 * `fatal()` is separate: it is the single exit for contract breaches on the
 * write path (see byte_cursor.hpp) and never returns.
 */

#ifndef UDPX_LOG_HPP
#define UDPX_LOG_HPP

#include <iosfwd>
#include <string>

namespace udpx {

struct Config;

class Logger {
public:
  /// Log to std::cerr; debug lines follow `cfg.debug_logs`.
  explicit Logger(const Config& cfg);

  /// Log to an arbitrary stream (tests capture into std::ostringstream).
  Logger(const Config& cfg, std::ostream& out);

  void info (const std::string& msg) const;
  void error(const std::string& msg) const;
  void debug(const std::string& msg) const;

  bool debug_enabled() const { return debug_; }

private:
  std::ostream* out_;
  bool          debug_;
};

/**
 * @brief Report an unrecoverable contract breach and stop the process.
 *
 * Writes `status=fatal reason=<reason>` to stderr, then calls std::abort().
 */
[[noreturn]] void fatal(const char* reason);

} // namespace udpx

#endif // UDPX_LOG_HPP
