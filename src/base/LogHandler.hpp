#ifndef __DEVLINK_LOG_HANDLER__
#define __DEVLINK_LOG_HANDLER__

#include "Headers.hpp"

namespace devlink {
/** @brief Where and how much the default logger writes. */
struct LogDestination {
  string directory;
  /** Log files are named `<prefix>-<timestamp>_<pid>.log`. */
  string prefix = "devlink";
  bool toStdout = false;
  bool silent = false;
  int verbose = 0;
  string maxFileSize = "20971520";
};

/**
 * @brief Configures easylogging++ for the devlink binary and its tests.
 *
 * The default logger goes to a per-run file. The "stdout" logger carries the
 * user-facing progress lines and always prints the bare message.
 */
class LogHandler {
 public:
  /** @return The base configuration shared by every logger. */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  static void setupStdoutLogger();

  /**
   * @brief Applies `destination` to `conf` and reconfigures the default
   * logger with it.
   * @return The log file path, empty when silent.
   * @throws SessionError of kind CONFIGURATION when the log file cannot be
   * created.
   */
  static string apply(el::Configurations *conf,
                      const LogDestination &destination);

 private:
  static string createLogFile(const LogDestination &destination);
  static void rolloutHandler(const char *filename, std::size_t size);
};
}  // namespace devlink
#endif  // __DEVLINK_LOG_HANDLER__
