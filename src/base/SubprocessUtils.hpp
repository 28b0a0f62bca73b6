#ifndef __DEVLINK_SUBPROCESS_UTILS__
#define __DEVLINK_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace devlink {
/**
 * @brief Spawns and reaps child processes without a shell.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Forks and execs `command` with `args`. The child inherits stdin,
   * stdout and stderr unless `quiet` is set, in which case they point at
   * /dev/null.
   * @throws std::runtime_error if the fork or the exec fails.
   */
  virtual pid_t spawn(const string& command, const vector<string>& args,
                      bool quiet = false);

  /**
   * @brief Blocks until the child exits.
   * @return The exit code, or 128 + signal number when killed by a signal.
   */
  virtual int waitForExit(pid_t pid);

  /**
   * @brief Non-blocking check for child exit. Fills `exitCode` when it
   * returns true.
   */
  virtual bool hasExited(pid_t pid, int* exitCode);

  /**
   * @brief Sends SIGTERM and reaps the child. A child still alive after
   * `graceMs` gets SIGKILL.
   */
  virtual void terminate(pid_t pid, int graceMs = TERMINATE_GRACE_MS);
};
}  // namespace devlink

#endif  // __DEVLINK_SUBPROCESS_UTILS__
