#ifndef __DEVLINK_SHELL_LAUNCHER__
#define __DEVLINK_SHELL_LAUNCHER__

#include "Channel.hpp"
#include "Headers.hpp"
#include "Session.hpp"
#include "TaskGroup.hpp"

namespace devlink {
/**
 * @brief A running remote shell.
 */
class ShellHandle {
 public:
  virtual ~ShellHandle() {}

  /** @brief Local port the exec proxy serves its stop endpoint on. */
  virtual int getControlPort() = 0;
  /** @brief Best-effort request for a graceful exit. Never throws. */
  virtual void stop() = 0;
  virtual bool isRunning() = 0;
  /** @brief Signals a process that ignored stop(). */
  virtual void terminate() = 0;
};

/**
 * @brief Starts the interactive remote shell for a target.
 */
class ShellLauncher {
 public:
  virtual ~ShellLauncher() {}

  /**
   * @brief Launches the shell. Its outcome, exit code or spawn failure, is
   * sent on `outcomes` exactly once; the waiting happens on a task in `tasks`.
   */
  virtual shared_ptr<ShellHandle> launch(
      const TargetIdentity& target, shared_ptr<TaskGroup> tasks,
      shared_ptr<Channel<CommandOutcome>> outcomes) = 0;
};
}  // namespace devlink

#endif  // __DEVLINK_SHELL_LAUNCHER__
