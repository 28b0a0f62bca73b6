#ifndef __DEVLINK_REMOTE_SHELL_LAUNCHER__
#define __DEVLINK_REMOTE_SHELL_LAUNCHER__

#include "Headers.hpp"
#include "ShellLauncher.hpp"
#include "SubprocessUtils.hpp"

namespace devlink {
class RemoteShellHandle : public ShellHandle {
 public:
  explicit RemoteShellHandle(int _controlPort);

  virtual int getControlPort() { return controlPort; }
  virtual void stop();
  virtual bool isRunning();
  virtual void terminate();

  void setPid(pid_t _pid);
  void markExited();

 protected:
  int controlPort;
  std::mutex handleMutex;
  pid_t pid;
  bool running;
};

/**
 * @brief Runs `<exec_binary> exec --pod <workload> --port <port> [-n <ns>]
 * -- <command>` wired to this process's terminal.
 */
class RemoteShellLauncher : public ShellLauncher {
 public:
  RemoteShellLauncher(const SessionManifest& _manifest,
                      shared_ptr<SubprocessUtils> _subprocessUtils);

  virtual shared_ptr<ShellHandle> launch(
      const TargetIdentity& target, shared_ptr<TaskGroup> tasks,
      shared_ptr<Channel<CommandOutcome>> outcomes);

  /** @brief Arguments passed to the exec binary, without argv[0]. */
  vector<string> buildExecArguments(const TargetIdentity& target,
                                    int controlPort) const;

  /** @brief A free loopback port, or the fallback when none is found. */
  static int pickControlPort();

 protected:
  SessionManifest manifest;
  shared_ptr<SubprocessUtils> subprocessUtils;
};
}  // namespace devlink

#endif  // __DEVLINK_REMOTE_SHELL_LAUNCHER__
