#include "RemoteShellLauncher.hpp"

#include "TcpSocketHandler.hpp"

namespace devlink {
RemoteShellHandle::RemoteShellHandle(int _controlPort)
    : controlPort(_controlPort), pid(-1), running(false) {}

void RemoteShellHandle::stop() {
  if (!isRunning()) {
    return;
  }
  VLOG(1) << "Asking the remote shell to exit through port " << controlPort;
  httplib::Client client("127.0.0.1", controlPort);
  client.set_connection_timeout(0, 300000);  // 300 milliseconds
  client.set_read_timeout(1, 0);
  auto res = client.Get("/");
  if (!res) {
    LOG(INFO) << "Could not reach the exec control endpoint on port "
              << controlPort << ": " << int(res.error());
  } else if (res->status != 200) {
    LOG(INFO) << "Exec control endpoint answered " << res->status;
  }
}

bool RemoteShellHandle::isRunning() {
  lock_guard<std::mutex> guard(handleMutex);
  return running;
}

void RemoteShellHandle::terminate() {
  lock_guard<std::mutex> guard(handleMutex);
  if (!running || pid <= 0) {
    return;
  }
  LOG(WARNING) << "Remote shell " << pid << " ignored the stop request";
  // The waiter task reaps the process.
  if (::kill(pid, SIGTERM) == -1) {
    LOG(WARNING) << "Could not signal " << pid << ": " << strerror(errno);
  }
}

void RemoteShellHandle::setPid(pid_t _pid) {
  lock_guard<std::mutex> guard(handleMutex);
  pid = _pid;
  running = true;
}

void RemoteShellHandle::markExited() {
  lock_guard<std::mutex> guard(handleMutex);
  running = false;
}

RemoteShellLauncher::RemoteShellLauncher(
    const SessionManifest& _manifest,
    shared_ptr<SubprocessUtils> _subprocessUtils)
    : manifest(_manifest), subprocessUtils(_subprocessUtils) {}

int RemoteShellLauncher::pickControlPort() {
  int port = TcpSocketHandler::findFreePort();
  if (port <= 0) {
    LOG(WARNING) << "Could not find a free port for the exec control server, "
                    "using "
                 << FALLBACK_SHELL_CONTROL_PORT;
    return FALLBACK_SHELL_CONTROL_PORT;
  }
  return port;
}

vector<string> RemoteShellLauncher::buildExecArguments(
    const TargetIdentity& target, int controlPort) const {
  vector<string> args = {"exec", "--pod", target.workload(), "--port",
                         to_string(controlPort)};
  if (!target.namespace_name().empty()) {
    args.push_back("-n");
    args.push_back(target.namespace_name());
  }
  args.push_back("--");
  if (manifest.shell().command_size() == 0) {
    args.push_back("sh");
  } else {
    for (const auto& part : manifest.shell().command()) {
      args.push_back(part);
    }
  }
  return args;
}

shared_ptr<ShellHandle> RemoteShellLauncher::launch(
    const TargetIdentity& target, shared_ptr<TaskGroup> tasks,
    shared_ptr<Channel<CommandOutcome>> outcomes) {
  int controlPort = pickControlPort();
  auto handle = make_shared<RemoteShellHandle>(controlPort);
  auto args = buildExecArguments(target, controlPort);
  LOG(INFO) << "Launching remote shell in " << target.workload()
            << " with control port " << controlPort;

  pid_t pid;
  try {
    pid = subprocessUtils->spawn(manifest.shell().exec_binary(), args);
  } catch (const std::runtime_error& ex) {
    LOG(ERROR) << "Could not launch the remote shell: " << ex.what();
    if (!outcomes->trySend(CommandOutcome::spawnFailed(ex.what()))) {
      STERROR << "Command outcome channel is full";
    }
    return handle;
  }
  handle->setPid(pid);

  auto utils = subprocessUtils;
  tasks->spawn("shell-waiter", [utils, pid, handle, outcomes]() {
    int exitCode = utils->waitForExit(pid);
    handle->markExited();
    LOG(INFO) << "Remote shell exited with code " << exitCode;
    if (!outcomes->trySend(CommandOutcome::exited(exitCode))) {
      STERROR << "Command outcome channel is full";
    }
  });
  return handle;
}
}  // namespace devlink
