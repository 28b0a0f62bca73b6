#include "SubprocessUtils.hpp"

namespace devlink {
namespace {
char** buildArgv(const string& command, const vector<string>& args) {
  char** argsArray = new char*[args.size() + 2];
  argsArray[0] = strdup(command.c_str());
  for (size_t a = 0; a < args.size(); a++) {
    argsArray[a + 1] = strdup(args[a].c_str());
  }
  argsArray[args.size() + 1] = NULL;
  return argsArray;
}

int decodeStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}
}  // namespace

pid_t SubprocessUtils::spawn(const string& command,
                             const vector<string>& args, bool quiet) {
  // The child reports an exec failure through a close-on-exec pipe, so a
  // successful exec leaves the pipe empty.
  int execPipe[2];
#ifdef __linux__
  FATAL_FAIL(pipe2(execPipe, O_CLOEXEC));
#else
  FATAL_FAIL(pipe(execPipe));
  FATAL_FAIL(fcntl(execPipe[0], F_SETFD, FD_CLOEXEC));
  FATAL_FAIL(fcntl(execPipe[1], F_SETFD, FD_CLOEXEC));
#endif

  pid_t pid = fork();
  if (pid == 0) {
    ::close(execPipe[0]);
    // The session runner blocks SIGINT/SIGTERM in every thread, the child
    // must not inherit that.
    sigset_t emptySet;
    sigemptyset(&emptySet);
    pthread_sigmask(SIG_SETMASK, &emptySet, NULL);
    if (quiet) {
      int devNull = ::open("/dev/null", O_RDWR);
      if (devNull >= 0) {
        dup2(devNull, STDIN_FILENO);
        dup2(devNull, STDOUT_FILENO);
        dup2(devNull, STDERR_FILENO);
        ::close(devNull);
      }
    }
    char** argsArray = buildArgv(command, args);
    execvp(command.c_str(), argsArray);
    int execErrno = errno;
    ssize_t ignored = ::write(execPipe[1], &execErrno, sizeof(execErrno));
    (void)ignored;
    _exit(127);
  }
  ::close(execPipe[1]);
  if (pid < 0) {
    int forkErrno = errno;
    ::close(execPipe[0]);
    throw std::runtime_error(string("Failed to fork: ") + strerror(forkErrno));
  }

  int childErrno = 0;
  ssize_t bytesRead;
  do {
    bytesRead = ::read(execPipe[0], &childErrno, sizeof(childErrno));
  } while (bytesRead == -1 && errno == EINTR);
  ::close(execPipe[0]);
  if (bytesRead > 0) {
    waitpid(pid, NULL, 0);
    throw std::runtime_error("Failed to run " + command + ": " +
                             strerror(childErrno));
  }
  VLOG(1) << "Spawned " << command << " with pid " << pid;
  return pid;
}

int SubprocessUtils::waitForExit(pid_t pid) {
  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      LOG(WARNING) << "waitpid failed for " << pid << ": " << strerror(errno);
      return -1;
    }
  }
  return decodeStatus(status);
}

bool SubprocessUtils::hasExited(pid_t pid, int* exitCode) {
  int status = 0;
  pid_t rc = waitpid(pid, &status, WNOHANG);
  if (rc == 0) {
    return false;
  }
  if (rc == -1) {
    LOG(WARNING) << "waitpid failed for " << pid << ": " << strerror(errno);
    *exitCode = -1;
    return true;
  }
  *exitCode = decodeStatus(status);
  return true;
}

void SubprocessUtils::terminate(pid_t pid, int graceMs) {
  int exitCode;
  if (hasExited(pid, &exitCode)) {
    return;
  }
  if (::kill(pid, SIGTERM) == -1) {
    LOG(WARNING) << "Could not signal " << pid << ": " << strerror(errno);
    return;
  }
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(graceMs);
  while (std::chrono::steady_clock::now() < deadline) {
    if (hasExited(pid, &exitCode)) {
      VLOG(1) << "Child " << pid << " exited with " << exitCode;
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  LOG(WARNING) << "Child " << pid << " ignored SIGTERM for " << graceMs
               << "ms, killing it";
  if (::kill(pid, SIGKILL) == -1) {
    LOG(WARNING) << "Could not kill " << pid << ": " << strerror(errno);
    return;
  }
  waitForExit(pid);
}
}  // namespace devlink
