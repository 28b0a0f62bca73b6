#include "SessionRunner.hpp"

namespace devlink {
namespace {
const std::chrono::milliseconds SIGNAL_POLL_INTERVAL(100);
}

SessionRunner::SessionRunner(shared_ptr<SessionController> _controller)
    : controller(_controller) {}

SessionResult SessionRunner::run() {
  sigset_t waitSet;
  sigemptyset(&waitSet);
  sigaddset(&waitSet, SIGINT);
  sigaddset(&waitSet, SIGTERM);
  sigset_t previousSet;
  // Threads started below inherit the blocked mask, so signals stay pending
  // until this thread collects them.
  int rc = pthread_sigmask(SIG_BLOCK, &waitSet, &previousSet);
  if (rc != 0) {
    STFATAL << "Could not block termination signals: " << strerror(rc);
  }

  auto exitChannel = controller->getExitChannel();
  auto sessionController = controller;
  std::thread controllerThread([sessionController, exitChannel]() {
    el::Helpers::setThreadName("session-controller");
    try {
      sessionController->run();
    } catch (const std::exception& ex) {
      STERROR << "Session controller crashed: " << ex.what();
      exitChannel->trySend(SessionResult::failed(
          SessionError(ErrorKind::FATAL, ex.what()), TargetIdentity()));
    }
  });

  struct timespec pollTimeout;
  pollTimeout.tv_sec = 0;
  pollTimeout.tv_nsec = SIGNAL_POLL_INTERVAL.count() * 1000 * 1000;

  bool interrupted = false;
  optional<SessionResult> result;
  while (!result) {
    int sig = sigtimedwait(&waitSet, NULL, &pollTimeout);
    if (sig > 0) {
      if (!interrupted) {
        LOG(INFO) << "Got signal " << sig << ", shutting down";
        interrupted = true;
        controller->interrupt();
      } else {
        LOG(WARNING) << "Got signal " << sig
                     << " during shutdown, exiting without waiting";
        controllerThread.detach();
        pthread_sigmask(SIG_SETMASK, &previousSet, NULL);
        return SessionResult::interrupted();
      }
    } else if (errno != EAGAIN && errno != EINTR) {
      FATAL_FAIL(sig);
    }
    result = exitChannel->tryReceive();
  }

  controllerThread.join();
  pthread_sigmask(SIG_SETMASK, &previousSet, NULL);
  return *result;
}
}  // namespace devlink
