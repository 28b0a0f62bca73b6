#ifndef __DEVLINK_SESSION_CONTROLLER__
#define __DEVLINK_SESSION_CONTROLLER__

#include "ExecutionContext.hpp"
#include "Headers.hpp"
#include "PortTunnelManager.hpp"
#include "Session.hpp"
#include "ShellLauncher.hpp"
#include "SocketHandler.hpp"
#include "SyncEngine.hpp"
#include "TargetResolver.hpp"

namespace devlink {
/**
 * @brief Drives a session through connect, sync, finalize, run and monitor,
 * reconnecting on recoverable failures.
 *
 * run() blocks on the calling thread, which becomes the only writer of the
 * Session. interrupt() may be called from any thread.
 */
class SessionController {
 public:
  SessionController(const SessionManifest& _manifest,
                    shared_ptr<TargetResolver> _resolver,
                    SyncEngineFactory _syncEngineFactory,
                    shared_ptr<ShellLauncher> _shellLauncher,
                    shared_ptr<SocketHandler> _socketHandler);

  virtual ~SessionController();

  /**
   * @brief Runs until clean completion, interruption or a terminal error.
   * The result is also sent on the exit channel.
   */
  SessionResult run();

  /** @brief Cancels the root context. Safe from any thread. */
  void interrupt();

  shared_ptr<Channel<SessionResult>> getExitChannel() { return exits; }

  void setPhaseListener(std::function<void(const PhaseChange&)> listener) {
    phaseListener = listener;
  }

  SessionPhase getPhase();

  /** @brief Zero-based index of the current connection attempt. */
  int getAttempt() { return attempt; }

 protected:
  /** @brief How one pass through the lifecycle ended. */
  struct AttemptOutcome {
    enum class Type { COMPLETED, INTERRUPTED, RECOVERABLE, TERMINAL };

    Type type;
    ErrorKind kind;
    string message;

    static AttemptOutcome completed() {
      return AttemptOutcome{Type::COMPLETED, ErrorKind::FATAL, ""};
    }
    static AttemptOutcome interrupted() {
      return AttemptOutcome{Type::INTERRUPTED, ErrorKind::INTERRUPTED, ""};
    }
    static AttemptOutcome recoverable(ErrorKind kind, const string& message) {
      return AttemptOutcome{Type::RECOVERABLE, kind, message};
    }
    static AttemptOutcome terminal(ErrorKind kind, const string& message) {
      return AttemptOutcome{Type::TERMINAL, kind, message};
    }
  };

  Session createSession();
  AttemptOutcome runAttempt(Session& session);

  void connect(Session& session);
  void synchronize(Session& session);
  void finalize(Session& session);
  void launchShell(Session& session);
  AttemptOutcome monitor(Session& session);

  /** @brief Maps a sync or finalize failure to recoverable or terminal. */
  AttemptOutcome classifyPhaseFailure(Session& session, ErrorKind kind,
                                      const string& message);

  /**
   * @brief Cancels the session, stops its collaborators and waits for its
   * tasks. A second call is a no-op.
   */
  void shutdown(Session& session);

  void setPhase(SessionPhase phase, const TargetIdentity& target);

  SessionManifest manifest;
  shared_ptr<TargetResolver> resolver;
  SyncEngineFactory syncEngineFactory;
  shared_ptr<ShellLauncher> shellLauncher;
  shared_ptr<SocketHandler> socketHandler;

  shared_ptr<ExecutionContext> rootContext;
  shared_ptr<Channel<SessionResult>> exits;
  std::function<void(const PhaseChange&)> phaseListener;

  std::mutex phaseMutex;
  SessionPhase phase;
  atomic<int> attempt;
  optional<ErrorKind> previousSignal;
};
}  // namespace devlink

#endif  // __DEVLINK_SESSION_CONTROLLER__
