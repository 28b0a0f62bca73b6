#ifndef __DEVLINK_SESSION__
#define __DEVLINK_SESSION__

#include "Channel.hpp"
#include "ExecutionContext.hpp"
#include "Headers.hpp"
#include "SessionError.hpp"
#include "TaskGroup.hpp"

namespace devlink {
class SyncEngine;
class PortTunnelManager;
class ShellHandle;

enum class SessionPhase {
  IDLE,
  CONNECTING,
  SYNCING,
  FINALIZING,
  RUNNING,
  DISCONNECTED,
  RECONNECTING,
  TERMINATED,
};

inline const char* sessionPhaseName(SessionPhase phase) {
  switch (phase) {
    case SessionPhase::IDLE:
      return "Idle";
    case SessionPhase::CONNECTING:
      return "Connecting";
    case SessionPhase::SYNCING:
      return "Syncing";
    case SessionPhase::FINALIZING:
      return "Finalizing";
    case SessionPhase::RUNNING:
      return "Running";
    case SessionPhase::DISCONNECTED:
      return "Disconnected";
    case SessionPhase::RECONNECTING:
      return "Reconnecting";
    case SessionPhase::TERMINATED:
      return "Terminated";
  }
  return "Unknown";
}

inline std::ostream& operator<<(std::ostream& os, SessionPhase phase) {
  return os << sessionPhaseName(phase);
}

/**
 * @brief How the remote shell ended: an exit code, or a spawn failure.
 */
struct CommandOutcome {
  bool spawned = false;
  int exitCode = -1;
  string error;

  bool succeeded() const { return spawned && exitCode == 0; }

  static CommandOutcome exited(int code) {
    CommandOutcome outcome;
    outcome.spawned = true;
    outcome.exitCode = code;
    return outcome;
  }

  static CommandOutcome spawnFailed(const string& message) {
    CommandOutcome outcome;
    outcome.error = message;
    return outcome;
  }
};

/** @brief Health feed event emitted when the sync engine drops. */
struct DisconnectEvent {
  string reason;
};

/**
 * @brief The terminal value of a session, delivered on the exit channel.
 */
struct SessionResult {
  enum class Outcome { CLEAN, INTERRUPTED, FAILED };

  Outcome outcome = Outcome::CLEAN;
  ErrorKind kind = ErrorKind::FATAL;
  string message;
  /** Last-known access details, printed when the session fails. */
  TargetIdentity lastTarget;

  bool isClean() const { return outcome != Outcome::FAILED; }

  static SessionResult clean() { return SessionResult(); }

  static SessionResult interrupted() {
    SessionResult result;
    result.outcome = Outcome::INTERRUPTED;
    result.kind = ErrorKind::INTERRUPTED;
    return result;
  }

  static SessionResult failed(const SessionError& error,
                              const TargetIdentity& target) {
    SessionResult result;
    result.outcome = Outcome::FAILED;
    result.kind = error.getKind();
    result.message = error.what();
    result.lastTarget = target;
    return result;
  }
};

/**
 * @brief Progress notification for the CLI. `previous` carries the signal
 * that caused a reconnection, if any.
 */
struct PhaseChange {
  SessionPhase phase;
  int attempt;
  optional<ErrorKind> previous;
  TargetIdentity target;
};

/**
 * @brief Everything one activation attempt owns.
 *
 * Only the controller thread touches these fields. Other threads hold the
 * channels they publish to and nothing else.
 */
struct Session {
  string id;
  shared_ptr<ExecutionContext> context;
  shared_ptr<TaskGroup> tasks;
  TargetIdentity target;
  shared_ptr<SyncEngine> syncEngine;
  shared_ptr<PortTunnelManager> tunnels;
  shared_ptr<ShellHandle> shell;

  shared_ptr<EventNotifier> notifier;
  shared_ptr<Channel<DisconnectEvent>> disconnects;
  shared_ptr<Channel<SessionError>> errors;
  shared_ptr<Channel<CommandOutcome>> commandOutcomes;
  /** Shared by every attempt of one controller. */
  shared_ptr<Channel<SessionResult>> exits;

  bool shutDown = false;
};
}  // namespace devlink

#endif  // __DEVLINK_SESSION__
