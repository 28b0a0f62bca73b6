#include "SessionController.hpp"

namespace devlink {
namespace {
const std::chrono::milliseconds MONITOR_WAKEUP(1000);
}  // namespace

SessionController::SessionController(const SessionManifest& _manifest,
                                     shared_ptr<TargetResolver> _resolver,
                                     SyncEngineFactory _syncEngineFactory,
                                     shared_ptr<ShellLauncher> _shellLauncher,
                                     shared_ptr<SocketHandler> _socketHandler)
    : manifest(_manifest),
      resolver(_resolver),
      syncEngineFactory(_syncEngineFactory),
      shellLauncher(_shellLauncher),
      socketHandler(_socketHandler),
      rootContext(new ExecutionContext()),
      exits(new Channel<SessionResult>("exit", 1)),
      phase(SessionPhase::IDLE),
      attempt(0) {}

SessionController::~SessionController() {}

SessionResult SessionController::run() {
  SessionResult result;
  TargetIdentity lastTarget = manifest.target();
  lastTarget.set_name(manifest.name());

  while (true) {
    Session session = createSession();
    AttemptOutcome outcome = runAttempt(session);
    if (!session.target.address().empty()) {
      lastTarget = session.target;
    }
    if (outcome.type == AttemptOutcome::Type::RECOVERABLE) {
      setPhase(SessionPhase::DISCONNECTED, lastTarget);
    }
    shutdown(session);

    if (outcome.type == AttemptOutcome::Type::COMPLETED) {
      LOG(INFO) << "Session completed";
      result = SessionResult::clean();
      break;
    }
    if (outcome.type == AttemptOutcome::Type::INTERRUPTED) {
      LOG(INFO) << "Session interrupted";
      result = SessionResult::interrupted();
      break;
    }
    if (outcome.type == AttemptOutcome::Type::TERMINAL) {
      LOG(ERROR) << "Session failed with " << outcome.kind << ": "
                 << outcome.message;
      result = SessionResult::failed(SessionError(outcome.kind, outcome.message),
                                     lastTarget);
      break;
    }

    LOG(INFO) << "Recovering from " << outcome.kind << ": " << outcome.message;
    previousSignal = outcome.kind;
    setPhase(SessionPhase::RECONNECTING, lastTarget);
    if (!rootContext->waitFor(
            std::chrono::milliseconds(manifest.reconnect_delay_ms()))) {
      LOG(INFO) << "Session interrupted while reconnecting";
      result = SessionResult::interrupted();
      break;
    }
    attempt++;
  }

  setPhase(SessionPhase::TERMINATED, lastTarget);
  if (!exits->trySend(result)) {
    LOG(WARNING) << "Exit channel already holds a result";
  }
  return result;
}

void SessionController::interrupt() {
  LOG(INFO) << "Interrupt requested";
  rootContext->cancel();
}

SessionPhase SessionController::getPhase() {
  lock_guard<std::mutex> guard(phaseMutex);
  return phase;
}

Session SessionController::createSession() {
  Session session;
  session.id = sole::uuid4().str();
  session.context = rootContext->createChild();
  session.tasks = make_shared<TaskGroup>();
  session.notifier = make_shared<EventNotifier>();
  session.disconnects = make_shared<Channel<DisconnectEvent>>(
      "disconnect", DISCONNECT_CHANNEL_CAPACITY, session.notifier);
  session.errors = make_shared<Channel<SessionError>>(
      "error", ERROR_CHANNEL_CAPACITY, session.notifier);
  session.commandOutcomes = make_shared<Channel<CommandOutcome>>(
      "command", COMMAND_CHANNEL_CAPACITY, session.notifier);
  session.exits = exits;
  VLOG(1) << "Created session " << session.id << " for attempt " << attempt;
  return session;
}

SessionController::AttemptOutcome SessionController::runAttempt(
    Session& session) {
  if (session.context->isCancelled()) {
    return AttemptOutcome::interrupted();
  }

  setPhase(SessionPhase::CONNECTING, session.target);
  try {
    connect(session);
  } catch (const SessionError& ex) {
    if (session.context->isCancelled() || ex.is(ErrorKind::INTERRUPTED)) {
      return AttemptOutcome::interrupted();
    }
    return AttemptOutcome::terminal(ex.getKind(), ex.what());
  } catch (const std::exception& ex) {
    if (session.context->isCancelled()) {
      return AttemptOutcome::interrupted();
    }
    return AttemptOutcome::terminal(ErrorKind::FATAL, ex.what());
  }

  typedef void (SessionController::*Step)(Session&);
  const vector<pair<SessionPhase, Step>> steps = {
      {SessionPhase::SYNCING, &SessionController::synchronize},
      {SessionPhase::FINALIZING, &SessionController::finalize},
  };
  for (const auto& step : steps) {
    setPhase(step.first, session.target);
    try {
      (this->*step.second)(session);
    } catch (const SessionError& ex) {
      return classifyPhaseFailure(session, ex.getKind(), ex.what());
    } catch (const std::exception& ex) {
      return classifyPhaseFailure(session, ErrorKind::FATAL, ex.what());
    }
  }

  setPhase(SessionPhase::RUNNING, session.target);
  launchShell(session);
  return monitor(session);
}

void SessionController::connect(Session& session) {
  session.target = resolver->resolve(manifest, session.context);
  session.syncEngine = syncEngineFactory(manifest, session.target);
  if (!session.syncEngine) {
    STFATAL << "Sync engine factory returned nothing";
  }
  session.tunnels = make_shared<PortTunnelManager>(
      socketHandler, manifest.tunnel(), session.errors);
}

void SessionController::synchronize(Session& session) {
  auto engine = session.syncEngine;
  auto context = session.context;
  engine->start(context);

  // Every binding is known before any data flows.
  session.tunnels->registerBinding(engine->controlBinding());
  session.tunnels->registerBinding(engine->guiBinding());
  for (const auto& forward : manifest.forwards()) {
    session.tunnels->registerBinding(forward);
  }
  session.tunnels->start(session.target.address(),
                         session.target.namespace_name(), context);

  auto disconnects = session.disconnects;
  session.tasks->spawn("sync-monitor", [engine, context, disconnects]() {
    engine->monitor(context, [disconnects](const string& reason) {
      if (!disconnects->trySend(DisconnectEvent{reason})) {
        VLOG(1) << "Disconnect already pending, coalescing: " << reason;
      }
    });
  });

  engine->waitForPing(context);
  engine->waitDrained(context);
}

void SessionController::finalize(Session& session) {
  auto engine = session.syncEngine;
  engine->overrideLocal(session.context);
  engine->waitDrained(session.context);
  engine->setMode(SEND_RECEIVE);
  engine->restart(session.context);
}

void SessionController::launchShell(Session& session) {
  session.shell = shellLauncher->launch(session.target, session.tasks,
                                        session.commandOutcomes);
}

SessionController::AttemptOutcome SessionController::monitor(
    Session& session) {
  auto notifier = session.notifier;
  session.context->addCancelListener([notifier]() { notifier->notify(); });

  while (true) {
    // Snapshot before checking so a send racing with the checks still wakes
    // the wait below.
    uint64_t generation = notifier->getGeneration();

    if (session.context->isCancelled()) {
      if (session.shell) {
        session.shell->stop();
      }
      return AttemptOutcome::interrupted();
    }

    auto outcome = session.commandOutcomes->tryReceive();
    if (outcome) {
      if (outcome->succeeded()) {
        return AttemptOutcome::completed();
      }
      string message = outcome->spawned
                           ? "command exited with code " +
                                 to_string(outcome->exitCode)
                           : outcome->error;
      auto disconnect = session.disconnects->tryReceive();
      if (disconnect) {
        return AttemptOutcome::recoverable(ErrorKind::LOST_CONNECTION,
                                           disconnect->reason);
      }
      if (!session.syncEngine->isConnected()) {
        return AttemptOutcome::recoverable(ErrorKind::COMMAND_FAILED, message);
      }
      return AttemptOutcome::terminal(ErrorKind::COMMAND_FAILED, message);
    }

    while (auto error = session.errors->tryReceive()) {
      LOG(WARNING) << "Session error (" << error->getKind()
                   << "): " << error->what();
    }

    auto disconnect = session.disconnects->tryReceive();
    if (disconnect) {
      if (session.shell) {
        session.shell->stop();
      }
      return AttemptOutcome::recoverable(ErrorKind::LOST_CONNECTION,
                                         disconnect->reason);
    }

    notifier->waitForChange(generation, MONITOR_WAKEUP);
  }
}

SessionController::AttemptOutcome SessionController::classifyPhaseFailure(
    Session& session, ErrorKind kind, const string& message) {
  if (session.context->isCancelled() || kind == ErrorKind::INTERRUPTED) {
    return AttemptOutcome::interrupted();
  }
  if (kind == ErrorKind::CONFIGURATION || kind == ErrorKind::AUTHENTICATION) {
    return AttemptOutcome::terminal(kind, message);
  }
  if (attempt == 0) {
    return AttemptOutcome::terminal(ErrorKind::FATAL, message);
  }
  return AttemptOutcome::recoverable(kind, message);
}

void SessionController::shutdown(Session& session) {
  if (session.shutDown) {
    return;
  }
  session.shutDown = true;
  VLOG(1) << "Shutting down session " << session.id;

  session.context->cancel();
  // The stops run as tasks so the deadline below bounds them too.
  if (session.shell) {
    auto shell = session.shell;
    session.tasks->spawn("shell-stop", [shell]() { shell->stop(); });
  }
  if (session.tunnels) {
    auto tunnels = session.tunnels;
    session.tasks->spawn("tunnel-stop", [tunnels]() { tunnels->stop(); });
  }
  if (session.syncEngine) {
    auto syncEngine = session.syncEngine;
    session.tasks->spawn("sync-stop", [syncEngine]() { syncEngine->stop(); });
  }
  if (!session.tasks->waitFor(
          std::chrono::milliseconds(manifest.shutdown_timeout_ms()))) {
    LOG(WARNING) << "Session " << session.id
                 << " left tasks running after shutdown";
  }
  if (session.shell && session.shell->isRunning()) {
    session.shell->terminate();
  }

  size_t dropped = session.disconnects->drain() + session.errors->drain() +
                   session.commandOutcomes->drain();
  if (dropped) {
    VLOG(1) << "Dropped " << dropped << " unconsumed session events";
  }
}

void SessionController::setPhase(SessionPhase newPhase,
                                 const TargetIdentity& target) {
  {
    lock_guard<std::mutex> guard(phaseMutex);
    phase = newPhase;
  }
  LOG(INFO) << "Session phase " << newPhase << " (attempt " << attempt << ")";
  if (phaseListener) {
    phaseListener(PhaseChange{newPhase, attempt, previousSignal, target});
  }
}
}  // namespace devlink
