#include "SessionFakes.hpp"

using namespace devlink;

namespace {
class TestableSessionController : public SessionController {
 public:
  using SessionController::SessionController;
  using SessionController::createSession;
  using SessionController::shutdown;
};

// Wires a controller to the fakes and records its phase changes.
class ControllerFixture {
 public:
  ControllerFixture()
      : script(new SyncScript()),
        resolver(new FakeTargetResolver()),
        shellLauncher(new FakeShellLauncher(script)) {
    manifest = fakeManifest(script);
  }

  ~ControllerFixture() {
    if (runner.joinable()) {
      controller->interrupt();
      runner.join();
    }
  }

  shared_ptr<TestableSessionController> build() {
    controller.reset(new TestableSessionController(
        manifest, resolver, fakeSyncEngineFactory(script), shellLauncher,
        make_shared<TcpSocketHandler>()));
    controller->setPhaseListener([this](const PhaseChange& change) {
      lock_guard<std::mutex> guard(phaseMutex);
      phases.push_back(change);
    });
    return controller;
  }

  SessionResult runToCompletion() {
    build();
    return controller->run();
  }

  void runInBackground() {
    build();
    runner = std::thread([this]() { result = controller->run(); });
  }

  SessionResult join() {
    runner.join();
    return result;
  }

  bool reached(SessionPhase phase, int attempt) {
    return waitUntil([this, phase, attempt]() {
      lock_guard<std::mutex> guard(phaseMutex);
      for (const auto& change : phases) {
        if (change.phase == phase && change.attempt == attempt) {
          return true;
        }
      }
      return false;
    });
  }

  vector<SessionPhase> phaseSequence() {
    lock_guard<std::mutex> guard(phaseMutex);
    vector<SessionPhase> sequence;
    for (const auto& change : phases) {
      sequence.push_back(change.phase);
    }
    return sequence;
  }

  optional<PhaseChange> find(SessionPhase phase, int attempt) {
    lock_guard<std::mutex> guard(phaseMutex);
    for (const auto& change : phases) {
      if (change.phase == phase && change.attempt == attempt) {
        return change;
      }
    }
    return std::nullopt;
  }

  SessionManifest manifest;
  shared_ptr<SyncScript> script;
  shared_ptr<FakeTargetResolver> resolver;
  shared_ptr<FakeShellLauncher> shellLauncher;
  shared_ptr<TestableSessionController> controller;

  std::mutex phaseMutex;
  vector<PhaseChange> phases;
  std::thread runner;
  SessionResult result;
};

bool contains(const vector<SessionPhase>& sequence, SessionPhase phase) {
  return std::find(sequence.begin(), sequence.end(), phase) != sequence.end();
}
}  // namespace

TEST_CASE("A fresh session runs the command and exits cleanly",
          "[SessionController]") {
  ControllerFixture fixture;
  fixture.shellLauncher->plans = {ShellPlan::exits(0)};

  SessionResult result = fixture.runToCompletion();

  REQUIRE(result.outcome == SessionResult::Outcome::CLEAN);
  REQUIRE(result.isClean());
  REQUIRE(fixture.phaseSequence() ==
          vector<SessionPhase>{SessionPhase::CONNECTING, SessionPhase::SYNCING,
                               SessionPhase::FINALIZING, SessionPhase::RUNNING,
                               SessionPhase::TERMINATED});
  REQUIRE(fixture.script->count("override") == 1);
  REQUIRE(fixture.script->count("mode:sendreceive") == 1);
  REQUIRE(fixture.script->count("restart") == 1);
  REQUIRE(fixture.script->count("stop") == 1);
  REQUIRE(fixture.controller->getPhase() == SessionPhase::TERMINATED);

  auto ready = fixture.find(SessionPhase::RUNNING, 0);
  REQUIRE(ready);
  REQUIRE(ready->target.name() == "api");
  REQUIRE(ready->target.endpoints(0) == "https://api.dev.example.com");
  REQUIRE_FALSE(ready->previous);

  // Exactly one terminal event
  auto exitChannel = fixture.controller->getExitChannel();
  REQUIRE(exitChannel->tryReceive());
  REQUIRE(exitChannel->empty());
}

TEST_CASE("The first drain completes before the mode flip",
          "[SessionController]") {
  ControllerFixture fixture;
  fixture.shellLauncher->plans = {ShellPlan::exits(0)};
  fixture.runToCompletion();

  int ping = fixture.script->indexOf("ping");
  int drain = fixture.script->indexOf("drain");
  int overrideLocal = fixture.script->indexOf("override");
  int flip = fixture.script->indexOf("mode:sendreceive");
  int restart = fixture.script->indexOf("restart");
  REQUIRE(fixture.script->indexOf("start") < ping);
  REQUIRE(ping < drain);
  REQUIRE(drain < overrideLocal);
  REQUIRE(overrideLocal < flip);
  REQUIRE(flip < restart);
  REQUIRE(fixture.script->count("mode:sendonly") == 0);
  REQUIRE(fixture.script->count("drain") == 2);
}

TEST_CASE("A failed command while sync is disconnected reconnects",
          "[SessionController]") {
  ControllerFixture fixture;
  fixture.shellLauncher->plans = {ShellPlan::hold(), ShellPlan::exits(0)};
  fixture.runInBackground();

  REQUIRE(fixture.reached(SessionPhase::RUNNING, 0));
  fixture.script->connected = false;
  fixture.shellLauncher->exitHeldShell(2);

  SessionResult result = fixture.join();
  REQUIRE(result.outcome == SessionResult::Outcome::CLEAN);
  REQUIRE(fixture.script->enginesCreated == 2);

  auto reconnecting = fixture.find(SessionPhase::RECONNECTING, 0);
  REQUIRE(reconnecting);
  REQUIRE(*reconnecting->previous == ErrorKind::COMMAND_FAILED);
  REQUIRE(fixture.find(SessionPhase::CONNECTING, 1));
  auto sequence = fixture.phaseSequence();
  REQUIRE(contains(sequence, SessionPhase::DISCONNECTED));
}

TEST_CASE("A failed command while sync is connected is terminal",
          "[SessionController]") {
  ControllerFixture fixture;
  fixture.shellLauncher->plans = {ShellPlan::exits(2)};

  SessionResult result = fixture.runToCompletion();

  REQUIRE(result.outcome == SessionResult::Outcome::FAILED);
  REQUIRE(result.kind == ErrorKind::COMMAND_FAILED);
  REQUIRE(result.lastTarget.name() == "api");
  REQUIRE(result.lastTarget.endpoints(0) == "https://api.dev.example.com");
  REQUIRE(fixture.script->enginesCreated == 1);
}

TEST_CASE("A sync disconnect stops the shell and reconnects",
          "[SessionController]") {
  ControllerFixture fixture;
  fixture.shellLauncher->plans = {ShellPlan::hold(), ShellPlan::exits(0)};
  fixture.runInBackground();

  REQUIRE(fixture.reached(SessionPhase::RUNNING, 0));
  fixture.script->disconnectRequested = true;

  SessionResult result = fixture.join();
  REQUIRE(result.outcome == SessionResult::Outcome::CLEAN);

  auto firstShell = fixture.shellLauncher->getHandle(0);
  REQUIRE(firstShell->stops >= 1);
  // It never exited by itself, so shutdown escalated.
  REQUIRE(firstShell->terminations == 1);

  auto reconnected = fixture.find(SessionPhase::RUNNING, 1);
  REQUIRE(reconnected);
  REQUIRE(*reconnected->previous == ErrorKind::LOST_CONNECTION);
  REQUIRE(fixture.shellLauncher->getLaunchCount() == 2);
}

TEST_CASE("A successful command wins over a simultaneous disconnect",
          "[SessionController]") {
  ControllerFixture fixture;
  fixture.shellLauncher->plans = {ShellPlan::exitsWithDisconnect(0)};

  SessionResult result = fixture.runToCompletion();

  REQUIRE(result.outcome == SessionResult::Outcome::CLEAN);
  REQUIRE(fixture.script->enginesCreated == 1);
  REQUIRE_FALSE(contains(fixture.phaseSequence(), SessionPhase::RECONNECTING));
}

TEST_CASE("A failed command with a pending disconnect is a lost connection",
          "[SessionController]") {
  ControllerFixture fixture;
  fixture.shellLauncher->plans = {ShellPlan::exitsWithDisconnect(1),
                                  ShellPlan::exits(0)};

  SessionResult result = fixture.runToCompletion();

  REQUIRE(result.outcome == SessionResult::Outcome::CLEAN);
  auto reconnecting = fixture.find(SessionPhase::RECONNECTING, 0);
  REQUIRE(reconnecting);
  REQUIRE(*reconnecting->previous == ErrorKind::LOST_CONNECTION);
}

TEST_CASE("An interrupt while syncing shuts down cleanly",
          "[SessionController]") {
  ControllerFixture fixture;
  fixture.script->drainBlocked = true;
  fixture.runInBackground();

  REQUIRE(fixture.reached(SessionPhase::SYNCING, 0));
  REQUIRE(waitUntil([&]() { return fixture.script->count("drain") == 1; }));
  auto start = std::chrono::steady_clock::now();
  fixture.controller->interrupt();

  SessionResult result = fixture.join();
  REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
  REQUIRE(result.outcome == SessionResult::Outcome::INTERRUPTED);
  REQUIRE(result.isClean());
  REQUIRE(fixture.script->count("stop") == 1);
  REQUIRE(fixture.shellLauncher->getLaunchCount() == 0);
  REQUIRE_FALSE(contains(fixture.phaseSequence(), SessionPhase::RUNNING));
}

TEST_CASE("An interrupt while running stops the shell",
          "[SessionController]") {
  ControllerFixture fixture;
  fixture.shellLauncher->plans = {ShellPlan::hold()};
  fixture.runInBackground();

  REQUIRE(fixture.reached(SessionPhase::RUNNING, 0));
  fixture.controller->interrupt();

  SessionResult result = fixture.join();
  REQUIRE(result.outcome == SessionResult::Outcome::INTERRUPTED);
  REQUIRE(fixture.shellLauncher->getHandle(0)->stops >= 1);
}

TEST_CASE("A failed target resolution is returned unchanged",
          "[SessionController]") {
  ControllerFixture fixture;
  fixture.resolver->failure =
      SessionError(ErrorKind::NOT_FOUND, "workload 'api' does not exist");

  SessionResult result = fixture.runToCompletion();

  REQUIRE(result.outcome == SessionResult::Outcome::FAILED);
  REQUIRE(result.kind == ErrorKind::NOT_FOUND);
  REQUIRE(result.message == "workload 'api' does not exist");
  REQUIRE(fixture.script->enginesCreated == 0);
  REQUIRE_FALSE(contains(fixture.phaseSequence(), SessionPhase::SYNCING));
}

TEST_CASE("Sync failures on the first attempt are fatal",
          "[SessionController]") {
  ControllerFixture fixture;
  fixture.script->failures.emplace(
      make_pair(0, string("ping")),
      SessionError(ErrorKind::LOST_CONNECTION, "daemon unreachable"));

  SessionResult result = fixture.runToCompletion();

  REQUIRE(result.outcome == SessionResult::Outcome::FAILED);
  REQUIRE(result.kind == ErrorKind::FATAL);
  REQUIRE(result.message == "daemon unreachable");
  REQUIRE(fixture.script->count("stop") == 1);
}

TEST_CASE("Sync failures after a reconnect are retried",
          "[SessionController]") {
  ControllerFixture fixture;
  fixture.shellLauncher->plans = {ShellPlan::hold(), ShellPlan::exits(0)};
  fixture.script->failures.emplace(
      make_pair(1, string("ping")),
      SessionError(ErrorKind::LOST_CONNECTION, "daemon restarting"));
  fixture.runInBackground();

  REQUIRE(fixture.reached(SessionPhase::RUNNING, 0));
  fixture.script->disconnectRequested = true;

  SessionResult result = fixture.join();
  REQUIRE(result.outcome == SessionResult::Outcome::CLEAN);
  REQUIRE(fixture.script->enginesCreated == 3);
  REQUIRE(fixture.find(SessionPhase::RUNNING, 2));
}

TEST_CASE("Authentication failures are never retried",
          "[SessionController]") {
  ControllerFixture fixture;
  fixture.shellLauncher->plans = {ShellPlan::hold()};
  fixture.script->failures.emplace(
      make_pair(1, string("ping")),
      SessionError(ErrorKind::AUTHENTICATION, "bad api key"));
  fixture.runInBackground();

  REQUIRE(fixture.reached(SessionPhase::RUNNING, 0));
  fixture.script->disconnectRequested = true;

  SessionResult result = fixture.join();
  REQUIRE(result.outcome == SessionResult::Outcome::FAILED);
  REQUIRE(result.kind == ErrorKind::AUTHENTICATION);
  REQUIRE(fixture.script->enginesCreated == 2);
}

TEST_CASE("Duplicate forwards fail the session as a configuration error",
          "[SessionController]") {
  ControllerFixture fixture;
  ForwardBinding clash;
  clash.set_local_port(fixture.script->controlPort);
  clash.set_remote_port(1);
  *fixture.manifest.add_forwards() = clash;

  SessionResult result = fixture.runToCompletion();

  REQUIRE(result.outcome == SessionResult::Outcome::FAILED);
  REQUIRE(result.kind == ErrorKind::CONFIGURATION);
}

TEST_CASE("Shutdown drains every channel and runs once",
          "[SessionController]") {
  ControllerFixture fixture;
  auto controller = fixture.build();
  Session session = controller->createSession();
  session.errors->trySend(SessionError(ErrorKind::FATAL, "tunnel failed"));
  session.disconnects->trySend(DisconnectEvent{"gone"});
  session.commandOutcomes->trySend(CommandOutcome::exited(0));

  controller->shutdown(session);
  REQUIRE(session.shutDown);
  REQUIRE(session.context->isCancelled());
  REQUIRE(session.errors->empty());
  REQUIRE(session.disconnects->empty());
  REQUIRE(session.commandOutcomes->empty());

  // A second call touches nothing
  session.errors->trySend(SessionError(ErrorKind::FATAL, "late"));
  controller->shutdown(session);
  REQUIRE(session.errors->size() == 1);
}

TEST_CASE("Shutdown is bounded by the timeout when the engine stop hangs",
          "[SessionController]") {
  ControllerFixture fixture;
  fixture.manifest.set_shutdown_timeout_ms(300);
  fixture.script->stopDelayMs = 3000;
  auto controller = fixture.build();
  Session session = controller->createSession();
  session.syncEngine = make_shared<FakeSyncEngine>(fixture.script, 0);

  auto begin = std::chrono::steady_clock::now();
  controller->shutdown(session);
  auto elapsed = std::chrono::steady_clock::now() - begin;

  REQUIRE(elapsed < std::chrono::milliseconds(1500));
  REQUIRE(fixture.script->count("stop") == 1);
  REQUIRE(session.context->isCancelled());
}
