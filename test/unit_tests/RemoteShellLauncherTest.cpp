#include "RemoteShellLauncher.hpp"
#include "TestHeaders.hpp"

using namespace devlink;

namespace {
TargetIdentity testTarget() {
  TargetIdentity target;
  target.set_name("api");
  target.set_namespace_name("dev");
  target.set_workload("api-7f9c");
  target.set_address("127.0.0.1");
  return target;
}

SessionManifest manifestFor(const string& execBinary) {
  SessionManifest manifest;
  manifest.set_name("api");
  manifest.mutable_shell()->set_exec_binary(execBinary);
  return manifest;
}

string readFile(const string& path) {
  ifstream in(path);
  return string((std::istreambuf_iterator<char>(in)),
                std::istreambuf_iterator<char>());
}
}  // namespace

TEST_CASE("Exec arguments name the workload, port and command",
          "[RemoteShellLauncher]") {
  SessionManifest manifest = manifestFor("kubectl");
  RemoteShellLauncher launcher(manifest, make_shared<SubprocessUtils>());

  SECTION("Default command is sh") {
    auto args = launcher.buildExecArguments(testTarget(), 15001);
    REQUIRE(args == vector<string>{"exec", "--pod", "api-7f9c", "--port",
                                   "15001", "-n", "dev", "--", "sh"});
  }

  SECTION("Declared command without a namespace") {
    manifest.mutable_shell()->add_command("bash");
    manifest.mutable_shell()->add_command("-l");
    RemoteShellLauncher commandLauncher(manifest,
                                        make_shared<SubprocessUtils>());
    TargetIdentity target = testTarget();
    target.clear_namespace_name();
    auto args = commandLauncher.buildExecArguments(target, 15001);
    REQUIRE(args == vector<string>{"exec", "--pod", "api-7f9c", "--port",
                                   "15001", "--", "bash", "-l"});
  }
}

TEST_CASE("Control ports are free loopback ports", "[RemoteShellLauncher]") {
  int port = RemoteShellLauncher::pickControlPort();
  REQUIRE(port > 0);
  REQUIRE(port < 65536);
}

TEST_CASE("The shell outcome is delivered once on the channel",
          "[RemoteShellLauncher]") {
  string base = GetTempDirectory() + "devlink_shell_" + to_string(getpid());
  string script = base + ".sh";
  string argsFile = base + ".args";
  {
    ofstream out(script);
    out << "#!/bin/sh\nprintf '%s\\n' \"$@\" > " << argsFile << "\nexit 3\n";
  }
  fs::permissions(script, fs::perms::owner_all);

  RemoteShellLauncher launcher(manifestFor(script),
                               make_shared<SubprocessUtils>());
  auto tasks = make_shared<TaskGroup>();
  auto outcomes = make_shared<Channel<CommandOutcome>>("command", 1);
  auto handle = launcher.launch(testTarget(), tasks, outcomes);

  auto outcome = outcomes->receive(std::chrono::seconds(10));
  REQUIRE(outcome);
  REQUIRE(outcome->spawned);
  REQUIRE(outcome->exitCode == 3);
  REQUIRE_FALSE(outcome->succeeded());
  REQUIRE(tasks->waitFor(std::chrono::seconds(10)));
  REQUIRE_FALSE(handle->isRunning());
  REQUIRE(outcomes->empty());

  string recorded = readFile(argsFile);
  REQUIRE(recorded.find("exec\n--pod\napi-7f9c\n--port\n" +
                        to_string(handle->getControlPort()) + "\n") == 0);

  fs::remove(script);
  fs::remove(argsFile);
}

TEST_CASE("A spawn failure is reported as an outcome",
          "[RemoteShellLauncher]") {
  RemoteShellLauncher launcher(manifestFor("/nonexistent/devlink-exec"),
                               make_shared<SubprocessUtils>());
  auto tasks = make_shared<TaskGroup>();
  auto outcomes = make_shared<Channel<CommandOutcome>>("command", 1);
  auto handle = launcher.launch(testTarget(), tasks, outcomes);

  auto outcome = outcomes->tryReceive();
  REQUIRE(outcome);
  REQUIRE_FALSE(outcome->spawned);
  REQUIRE_FALSE(outcome->error.empty());
  REQUIRE_FALSE(handle->isRunning());
  // Nothing to stop
  handle->stop();
  handle->terminate();
}

TEST_CASE("Stop asks the exec control endpoint to exit",
          "[RemoteShellLauncher]") {
  atomic<int> requests(0);
  httplib::Server server;
  server.Get("/", [&requests](const httplib::Request&, httplib::Response& res) {
    requests++;
    res.set_content("ok", "text/plain");
  });
  int port = server.bind_to_any_port("127.0.0.1");
  std::thread serverThread([&server]() { server.listen_after_bind(); });
  while (!server.is_running()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }

  RemoteShellHandle handle(port);
  handle.stop();
  REQUIRE(requests == 0);

  handle.setPid(getpid());
  REQUIRE(handle.isRunning());
  handle.stop();
  REQUIRE(requests == 1);

  handle.markExited();
  REQUIRE_FALSE(handle.isRunning());

  server.stop();
  serverThread.join();
}
