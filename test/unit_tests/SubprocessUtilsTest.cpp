#include "SubprocessUtils.hpp"

#include "TestHeaders.hpp"

using namespace devlink;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("SubprocessUtils reports the exit code", "[SubprocessUtils]") {
  SubprocessUtils utils;
  pid_t pid = utils.spawn("sh", {"-c", "exit 7"});
  REQUIRE(pid > 0);
  REQUIRE(utils.waitForExit(pid) == 7);
}

TEST_CASE("SubprocessUtils passes arguments without a shell",
          "[SubprocessUtils]") {
  string path = GetTempDirectory() + "devlink_subprocess_args_" +
                to_string(getpid());
  SubprocessUtils utils;
  pid_t pid = utils.spawn("sh", {"-c", "printf '%s' \"$1\" > \"$0\"", path,
                                 "hello world"});
  REQUIRE(utils.waitForExit(pid) == 0);

  ifstream in(path);
  string contents((std::istreambuf_iterator<char>(in)),
                  std::istreambuf_iterator<char>());
  REQUIRE(contents == "hello world");
  fs::remove(path);
}

TEST_CASE("SubprocessUtils throws when the binary is missing",
          "[SubprocessUtils]") {
  SubprocessUtils utils;
  REQUIRE_THROWS_WITH(utils.spawn("/nonexistent/devlink-binary", {}),
                      ContainsSubstring("Failed to run"));
}

TEST_CASE("SubprocessUtils polls and terminates children",
          "[SubprocessUtils]") {
  SubprocessUtils utils;
  pid_t pid = utils.spawn("sleep", {"30"}, true);
  int exitCode = 0;
  REQUIRE_FALSE(utils.hasExited(pid, &exitCode));

  utils.terminate(pid);
  // Already reaped
  REQUIRE(::kill(pid, 0) == -1);
}

TEST_CASE("SubprocessUtils kills a child that ignores SIGTERM",
          "[SubprocessUtils]") {
  string ready = GetTempDirectory() + "devlink_subprocess_trap_" +
                 to_string(getpid());
  fs::remove(ready);
  SubprocessUtils utils;
  pid_t pid = utils.spawn(
      "sh", {"-c", "trap '' TERM; touch \"$0\"; while :; do sleep 0.1; done",
             ready},
      true);
  for (int a = 0; a < 500 && !fs::exists(ready); a++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  REQUIRE(fs::exists(ready));

  auto begin = std::chrono::steady_clock::now();
  utils.terminate(pid, 200);
  auto elapsed = std::chrono::steady_clock::now() - begin;
  REQUIRE(elapsed >= std::chrono::milliseconds(200));
  REQUIRE(elapsed < std::chrono::milliseconds(2000));
  REQUIRE(::kill(pid, 0) == -1);
  fs::remove(ready);
}

TEST_CASE("SubprocessUtils maps signals above 128", "[SubprocessUtils]") {
  SubprocessUtils utils;
  pid_t pid = utils.spawn("sleep", {"30"}, true);
  REQUIRE(::kill(pid, SIGKILL) == 0);
  REQUIRE(utils.waitForExit(pid) == 128 + SIGKILL);
}
