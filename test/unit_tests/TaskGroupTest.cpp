#include "TaskGroup.hpp"
#include "TestHeaders.hpp"

using namespace devlink;

TEST_CASE("TaskGroup joins finished tasks", "[TaskGroup]") {
  TaskGroup tasks;
  atomic<int> count(0);
  for (int i = 0; i < 4; ++i) {
    tasks.spawn("counter", [&count]() { count++; });
  }
  REQUIRE(tasks.waitFor(std::chrono::seconds(10)));
  REQUIRE(count == 4);
  REQUIRE(tasks.getRunningCount() == 0);
}

TEST_CASE("TaskGroup survives throwing tasks", "[TaskGroup]") {
  TaskGroup tasks;
  tasks.spawn("thrower", []() { throw std::runtime_error("boom"); });
  REQUIRE(tasks.waitFor(std::chrono::seconds(10)));
}

TEST_CASE("TaskGroup abandons stragglers at the deadline", "[TaskGroup]") {
  auto release = make_shared<atomic<bool>>(false);
  auto finished = make_shared<atomic<bool>>(false);
  {
    TaskGroup tasks;
    tasks.spawn("straggler", [release, finished]() {
      while (!release->load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
      }
      finished->store(true);
    });
    auto start = std::chrono::steady_clock::now();
    REQUIRE_FALSE(tasks.waitFor(std::chrono::milliseconds(50)));
    REQUIRE(std::chrono::steady_clock::now() - start <
            std::chrono::seconds(5));
    REQUIRE(tasks.getRunningCount() == 1);
  }
  // The detached thread keeps running after the group is gone.
  release->store(true);
  for (int i = 0; i < 1000 && !finished->load(); ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  REQUIRE(finished->load());
}
