#ifndef __DEVLINK_TASK_GROUP__
#define __DEVLINK_TASK_GROUP__

#include "Headers.hpp"

namespace devlink {
/**
 * @brief A set of named background threads that can be waited on with a
 * deadline.
 *
 * Threads still running when the deadline passes are detached, never killed.
 * Their bookkeeping is shared so a detached thread can outlive the group.
 */
class TaskGroup {
 public:
  TaskGroup();
  ~TaskGroup();

  /**
   * @brief Starts `task` on a new thread named `name`. Exceptions escaping the
   * task are logged.
   */
  void spawn(const string& name, std::function<void()> task);

  /**
   * @brief Waits for every task to finish.
   * @return false if some tasks were still running at the deadline and have
   * been abandoned.
   */
  bool waitFor(std::chrono::milliseconds timeout);

  /** @brief Number of spawned tasks that have not returned yet. */
  int getRunningCount();

 protected:
  struct SharedState {
    std::mutex stateMutex;
    std::condition_variable finished;
    int running = 0;
  };

  struct Task {
    string name;
    std::thread thread;
    shared_ptr<atomic<bool>> done;
  };

  shared_ptr<SharedState> state;
  std::mutex tasksMutex;
  vector<Task> tasks;
};
}  // namespace devlink

#endif  // __DEVLINK_TASK_GROUP__
