#include "TaskGroup.hpp"

namespace devlink {
TaskGroup::TaskGroup() : state(new SharedState()) {}

TaskGroup::~TaskGroup() { waitFor(std::chrono::milliseconds(0)); }

void TaskGroup::spawn(const string& name, std::function<void()> task) {
  auto done = make_shared<atomic<bool>>(false);
  auto sharedState = state;
  {
    lock_guard<std::mutex> guard(sharedState->stateMutex);
    sharedState->running++;
  }
  std::thread t([name, task, done, sharedState]() {
    el::Helpers::setThreadName(name);
    try {
      task();
    } catch (const std::exception& ex) {
      STERROR << "Task " << name << " exited with an exception: " << ex.what();
    }
    done->store(true);
    {
      lock_guard<std::mutex> guard(sharedState->stateMutex);
      sharedState->running--;
    }
    sharedState->finished.notify_all();
  });
  lock_guard<std::mutex> guard(tasksMutex);
  tasks.push_back(Task{name, std::move(t), done});
}

bool TaskGroup::waitFor(std::chrono::milliseconds timeout) {
  bool allFinished;
  {
    unique_lock<std::mutex> lock(state->stateMutex);
    allFinished = state->finished.wait_for(
        lock, timeout, [this] { return state->running == 0; });
  }
  vector<Task> toReap;
  {
    lock_guard<std::mutex> guard(tasksMutex);
    toReap.swap(tasks);
  }
  for (auto& task : toReap) {
    if (task.done->load()) {
      task.thread.join();
    } else {
      LOG(WARNING) << "Abandoning task " << task.name
                   << " that did not stop in time";
      task.thread.detach();
    }
  }
  return allFinished;
}

int TaskGroup::getRunningCount() {
  lock_guard<std::mutex> guard(state->stateMutex);
  return state->running;
}
}  // namespace devlink
