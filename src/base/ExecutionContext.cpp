#include "ExecutionContext.hpp"

namespace devlink {
ExecutionContext::ExecutionContext() : cancelled(false), nextListenerId(0) {}

ExecutionContext::~ExecutionContext() {}

shared_ptr<ExecutionContext> ExecutionContext::createChild() {
  auto child = make_shared<ExecutionContext>();
  weak_ptr<ExecutionContext> weakChild = child;
  int listenerId = addCancelListener([weakChild]() {
    auto c = weakChild.lock();
    if (c) {
      c->cancel();
    }
  });
  // Detach from the parent once the child is cancelled so long-lived parents
  // do not accumulate dead listeners.
  weak_ptr<ExecutionContext> weakParent = shared_from_this();
  child->addCancelListener([weakParent, listenerId]() {
    auto p = weakParent.lock();
    if (p) {
      p->removeCancelListener(listenerId);
    }
  });
  return child;
}

void ExecutionContext::cancel() {
  map<int, std::function<void()>> toFire;
  {
    lock_guard<std::mutex> guard(contextMutex);
    if (cancelled) {
      return;
    }
    cancelled = true;
    toFire.swap(listeners);
  }
  cancelCondition.notify_all();
  VLOG(1) << "Execution context cancelled, firing " << toFire.size()
          << " listeners";
  for (auto& it : toFire) {
    it.second();
  }
}

bool ExecutionContext::isCancelled() const {
  lock_guard<std::mutex> guard(contextMutex);
  return cancelled;
}

bool ExecutionContext::waitFor(std::chrono::milliseconds duration) {
  unique_lock<std::mutex> lock(contextMutex);
  return !cancelCondition.wait_for(lock, duration,
                                   [this] { return cancelled; });
}

int ExecutionContext::addCancelListener(std::function<void()> listener) {
  {
    lock_guard<std::mutex> guard(contextMutex);
    if (!cancelled) {
      int id = nextListenerId++;
      listeners[id] = listener;
      return id;
    }
  }
  listener();
  return -1;
}

void ExecutionContext::removeCancelListener(int id) {
  lock_guard<std::mutex> guard(contextMutex);
  listeners.erase(id);
}
}  // namespace devlink
