#ifndef __DEVLINK_CHANNEL__
#define __DEVLINK_CHANNEL__

#include "Headers.hpp"

namespace devlink {
/**
 * @brief Wakes a single reader that selects across several channels.
 *
 * Every send on a channel bound to the notifier bumps a generation counter,
 * so a reader that snapshots the generation before checking its channels
 * never misses a wakeup.
 */
class EventNotifier {
 public:
  EventNotifier() : generation(0) {}

  void notify() {
    {
      lock_guard<std::mutex> guard(notifierMutex);
      ++generation;
    }
    condition.notify_all();
  }

  uint64_t getGeneration() {
    lock_guard<std::mutex> guard(notifierMutex);
    return generation;
  }

  /**
   * @brief Waits until the generation moves past `seen`.
   * @return true if something was notified before the timeout.
   */
  bool waitForChange(uint64_t seen, std::chrono::milliseconds timeout) {
    unique_lock<std::mutex> lock(notifierMutex);
    return condition.wait_for(lock, timeout,
                              [this, seen] { return generation != seen; });
  }

 protected:
  std::mutex notifierMutex;
  std::condition_variable condition;
  uint64_t generation;
};

/**
 * @brief Bounded multi-writer/single-reader queue. Sends never block: a send
 * to a full channel is rejected and the caller decides whether that means
 * coalesced or dropped.
 */
template <typename T>
class Channel {
 public:
  Channel(const string& _name, size_t _capacity,
          shared_ptr<EventNotifier> _notifier = nullptr)
      : name(_name), capacity(_capacity), notifier(_notifier) {
    if (capacity == 0) {
      STFATAL << "Channel " << name << " needs a capacity of at least one";
    }
  }

  /** @return false if the channel was full and `value` was not queued. */
  bool trySend(const T& value) {
    {
      lock_guard<std::mutex> guard(channelMutex);
      if (queue.size() >= capacity) {
        return false;
      }
      queue.push_back(value);
    }
    condition.notify_all();
    if (notifier) {
      notifier->notify();
    }
    return true;
  }

  optional<T> tryReceive() {
    lock_guard<std::mutex> guard(channelMutex);
    if (queue.empty()) {
      return std::nullopt;
    }
    T value = queue.front();
    queue.pop_front();
    return value;
  }

  /** @brief Blocks up to `timeout` for a value. */
  optional<T> receive(std::chrono::milliseconds timeout) {
    unique_lock<std::mutex> lock(channelMutex);
    if (!condition.wait_for(lock, timeout, [this] { return !queue.empty(); })) {
      return std::nullopt;
    }
    T value = queue.front();
    queue.pop_front();
    return value;
  }

  bool empty() {
    lock_guard<std::mutex> guard(channelMutex);
    return queue.empty();
  }

  size_t size() {
    lock_guard<std::mutex> guard(channelMutex);
    return queue.size();
  }

  /** @brief Discards everything queued and returns how many were dropped. */
  size_t drain() {
    lock_guard<std::mutex> guard(channelMutex);
    size_t dropped = queue.size();
    queue.clear();
    return dropped;
  }

  const string& getName() const { return name; }

 protected:
  string name;
  size_t capacity;
  shared_ptr<EventNotifier> notifier;
  std::mutex channelMutex;
  std::condition_variable condition;
  deque<T> queue;
};
}  // namespace devlink

#endif  // __DEVLINK_CHANNEL__
