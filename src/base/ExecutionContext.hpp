#ifndef __DEVLINK_EXECUTION_CONTEXT__
#define __DEVLINK_EXECUTION_CONTEXT__

#include "Headers.hpp"

namespace devlink {
/**
 * @brief Cancellation primitive shared by every blocking call in a session.
 *
 * Cancelling a context cancels all of its children. Cancellation is one-way
 * and idempotent.
 */
class ExecutionContext : public std::enable_shared_from_this<ExecutionContext> {
 public:
  ExecutionContext();
  virtual ~ExecutionContext();

  /** @brief Creates a context that is cancelled when this one is. */
  shared_ptr<ExecutionContext> createChild();

  /** @brief Cancels the context and fires every registered listener once. */
  void cancel();

  bool isCancelled() const;

  /**
   * @brief Sleeps for up to `duration`.
   * @return false if the context was cancelled before the time elapsed.
   */
  bool waitFor(std::chrono::milliseconds duration);

  /**
   * @brief Registers a callback run on cancellation. If the context is already
   * cancelled the callback runs immediately on the calling thread.
   * @return An id for removeCancelListener.
   */
  int addCancelListener(std::function<void()> listener);

  void removeCancelListener(int id);

 protected:
  mutable std::mutex contextMutex;
  std::condition_variable cancelCondition;
  bool cancelled;
  int nextListenerId;
  map<int, std::function<void()>> listeners;
};
}  // namespace devlink

#endif  // __DEVLINK_EXECUTION_CONTEXT__
