#ifndef __DEVLINK_SYNC_ENGINE__
#define __DEVLINK_SYNC_ENGINE__

#include "ExecutionContext.hpp"
#include "Headers.hpp"
#include "SessionError.hpp"

namespace devlink {
/**
 * @brief The file synchronization engine a session supervises.
 *
 * Blocking calls observe the context and throw SessionError on failure, with
 * kind INTERRUPTED when the context was cancelled.
 */
class SyncEngine {
 public:
  virtual ~SyncEngine() {}

  /**
   * @brief Brings the daemon up with the folder in the engine's current mode
   * (SEND_ONLY for a new engine), even if the daemon kept an older type.
   */
  virtual void start(shared_ptr<ExecutionContext> context) = 0;
  /** @brief Safe to call more than once and on an engine never started. */
  virtual void stop() = 0;

  /** @brief Blocks until the engine answers its readiness check. */
  virtual void waitForPing(shared_ptr<ExecutionContext> context) = 0;
  /** @brief Blocks until no transfers are pending. */
  virtual void waitDrained(shared_ptr<ExecutionContext> context) = 0;
  /** @brief Makes local state win every conflict, once. */
  virtual void overrideLocal(shared_ptr<ExecutionContext> context) = 0;
  /** @brief Takes effect on the next restart. */
  virtual void setMode(SyncMode mode) = 0;
  virtual void restart(shared_ptr<ExecutionContext> context) = 0;

  virtual bool isConnected() = 0;

  /**
   * @brief Watches engine health until the context is cancelled, calling
   * `onDisconnect` when the engine drops.
   */
  virtual void monitor(
      shared_ptr<ExecutionContext> context,
      std::function<void(const string&)> onDisconnect) = 0;

  /** @brief Tunnel binding for the engine's control traffic. */
  virtual ForwardBinding controlBinding() = 0;
  /** @brief Tunnel binding for the engine's web GUI. */
  virtual ForwardBinding guiBinding() = 0;
};

/**
 * @brief Builds a fresh engine for every connection attempt.
 */
typedef std::function<shared_ptr<SyncEngine>(const SessionManifest&,
                                             const TargetIdentity&)>
    SyncEngineFactory;
}  // namespace devlink

#endif  // __DEVLINK_SYNC_ENGINE__
