#ifndef __DEVLINK_PORT_TUNNEL_MANAGER__
#define __DEVLINK_PORT_TUNNEL_MANAGER__

#include "Channel.hpp"
#include "ExecutionContext.hpp"
#include "Headers.hpp"
#include "SessionError.hpp"
#include "SocketHandler.hpp"
#include "TaskGroup.hpp"
#include "TunnelBinding.hpp"

namespace devlink {
/**
 * @brief Owns the session's local-to-remote port bindings.
 *
 * Bindings are registered before start(). Each started binding runs on its
 * own task; a binding that fails reports on the error channel without
 * affecting its siblings.
 */
class PortTunnelManager {
 public:
  PortTunnelManager(shared_ptr<SocketHandler> _socketHandler,
                    const TunnelSettings& _settings,
                    shared_ptr<Channel<SessionError>> _errors);

  ~PortTunnelManager();

  /**
   * @throws SessionError of kind CONFIGURATION for a duplicate local port or
   * when called after start().
   */
  void registerBinding(const ForwardBinding& binding);

  void registerBinding(int localPort, int remotePort);

  /**
   * @brief Starts every registered binding against `targetAddress` and
   * returns once each one is listening or has failed.
   */
  void start(const string& targetAddress, const string& namespaceName,
             shared_ptr<ExecutionContext> context);

  /** @brief Cancels every binding and waits for them. Idempotent. */
  void stop();

  bool isStarted();

  vector<ForwardBinding> getBindings();

  /** @brief Number of bindings that started listening. */
  int getListeningCount();

 protected:
  shared_ptr<SocketHandler> socketHandler;
  TunnelSettings settings;
  shared_ptr<Channel<SessionError>> errors;

  std::mutex managerMutex;
  vector<ForwardBinding> bindings;
  set<int> localPorts;
  bool started;
  bool stopped;
  shared_ptr<ExecutionContext> tunnelContext;
  TaskGroup tasks;
  vector<shared_ptr<TunnelBinding>> activeBindings;
};
}  // namespace devlink

#endif  // __DEVLINK_PORT_TUNNEL_MANAGER__
