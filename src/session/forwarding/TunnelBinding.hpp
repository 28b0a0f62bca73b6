#ifndef __DEVLINK_TUNNEL_BINDING__
#define __DEVLINK_TUNNEL_BINDING__

#include "Channel.hpp"
#include "ExecutionContext.hpp"
#include "Headers.hpp"
#include "SessionError.hpp"
#include "SocketHandler.hpp"

namespace devlink {
/**
 * @brief Relays one local port to `targetAddress:remotePort`.
 *
 * Every accepted local connection gets its own remote connection and bytes
 * are pumped both ways until either side closes.
 */
class TunnelBinding {
 public:
  TunnelBinding(shared_ptr<SocketHandler> _socketHandler,
                const ForwardBinding& _binding, const string& targetAddress,
                const TunnelSettings& _settings,
                shared_ptr<Channel<SessionError>> _errors);

  ~TunnelBinding();

  /**
   * @brief Binds the local port.
   * @throws std::runtime_error if the port cannot be bound.
   */
  void listen();

  /** @brief Accepts and relays until the context is cancelled. */
  void run(shared_ptr<ExecutionContext> context);

  const ForwardBinding& getBinding() const { return binding; }

  inline SocketEndpoint getSource() { return source; }

  inline SocketEndpoint getDestination() { return destination; }

  /** @brief Number of relayed connection pairs currently open. */
  int getConnectionCount() { return connectionCount; }

 protected:
  enum class PumpResult { IDLE, MOVED, CLOSED };

  int acceptConnection();
  /** @brief Connects to the destination, retrying with a linear backoff. */
  int connectDestination(shared_ptr<ExecutionContext> context);
  /** @return true if any bytes moved. */
  bool update();
  PumpResult pump(int fromFd, int toFd);
  void closeAll();

  shared_ptr<SocketHandler> socketHandler;
  ForwardBinding binding;
  SocketEndpoint source;
  SocketEndpoint destination;
  TunnelSettings settings;
  shared_ptr<Channel<SessionError>> errors;
  bool listening;
  /** @brief Local fd to the remote fd it is relayed to. */
  map<int, int> sourceToDestination;
  atomic<int> connectionCount;
};
}  // namespace devlink

#endif  // __DEVLINK_TUNNEL_BINDING__
