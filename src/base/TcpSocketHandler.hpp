#ifndef __DEVLINK_TCP_SOCKET_HANDLER__
#define __DEVLINK_TCP_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace devlink {
/**
 * @brief SocketHandler over IPv4/IPv6 TCP.
 *
 * Every descriptor it hands out is tracked, so reads and writes on a socket
 * that was already closed fail with EPIPE instead of touching a reused fd.
 */
class TcpSocketHandler : public SocketHandler {
 public:
  TcpSocketHandler();
  virtual ~TcpSocketHandler();

  virtual bool waitForData(int fd, std::chrono::milliseconds timeout);
  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual ssize_t write(int fd, const void* buf, size_t count);

  /** @brief Tries each resolved address with CONNECT_TIMEOUT. */
  virtual int connect(const SocketEndpoint& endpoint);
  /** @brief An empty endpoint name binds every interface. */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint);
  virtual int accept(int fd);
  virtual void stopListening(const SocketEndpoint& endpoint);
  virtual void close(int fd);

  /**
   * @brief Asks the kernel for an unused loopback port by binding port 0.
   * @return The port, or -1 if none could be reserved.
   */
  static int findFreePort();

  static const std::chrono::milliseconds CONNECT_TIMEOUT;

 protected:
  bool isOpen(int fd);
  /** @brief Non-blocking, no SIGPIPE, no Nagle. */
  void configureStream(int fd);
  int connectAddress(const addrinfo* address, const SocketEndpoint& endpoint);

  std::mutex socketMutex;
  set<int> openSockets;
  map<int, set<int>> listenersByPort;
};
}  // namespace devlink

#endif  // __DEVLINK_TCP_SOCKET_HANDLER__
