#ifndef __DEVLINK_SOCKET_ENDPOINT__
#define __DEVLINK_SOCKET_ENDPOINT__

#include "Headers.hpp"

namespace devlink {
/**
 * @brief A host and TCP port. The tunnel's local side is always loopback; the
 * remote side is whatever address the target resolved to.
 */
class SocketEndpoint {
 public:
  SocketEndpoint(const string &_host, int _port) : host(_host), port(_port) {}

  static SocketEndpoint loopback(int port) {
    return SocketEndpoint("127.0.0.1", port);
  }

  const string &getName() const { return host; }

  int getPort() const { return port; }

 protected:
  string host;
  int port;
};

inline ostream &operator<<(ostream &os, const SocketEndpoint &endpoint) {
  return os << endpoint.getName() << ":" << endpoint.getPort();
}
}  // namespace devlink

#endif  // __DEVLINK_SOCKET_ENDPOINT__
