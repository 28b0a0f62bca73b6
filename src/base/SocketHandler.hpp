#ifndef __DEVLINK_SOCKET_HANDLER__
#define __DEVLINK_SOCKET_HANDLER__

#include "Headers.hpp"
#include "SocketEndpoint.hpp"

namespace devlink {
/**
 * @brief Byte-stream sockets as seen by the tunnel relay.
 *
 * Descriptors are non-blocking. Implementations must be safe to call from
 * several binding threads at once.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /** @brief Blocks up to `timeout` until `fd` is readable or closed. */
  virtual bool waitForData(int fd, std::chrono::milliseconds timeout) = 0;

  bool hasData(int fd) {
    return waitForData(fd, std::chrono::milliseconds(0));
  }

  /** @brief One non-blocking read. Sets errno to EAGAIN when empty. */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /** @brief One non-blocking write. May write less than `count`. */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Writes the whole buffer, waiting while the peer is slow.
   * @return false on a socket error or when no progress is made for
   * WRITE_STALL_TIMEOUT.
   */
  bool writeAll(int fd, const void* buf, size_t count);

  /** @return A connected descriptor, or -1 when the endpoint is unreachable. */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Binds every address of the endpoint.
   * @throws std::runtime_error when the port cannot be bound.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint) = 0;
  virtual set<int> getEndpointFds(const SocketEndpoint& endpoint) = 0;
  /** @return The client fd, or -1 when nothing is pending. */
  virtual int accept(int fd) = 0;
  virtual void stopListening(const SocketEndpoint& endpoint) = 0;
  virtual void close(int fd) = 0;

  static const std::chrono::seconds WRITE_STALL_TIMEOUT;
};
}  // namespace devlink

#endif  // __DEVLINK_SOCKET_HANDLER__
