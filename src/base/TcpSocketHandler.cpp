#include "TcpSocketHandler.hpp"

namespace devlink {
namespace {
void setNonBlocking(int fd) {
  int opts = fcntl(fd, F_GETFL);
  FATAL_FAIL_UNLESS_EINVAL(opts);
  FATAL_FAIL_UNLESS_EINVAL(fcntl(fd, F_SETFL, opts | O_NONBLOCK));
}

struct AddrInfoDeleter {
  void operator()(addrinfo* info) const {
    if (info) {
      freeaddrinfo(info);
    }
  }
};
typedef std::unique_ptr<addrinfo, AddrInfoDeleter> AddrInfoPtr;

AddrInfoPtr resolve(const SocketEndpoint& endpoint, int flags) {
  addrinfo hints;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = flags;
  string port = to_string(endpoint.getPort());
  const char* host =
      endpoint.getName().empty() ? NULL : endpoint.getName().c_str();

  addrinfo* results = NULL;
  int rc = getaddrinfo(host, port.c_str(), &hints, &results);
  AddrInfoPtr owned(results);
  if (rc != 0) {
    stringstream ss;
    ss << "cannot resolve " << endpoint << ": " << gai_strerror(rc);
    throw std::runtime_error(ss.str());
  }
  return owned;
}
}  // namespace

const std::chrono::milliseconds TcpSocketHandler::CONNECT_TIMEOUT(3000);

TcpSocketHandler::TcpSocketHandler() {}

TcpSocketHandler::~TcpSocketHandler() {
  lock_guard<std::mutex> guard(socketMutex);
  for (int fd : openSockets) {
    ::close(fd);
  }
  for (auto& it : listenersByPort) {
    for (int fd : it.second) {
      ::close(fd);
    }
  }
}

bool TcpSocketHandler::isOpen(int fd) {
  lock_guard<std::mutex> guard(socketMutex);
  return openSockets.count(fd) > 0;
}

bool TcpSocketHandler::waitForData(int fd, std::chrono::milliseconds timeout) {
  pollfd pfd;
  pfd.fd = fd;
  pfd.events = POLLIN;
  pfd.revents = 0;
  int n = poll(&pfd, 1, int(timeout.count()));
  if (n <= 0) {
    return false;
  }
  // Hangups and errors are reported as readable so the caller's read sees them.
  return (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
}

ssize_t TcpSocketHandler::read(int fd, void* buf, size_t count) {
  if (!isOpen(fd)) {
    VLOG(1) << "Read from closed socket " << fd;
    errno = EPIPE;
    return -1;
  }
  ssize_t bytesRead = ::read(fd, buf, count);
  int readErrno = errno;
  if (bytesRead < 0 && readErrno != EAGAIN && readErrno != EWOULDBLOCK) {
    LOG(WARNING) << "Error reading fd " << fd << ": " << strerror(readErrno);
  }
  errno = readErrno;
  return bytesRead;
}

ssize_t TcpSocketHandler::write(int fd, const void* buf, size_t count) {
  if (!isOpen(fd)) {
    VLOG(1) << "Write to closed socket " << fd;
    errno = EPIPE;
    return -1;
  }
#ifdef MSG_NOSIGNAL
  return ::send(fd, buf, count, MSG_NOSIGNAL);
#else
  return ::write(fd, buf, count);
#endif
}

int TcpSocketHandler::connectAddress(const addrinfo* address,
                                     const SocketEndpoint& endpoint) {
  int fd = socket(address->ai_family, address->ai_socktype,
                  address->ai_protocol);
  if (fd == -1) {
    VLOG(1) << "Error creating socket for " << endpoint << ": "
            << strerror(errno);
    return -1;
  }
  setNonBlocking(fd);
  if (::connect(fd, address->ai_addr, address->ai_addrlen) == -1 &&
      errno != EINPROGRESS) {
    VLOG(1) << "Error connecting to " << endpoint << ": " << strerror(errno);
    ::close(fd);
    return -1;
  }

  pollfd pfd;
  pfd.fd = fd;
  pfd.events = POLLOUT;
  pfd.revents = 0;
  if (poll(&pfd, 1, int(CONNECT_TIMEOUT.count())) <= 0) {
    VLOG(1) << "Timed out connecting to " << endpoint;
    ::close(fd);
    return -1;
  }
  int soError = 0;
  socklen_t len = sizeof(soError);
  FATAL_FAIL(getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len));
  if (soError != 0) {
    VLOG(1) << "Error connecting to " << endpoint << ": " << strerror(soError);
    ::close(fd);
    return -1;
  }
  return fd;
}

int TcpSocketHandler::connect(const SocketEndpoint& endpoint) {
  AddrInfoPtr results;
  try {
    results = resolve(endpoint, AI_V4MAPPED | AI_ADDRCONFIG);
  } catch (const std::runtime_error& ex) {
    VLOG(1) << ex.what();
    return -1;
  }

  for (addrinfo* p = results.get(); p != NULL; p = p->ai_next) {
    int fd = connectAddress(p, endpoint);
    if (fd >= 0) {
      configureStream(fd);
      lock_guard<std::mutex> guard(socketMutex);
      openSockets.insert(fd);
      VLOG(1) << "Connected to " << endpoint << " using fd " << fd;
      return fd;
    }
  }
  VLOG(1) << "Could not connect to " << endpoint;
  return -1;
}

set<int> TcpSocketHandler::listen(const SocketEndpoint& endpoint) {
  int port = endpoint.getPort();
  {
    lock_guard<std::mutex> guard(socketMutex);
    if (listenersByPort.count(port)) {
      STFATAL << "Tried to listen twice on port " << port;
    }
  }

  AddrInfoPtr results = resolve(endpoint, AI_PASSIVE);
  set<int> listeners;
  string bindError;
  for (addrinfo* p = results.get(); p != NULL; p = p->ai_next) {
    int fd = socket(p->ai_family, p->ai_socktype, p->ai_protocol);
    if (fd == -1) {
      VLOG(1) << "Error creating listen socket: " << strerror(errno);
      continue;
    }
    setNonBlocking(fd);
    int flag = 1;
    FATAL_FAIL(setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &flag, sizeof(flag)));
    if (p->ai_family == AF_INET6) {
      // The IPv4 result gets its own socket
      FATAL_FAIL(
          setsockopt(fd, IPPROTO_IPV6, IPV6_V6ONLY, &flag, sizeof(flag)));
    }
    if (::bind(fd, p->ai_addr, p->ai_addrlen) == -1) {
      bindError = "cannot bind port " + to_string(port) + ": " +
                  strerror(errno);
      LOG(ERROR) << bindError;
      ::close(fd);
      continue;
    }
    FATAL_FAIL(::listen(fd, 32));
    listeners.insert(fd);
  }

  // A partially bound port is as good as a busy one
  if (!bindError.empty() || listeners.empty()) {
    for (int fd : listeners) {
      ::close(fd);
    }
    throw std::runtime_error(bindError.empty()
                                 ? "no interface to bind for port " +
                                       to_string(port)
                                 : bindError);
  }

  lock_guard<std::mutex> guard(socketMutex);
  listenersByPort[port] = listeners;
  VLOG(1) << "Listening on " << endpoint;
  return listeners;
}

set<int> TcpSocketHandler::getEndpointFds(const SocketEndpoint& endpoint) {
  lock_guard<std::mutex> guard(socketMutex);
  auto it = listenersByPort.find(endpoint.getPort());
  if (it == listenersByPort.end()) {
    STFATAL << "Not listening on " << endpoint;
  }
  return it->second;
}

int TcpSocketHandler::accept(int listenFd) {
  sockaddr_storage client;
  socklen_t len = sizeof(client);
  int fd = ::accept(listenFd, (sockaddr*)&client, &len);
  if (fd < 0) {
    int acceptErrno = errno;
    if (acceptErrno != EAGAIN && acceptErrno != EWOULDBLOCK) {
      LOG(WARNING) << "Error accepting on " << listenFd << ": "
                   << strerror(acceptErrno);
    }
    errno = acceptErrno;
    return -1;
  }
  configureStream(fd);
  lock_guard<std::mutex> guard(socketMutex);
  openSockets.insert(fd);
  VLOG(3) << "Accepted fd " << fd << " on " << listenFd;
  return fd;
}

void TcpSocketHandler::stopListening(const SocketEndpoint& endpoint) {
  lock_guard<std::mutex> guard(socketMutex);
  auto it = listenersByPort.find(endpoint.getPort());
  if (it == listenersByPort.end()) {
    STFATAL << "Not listening on " << endpoint;
  }
  for (int fd : it->second) {
    FATAL_FAIL(::close(fd));
  }
  listenersByPort.erase(it);
}

void TcpSocketHandler::close(int fd) {
  lock_guard<std::mutex> guard(socketMutex);
  if (!openSockets.erase(fd)) {
    STERROR << "Tried to close a socket that is not open: " << fd;
    return;
  }
  VLOG(1) << "Closing fd " << fd;
  FATAL_FAIL(::close(fd));
}

void TcpSocketHandler::configureStream(int fd) {
  setNonBlocking(fd);
#ifndef MSG_NOSIGNAL
  int noSigPipe = 1;
  if (setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &noSigPipe,
                 sizeof(noSigPipe)) == -1) {
    ::signal(SIGPIPE, SIG_IGN);
  }
#endif
  int flag = 1;
  FATAL_FAIL_UNLESS_EINVAL(
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)));
}

int TcpSocketHandler::findFreePort() {
  int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd == -1) {
    LOG(WARNING) << "Error creating socket: " << strerror(errno);
    return -1;
  }
  sockaddr_in addr;
  memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  socklen_t len = sizeof(addr);
  int port = -1;
  if (::bind(fd, (sockaddr*)&addr, sizeof(addr)) == -1) {
    LOG(WARNING) << "Error binding an ephemeral port: " << strerror(errno);
  } else if (getsockname(fd, (sockaddr*)&addr, &len) == -1) {
    LOG(WARNING) << "Error reading the ephemeral port: " << strerror(errno);
  } else {
    port = ntohs(addr.sin_port);
  }
  ::close(fd);
  return port;
}
}  // namespace devlink
