#include "TunnelBinding.hpp"

namespace devlink {
TunnelBinding::TunnelBinding(shared_ptr<SocketHandler> _socketHandler,
                             const ForwardBinding& _binding,
                             const string& targetAddress,
                             const TunnelSettings& _settings,
                             shared_ptr<Channel<SessionError>> _errors)
    : socketHandler(_socketHandler),
      binding(_binding),
      source(SocketEndpoint::loopback(_binding.local_port())),
      destination(targetAddress, _binding.remote_port()),
      settings(_settings),
      errors(_errors),
      listening(false),
      connectionCount(0) {}

TunnelBinding::~TunnelBinding() { closeAll(); }

void TunnelBinding::listen() {
  socketHandler->listen(source);
  listening = true;
  LOG(INFO) << "Tunnel " << source << " -> " << destination << " listening";
}

void TunnelBinding::run(shared_ptr<ExecutionContext> context) {
  while (!context->isCancelled()) {
    bool active = false;
    int sourceFd = acceptConnection();
    if (sourceFd >= 0) {
      active = true;
      int destinationFd = connectDestination(context);
      if (destinationFd < 0) {
        socketHandler->close(sourceFd);
      } else {
        VLOG(1) << "Tunnel " << binding << " relaying fd " << sourceFd
                << " to fd " << destinationFd;
        sourceToDestination[sourceFd] = destinationFd;
        connectionCount = int(sourceToDestination.size());
      }
    }
    if (update()) {
      active = true;
    }
    if (!active) {
      context->waitFor(std::chrono::milliseconds(10));
    }
  }
  closeAll();
}

int TunnelBinding::acceptConnection() {
  if (!listening) {
    return -1;
  }
  for (int i : socketHandler->getEndpointFds(source)) {
    int fd = socketHandler->accept(i);
    if (fd > -1) {
      LOG(INFO) << "Tunnel " << source << " -> " << destination
                << " socket created with fd " << fd;
      return fd;
    }
  }
  return -1;
}

int TunnelBinding::connectDestination(shared_ptr<ExecutionContext> context) {
  int attempts = max(1, settings.max_connect_attempts());
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    int fd = socketHandler->connect(destination);
    if (fd >= 0) {
      return fd;
    }
    LOG(INFO) << "Tunnel " << binding << " could not reach " << destination
              << " (attempt " << attempt << " of " << attempts << ")";
    if (attempt < attempts &&
        !context->waitFor(
            std::chrono::milliseconds(settings.retry_backoff_ms() * attempt))) {
      return -1;
    }
  }
  if (context->isCancelled()) {
    return -1;
  }
  stringstream ss;
  ss << "tunnel " << binding << " could not connect to " << destination
     << " after " << attempts << " attempts";
  if (!errors->trySend(SessionError(ErrorKind::LOST_CONNECTION, ss.str()))) {
    LOG(WARNING) << "Error channel full, dropping: " << ss.str();
  }
  return -1;
}

bool TunnelBinding::update() {
  bool moved = false;
  vector<int> pairsToRemove;
  for (auto& it : sourceToDestination) {
    PumpResult upstream = pump(it.first, it.second);
    PumpResult downstream = PumpResult::IDLE;
    if (upstream != PumpResult::CLOSED) {
      downstream = pump(it.second, it.first);
    }
    if (upstream == PumpResult::MOVED || downstream == PumpResult::MOVED) {
      moved = true;
    }
    if (upstream == PumpResult::CLOSED || downstream == PumpResult::CLOSED) {
      pairsToRemove.push_back(it.first);
    }
  }
  for (int sourceFd : pairsToRemove) {
    VLOG(1) << "Tunnel " << binding << " closing fd " << sourceFd;
    socketHandler->close(sourceToDestination[sourceFd]);
    socketHandler->close(sourceFd);
    sourceToDestination.erase(sourceFd);
  }
  connectionCount = int(sourceToDestination.size());
  return moved;
}

TunnelBinding::PumpResult TunnelBinding::pump(int fromFd, int toFd) {
  if (!socketHandler->hasData(fromFd)) {
    return PumpResult::IDLE;
  }
  char buf[4096];
  ssize_t bytesRead = socketHandler->read(fromFd, buf, sizeof(buf));
  if (bytesRead == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
    // Bail for now
    return PumpResult::IDLE;
  }
  if (bytesRead == -1) {
    VLOG(1) << "Got error reading fd " << fromFd << ": " << strerror(errno);
    return PumpResult::CLOSED;
  }
  if (bytesRead == 0) {
    VLOG(1) << "Got close reading fd " << fromFd;
    return PumpResult::CLOSED;
  }
  if (!socketHandler->writeAll(toFd, buf, bytesRead)) {
    VLOG(1) << "Could not write " << bytesRead << " bytes to fd " << toFd;
    return PumpResult::CLOSED;
  }
  return PumpResult::MOVED;
}

void TunnelBinding::closeAll() {
  for (auto& it : sourceToDestination) {
    socketHandler->close(it.second);
    socketHandler->close(it.first);
  }
  sourceToDestination.clear();
  connectionCount = 0;
  if (listening) {
    socketHandler->stopListening(source);
    listening = false;
    LOG(INFO) << "Tunnel " << source << " -> " << destination << " stopped";
  }
}
}  // namespace devlink
