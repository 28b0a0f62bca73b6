#include "PortTunnelManager.hpp"
#include "TcpSocketHandler.hpp"
#include "TestHeaders.hpp"

using namespace devlink;

namespace {
// Echoes every byte back on 127.0.0.1:port until stopped.
class EchoServer {
 public:
  explicit EchoServer(int _port)
      : port(_port),
        socketHandler(new TcpSocketHandler()),
        endpoint(SocketEndpoint::loopback(_port)),
        running(true) {
    socketHandler->listen(endpoint);
    serverThread = std::thread([this]() { loop(); });
  }

  ~EchoServer() {
    running = false;
    serverThread.join();
    for (int fd : clients) {
      socketHandler->close(fd);
    }
    socketHandler->stopListening(endpoint);
  }

  int getPort() { return port; }

 protected:
  void loop() {
    while (running) {
      for (int listenFd : socketHandler->getEndpointFds(endpoint)) {
        int fd = socketHandler->accept(listenFd);
        if (fd > -1) {
          clients.push_back(fd);
        }
      }
      for (int fd : clients) {
        if (!socketHandler->hasData(fd)) {
          continue;
        }
        char buf[1024];
        ssize_t bytesRead = socketHandler->read(fd, buf, sizeof(buf));
        if (bytesRead > 0) {
          socketHandler->writeAll(fd, buf, bytesRead);
        }
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  }

  int port;
  shared_ptr<TcpSocketHandler> socketHandler;
  SocketEndpoint endpoint;
  atomic<bool> running;
  vector<int> clients;
  std::thread serverThread;
};

TunnelSettings fastSettings() {
  TunnelSettings settings;
  settings.set_max_connect_attempts(2);
  settings.set_retry_backoff_ms(10);
  return settings;
}

int freePort() {
  int port = TcpSocketHandler::findFreePort();
  REQUIRE(port > 0);
  return port;
}
}  // namespace

TEST_CASE("Duplicate local ports are rejected before start",
          "[PortTunnelManager]") {
  auto errors = make_shared<Channel<SessionError>>("error", 8);
  PortTunnelManager manager(make_shared<TcpSocketHandler>(), fastSettings(),
                            errors);
  manager.registerBinding(18080, 8080);
  try {
    manager.registerBinding(18080, 9090);
    FAIL("Expected a duplicate local port to throw");
  } catch (const SessionError& ex) {
    REQUIRE(ex.is(ErrorKind::CONFIGURATION));
  }
  // Same remote port on another local port is fine
  manager.registerBinding(18081, 8080);
  REQUIRE(manager.getBindings().size() == 2);
  REQUIRE_FALSE(manager.isStarted());
}

TEST_CASE("Stop is safe without start and when repeated",
          "[PortTunnelManager]") {
  auto errors = make_shared<Channel<SessionError>>("error", 8);
  PortTunnelManager manager(make_shared<TcpSocketHandler>(), fastSettings(),
                            errors);
  manager.stop();
  manager.stop();

  auto context = make_shared<ExecutionContext>();
  manager.registerBinding(freePort(), 80);
  manager.start("127.0.0.1", "", context);
  manager.stop();
  manager.stop();
  REQUIRE(manager.getListeningCount() == 0);
}

TEST_CASE("Start establishes one tunnel per binding", "[PortTunnelManager]") {
  auto errors = make_shared<Channel<SessionError>>("error", 8);
  auto context = make_shared<ExecutionContext>();
  PortTunnelManager manager(make_shared<TcpSocketHandler>(), fastSettings(),
                            errors);
  manager.registerBinding(freePort(), 80);
  manager.registerBinding(freePort(), 81);
  manager.registerBinding(freePort(), 82);

  manager.start("127.0.0.1", "dev", context);
  REQUIRE(manager.isStarted());
  REQUIRE(manager.getListeningCount() == 3);
  REQUIRE(errors->empty());

  SECTION("Registering after start is a configuration error") {
    try {
      manager.registerBinding(freePort(), 83);
      FAIL("Expected register after start to throw");
    } catch (const SessionError& ex) {
      REQUIRE(ex.is(ErrorKind::CONFIGURATION));
    }
  }

  SECTION("Starting twice is a configuration error") {
    REQUIRE_THROWS_AS(manager.start("127.0.0.1", "dev", context),
                      SessionError);
  }
  manager.stop();
}

TEST_CASE("A binding that cannot listen does not stop its siblings",
          "[PortTunnelManager]") {
  int busyPort = freePort();
  TcpSocketHandler occupant;
  occupant.listen(SocketEndpoint::loopback(busyPort));

  auto errors = make_shared<Channel<SessionError>>("error", 8);
  auto context = make_shared<ExecutionContext>();
  PortTunnelManager manager(make_shared<TcpSocketHandler>(), fastSettings(),
                            errors);
  manager.registerBinding(busyPort, 80);
  manager.registerBinding(freePort(), 81);
  manager.start("127.0.0.1", "", context);

  REQUIRE(manager.getListeningCount() == 1);
  auto error = errors->tryReceive();
  REQUIRE(error);
  REQUIRE(error->is(ErrorKind::FATAL));

  manager.stop();
  occupant.stopListening(SocketEndpoint::loopback(busyPort));
}

TEST_CASE("Tunnels relay to the target address", "[PortTunnelManager]") {
  EchoServer echo(freePort());
  int localPort = freePort();

  auto errors = make_shared<Channel<SessionError>>("error", 8);
  auto context = make_shared<ExecutionContext>();
  PortTunnelManager manager(make_shared<TcpSocketHandler>(), fastSettings(),
                            errors);
  manager.registerBinding(localPort, echo.getPort());
  manager.start("127.0.0.1", "", context);

  TcpSocketHandler client;
  int fd = client.connect(SocketEndpoint::loopback(localPort));
  REQUIRE(fd > 0);
  string message = "devlink tunnel";
  REQUIRE(client.writeAll(fd, message.data(), message.size()));

  string received;
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
  while (received.size() < message.size() &&
         std::chrono::steady_clock::now() < deadline) {
    if (!client.waitForData(fd, std::chrono::milliseconds(100))) {
      continue;
    }
    char buf[1024];
    ssize_t bytesRead = client.read(fd, buf, sizeof(buf));
    if (bytesRead > 0) {
      received.append(buf, bytesRead);
    }
  }
  REQUIRE(received == message);

  client.close(fd);
  context->cancel();
  manager.stop();
  REQUIRE(errors->empty());
}

TEST_CASE("Cancelled contexts do not start tunnels", "[PortTunnelManager]") {
  auto errors = make_shared<Channel<SessionError>>("error", 8);
  auto context = make_shared<ExecutionContext>();
  context->cancel();
  PortTunnelManager manager(make_shared<TcpSocketHandler>(), fastSettings(),
                            errors);
  manager.registerBinding(freePort(), 80);
  try {
    manager.start("127.0.0.1", "", context);
    FAIL("Expected start on a cancelled context to throw");
  } catch (const SessionError& ex) {
    REQUIRE(ex.is(ErrorKind::INTERRUPTED));
  }
  REQUIRE_FALSE(manager.isStarted());
}
