#include "PortTunnelManager.hpp"

namespace devlink {
namespace {
// Binding loops poll every few milliseconds, but one may be inside a connect
// retry when stop() is called.
const std::chrono::milliseconds BINDING_STOP_TIMEOUT(5000);
}  // namespace

PortTunnelManager::PortTunnelManager(shared_ptr<SocketHandler> _socketHandler,
                                     const TunnelSettings& _settings,
                                     shared_ptr<Channel<SessionError>> _errors)
    : socketHandler(_socketHandler),
      settings(_settings),
      errors(_errors),
      started(false),
      stopped(false) {}

PortTunnelManager::~PortTunnelManager() { stop(); }

void PortTunnelManager::registerBinding(const ForwardBinding& binding) {
  lock_guard<std::mutex> guard(managerMutex);
  if (started) {
    stringstream ss;
    ss << "cannot forward " << binding << " after the tunnels started";
    throw SessionError(ErrorKind::CONFIGURATION, ss.str());
  }
  if (localPorts.find(binding.local_port()) != localPorts.end()) {
    throw SessionError(ErrorKind::CONFIGURATION,
                       "local port " + to_string(binding.local_port()) +
                           " is forwarded more than once");
  }
  localPorts.insert(binding.local_port());
  bindings.push_back(binding);
  VLOG(1) << "Registered tunnel " << binding;
}

void PortTunnelManager::registerBinding(int localPort, int remotePort) {
  ForwardBinding binding;
  binding.set_local_port(localPort);
  binding.set_remote_port(remotePort);
  registerBinding(binding);
}

void PortTunnelManager::start(const string& targetAddress,
                              const string& namespaceName,
                              shared_ptr<ExecutionContext> context) {
  lock_guard<std::mutex> guard(managerMutex);
  if (started) {
    throw SessionError(ErrorKind::CONFIGURATION,
                       "the tunnels were already started");
  }
  if (context->isCancelled()) {
    throw SessionError(ErrorKind::INTERRUPTED, "tunnel start cancelled");
  }
  started = true;
  tunnelContext = context->createChild();
  LOG(INFO) << "Starting " << bindings.size() << " tunnels to "
            << targetAddress
            << (namespaceName.empty() ? "" : " in namespace " + namespaceName);

  for (const auto& binding : bindings) {
    auto tunnel = make_shared<TunnelBinding>(socketHandler, binding,
                                             targetAddress, settings, errors);
    try {
      tunnel->listen();
    } catch (const std::runtime_error& ex) {
      stringstream ss;
      ss << "tunnel " << binding << " could not start: " << ex.what();
      LOG(ERROR) << ss.str();
      if (!errors->trySend(SessionError(ErrorKind::FATAL, ss.str()))) {
        LOG(WARNING) << "Error channel full, dropping: " << ss.str();
      }
      continue;
    }
    activeBindings.push_back(tunnel);
    auto bindingContext = tunnelContext;
    tasks.spawn("tunnel-" + to_string(binding.local_port()),
                [tunnel, bindingContext]() { tunnel->run(bindingContext); });
  }
}

void PortTunnelManager::stop() {
  shared_ptr<ExecutionContext> contextToCancel;
  {
    lock_guard<std::mutex> guard(managerMutex);
    if (!started || stopped) {
      return;
    }
    stopped = true;
    contextToCancel = tunnelContext;
  }
  contextToCancel->cancel();
  if (!tasks.waitFor(BINDING_STOP_TIMEOUT)) {
    LOG(WARNING) << "Some tunnels did not stop in time";
  }
  lock_guard<std::mutex> guard(managerMutex);
  activeBindings.clear();
  LOG(INFO) << "Tunnels stopped";
}

bool PortTunnelManager::isStarted() {
  lock_guard<std::mutex> guard(managerMutex);
  return started;
}

vector<ForwardBinding> PortTunnelManager::getBindings() {
  lock_guard<std::mutex> guard(managerMutex);
  return bindings;
}

int PortTunnelManager::getListeningCount() {
  lock_guard<std::mutex> guard(managerMutex);
  return int(activeBindings.size());
}
}  // namespace devlink
