#include "RestSyncEngine.hpp"

namespace devlink {
RestSyncEngine::RestSyncEngine(const SyncSettings& _settings,
                               const TargetIdentity& _target,
                               shared_ptr<SubprocessUtils> _subprocessUtils)
    : settings(_settings),
      target(_target),
      subprocessUtils(_subprocessUtils),
      mode(SEND_ONLY),
      daemonPid(-1),
      connected(false) {}

RestSyncEngine::~RestSyncEngine() { stop(); }

void RestSyncEngine::start(shared_ptr<ExecutionContext> context) {
  if (context->isCancelled()) {
    throw SessionError(ErrorKind::INTERRUPTED, "sync start cancelled");
  }
  if (settings.daemon_binary().empty()) {
    LOG(INFO) << "Using the sync daemon already listening on port "
              << settings.api_port();
  } else {
    spawnDaemon();
  }
  applyFolderType(context);
}

void RestSyncEngine::spawnDaemon() {
  lock_guard<std::mutex> guard(engineMutex);
  if (daemonPid > 0) {
    STFATAL << "Sync daemon started twice";
  }
  vector<string> args = {
      "-no-browser",
      "-gui-address=127.0.0.1:" + to_string(settings.api_port()),
  };
  if (!settings.api_key().empty()) {
    args.push_back("-gui-apikey=" + settings.api_key());
  }
  try {
    daemonPid = subprocessUtils->spawn(settings.daemon_binary(), args, true);
  } catch (const std::runtime_error& ex) {
    throw SessionError(ErrorKind::FATAL,
                       string("could not start the sync daemon: ") + ex.what());
  }
  LOG(INFO) << "Started sync daemon " << settings.daemon_binary() << " as pid "
            << daemonPid;
}

void RestSyncEngine::applyFolderType(shared_ptr<ExecutionContext> context) {
  string path = "/rest/config/folders/" + settings.folder_id();
  string current;
  pollUntil(context, "folder config", [this, &path, &current]() {
    current = getJson(path).value("type", "");
    return true;
  });
  string wanted = folderType(getMode());
  if (current == wanted) {
    VLOG(1) << "Folder " << settings.folder_id() << " is already " << wanted;
    return;
  }
  // A daemon that outlived the last attempt still has the finalized type.
  LOG(INFO) << "Folder " << settings.folder_id() << " is " << current
            << ", switching it to " << wanted;
  restart(context);
}

void RestSyncEngine::stop() {
  pid_t pid;
  {
    lock_guard<std::mutex> guard(engineMutex);
    pid = daemonPid;
    daemonPid = -1;
  }
  connected = false;
  if (pid > 0) {
    LOG(INFO) << "Stopping sync daemon " << pid;
    subprocessUtils->terminate(pid);
  }
}

void RestSyncEngine::waitForPing(shared_ptr<ExecutionContext> context) {
  pollUntil(context, "ping", [this]() {
    json reply = getJson("/rest/system/ping");
    return reply.value("ping", "") == "pong";
  });
  connected = true;
  VLOG(1) << "Sync daemon answered ping";
}

void RestSyncEngine::waitDrained(shared_ptr<ExecutionContext> context) {
  string path = "/rest/db/completion?" + folderQuery();
  if (!settings.remote_device_id().empty()) {
    path += "&device=" + settings.remote_device_id();
  }
  pollUntil(context, "completion", [this, path]() {
    json reply = getJson(path);
    double completion = reply.value("completion", 0.0);
    int64_t needBytes = reply.value("needBytes", int64_t(0));
    VLOG(1) << "Sync completion " << completion << "%, " << needBytes
            << " bytes pending";
    return completion >= 100.0 && needBytes == 0;
  });
}

void RestSyncEngine::overrideLocal(shared_ptr<ExecutionContext> context) {
  if (context->isCancelled()) {
    throw SessionError(ErrorKind::INTERRUPTED, "override cancelled");
  }
  send("POST", "/rest/db/override?" + folderQuery(), "");
  LOG(INFO) << "Local changes override remote state";
}

void RestSyncEngine::setMode(SyncMode _mode) {
  lock_guard<std::mutex> guard(engineMutex);
  mode = _mode;
}

SyncMode RestSyncEngine::getMode() {
  lock_guard<std::mutex> guard(engineMutex);
  return mode;
}

string RestSyncEngine::folderType(SyncMode mode) {
  switch (mode) {
    case SEND_ONLY:
      return "sendonly";
    case SEND_RECEIVE:
      return "sendreceive";
  }
  STFATAL << "Unknown sync mode " << int(mode);
  return "";
}

void RestSyncEngine::restart(shared_ptr<ExecutionContext> context) {
  if (context->isCancelled()) {
    throw SessionError(ErrorKind::INTERRUPTED, "restart cancelled");
  }
  json folderPatch = {{"type", folderType(getMode())}};
  send("PATCH", "/rest/config/folders/" + settings.folder_id(),
       folderPatch.dump());
  try {
    send("POST", "/rest/system/restart", "");
  } catch (const SessionError& ex) {
    // The daemon may drop the connection while it goes down.
    if (!ex.is(ErrorKind::LOST_CONNECTION)) {
      throw;
    }
    VLOG(1) << "Restart request did not get an answer: " << ex.what();
  }
  connected = false;
  waitForPing(context);
}

bool RestSyncEngine::isConnected() { return connected; }

void RestSyncEngine::monitor(shared_ptr<ExecutionContext> context,
                             std::function<void(const string&)> onDisconnect) {
  int failures = 0;
  string lastProblem;
  while (context->waitFor(
      std::chrono::milliseconds(settings.monitor_interval_ms()))) {
    bool healthy = false;
    try {
      healthy = checkRemoteConnected();
      if (!healthy) {
        lastProblem = "remote device is not connected";
      }
    } catch (const SessionError& ex) {
      lastProblem = ex.what();
    } catch (const json::exception& ex) {
      lastProblem = ex.what();
    }
    if (healthy) {
      failures = 0;
      continue;
    }
    failures++;
    VLOG(1) << "Sync health check failed (" << failures << "/"
            << settings.monitor_failures() << "): " << lastProblem;
    if (failures >= settings.monitor_failures()) {
      connected = false;
      LOG(INFO) << "Sync engine disconnected: " << lastProblem;
      onDisconnect(lastProblem);
      return;
    }
  }
}

ForwardBinding RestSyncEngine::controlBinding() {
  ForwardBinding binding;
  binding.set_local_port(settings.control_port());
  binding.set_remote_port(settings.remote_control_port());
  return binding;
}

ForwardBinding RestSyncEngine::guiBinding() {
  ForwardBinding binding;
  binding.set_local_port(settings.gui_port());
  binding.set_remote_port(settings.remote_gui_port());
  return binding;
}

bool RestSyncEngine::checkRemoteConnected() {
  if (settings.remote_device_id().empty()) {
    json reply = getJson("/rest/system/ping");
    return reply.value("ping", "") == "pong";
  }
  json reply = getJson("/rest/system/connections");
  auto connections = reply.find("connections");
  if (connections == reply.end() || !connections->is_object()) {
    return false;
  }
  auto device = connections->find(settings.remote_device_id());
  if (device == connections->end() || !device->is_object()) {
    return false;
  }
  return device->value("connected", false);
}

json RestSyncEngine::getJson(const string& path) {
  httplib::Client client("127.0.0.1", settings.api_port());
  configureClient(&client);
  auto res = client.Get(path.c_str(), requestHeaders());
  if (!res) {
    throw SessionError(ErrorKind::LOST_CONNECTION,
                       "sync daemon did not answer GET " + path);
  }
  checkStatus("GET", path, res->status);
  return parseJsonObject(res->body, "sync daemon GET " + path);
}

void RestSyncEngine::send(const string& method, const string& path,
                          const string& body) {
  httplib::Client client("127.0.0.1", settings.api_port());
  configureClient(&client);
  httplib::Result res = (method == "PATCH")
                            ? client.Patch(path.c_str(), requestHeaders(),
                                           body, "application/json")
                            : client.Post(path.c_str(), requestHeaders(), body,
                                          "application/json");
  if (!res) {
    throw SessionError(ErrorKind::LOST_CONNECTION,
                       "sync daemon did not answer " + method + " " + path);
  }
  checkStatus(method, path, res->status);
}

void RestSyncEngine::checkStatus(const string& method, const string& path,
                                 int status) {
  if (status == 401 || status == 403) {
    throw SessionError(ErrorKind::AUTHENTICATION,
                       "sync daemon rejected the API key for " + method + " " +
                           path);
  }
  if (status < 200 || status >= 300) {
    throw SessionError(ErrorKind::LOST_CONNECTION,
                       "sync daemon answered " + to_string(status) + " to " +
                           method + " " + path);
  }
}

httplib::Headers RestSyncEngine::requestHeaders() {
  httplib::Headers headers;
  if (!settings.api_key().empty()) {
    headers.emplace("X-API-Key", settings.api_key());
  }
  return headers;
}

void RestSyncEngine::configureClient(httplib::Client* client) {
  int timeoutMs = settings.request_timeout_ms();
  client->set_connection_timeout(timeoutMs / 1000, (timeoutMs % 1000) * 1000);
  client->set_read_timeout(timeoutMs / 1000, (timeoutMs % 1000) * 1000);
  client->set_write_timeout(timeoutMs / 1000, (timeoutMs % 1000) * 1000);
}

void RestSyncEngine::pollUntil(shared_ptr<ExecutionContext> context,
                               const string& what,
                               std::function<bool()> check) {
  while (true) {
    if (context->isCancelled()) {
      throw SessionError(ErrorKind::INTERRUPTED,
                         "cancelled while waiting for sync " + what);
    }
    try {
      if (check()) {
        return;
      }
    } catch (const SessionError& ex) {
      if (!ex.is(ErrorKind::LOST_CONNECTION)) {
        throw;
      }
      VLOG(1) << "Sync " << what << " not ready: " << ex.what();
    } catch (const json::exception& ex) {
      throw SessionError(ErrorKind::FATAL, "unexpected sync " + what +
                                               " reply: " + ex.what());
    }
    if (!context->waitFor(
            std::chrono::milliseconds(settings.poll_interval_ms()))) {
      throw SessionError(ErrorKind::INTERRUPTED,
                         "cancelled while waiting for sync " + what);
    }
  }
}

string RestSyncEngine::folderQuery() { return "folder=" + settings.folder_id(); }
}  // namespace devlink
