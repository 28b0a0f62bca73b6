#ifndef __DEVLINK_REST_SYNC_ENGINE__
#define __DEVLINK_REST_SYNC_ENGINE__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "SubprocessUtils.hpp"
#include "SyncEngine.hpp"

namespace devlink {
/**
 * @brief Drives a sync daemon through its local REST API.
 *
 * The daemon owns the transfer protocol; this class only sequences it. When
 * `daemon_binary` is configured the daemon is spawned on start() and stopped
 * on stop(), otherwise it is assumed to be running already.
 */
class RestSyncEngine : public SyncEngine {
 public:
  RestSyncEngine(const SyncSettings& _settings, const TargetIdentity& _target,
                 shared_ptr<SubprocessUtils> _subprocessUtils);
  virtual ~RestSyncEngine();

  virtual void start(shared_ptr<ExecutionContext> context);
  virtual void stop();
  virtual void waitForPing(shared_ptr<ExecutionContext> context);
  virtual void waitDrained(shared_ptr<ExecutionContext> context);
  virtual void overrideLocal(shared_ptr<ExecutionContext> context);
  virtual void setMode(SyncMode mode);
  virtual void restart(shared_ptr<ExecutionContext> context);
  virtual bool isConnected();
  virtual void monitor(shared_ptr<ExecutionContext> context,
                       std::function<void(const string&)> onDisconnect);
  virtual ForwardBinding controlBinding();
  virtual ForwardBinding guiBinding();

  SyncMode getMode();

  /** @brief Folder type string the daemon understands for a mode. */
  static string folderType(SyncMode mode);

 protected:
  void spawnDaemon();

  /**
   * @brief Reads the folder type the daemon holds and, when it differs from
   * the current mode, patches it and restarts the daemon.
   */
  void applyFolderType(shared_ptr<ExecutionContext> context);

  /** @brief One health check: is the remote device connected right now? */
  bool checkRemoteConnected();

  /**
   * @throws SessionError LOST_CONNECTION when the daemon is unreachable,
   * AUTHENTICATION when it rejects the API key.
   */
  json getJson(const string& path);
  void send(const string& method, const string& path, const string& body);
  void checkStatus(const string& method, const string& path, int status);
  httplib::Headers requestHeaders();
  void configureClient(httplib::Client* client);

  /**
   * @brief Calls `check` every poll interval until it returns true. Transport
   * errors are retried, authentication errors are not.
   */
  void pollUntil(shared_ptr<ExecutionContext> context, const string& what,
                 std::function<bool()> check);

  string folderQuery();

  SyncSettings settings;
  TargetIdentity target;
  shared_ptr<SubprocessUtils> subprocessUtils;

  std::mutex engineMutex;
  SyncMode mode;
  pid_t daemonPid;
  atomic<bool> connected;
};
}  // namespace devlink

#endif  // __DEVLINK_REST_SYNC_ENGINE__
