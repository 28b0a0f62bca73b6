#include "SessionConfig.hpp"

#include "SimpleIni.h"
#include "TunnelUtils.hpp"

namespace devlink {
namespace {
string readString(CSimpleIniA& ini, const char* section, const char* key,
                  const string& defaultValue = "") {
  const char* value = ini.GetValue(section, key, NULL);
  if (value == NULL) {
    return defaultValue;
  }
  return trim(value);
}

string readRequired(CSimpleIniA& ini, const char* section, const char* key) {
  string value = readString(ini, section, key);
  if (value.empty()) {
    throw SessionError(ErrorKind::CONFIGURATION,
                       string("missing required key '") + key +
                           "' in section [" + section + "]");
  }
  return value;
}

int readInt(CSimpleIniA& ini, const char* section, const char* key,
            int defaultValue) {
  string value = readString(ini, section, key);
  if (value.empty()) {
    return defaultValue;
  }
  try {
    size_t consumed = 0;
    int parsed = stoi(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw SessionError(ErrorKind::CONFIGURATION,
                       string("key '") + key + "' in section [" + section +
                           "] must be a number, got '" + value + "'");
  }
}

int readPositiveInt(CSimpleIniA& ini, const char* section, const char* key,
                    int defaultValue) {
  int value = readInt(ini, section, key, defaultValue);
  if (value <= 0) {
    throw SessionError(ErrorKind::CONFIGURATION,
                       string("key '") + key + "' in section [" + section +
                           "] must be positive");
  }
  return value;
}

bool readBool(CSimpleIniA& ini, const char* section, const char* key,
              bool defaultValue) {
  string value = readString(ini, section, key);
  if (value.empty()) {
    return defaultValue;
  }
  return value == "1" || value == "true" || value == "yes" || value == "on";
}

vector<string> splitNonEmpty(const string& value, char delim) {
  vector<string> parts;
  for (auto& part : split(value, delim)) {
    string trimmed = trim(part);
    if (!trimmed.empty()) {
      parts.push_back(trimmed);
    }
  }
  return parts;
}
}  // namespace

SessionManifest SessionConfig::load(const string& path, DebugSettings* debug) {
  if (!fs::exists(path)) {
    throw SessionError(ErrorKind::CONFIGURATION,
                       "session file " + path + " does not exist");
  }
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw SessionError(ErrorKind::CONFIGURATION,
                       "could not read session file " + path);
  }

  SessionManifest manifest;
  manifest.set_name(readRequired(ini, "Session", "name"));
  manifest.set_namespace_name(readString(ini, "Session", "namespace"));
  manifest.set_local_folder(
      readString(ini, "Session", "local_folder", fs::current_path().string()));
  manifest.set_reconnect_delay_ms(readInt(ini, "Session", "reconnect_delay_ms",
                                          manifest.reconnect_delay_ms()));
  manifest.set_shutdown_timeout_ms(readPositiveInt(
      ini, "Session", "shutdown_timeout_ms", manifest.shutdown_timeout_ms()));
  if (manifest.reconnect_delay_ms() < 0) {
    throw SessionError(ErrorKind::CONFIGURATION,
                       "reconnect_delay_ms cannot be negative");
  }

  string forwards = readString(ini, "Session", "forward");
  try {
    for (const auto& binding : parseForwardBindings(forwards)) {
      *manifest.add_forwards() = binding;
    }
  } catch (const TunnelParseException& ex) {
    throw SessionError(ErrorKind::CONFIGURATION,
                       string("bad forward in session file: ") + ex.what());
  }

  auto target = manifest.mutable_target();
  target->set_address(readRequired(ini, "Target", "address"));
  target->set_workload(readString(ini, "Target", "workload"));
  target->set_credentials(readString(ini, "Target", "credentials"));
  for (const auto& endpoint :
       splitNonEmpty(readString(ini, "Target", "endpoint"), ',')) {
    target->add_endpoints(endpoint);
  }

  auto sync = manifest.mutable_sync();
  sync->set_api_port(readPositiveInt(ini, "Sync", "api_port", sync->api_port()));
  sync->set_api_key(readString(ini, "Sync", "api_key"));
  sync->set_folder_id(readString(ini, "Sync", "folder_id", manifest.name()));
  sync->set_remote_device_id(readString(ini, "Sync", "remote_device_id"));
  sync->set_control_port(
      readPositiveInt(ini, "Sync", "control_port", sync->control_port()));
  sync->set_remote_control_port(readPositiveInt(
      ini, "Sync", "remote_control_port", sync->remote_control_port()));
  sync->set_gui_port(readPositiveInt(ini, "Sync", "gui_port", sync->gui_port()));
  sync->set_remote_gui_port(
      readPositiveInt(ini, "Sync", "remote_gui_port", sync->remote_gui_port()));
  sync->set_daemon_binary(readString(ini, "Sync", "daemon_binary"));
  sync->set_poll_interval_ms(
      readPositiveInt(ini, "Sync", "poll_interval_ms", sync->poll_interval_ms()));
  sync->set_monitor_interval_ms(readPositiveInt(
      ini, "Sync", "monitor_interval_ms", sync->monitor_interval_ms()));
  sync->set_monitor_failures(
      readPositiveInt(ini, "Sync", "monitor_failures", sync->monitor_failures()));
  sync->set_request_timeout_ms(readPositiveInt(
      ini, "Sync", "request_timeout_ms", sync->request_timeout_ms()));

  auto shell = manifest.mutable_shell();
  shell->set_exec_binary(readRequired(ini, "Shell", "exec_binary"));
  for (const auto& part :
       splitNonEmpty(readString(ini, "Session", "command"), ' ')) {
    shell->add_command(part);
  }

  auto tunnel = manifest.mutable_tunnel();
  tunnel->set_max_connect_attempts(readPositiveInt(
      ini, "Tunnel", "max_connect_attempts", tunnel->max_connect_attempts()));
  tunnel->set_retry_backoff_ms(
      readInt(ini, "Tunnel", "retry_backoff_ms", tunnel->retry_backoff_ms()));

  if (debug) {
    debug->verbose = readInt(ini, "Debug", "verbose", debug->verbose);
    debug->silent = readBool(ini, "Debug", "silent", debug->silent);
    debug->logsize = readString(ini, "Debug", "logsize", debug->logsize);
  }
  VLOG(1) << "Loaded session " << manifest.name() << " from " << path;
  return manifest;
}

string SessionConfig::defaultConfigPath() {
  return sago::getConfigHome() + "/devlink/session.ini";
}
}  // namespace devlink
