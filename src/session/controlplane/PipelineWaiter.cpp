#include "PipelineWaiter.hpp"

namespace devlink {
bool destroyPipelineIfExists(shared_ptr<ControlPlaneClient> client,
                             const string& name, bool destroyVolumes) {
  try {
    client->destroyPipeline(name, destroyVolumes);
  } catch (const SessionError& ex) {
    if (ex.is(ErrorKind::NOT_FOUND)) {
      LOG(INFO) << "pipeline '" << name << "' not found";
      return false;
    }
    throw SessionError(ex.getKind(), "failed to destroy pipeline '" + name +
                                         "': " + ex.what());
  }
  return true;
}

bool deleteDivertIfExists(shared_ptr<ControlPlaneClient> client,
                          const string& name) {
  try {
    client->deleteDivert(name);
  } catch (const SessionError& ex) {
    if (ex.is(ErrorKind::NOT_FOUND)) {
      LOG(INFO) << "divert '" << name << "' not found";
      return false;
    }
    throw SessionError(ex.getKind(), "failed to delete divert '" + name +
                                         "': " + ex.what());
  }
  return true;
}

void waitUntilDestroyed(shared_ptr<ControlPlaneClient> client,
                        const string& name,
                        shared_ptr<ExecutionContext> context,
                        std::chrono::milliseconds timeout,
                        std::chrono::milliseconds pollInterval) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    auto waitTime = pollInterval;
    if (timeout.count() > 0) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        throw SessionError(ErrorKind::TIMEOUT,
                           "pipeline '" + name + "' didn't finish after " +
                               formatDuration(timeout));
      }
      waitTime = min(waitTime, remaining);
    }
    if (!context->waitFor(waitTime)) {
      throw SessionError(ErrorKind::INTERRUPTED,
                         "stopped waiting for pipeline '" + name + "'");
    }
    if (timeout.count() > 0 && std::chrono::steady_clock::now() >= deadline) {
      throw SessionError(ErrorKind::TIMEOUT, "pipeline '" + name +
                                                 "' didn't finish after " +
                                                 formatDuration(timeout));
    }

    Pipeline pipeline;
    try {
      pipeline = client->getPipelineByName(name);
    } catch (const SessionError& ex) {
      if (ex.is(ErrorKind::NOT_FOUND)) {
        VLOG(1) << "pipeline '" << name << "' is gone";
        return;
      }
      throw SessionError(ErrorKind::FATAL, "failed to get pipeline '" + name +
                                               "': " + ex.what());
    }
    if (pipeline.status == "error") {
      throw SessionError(ErrorKind::FATAL, "pipeline '" + name + "' failed");
    }
    VLOG(1) << "pipeline '" << name << "' is " << pipeline.status;
  }
}

string formatDuration(std::chrono::milliseconds duration) {
  int64_t ms = duration.count();
  if (ms == 0) {
    return "0s";
  }
  if (ms < 1000) {
    return to_string(ms) + "ms";
  }
  int64_t hours = ms / 3600000;
  int64_t minutes = (ms % 3600000) / 60000;
  int64_t seconds = (ms % 60000) / 1000;
  int64_t millis = ms % 1000;

  stringstream ss;
  if (hours > 0) {
    ss << hours << "h";
  }
  if (hours > 0 || minutes > 0) {
    ss << minutes << "m";
  }
  ss << seconds;
  if (millis > 0) {
    string fraction = to_string(millis + 1000).substr(1);
    fraction.erase(fraction.find_last_not_of('0') + 1);
    ss << "." << fraction;
  }
  ss << "s";
  return ss.str();
}
}  // namespace devlink
