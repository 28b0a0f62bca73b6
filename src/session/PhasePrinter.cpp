#include "PhasePrinter.hpp"

namespace devlink {
namespace {
string firstEndpoint(const TargetIdentity& target) {
  if (target.endpoints_size() > 0) {
    return target.endpoints(0);
  }
  return target.address();
}

bool afterLostConnection(const PhaseChange& change) {
  return change.previous && *change.previous == ErrorKind::LOST_CONNECTION;
}
}  // namespace

vector<string> describePhaseChange(const PhaseChange& change) {
  switch (change.phase) {
    case SessionPhase::CONNECTING:
      return {"Connecting to your remote workload..."};
    case SessionPhase::SYNCING:
      return {"Synchronizing your files..."};
    case SessionPhase::FINALIZING:
      return {"Finalizing configuration..."};
    case SessionPhase::RUNNING: {
      vector<string> lines;
      if (afterLostConnection(change)) {
        lines.push_back("Reconnected to your remote workload.");
      }
      lines.push_back("Your remote workload '" + change.target.name() +
                      "' is ready at " + firstEndpoint(change.target));
      return lines;
    }
    case SessionPhase::RECONNECTING:
      if (afterLostConnection(change)) {
        return {"Lost connection to your remote workload, reconnecting..."};
      }
      return {"Your command failed while sync was disconnected, "
              "reconnecting..."};
    default:
      return {};
  }
}

void printPhaseChange(const PhaseChange& change) {
  for (const auto& line : describePhaseChange(change)) {
    CLOG(INFO, "stdout") << line << endl;
  }
}

void printAccessDetails(const TargetIdentity& target) {
  if (target.name().empty()) {
    return;
  }
  CLOG(INFO, "stdout") << "Your remote workload '" << target.name()
                       << "' may still be running." << endl;
  for (int i = 0; i < target.endpoints_size(); ++i) {
    CLOG(INFO, "stdout") << "  Endpoint: " << target.endpoints(i) << endl;
  }
}
}  // namespace devlink
