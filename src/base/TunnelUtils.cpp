#include "TunnelUtils.hpp"

namespace devlink {
namespace {
int parsePort(const string& text, const string& input) {
  size_t consumed = 0;
  int port = stoi(text, &consumed);
  if (consumed != text.size()) {
    throw TunnelParseException("Invalid tunnel argument '" + input +
                               "': trailing characters in port '" + text +
                               "'");
  }
  if (port < 1 || port > 65535) {
    throw TunnelParseException("Invalid tunnel argument '" + input +
                               "': port " + text + " is out of range");
  }
  return port;
}

void processTunnelArg(vector<ForwardBinding>& bindings,
                      const vector<string>& localRemote, const string& input) {
  if (localRemote.size() != 2) {
    throw TunnelParseException(
        "Tunnel argument must have local and remote ports between a ':'");
  }
  string local = trim(localRemote[0]);
  string remote = trim(localRemote[1]);
  try {
    if (local.find('-') != string::npos && remote.find('-') != string::npos) {
      // ranges
      vector<string> localRange = split(local, '-');
      vector<string> remoteRange = split(remote, '-');
      if (localRange.size() != 2 || remoteRange.size() != 2) {
        throw TunnelParseException("Invalid port range in '" + input + "'");
      }
      int localStart = parsePort(localRange[0], input);
      int localEnd = parsePort(localRange[1], input);
      int remoteStart = parsePort(remoteRange[0], input);
      int remoteEnd = parsePort(remoteRange[1], input);

      if (localEnd < localStart) {
        throw TunnelParseException("Port range '" + local +
                                   "' must be ascending");
      }
      if (localEnd - localStart != remoteEnd - remoteStart) {
        throw TunnelParseException(
            "local/remote port range must have same length");
      }
      int portRangeLength = localEnd - localStart + 1;
      for (int i = 0; i < portRangeLength; ++i) {
        ForwardBinding binding;
        binding.set_local_port(localStart + i);
        binding.set_remote_port(remoteStart + i);
        bindings.push_back(binding);
      }
    } else if (local.find('-') != string::npos ||
               remote.find('-') != string::npos) {
      throw TunnelParseException(
          "Invalid port range syntax: if local is a range, "
          "remote must be a range (and vice versa)");
    } else {
      ForwardBinding binding;
      binding.set_local_port(parsePort(local, input));
      binding.set_remote_port(parsePort(remote, input));
      bindings.push_back(binding);
    }
  } catch (const TunnelParseException& e) {
    throw;
  } catch (const std::logic_error& lr) {
    throw TunnelParseException("Invalid tunnel argument '" + input +
                               "': " + lr.what());
  }
}
}  // namespace

vector<ForwardBinding> parseForwardBindings(const string& input) {
  vector<ForwardBinding> bindings;
  if (trim(input).empty()) {
    return bindings;
  }
  for (auto& element : split(input, ',')) {
    processTunnelArg(bindings, split(element, ':'), input);
  }
  return bindings;
}

}  // namespace devlink
