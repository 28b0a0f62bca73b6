#ifndef __DEVLINK_HEADERS__
#define __DEVLINK_HEADERS__

// httplib pulls in the socket headers itself and must come first
#include "httplib.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <paths.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <errno.h>
#include <fcntl.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "DevLink.pb.h"
#include "easylogging++.h"
#include "sago/platform_folders.h"
#include "sole.hpp"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

// Exec control port used when the kernel hands out no free port.
const int FALLBACK_SHELL_CONTROL_PORT = 15000;

// How long a child gets between SIGTERM and SIGKILL.
const int TERMINATE_GRACE_MS = 1000;

// Session fan-in channel capacities. One pending disconnect or command
// outcome is all the controller ever needs to see.
const int DISCONNECT_CHANNEL_CAPACITY = 1;
const int ERROR_CHANNEL_CAPACITY = 8;
const int COMMAND_CHANNEL_CAPACITY = 1;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

inline void SetErrno(int e) { errno = e; }

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << errno << "): " << strerror(errno);

// BSD reports EINVAL for socket options on a peer that already hung up.
#define FATAL_FAIL_UNLESS_EINVAL(X)     \
  if (((X) == -1) && errno != EINVAL) \
    STFATAL << "Error: (" << errno << "): " << strerror(errno);

#ifndef DEVLINK_VERSION
#define DEVLINK_VERSION "unknown"
#endif

namespace devlink {
inline vector<string> split(const string &s, char delim) {
  vector<string> parts;
  stringstream ss(s);
  string item;
  while (std::getline(ss, item, delim)) {
    parts.push_back(item);
  }
  return parts;
}

inline string trim(const string &s) {
  auto start = s.find_first_not_of(" \t\r\n");
  if (start == string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

inline string GetTempDirectory() { return _PATH_TMP; }

/**
 * @brief Logs uncaught exceptions with a stack trace before dying.
 */
inline void HandleTerminate() {
  static bool installed = false;
  if (installed) {
    return;
  }
  installed = true;
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (!eptr) {
      STFATAL << "Terminate called without an exception";
    }
    try {
      std::rethrow_exception(eptr);
    } catch (const std::exception &e) {
      STFATAL << "Uncaught exception: " << e.what();
    } catch (...) {
      STFATAL << "Uncaught exception of unknown type";
    }
  });
}

inline std::ostream &operator<<(std::ostream &os,
                                const ForwardBinding &binding) {
  return os << binding.local_port() << "->" << binding.remote_port();
}
}  // namespace devlink

#endif  // __DEVLINK_HEADERS__
