#ifndef __DEVLINK_SESSION_CONFIG__
#define __DEVLINK_SESSION_CONFIG__

#include "Headers.hpp"
#include "SessionError.hpp"

namespace devlink {
/** @brief Values from the [Debug] section. Command-line flags override them. */
struct DebugSettings {
  int verbose = 0;
  bool silent = false;
  string logsize = "20971520";
};

/**
 * @brief Reads the session INI file into a SessionManifest.
 */
class SessionConfig {
 public:
  /**
   * @throws SessionError of kind CONFIGURATION for a missing file, a missing
   * required key, a bad number or a malformed forward.
   */
  static SessionManifest load(const string& path, DebugSettings* debug);

  static string defaultConfigPath();
};
}  // namespace devlink

#endif  // __DEVLINK_SESSION_CONFIG__
