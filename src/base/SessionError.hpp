#ifndef __DEVLINK_SESSION_ERROR__
#define __DEVLINK_SESSION_ERROR__

#include "Headers.hpp"

namespace devlink {
/**
 * @brief Classification attached to every runtime failure where it
 * originates, so the session controller can switch on it centrally.
 */
enum class ErrorKind {
  CONFIGURATION,
  LOST_CONNECTION,
  COMMAND_FAILED,
  INTERRUPTED,
  FATAL,
  NOT_FOUND,
  AUTHENTICATION,
  TIMEOUT,
};

inline const char* errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::CONFIGURATION:
      return "ConfigurationError";
    case ErrorKind::LOST_CONNECTION:
      return "LostConnection";
    case ErrorKind::COMMAND_FAILED:
      return "CommandFailed";
    case ErrorKind::INTERRUPTED:
      return "Interrupted";
    case ErrorKind::FATAL:
      return "Fatal";
    case ErrorKind::NOT_FOUND:
      return "NotFound";
    case ErrorKind::AUTHENTICATION:
      return "AuthError";
    case ErrorKind::TIMEOUT:
      return "Timeout";
  }
  return "Unknown";
}

/**
 * @brief Runtime failure tagged with an ErrorKind.
 */
class SessionError : public std::runtime_error {
 public:
  SessionError(ErrorKind _kind, const string& message)
      : std::runtime_error(message), kind(_kind) {}

  ErrorKind getKind() const { return kind; }

  bool is(ErrorKind other) const { return kind == other; }

 protected:
  ErrorKind kind;
};

inline std::ostream& operator<<(std::ostream& os, ErrorKind kind) {
  return os << errorKindName(kind);
}
}  // namespace devlink

#endif  // __DEVLINK_SESSION_ERROR__
