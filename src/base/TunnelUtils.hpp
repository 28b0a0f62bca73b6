#ifndef __DEVLINK_TUNNEL_UTILS__
#define __DEVLINK_TUNNEL_UTILS__

#include "Headers.hpp"

namespace devlink {
/**
 * @brief Parses a comma-separated list of `local:remote` pairs and matching
 * `start-end:start-end` ranges into forward bindings.
 * @throws TunnelParseException when the syntax is invalid.
 */
vector<ForwardBinding> parseForwardBindings(const string& input);

/** @brief A malformed `forward` value; the message names the bad part. */
class TunnelParseException : public std::runtime_error {
 public:
  explicit TunnelParseException(const string& msg) : std::runtime_error(msg) {}
};
}  // namespace devlink
#endif  // __DEVLINK_TUNNEL_UTILS__
