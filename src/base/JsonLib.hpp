#ifndef __DEVLINK_JSON_LIB__
#define __DEVLINK_JSON_LIB__

#include "Headers.hpp"
#include "SessionError.hpp"
#include "nlohmann/json.hpp"

namespace devlink {
using json = nlohmann::json;

/**
 * @brief Parses a reply body that must hold a JSON object.
 *
 * @throws SessionError of kind FATAL naming `source` when the body is not
 * valid json or not an object.
 */
inline json parseJsonObject(const string& body, const string& source) {
  json reply;
  try {
    reply = json::parse(body);
  } catch (const json::parse_error& ex) {
    throw SessionError(ErrorKind::FATAL,
                       "invalid json from " + source + ": " + ex.what());
  }
  if (!reply.is_object()) {
    throw SessionError(ErrorKind::FATAL,
                       "expected a json object from " + source);
  }
  return reply;
}
}  // namespace devlink

#endif  // __DEVLINK_JSON_LIB__
