#ifndef __DEVLINK_TARGET_RESOLVER__
#define __DEVLINK_TARGET_RESOLVER__

#include "ExecutionContext.hpp"
#include "Headers.hpp"
#include "SessionError.hpp"

namespace devlink {
/**
 * @brief Finds the remote workload a session binds to.
 */
class TargetResolver {
 public:
  virtual ~TargetResolver() {}

  /**
   * @throws SessionError of kind NOT_FOUND or AUTHENTICATION.
   */
  virtual TargetIdentity resolve(const SessionManifest& manifest,
                                 shared_ptr<ExecutionContext> context) = 0;
};

/**
 * @brief Resolves the target from the [Target] section of the session file.
 */
class StaticTargetResolver : public TargetResolver {
 public:
  virtual TargetIdentity resolve(const SessionManifest& manifest,
                                 shared_ptr<ExecutionContext> context);
};
}  // namespace devlink

#endif  // __DEVLINK_TARGET_RESOLVER__
