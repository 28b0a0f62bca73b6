#include "TargetResolver.hpp"

namespace devlink {
TargetIdentity StaticTargetResolver::resolve(
    const SessionManifest& manifest, shared_ptr<ExecutionContext> context) {
  if (context->isCancelled()) {
    throw SessionError(ErrorKind::INTERRUPTED, "target resolution cancelled");
  }
  TargetIdentity target = manifest.target();
  if (target.address().empty()) {
    throw SessionError(ErrorKind::NOT_FOUND,
                       "no address is configured for '" + manifest.name() +
                           "'");
  }
  target.set_name(manifest.name());
  target.set_namespace_name(manifest.namespace_name());
  if (target.workload().empty()) {
    target.set_workload(manifest.name());
  }
  VLOG(1) << "Resolved " << target.name() << " to " << target.address();
  return target;
}
}  // namespace devlink
