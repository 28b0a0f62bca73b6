#ifndef __DEVLINK_CONTROL_PLANE_CLIENT__
#define __DEVLINK_CONTROL_PLANE_CLIENT__

#include "Headers.hpp"
#include "SessionError.hpp"

namespace devlink {
struct Pipeline {
  string id;
  string name;
  /** Lifecycle status reported by the control plane, e.g. "deployed". */
  string status;
};

// Routes traffic for `service` and `ingress` to a developer's copy of them.
struct Divert {
  string name;
  string service;
  string ingress;
};

/**
 * @brief CRUD access to pipelines and diverts on the control plane.
 *
 * Every call reports a missing pipeline or divert as a SessionError of kind
 * NOT_FOUND, distinct from any other failure.
 */
class ControlPlaneClient {
 public:
  virtual ~ControlPlaneClient() {}

  virtual Pipeline createPipeline(const string& name,
                                  const string& repository,
                                  const string& branch) = 0;
  virtual void destroyPipeline(const string& name, bool destroyVolumes) = 0;
  virtual Pipeline getPipelineByName(const string& name) = 0;

  virtual Divert createDivert(const Divert& divert) = 0;
  virtual void deleteDivert(const string& name) = 0;
  virtual Divert getDivertByName(const string& name) = 0;
};
}  // namespace devlink

#endif  // __DEVLINK_CONTROL_PLANE_CLIENT__
