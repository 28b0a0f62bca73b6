#ifndef __DEVLINK_SESSION_RUNNER__
#define __DEVLINK_SESSION_RUNNER__

#include "Headers.hpp"
#include "SessionController.hpp"

namespace devlink {
/**
 * @brief Runs a SessionController on its own thread while the calling thread
 * waits for SIGINT/SIGTERM or the controller's exit.
 *
 * The first signal interrupts the controller and waits for it to shut down.
 * A second signal gives up on the shutdown and returns immediately.
 */
class SessionRunner {
 public:
  explicit SessionRunner(shared_ptr<SessionController> _controller);

  SessionResult run();

 protected:
  shared_ptr<SessionController> controller;
};
}  // namespace devlink

#endif  // __DEVLINK_SESSION_RUNNER__
