#ifndef __DEVLINK_PIPELINE_WAITER__
#define __DEVLINK_PIPELINE_WAITER__

#include "ControlPlaneClient.hpp"
#include "ExecutionContext.hpp"
#include "Headers.hpp"

namespace devlink {
/**
 * @brief Destroys a pipeline, treating an already missing one as success.
 * @return false if the pipeline did not exist.
 */
bool destroyPipelineIfExists(shared_ptr<ControlPlaneClient> client,
                             const string& name, bool destroyVolumes);

/** @return false if the divert did not exist. */
bool deleteDivertIfExists(shared_ptr<ControlPlaneClient> client,
                          const string& name);

/**
 * @brief Polls until the pipeline is gone, for control planes that do not
 * report destroy actions.
 *
 * Throws SessionError: FATAL if the pipeline reports status "error" or the
 * lookup fails, TIMEOUT once `timeout` elapses (zero waits forever),
 * INTERRUPTED if `context` is cancelled.
 */
void waitUntilDestroyed(
    shared_ptr<ControlPlaneClient> client, const string& name,
    shared_ptr<ExecutionContext> context, std::chrono::milliseconds timeout,
    std::chrono::milliseconds pollInterval = std::chrono::milliseconds(1000));

/** @brief Renders a duration like "5m0s", "1.5s" or "200ms". */
string formatDuration(std::chrono::milliseconds duration);
}  // namespace devlink

#endif  // __DEVLINK_PIPELINE_WAITER__
