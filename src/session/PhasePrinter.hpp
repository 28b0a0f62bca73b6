#ifndef __DEVLINK_PHASE_PRINTER__
#define __DEVLINK_PHASE_PRINTER__

#include "Headers.hpp"
#include "Session.hpp"

namespace devlink {
/**
 * @brief The progress lines shown to the user for a phase change. Phases
 * with nothing to say give an empty list.
 */
vector<string> describePhaseChange(const PhaseChange& change);

/** @brief Writes describePhaseChange() to the stdout logger. */
void printPhaseChange(const PhaseChange& change);

/** @brief Where a dropped user can still reach the workload. */
void printAccessDetails(const TargetIdentity& target);
}  // namespace devlink

#endif  // __DEVLINK_PHASE_PRINTER__
