/***
 * Name: gilbridge::obs (snapshot publishers)
 * Purpose: Publish GlobalLock and runtime counters into a Metrics instance.
 * Inputs: LockStats / RuntimeStats snapshots
 * Outputs: "lock.*" and "runtime.*" counters and gauges
 * Theory of Operation: Monotonic values become counters, point-in-time values
 *   (depths, live bytes and objects) become gauges. Values overwrite any
 *   previous publication so the same Metrics can be refreshed repeatedly.
 */
#pragma once

#include "gilbridge/GlobalLock.h"
#include "observability/Metrics.h"
#include "runtime/RuntimeStats.h"

namespace gilbridge::obs {

void recordLockStats(Metrics& metrics, const LockStats& stats);

void recordRuntimeStats(Metrics& metrics, const rt::RuntimeStats& stats);

} // namespace gilbridge::obs
