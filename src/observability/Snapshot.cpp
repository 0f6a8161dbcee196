/***
 * Name: gilbridge::obs::recordLockStats, gilbridge::obs::recordRuntimeStats
 * Purpose: Map stats snapshots onto metric keys.
 */
#include "observability/Snapshot.h"

#include <cstdint>

namespace gilbridge::obs {

void recordLockStats(Metrics& metrics, const LockStats& stats) {
  metrics.setCounter("lock.acquisitions", stats.acquisitions);
  metrics.setCounter("lock.reentrant", stats.reentrantAcquisitions);
  metrics.setCounter("lock.contended", stats.contendedAcquisitions);
  metrics.setCounter("lock.suspensions", stats.suspensions);
  metrics.setGauge("lock.max_depth", static_cast<uint64_t>(stats.maxDepth));
}

void recordRuntimeStats(Metrics& metrics, const rt::RuntimeStats& stats) {
  metrics.setCounter("runtime.allocated", stats.numAllocated);
  metrics.setCounter("runtime.freed", stats.numFreed);
  metrics.setCounter("runtime.incref", stats.numIncref);
  metrics.setCounter("runtime.decref", stats.numDecref);
  metrics.setCounter("runtime.failed_allocations", stats.failedAllocations);
  metrics.setCounter("runtime.bytes_allocated", stats.bytesAllocated);
  const uint64_t live = stats.numAllocated >= stats.numFreed ? stats.numAllocated - stats.numFreed : 0;
  metrics.setGauge("runtime.objects_live", live);
  metrics.setGauge("runtime.bytes_live", stats.bytesLive);
  metrics.setGauge("runtime.peak_bytes_live", stats.peakBytesLive);
}

} // namespace gilbridge::obs
