/***
 * Name: gilbridge::fatal::allocationFailure
 * Purpose: Terminate the current operation after the foreign heap failed to allocate.
 * Inputs:
 *   - operation: name of the bridge call that needed the object
 *   - detail: what the runtime reported (usually its MemoryError text)
 * Outputs: Never returns
 * Theory of Operation: Always writes one line to stderr (not gated by debug:
 *   the process is about to lose an operation or die). Then throws
 *   AllocationFailure or aborts per the active Config.
 */
#include "gilbridge/Fatal.h"
#include "gilbridge/Config.h"
#include "gilbridge/exceptions/allocation_failure.h"

#include <cstdio>
#include <cstdlib>
#include <string>

namespace gilbridge::fatal {

void allocationFailure(const char* operation, const std::string& detail) {
  std::string message = std::string(operation) + ": foreign runtime could not allocate";
  if (!detail.empty()) { message += " (" + detail + ")"; }
  std::fprintf(stderr, "[gilbridge] fatal: %s\n", message.c_str());
  if (activeConfig().onAllocationFailure == AllocationFailurePolicy::Abort) {
    std::abort();
  }
  throw exceptions::AllocationFailure(message);
}

}  // namespace gilbridge::fatal
