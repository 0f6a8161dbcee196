/***
 * Name: gilbridge::support (debug state)
 * Purpose: Hold the process-wide diagnostic flag.
 * Inputs: GILBRIDGE_DEBUG environment variable at startup; SetDebugEnabled calls
 * Outputs: DebugEnabled() answers
 * Theory of Operation: Relaxed atomic; readers only need an eventually visible value.
 */
#include "gilbridge/support/debug.h"

#include <atomic>
#include <cstdlib>

namespace gilbridge {
namespace support {

namespace {
bool env_enabled() {
  const char* value = std::getenv("GILBRIDGE_DEBUG");
  return value != nullptr && *value != '\0' && !(value[0] == '0' && value[1] == '\0');
}

std::atomic<bool>& debug_flag() {
  static std::atomic<bool> flag{env_enabled()};
  return flag;
}
}  // namespace

bool DebugEnabled() { return debug_flag().load(std::memory_order_relaxed); }

void SetDebugEnabled(bool enabled) { debug_flag().store(enabled, std::memory_order_relaxed); }

}  // namespace support
}  // namespace gilbridge
