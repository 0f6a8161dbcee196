/***
 * Name: gilbridge::support::DebugLog
 * Purpose: Write a single diagnostic line to stderr.
 * Inputs:
 *   - fmt, ...: printf-style message
 * Outputs: "[gilbridge] <message>\n" on stderr when debugging is enabled
 * Theory of Operation: Formats into a fixed buffer so the line is emitted with
 *   one fprintf call and does not interleave with other threads mid-line.
 */
#include "gilbridge/support/debug.h"

#include <cstdarg>
#include <cstdio>

namespace gilbridge {
namespace support {

void DebugLog(const char* fmt, ...) {
  if (!DebugEnabled()) { return; }
  char line[512];
  va_list args;
  va_start(args, fmt);
  std::vsnprintf(line, sizeof(line), fmt, args);
  va_end(args);
  std::fprintf(stderr, "[gilbridge] %s\n", line);
}

}  // namespace support
}  // namespace gilbridge
