/***
 * Name: gilbridge::support (debug)
 * Purpose: Opt-in diagnostic output for the bridge core.
 * Inputs: printf-style format strings
 * Outputs: Lines on stderr prefixed with "[gilbridge]"
 * Theory of Operation: The enabled flag starts from GILBRIDGE_DEBUG and is
 *   overridden by applyConfig(). Output is unbuffered stderr; nothing is
 *   formatted when the flag is off.
 */
#pragma once

namespace gilbridge {
namespace support {

/*** DebugEnabled: Whether diagnostic output is on. */
bool DebugEnabled();

/*** SetDebugEnabled: Turn diagnostic output on or off. */
void SetDebugEnabled(bool enabled);

/*** DebugLog: Emit one "[gilbridge] ..." line when enabled. */
void DebugLog(const char* fmt, ...) __attribute__((format(printf, 1, 2)));

}  // namespace support
}  // namespace gilbridge
