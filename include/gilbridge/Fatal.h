/***
 * Name: gilbridge::fatal
 * Purpose: The single exit for unrecoverable foreign-runtime conditions.
 * Inputs: The failing operation and whatever the runtime reported
 * Outputs: Never returns
 * Theory of Operation: Allocation exhaustion bypasses Result entirely. The
 *   action is chosen by Config::onAllocationFailure.
 */
#pragma once

#include <string>

namespace gilbridge::fatal {

[[noreturn]] void allocationFailure(const char* operation, const std::string& detail);

}  // namespace gilbridge::fatal
