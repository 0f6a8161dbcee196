/***
 * Name: gilbridge::Config
 * Purpose: Process-wide bridge settings.
 * Inputs:
 *   - GILBRIDGE_DEBUG: any value enables diagnostic output
 *   - GILBRIDGE_ON_ALLOC_FAILURE: "throw" (default) or "abort"
 * Outputs: The active configuration consulted by logging and the fatal path
 * Theory of Operation: configFromEnvironment() parses and validates the
 *   variables (ConfigError on unknown values); applyConfig() installs a Config.
 *   Until applyConfig() is called the defaults below are active.
 */
#pragma once

#include <string>

namespace gilbridge {

enum class AllocationFailurePolicy {
  Throw,  // throw exceptions::AllocationFailure; the operation cannot complete
  Abort   // log and std::abort(), matching runtimes that treat exhaustion as unrecoverable
};

struct Config {
  bool debug{false};
  AllocationFailurePolicy onAllocationFailure{AllocationFailurePolicy::Throw};
};

/*** parseAllocationFailurePolicy: "throw" | "abort" (case-insensitive). */
bool parseAllocationFailurePolicy(const std::string& text, AllocationFailurePolicy& out);

Config configFromEnvironment();

void applyConfig(const Config& config);

Config activeConfig();

}  // namespace gilbridge
