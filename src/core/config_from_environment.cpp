/***
 * Name: gilbridge::configFromEnvironment
 * Purpose: Build a Config from GILBRIDGE_* environment variables.
 * Inputs: Process environment
 * Outputs: Validated Config
 * Theory of Operation: Unset variables keep defaults; an unrecognized policy
 *   value throws ConfigError naming the variable and value.
 */
#include "gilbridge/Config.h"
#include "gilbridge/exceptions/config_error.h"

#include <cstdlib>
#include <string>

namespace gilbridge {

Config configFromEnvironment() {
  Config config;
  if (const char* debug = std::getenv("GILBRIDGE_DEBUG"); debug != nullptr) {
    const std::string value(debug);
    config.debug = !(value.empty() || value == "0");
  }
  if (const char* policy = std::getenv("GILBRIDGE_ON_ALLOC_FAILURE"); policy != nullptr && *policy != '\0') {
    if (!parseAllocationFailurePolicy(policy, config.onAllocationFailure)) {
      throw exceptions::ConfigError(std::string("GILBRIDGE_ON_ALLOC_FAILURE: expected 'throw' or 'abort', got '") +
                                    policy + "'");
    }
  }
  return config;
}

}  // namespace gilbridge
