/***
 * Name: gilbridge::applyConfig, gilbridge::activeConfig
 * Purpose: Install and read the process-wide configuration.
 * Inputs: Config to install
 * Outputs: Copy of the active Config
 * Theory of Operation: Guarded by a mutex; applyConfig also forwards the
 *   debug flag to support::SetDebugEnabled so logging follows the config.
 */
#include "gilbridge/Config.h"
#include "gilbridge/support/debug.h"

#include <mutex>

namespace gilbridge {

namespace {
std::mutex g_config_mu; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
Config g_config{support::DebugEnabled(), AllocationFailurePolicy::Throw}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
}  // namespace

void applyConfig(const Config& config) {
  {
    const std::lock_guard<std::mutex> lk(g_config_mu);
    g_config = config;
  }
  support::SetDebugEnabled(config.debug);
}

Config activeConfig() {
  const std::lock_guard<std::mutex> lk(g_config_mu);
  return g_config;
}

}  // namespace gilbridge
