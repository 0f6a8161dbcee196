/***
 * Name: gilbridge::ffi::api, gilbridge::ffi::install
 * Purpose: Select the foreign runtime implementation the bridge talks to.
 * Inputs: Optional replacement implementation
 * Outputs: Reference to the installed implementation
 * Theory of Operation: An atomic pointer; nullptr means the bundled runtime.
 *   Swapping while references are live would hand their pointers to a runtime
 *   that never created them, so callers swap only at quiescent points.
 */
#include "gilbridge/ffi/Api.h"
#include "runtime/RuntimeApi.h"

#include <atomic>

namespace gilbridge::ffi {

namespace {
std::atomic<Api*> g_installed{nullptr}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
}  // namespace

Api& api() {
  Api* impl = g_installed.load(std::memory_order_acquire);
  return impl != nullptr ? *impl : rt::RuntimeApi::instance();
}

Api* install(Api* impl) {
  Api* previous = g_installed.exchange(impl, std::memory_order_acq_rel);
  return previous != nullptr ? previous : &rt::RuntimeApi::instance();
}

}  // namespace gilbridge::ffi
