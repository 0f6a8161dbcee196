/***
 * Name: gilbridge::Token (impl)
 * Purpose: Answer and enforce token liveness.
 */
#include "gilbridge/Token.h"
#include "gilbridge/detail/Scopes.h"
#include "gilbridge/exceptions/scope_violation.h"
#include "gilbridge/support/debug.h"

#include <string>

namespace gilbridge {

bool Token::alive() const noexcept { return detail::scope_is_open(scope_); }

void Token::require() const {
  if (alive()) { return; }
  support::DebugLog("scope violation: token for scope %llu used outside its LockGuard",
                    static_cast<unsigned long long>(scope_));
  throw exceptions::ScopeViolation("token for lock scope " + std::to_string(scope_) +
                                   " used outside its LockGuard or on another thread");
}

}  // namespace gilbridge
