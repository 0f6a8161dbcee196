/***
 * Name: gilbridge::detail (scope registry)
 * Purpose: Track which LockGuard scopes are open on each thread.
 * Theory of Operation: Scope tags come from a process-wide counter so a tag is
 *   never reused. Each thread keeps a small stack of its open tags; guards nest,
 *   so closing normally pops the top. AllowThreads marks the tags open at the
 *   time it suspends; those report closed until it resumes, while tags opened
 *   after the mark stay live.
 */
#include "gilbridge/detail/Scopes.h"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace gilbridge::detail {

namespace {
std::atomic<uint64_t> g_next_scope{1}; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
thread_local std::vector<uint64_t> t_open_scopes; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
// Tags stored below this index belong to a suspended hold.
thread_local std::size_t t_suspended_below = 0; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)
} // namespace

uint64_t open_scope() {
  const uint64_t scope = g_next_scope.fetch_add(1, std::memory_order_relaxed);
  t_open_scopes.push_back(scope);
  return scope;
}

void close_scope(uint64_t scope) {
  if (!t_open_scopes.empty() && t_open_scopes.back() == scope) {
    t_open_scopes.pop_back();
    return;
  }
  auto it = std::find(t_open_scopes.begin(), t_open_scopes.end(), scope);
  if (it == t_open_scopes.end()) { return; }
  if (static_cast<std::size_t>(it - t_open_scopes.begin()) < t_suspended_below) { --t_suspended_below; }
  t_open_scopes.erase(it);
}

bool scope_is_open(uint64_t scope) {
  auto it = std::find(t_open_scopes.rbegin(), t_open_scopes.rend(), scope);
  if (it == t_open_scopes.rend()) { return false; }
  const auto index = static_cast<std::size_t>(t_open_scopes.rend() - it) - 1;
  return index >= t_suspended_below;
}

std::size_t open_scope_count() { return t_open_scopes.size(); }

std::size_t suspend_open_scopes() { return std::exchange(t_suspended_below, t_open_scopes.size()); }

void resume_open_scopes(std::size_t previousMark) { t_suspended_below = std::min(previousMark, t_open_scopes.size()); }

} // namespace gilbridge::detail
