/***
 * Name: gilbridge::Token
 * Purpose: Access token proving the bridge lock is held in the current scope.
 * Inputs: Minted only by LockGuard
 * Outputs: Witness passed to every foreign-object operation
 * Theory of Operation:
 *   A token carries the tag of the LockGuard scope that minted it and nothing
 *   else; copying it is free. It is alive while that scope is open on the
 *   calling thread and the thread has not suspended the lock (AllowThreads).
 *   require() turns a dead token into exceptions::ScopeViolation, which is how
 *   borrowed views that escaped their scope are caught at run time.
 */
#pragma once

#include <cstdint>

namespace gilbridge {

class LockGuard;

class Token {
 public:
  // True while the minting scope is open on this thread and the lock is not suspended.
  bool alive() const noexcept;

  // Throws exceptions::ScopeViolation when !alive().
  void require() const;

  uint64_t scope() const noexcept { return scope_; }

  friend bool operator==(Token a, Token b) noexcept { return a.scope_ == b.scope_; }
  friend bool operator!=(Token a, Token b) noexcept { return a.scope_ != b.scope_; }

 private:
  friend class LockGuard;
  explicit Token(uint64_t scope) noexcept : scope_(scope) {}

  uint64_t scope_;
};

}  // namespace gilbridge
