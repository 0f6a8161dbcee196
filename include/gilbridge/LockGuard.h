/***
 * Name: gilbridge::LockGuard, gilbridge::AllowThreads
 * Purpose: RAII acquisition of the bridge lock and the token it vouches for.
 * Inputs: none
 * Outputs: Token valid for the guard's lifetime
 * Theory of Operation:
 *   LockGuard acquires GlobalLock (re-entrantly) and opens a scope tag on the
 *   calling thread; its destructor closes the tag and releases. AllowThreads
 *   suspends the calling thread's hold for its own lifetime so other threads can
 *   run; tokens minted before it are dead until it resumes. A LockGuard opened
 *   inside it re-acquires the lock and mints a live token of its own.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>

#include "gilbridge/Token.h"

namespace gilbridge {

class LockGuard {
 public:
  LockGuard();
  ~LockGuard();

  LockGuard(const LockGuard&) = delete;
  LockGuard& operator=(const LockGuard&) = delete;
  LockGuard(LockGuard&&) = delete;
  LockGuard& operator=(LockGuard&&) = delete;

  Token token() const noexcept { return Token(scope_); }

 private:
  uint64_t scope_;
};

class AllowThreads {
 public:
  explicit AllowThreads(Token token);
  ~AllowThreads();

  AllowThreads(const AllowThreads&) = delete;
  AllowThreads& operator=(const AllowThreads&) = delete;

 private:
  std::size_t depth_;
  std::size_t scopeMark_;
};

/*** withLock: Run fn(Token) under a fresh LockGuard and return its result. */
template <typename F>
auto withLock(F&& fn) -> decltype(std::forward<F>(fn)(std::declval<Token>())) {
  LockGuard guard;
  return std::forward<F>(fn)(guard.token());
}

/*** allowThreads: Run fn() with the lock released; the caller's tokens are dead meanwhile. */
template <typename F>
auto allowThreads(Token token, F&& fn) -> decltype(std::forward<F>(fn)()) {
  AllowThreads unlocked(token);
  return std::forward<F>(fn)();
}

}  // namespace gilbridge
