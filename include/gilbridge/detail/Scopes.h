/**
 * @file
 * @brief Per-thread registry of open LockGuard scopes backing Token::alive().
 */
#pragma once

#include <cstddef>
#include <cstdint>

namespace gilbridge::detail {

uint64_t open_scope();

void close_scope(uint64_t scope);

bool scope_is_open(uint64_t scope);

// Number of scopes open on the calling thread, suspended ones included.
std::size_t open_scope_count();

// Mark every tag open now as suspended; returns the previous mark for resume_open_scopes().
std::size_t suspend_open_scopes();

void resume_open_scopes(std::size_t previousMark);

} // namespace gilbridge::detail
