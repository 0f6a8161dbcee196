/***
 * Name: gilbridge::BorrowedRef
 * Purpose: Non-owning view of a foreign object, bounded by a token's scope.
 * Inputs: Token and a raw pointer the caller keeps alive for the token's scope
 * Outputs: Checked raw pointer access, identity comparison, promotion to OwnedRef
 * Theory of Operation:
 *   Two words: the token and the pointer. It never touches the refcount. Every
 *   read goes through asPtr(), which rejects a dead token with ScopeViolation,
 *   so a view that escaped its LockGuard fails loudly instead of dangling.
 */
#pragma once

#include "gilbridge/Token.h"
#include "gilbridge/ffi/Api.h"

namespace gilbridge {

class OwnedRef;

class BorrowedRef {
 public:
  // ptr must be non-null and stay alive while token is (InvalidReference otherwise).
  static BorrowedRef fromBorrowedPtr(Token token, ffi::RawObject* ptr);

  ffi::RawObject* asPtr() const;
  Token token() const noexcept { return token_; }
  bool valid() const noexcept { return token_.alive(); }

  const char* typeName() const;
  bool isInstance(ffi::BuiltinType type) const;
  bool isNone() const;

  // New strong reference to the same object.
  OwnedRef toOwned() const;

  friend bool operator==(const BorrowedRef& a, const BorrowedRef& b) noexcept { return a.ptr_ == b.ptr_; }
  friend bool operator!=(const BorrowedRef& a, const BorrowedRef& b) noexcept { return a.ptr_ != b.ptr_; }

 private:
  BorrowedRef(Token token, ffi::RawObject* ptr) noexcept : token_(token), ptr_(ptr) {}

  Token token_;
  ffi::RawObject* ptr_;
};

}  // namespace gilbridge
