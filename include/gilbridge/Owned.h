/***
 * Name: gilbridge::Owned<T>
 * Purpose: Owning reference whose object is known to be of typed wrapper T.
 * Inputs: An OwnedRef whose type was checked (by T itself or by tryFrom)
 * Outputs: Typed views bound to a token
 * Theory of Operation: Same ownership rules as OwnedRef; the type check is
 *   done once, at construction. Only T and tryFrom can construct one.
 */
#pragma once

#include <utility>

#include "gilbridge/OwnedRef.h"
#include "gilbridge/Result.h"

namespace gilbridge {

template <typename T>
class Owned {
 public:
  static Result<Owned<T>> tryFrom(Token token, OwnedRef ref) {
    auto view = T::tryFrom(ref.asBorrowed(token));
    if (!view.isOk()) { return std::move(view).error(); }
    return Owned<T>(std::move(ref));
  }

  T get(Token token) const { return T(ref_.asBorrowed(token)); }
  BorrowedRef asBorrowed(Token token) const { return ref_.asBorrowed(token); }
  Owned clone(Token token) const { return Owned(ref_.clone(token)); }

  const OwnedRef& ref() const noexcept { return ref_; }
  OwnedRef intoRef() && { return std::move(ref_); }

 private:
  friend T;
  explicit Owned(OwnedRef ref) noexcept : ref_(std::move(ref)) {}

  OwnedRef ref_;
};

}  // namespace gilbridge
