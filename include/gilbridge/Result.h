/***
 * Name: gilbridge::Result
 * Purpose: Value-or-error return type for every recoverable boundary operation.
 * Inputs: A value of T or an error of E (Error unless an operation has a narrower failure type)
 * Outputs: isOk()/value()/error() accessors
 * Theory of Operation: Holds exactly one of the two in a std::variant. Accessing
 *   the wrong alternative is a programming error and throws std::bad_variant_access.
 *   Construction is implicit from either alternative so `return value;` and
 *   `return error;` both read naturally at call sites.
 */
#pragma once

#include <utility>
#include <variant>

#include "gilbridge/Error.h"

namespace gilbridge {

template <typename T, typename E = Error>
class Result {
 public:
  Result(T value) : storage_(std::in_place_index<0>, std::move(value)) {}  // NOLINT(google-explicit-constructor)
  Result(E error) : storage_(std::in_place_index<1>, std::move(error)) {}  // NOLINT(google-explicit-constructor)

  bool isOk() const noexcept { return storage_.index() == 0; }
  explicit operator bool() const noexcept { return isOk(); }

  T& value() & { return std::get<0>(storage_); }
  const T& value() const& { return std::get<0>(storage_); }
  T&& value() && { return std::get<0>(std::move(storage_)); }

  const E& error() const& { return std::get<1>(storage_); }
  E&& error() && { return std::get<1>(std::move(storage_)); }

  template <typename U>
  T valueOr(U&& fallback) const& {
    return isOk() ? std::get<0>(storage_) : static_cast<T>(std::forward<U>(fallback));
  }

 private:
  std::variant<T, E> storage_;
};

}  // namespace gilbridge
