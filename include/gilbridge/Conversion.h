/***
 * Name: gilbridge (Conversion protocol)
 * Purpose: Map host values to and from foreign objects.
 * Inputs: Host values (ToForeign) or borrowed foreign objects (FromForeign, TryDowncast)
 * Outputs: Owning references, host values, typed wrappers
 * Theory of Operation:
 *   Three independent capabilities, each a trait template specialized per type:
 *     - ToForeign<T>::convert(Token, const T&) -> OwnedRef. Infallible; running
 *       out of memory takes the fatal path.
 *     - FromForeign<T>::extract(BorrowedRef) -> Result<T>. Fails with a type
 *       mismatch, a decode error or a captured foreign exception.
 *     - TryDowncast<W>::downcast(BorrowedRef) -> Result<W>. Fails with a type
 *       mismatch only; the default forwards to W::tryFrom.
 *   Composite conversions run the steps in order and return the first failure
 *   unchanged (extracting std::string is a String downcast, then toText).
 *   A type gains a capability by specializing the trait; using one that is not
 *   specialized is a compile error.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "gilbridge/BorrowedRef.h"
#include "gilbridge/OwnedRef.h"
#include "gilbridge/Result.h"
#include "gilbridge/Token.h"

namespace gilbridge {

template <typename T>
struct ToForeign;

template <typename T>
struct FromForeign;

template <typename W>
struct TryDowncast {
  static Result<W> downcast(BorrowedRef ref) { return W::tryFrom(ref); }
};

/*** toObject: Convert a host value into a new foreign object. */
template <typename T>
OwnedRef toObject(Token token, T&& value) {
  return ToForeign<std::decay_t<T>>::convert(token, std::forward<T>(value));
}

/*** extract: Convert a foreign object into a host value. */
template <typename T>
Result<T> extract(BorrowedRef ref) {
  return FromForeign<T>::extract(ref);
}

/*** downcast: Narrow a foreign object to typed wrapper W. */
template <typename W>
Result<W> downcast(BorrowedRef ref) {
  return TryDowncast<W>::downcast(ref);
}

/*** noneObject: New reference to the foreign None. */
OwnedRef noneObject(Token token);

// Host -> foreign

template <>
struct ToForeign<std::string_view> {
  static OwnedRef convert(Token token, std::string_view value);
};

template <>
struct ToForeign<std::string> {
  static OwnedRef convert(Token token, const std::string& value) {
    return ToForeign<std::string_view>::convert(token, value);
  }
};

template <>
struct ToForeign<const char*> {
  static OwnedRef convert(Token token, const char* value) {
    return ToForeign<std::string_view>::convert(token, std::string_view(value));
  }
};

template <>
struct ToForeign<std::vector<std::uint8_t>> {
  static OwnedRef convert(Token token, const std::vector<std::uint8_t>& value);
};

template <>
struct ToForeign<bool> {
  static OwnedRef convert(Token token, bool value);
};

template <>
struct ToForeign<std::int64_t> {
  static OwnedRef convert(Token token, std::int64_t value);
};

template <>
struct ToForeign<int> {
  static OwnedRef convert(Token token, int value) {
    return ToForeign<std::int64_t>::convert(token, static_cast<std::int64_t>(value));
  }
};

template <>
struct ToForeign<double> {
  static OwnedRef convert(Token token, double value);
};

template <typename T>
struct ToForeign<std::optional<T>> {
  static OwnedRef convert(Token token, const std::optional<T>& value) {
    if (!value) { return noneObject(token); }
    return ToForeign<T>::convert(token, *value);
  }
};

// Foreign -> host

template <>
struct FromForeign<std::string_view> {
  // The view points into the foreign object's storage and is valid while that object is.
  static Result<std::string_view> extract(BorrowedRef ref);
};

template <>
struct FromForeign<std::string> {
  static Result<std::string> extract(BorrowedRef ref);
};

template <>
struct FromForeign<std::vector<std::uint8_t>> {
  static Result<std::vector<std::uint8_t>> extract(BorrowedRef ref);
};

template <>
struct FromForeign<bool> {
  static Result<bool> extract(BorrowedRef ref);
};

template <>
struct FromForeign<std::int64_t> {
  static Result<std::int64_t> extract(BorrowedRef ref);
};

template <>
struct FromForeign<double> {
  // Accepts float and int objects.
  static Result<double> extract(BorrowedRef ref);
};

template <typename T>
struct FromForeign<std::optional<T>> {
  static Result<std::optional<T>> extract(BorrowedRef ref) {
    if (ref.isNone()) { return std::optional<T>(); }
    Result<T> inner = FromForeign<T>::extract(ref);
    if (!inner.isOk()) { return std::move(inner).error(); }
    return std::optional<T>(std::move(inner).value());
  }
};

}  // namespace gilbridge
