/***
 * Name: gilbridge::Bytes
 * Purpose: Typed view of a foreign immutable byte buffer.
 * Inputs: A BorrowedRef that passed the bytes type check, or host bytes to copy
 * Outputs: Length-delimited view of the stored bytes
 * Theory of Operation: The buffer is never treated as NUL terminated; embedded
 *   zero bytes are preserved both ways.
 */
#pragma once

#include <cstddef>
#include <string_view>

#include "gilbridge/BorrowedRef.h"
#include "gilbridge/Owned.h"
#include "gilbridge/Result.h"
#include "gilbridge/Token.h"

namespace gilbridge {

class Bytes {
 public:
  static constexpr const char* kTypeName = "bytes";

  static Owned<Bytes> create(Token token, std::string_view data);
  static Owned<Bytes> fromPtr(Token token, const void* data, std::size_t len);
  static Result<Bytes> tryFrom(BorrowedRef ref);

  std::string_view asBytes() const;
  const unsigned char* data() const;
  std::size_t len() const;

  const BorrowedRef& ref() const noexcept { return ref_; }
  Owned<Bytes> toOwned() const;

 private:
  template <typename>
  friend class Owned;
  explicit Bytes(BorrowedRef ref) noexcept : ref_(ref) {}

  BorrowedRef ref_;
};

}  // namespace gilbridge
