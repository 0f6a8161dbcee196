/***
 * Name: gilbridge::String
 * Purpose: Typed view of a foreign text object.
 * Inputs: A BorrowedRef that passed the text type check, or host text to copy
 * Outputs: Byte view of the stored text, validated or repaired host text
 * Theory of Operation:
 *   The foreign runtime stores text as generalized UTF-8, so asBytes() is a
 *   zero-copy view of that storage. create() never fails on content: each byte
 *   of host text that is not valid UTF-8 is kept as the lone surrogate
 *   U+DC00+byte. toText() validates strictly; on failure the escaped bytes are
 *   mapped back first, so the DecodeError describes the text as it was created.
 *   toTextLossy() is the only path that repairs silently, with one U+FFFD per
 *   maximal invalid subpart of those original bytes.
 *   All views are valid while the token the wrapped reference carries is alive.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "gilbridge/BorrowedRef.h"
#include "gilbridge/DecodeError.h"
#include "gilbridge/Owned.h"
#include "gilbridge/Result.h"
#include "gilbridge/Token.h"

namespace gilbridge {

class String {
 public:
  // Foreign type name used in TypeMismatch errors.
  static constexpr const char* kTypeName = "str";

  static Owned<String> create(Token token, std::string_view text);
  static Result<String> tryFrom(BorrowedRef ref);

  // Decode src (bytes-like) with the runtime's codec; encoding and errors are passed through.
  static Result<Owned<String>> fromObject(BorrowedRef src, const char* encoding = "utf-8",
                                          const char* errors = "strict");

  std::string_view asBytes() const;
  std::size_t len() const { return asBytes().size(); }

  Result<std::string_view, DecodeError> toText() const;
  std::string toTextLossy() const;

  const BorrowedRef& ref() const noexcept { return ref_; }
  Owned<String> toOwned() const;

 private:
  template <typename>
  friend class Owned;
  explicit String(BorrowedRef ref) noexcept : ref_(ref) {}

  BorrowedRef ref_;
};

}  // namespace gilbridge
