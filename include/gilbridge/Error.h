/***
 * Name: gilbridge::Error
 * Purpose: Host-side capture of a recoverable foreign-boundary failure.
 * Inputs:
 *   - The pending foreign exception (fetch/take), or
 *   - A host-detected failure (type mismatch, text decode)
 * Outputs: Inspectable kind, foreign type name, message and decode payload;
 *   re-raisable into the foreign runtime (restore/toObject).
 * Theory of Operation:
 *   Everything is copied out of the foreign exception at capture time, so an
 *   Error can be inspected, copied and moved across threads without the lock.
 *   Rebuilding a foreign exception needs a token again. Allocation failure is
 *   never an Error; see fatal::allocationFailure.
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "gilbridge/Token.h"

namespace gilbridge {

class OwnedRef;

enum class ErrorKind {
  TypeMismatch,     // a checked downcast or extraction met the wrong foreign type
  Decode,           // bytes are not valid text under the expected encoding
  ForeignException  // an exception raised by the foreign runtime
};

struct DecodeInfo {
  std::string encoding;
  std::string object;  // the complete input that failed to decode
  std::size_t start{0};
  std::size_t end{0};
  std::string reason;
};

class Error {
 public:
  static Error typeMismatch(const std::string& expected, const std::string& actual);
  static Error foreign(std::string typeName, std::string message);
  static Error decode(DecodeInfo info);

  // Take the pending foreign exception; SystemError if nothing is pending.
  static Error fetch(Token token);
  // Take the pending foreign exception if there is one.
  static std::optional<Error> take(Token token);

  ErrorKind kind() const noexcept { return kind_; }
  const std::string& typeName() const noexcept { return typeName_; }
  const std::string& message() const noexcept { return message_; }
  const std::optional<DecodeInfo>& decodeInfo() const noexcept { return decode_; }

  // "TypeName: message"
  std::string toString() const;

  // Whether the captured type is typeName or a subclass of it in the foreign hierarchy.
  bool matches(Token token, const char* typeName) const;

  // Build the equivalent foreign exception object.
  OwnedRef toObject(Token token) const;

  // Make the equivalent foreign exception the pending one.
  void restore(Token token) const;

 private:
  Error(ErrorKind kind, std::string typeName, std::string message, std::optional<DecodeInfo> decode);

  ErrorKind kind_;
  std::string typeName_;
  std::string message_;
  std::optional<DecodeInfo> decode_;
};

}  // namespace gilbridge
