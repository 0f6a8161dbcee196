/***
 * Name: gilbridge::DecodeError
 * Purpose: Failure of a text view to validate as UTF-8.
 * Inputs: The byte view and the first validation error
 * Outputs: First invalid offset, offending byte range, reason; conversion into Error
 * Theory of Operation: Owns a copy of the input so it outlives the token that
 *   produced the view. toError() yields an ErrorKind::Decode Error shaped like
 *   the foreign runtime's UnicodeDecodeError.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "gilbridge/Error.h"
#include "gilbridge/support/utf8.h"

namespace gilbridge {

class DecodeError {
 public:
  DecodeError(std::string encoding, std::string input, std::size_t start, std::size_t end, std::string reason);

  static DecodeError fromUtf8(std::string_view input, const support::Utf8Error& err);

  // Number of leading bytes that were valid; also the first invalid offset.
  std::size_t validUpTo() const noexcept { return start_; }
  std::size_t start() const noexcept { return start_; }
  std::size_t end() const noexcept { return end_; }
  std::string_view offendingBytes() const;

  const std::string& encoding() const noexcept { return encoding_; }
  const std::string& input() const noexcept { return input_; }
  const std::string& reason() const noexcept { return reason_; }

  std::string message() const;
  Error toError() const;

 private:
  std::string encoding_;
  std::string input_;
  std::size_t start_;
  std::size_t end_;
  std::string reason_;
};

}  // namespace gilbridge
