/**
 * @file
 * @brief Decode helpers for utf-8, ascii, latin-1 and ICU-backed encodings.
 */
#pragma once

#include <cstddef>
#include <string>

namespace gilbridge::rt::detail {

enum class ErrorPolicy { Strict, Replace, Ignore, SurrogateEscape, SurrogatePass };

// Position and reason of the first undecodable unit under the strict policy.
struct DecodeFailure {
  std::size_t start{0};
  std::size_t end{0};
  const char* reason{""};
};

// Map an error handler name to a policy; nullptr or "" means strict.
bool parse_error_policy(const char* name, ErrorPolicy& out);

// Lowercase with '_' folded to '-' ("UTF_8" -> "utf-8").
std::string normalize_encoding_name(const char* name);

// Decoders append generalized UTF-8 to out. Return false (filling failure) only
// when the strict policy meets an undecodable unit.
bool decode_utf8_bytes(const unsigned char* p, std::size_t nb, ErrorPolicy policy, std::string& out_utf8,
                       DecodeFailure& failure);

bool decode_ascii_bytes(const unsigned char* p, std::size_t nb, ErrorPolicy policy, std::string& out_utf8,
                        DecodeFailure& failure);

void decode_latin1_bytes(const unsigned char* p, std::size_t nb, std::string& out_utf8);

enum class IcuDecodeStatus { Ok, UnknownEncoding, UnsupportedPolicy, Failed };

// Decode through an ICU converter; supports strict, replace and ignore.
IcuDecodeStatus decode_icu_bytes(const char* encoding, const unsigned char* p, std::size_t nb, ErrorPolicy policy,
                                 std::string& out_utf8, DecodeFailure& failure);

} // namespace gilbridge::rt::detail
