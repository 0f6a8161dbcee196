/***
 * Name: gilbridge::support (utf8)
 * Purpose: UTF-8 validation, lossy repair and code point encoding shared by the
 *          bridge core and the bundled runtime.
 * Inputs: Raw byte ranges
 * Outputs: Validation results with the first error position; repaired strings
 * Theory of Operation:
 *   Validation follows the well-formed byte sequence table of the Unicode
 *   standard. An error reports how many leading bytes were valid and the length
 *   of the offending unit (the maximal subpart of an ill-formed sequence). An
 *   encoded surrogate is not a unit of its own: ED fails on its second byte and
 *   the remaining bytes are each invalid start bytes.
 *   Text stored with escaped bytes (U+DC80..U+DCFF standing for 0x80..0xFF) is
 *   turned back into the original bytes by UnescapeSurrogates.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace gilbridge {
namespace support {

inline constexpr uint32_t kReplacementCharacter = 0xFFFDU;

struct Utf8Error {
  std::size_t validUpTo{0};
  // Length of the invalid unit; 0 means the input ended inside a sequence.
  std::size_t errorLen{0};
  const char* reason{""};
};

/*** ValidateUtf8: Return the first error, or nullopt when [p, p+n) is well formed.
 *   allowSurrogates accepts encoded surrogate code points (generalized UTF-8). */
std::optional<Utf8Error> ValidateUtf8(const unsigned char* p, std::size_t n, bool allowSurrogates = false);

/*** DecodeUtf8Lossy: Copy [p, p+n) replacing each invalid unit with U+FFFD. */
std::string DecodeUtf8Lossy(const unsigned char* p, std::size_t n);

/*** UnescapeSurrogates: Copy [p, p+n) turning each encoded U+DC80..U+DCFF into
 *   the byte it escapes; everything else is copied unchanged. */
std::string UnescapeSurrogates(const unsigned char* p, std::size_t n);

/*** AppendCodePoint: Append cp (surrogates included) in generalized UTF-8. */
void AppendCodePoint(std::string& out, uint32_t cp);

}  // namespace support
}  // namespace gilbridge
