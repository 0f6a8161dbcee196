/***
 * Name: gilbridge::support::DecodeUtf8Lossy
 * Purpose: Produce well-formed UTF-8 from arbitrary bytes.
 * Inputs:
 *   - p, n: byte range to repair
 * Outputs: Copy of the input with each invalid unit replaced by U+FFFD
 * Theory of Operation: Repeatedly validates the remaining suffix, copies the
 *   valid prefix, emits one replacement character and skips the invalid unit.
 *   A truncated trailing sequence becomes a single replacement character.
 */
#include "gilbridge/support/utf8.h"

#include <cstddef>
#include <string>

namespace gilbridge {
namespace support {

std::string DecodeUtf8Lossy(const unsigned char* p, std::size_t n) {
  std::string out;
  out.reserve(n);
  std::size_t pos = 0;
  while (pos < n) {
    const auto err = ValidateUtf8(p + pos, n - pos);
    if (!err) {
      out.append(reinterpret_cast<const char*>(p + pos), n - pos);
      break;
    }
    out.append(reinterpret_cast<const char*>(p + pos), err->validUpTo);
    AppendCodePoint(out, kReplacementCharacter);
    if (err->errorLen == 0) { break; }
    pos += err->validUpTo + err->errorLen;
  }
  return out;
}

}  // namespace support
}  // namespace gilbridge
