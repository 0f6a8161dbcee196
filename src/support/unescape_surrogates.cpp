/***
 * Name: gilbridge::support::UnescapeSurrogates
 * Purpose: Recover the original bytes of text stored with escaped invalid bytes.
 * Inputs:
 *   - p, n: generalized UTF-8 byte range
 * Outputs: Copy of the input with ED B2 80..BF and ED B3 80..BF (U+DC80..U+DCFF)
 *          replaced by the single byte 0x80..0xFF each one stands for
 * Theory of Operation: Bytes below 0x80 are never escaped, so only the upper
 *   half of the low-surrogate block is mapped back.
 */
#include "gilbridge/support/utf8.h"

#include <cstddef>
#include <string>

namespace gilbridge {
namespace support {

std::string UnescapeSurrogates(const unsigned char* p, std::size_t n) {
  std::string out;
  out.reserve(n);
  std::size_t i = 0;
  while (i < n) {
    if (p[i] == 0xEDU && i + 2 < n && (p[i + 1] == 0xB2U || p[i + 1] == 0xB3U) && (p[i + 2] & 0xC0U) == 0x80U) {
      const unsigned hi = p[i + 1] == 0xB3U ? 0x40U : 0x00U;
      out.push_back(static_cast<char>(0x80U + hi + (p[i + 2] & 0x3FU)));
      i += 3;
      continue;
    }
    out.push_back(static_cast<char>(p[i]));
    ++i;
  }
  return out;
}

}  // namespace support
}  // namespace gilbridge
