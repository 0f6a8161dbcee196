/***
 * Name: gilbridge::support::ValidateUtf8
 * Purpose: Locate the first ill-formed unit in a UTF-8 byte range.
 * Inputs:
 *   - p, n: byte range to validate
 *   - allowSurrogates: accept ED A0..BF continuation (generalized UTF-8); otherwise
 *     ED A0 is an invalid continuation at the ED, as for any out-of-range second byte
 * Outputs: nullopt when valid; otherwise the valid prefix length, unit length and reason
 * Theory of Operation: Table-driven lead byte classification. The second byte
 *   range depends on the lead (E0, ED, F0, F4 are restricted); later bytes must
 *   be 80..BF. A mismatch ends the maximal subpart at the offending byte.
 */
#include "gilbridge/support/utf8.h"

#include <cstddef>
#include <optional>

namespace gilbridge {
namespace support {

namespace {
constexpr unsigned char kContLo = 0x80U;
constexpr unsigned char kContHi = 0xBFU;

bool in_range(unsigned char c, unsigned char lo, unsigned char hi) { return c >= lo && c <= hi; }
}  // namespace

std::optional<Utf8Error> ValidateUtf8(const unsigned char* p, std::size_t n, bool allowSurrogates) {
  std::size_t i = 0;
  while (i < n) {
    const unsigned char c = p[i];
    if (c < 0x80U) { ++i; continue; }
    std::size_t need = 0;
    unsigned char lo = kContLo;
    unsigned char hi = kContHi;
    if (in_range(c, 0xC2U, 0xDFU)) { need = 1; }
    else if (c == 0xE0U) { need = 2; lo = 0xA0U; }
    else if (c == 0xEDU) { need = 2; hi = allowSurrogates ? kContHi : 0x9FU; }
    else if (in_range(c, 0xE1U, 0xEFU)) { need = 2; }
    else if (c == 0xF0U) { need = 3; lo = 0x90U; }
    else if (in_range(c, 0xF1U, 0xF3U)) { need = 3; }
    else if (c == 0xF4U) { need = 3; hi = 0x8FU; }
    else { return Utf8Error{i, 1, "invalid start byte"}; }

    if (i + 1 >= n) { return Utf8Error{i, 0, "unexpected end of data"}; }
    const unsigned char c1 = p[i + 1];
    if (!in_range(c1, lo, hi)) { return Utf8Error{i, 1, "invalid continuation byte"}; }
    for (std::size_t k = 2; k <= need; ++k) {
      if (i + k >= n) { return Utf8Error{i, 0, "unexpected end of data"}; }
      if (!in_range(p[i + k], kContLo, kContHi)) { return Utf8Error{i, k, "invalid continuation byte"}; }
    }
    i += need + 1;
  }
  return std::nullopt;
}

}  // namespace support
}  // namespace gilbridge
