/***
 * Name: gilbridge::support::AppendCodePoint
 * Purpose: Encode a single code point as generalized UTF-8.
 * Inputs:
 *   - out: destination buffer
 *   - cp: code point in [0, 0x10FFFF]; surrogates allowed
 * Outputs: out grows by one to four bytes
 * Theory of Operation: Standard UTF-8 bit packing without the surrogate exclusion.
 *   Callers validate the range; out-of-range values encode as U+FFFD.
 */
#include "gilbridge/support/utf8.h"

#include <cstdint>
#include <string>

namespace gilbridge {
namespace support {

void AppendCodePoint(std::string& out, uint32_t cp) {
  if (cp > 0x10FFFFU) { cp = kReplacementCharacter; }
  if (cp < 0x80U) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800U) {
    out.push_back(static_cast<char>(0xC0U | (cp >> 6U)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else if (cp < 0x10000U) {
    out.push_back(static_cast<char>(0xE0U | (cp >> 12U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xF0U | (cp >> 18U)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
  }
}

}  // namespace support
}  // namespace gilbridge
