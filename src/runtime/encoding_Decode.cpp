/**
 * @file
 * @brief Decode helpers for utf-8, ascii and latin-1.
 */
#include "runtime/detail/EncodingHandlers.h"
#include "gilbridge/support/utf8.h"

#include <cctype>
#include <cstdint>
#include <cstring>
#include <string>

namespace gilbridge::rt::detail {

static constexpr uint32_t kSurrogateEscapeBase = 0xDC00U;

bool parse_error_policy(const char* name, ErrorPolicy& out) {
  if (name == nullptr || *name == '\0' || std::strcmp(name, "strict") == 0) { out = ErrorPolicy::Strict; return true; }
  if (std::strcmp(name, "replace") == 0) { out = ErrorPolicy::Replace; return true; }
  if (std::strcmp(name, "ignore") == 0) { out = ErrorPolicy::Ignore; return true; }
  if (std::strcmp(name, "surrogateescape") == 0) { out = ErrorPolicy::SurrogateEscape; return true; }
  if (std::strcmp(name, "surrogatepass") == 0) { out = ErrorPolicy::SurrogatePass; return true; }
  return false;
}

std::string normalize_encoding_name(const char* name) {
  std::string out = (name != nullptr && *name != '\0') ? name : "utf-8";
  for (auto& c : out) {
    if (c == '_') { c = '-'; }
    else { c = static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }
  }
  return out;
}

// Handle one undecodable unit [p, p+len) under a non-strict policy.
static void repair_unit(const unsigned char* p, std::size_t len, ErrorPolicy policy, std::string& out) {
  switch (policy) {
    case ErrorPolicy::Replace: support::AppendCodePoint(out, support::kReplacementCharacter); break;
    case ErrorPolicy::SurrogateEscape:
      for (std::size_t i = 0; i < len; ++i) { support::AppendCodePoint(out, kSurrogateEscapeBase + p[i]); }
      break;
    default: break;
  }
}

bool decode_utf8_bytes(const unsigned char* p, std::size_t nb, ErrorPolicy policy, std::string& out_utf8,
                       DecodeFailure& failure) {
  out_utf8.reserve(out_utf8.size() + nb);
  const bool allowSurrogates = policy == ErrorPolicy::SurrogatePass;
  std::size_t pos = 0;
  while (pos < nb) {
    const auto err = support::ValidateUtf8(p + pos, nb - pos, allowSurrogates);
    if (!err) {
      out_utf8.append(reinterpret_cast<const char*>(p + pos), nb - pos);
      break;
    }
    out_utf8.append(reinterpret_cast<const char*>(p + pos), err->validUpTo);
    const std::size_t start = pos + err->validUpTo;
    const std::size_t unit = (err->errorLen == 0) ? (nb - start) : err->errorLen;
    if (policy == ErrorPolicy::Strict || policy == ErrorPolicy::SurrogatePass) {
      failure.start = start;
      failure.end = start + unit;
      failure.reason = err->reason;
      return false;
    }
    repair_unit(p + start, unit, policy, out_utf8);
    pos = start + unit;
  }
  return true;
}

bool decode_ascii_bytes(const unsigned char* p, std::size_t nb, ErrorPolicy policy, std::string& out_utf8,
                        DecodeFailure& failure) {
  out_utf8.reserve(out_utf8.size() + nb);
  for (std::size_t i = 0; i < nb; ++i) {
    if ((p[i] & 0x80U) == 0) { out_utf8.push_back(static_cast<char>(p[i])); continue; }
    if (policy == ErrorPolicy::Strict || policy == ErrorPolicy::SurrogatePass) {
      failure.start = i;
      failure.end = i + 1;
      failure.reason = "ordinal not in range(128)";
      return false;
    }
    repair_unit(p + i, 1, policy, out_utf8);
  }
  return true;
}

void decode_latin1_bytes(const unsigned char* p, std::size_t nb, std::string& out_utf8) {
  out_utf8.reserve(out_utf8.size() + nb);
  for (std::size_t i = 0; i < nb; ++i) { support::AppendCodePoint(out_utf8, p[i]); }
}

} // namespace gilbridge::rt::detail
