/**
 * @file
 * @brief Decode through ICU converters for encodings without a built-in handler.
 */
#include "runtime/detail/EncodingHandlers.h"

#include <unicode/ucnv.h>
#include <unicode/ucnv_err.h>
#include <unicode/ustring.h>
#include <unicode/utypes.h>

#include <memory>
#include <string>
#include <vector>

namespace gilbridge::rt::detail {

namespace {
struct ConverterCloser {
  void operator()(UConverter* cnv) const { ucnv_close(cnv); }
};
using ConverterPtr = std::unique_ptr<UConverter, ConverterCloser>;

constexpr std::size_t kMinTargetUnits = 16;
} // namespace

IcuDecodeStatus decode_icu_bytes(const char* encoding, const unsigned char* p, std::size_t nb, ErrorPolicy policy,
                                 std::string& out_utf8, DecodeFailure& failure) {
  UErrorCode status = U_ZERO_ERROR;
  ConverterPtr cnv(ucnv_open(encoding, &status));
  if (U_FAILURE(status) || !cnv) { return IcuDecodeStatus::UnknownEncoding; }

  UConverterToUCallback action = nullptr;
  switch (policy) {
    case ErrorPolicy::Strict: action = UCNV_TO_U_CALLBACK_STOP; break;
    case ErrorPolicy::Replace: action = UCNV_TO_U_CALLBACK_SUBSTITUTE; break;
    case ErrorPolicy::Ignore: action = UCNV_TO_U_CALLBACK_SKIP; break;
    default: return IcuDecodeStatus::UnsupportedPolicy;
  }
  ucnv_setToUCallBack(cnv.get(), action, nullptr, nullptr, nullptr, &status);
  if (U_FAILURE(status)) { return IcuDecodeStatus::UnsupportedPolicy; }

  const char* begin = reinterpret_cast<const char*>(p);
  const char* source = begin;
  const char* sourceLimit = begin + nb;
  std::vector<UChar> units(nb * 2 + kMinTargetUnits);
  UChar* target = units.data();
  for (;;) {
    status = U_ZERO_ERROR;
    ucnv_toUnicode(cnv.get(), &target, units.data() + units.size(), &source, sourceLimit, nullptr, true, &status);
    if (status != U_BUFFER_OVERFLOW_ERROR) { break; }
    const std::size_t used = static_cast<std::size_t>(target - units.data());
    units.resize(units.size() * 2);
    target = units.data() + used;
  }
  if (U_FAILURE(status)) {
    char invalid[32];
    int8_t invalidLen = static_cast<int8_t>(sizeof(invalid));
    UErrorCode invalidStatus = U_ZERO_ERROR;
    ucnv_getInvalidChars(cnv.get(), invalid, &invalidLen, &invalidStatus);
    if (U_FAILURE(invalidStatus)) { invalidLen = 1; }
    failure.end = static_cast<std::size_t>(source - begin);
    failure.start = failure.end >= static_cast<std::size_t>(invalidLen) ? failure.end - static_cast<std::size_t>(invalidLen) : 0;
    failure.reason = (status == U_TRUNCATED_CHAR_FOUND) ? "incomplete multibyte sequence" : "illegal multibyte sequence";
    return IcuDecodeStatus::Failed;
  }

  const auto unitCount = static_cast<int32_t>(target - units.data());
  int32_t needed = 0;
  status = U_ZERO_ERROR;
  u_strToUTF8(nullptr, 0, &needed, units.data(), unitCount, &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
    failure.start = 0;
    failure.end = nb;
    failure.reason = "unpaired surrogate in converter output";
    return IcuDecodeStatus::Failed;
  }
  const std::size_t offset = out_utf8.size();
  out_utf8.resize(offset + static_cast<std::size_t>(needed));
  status = U_ZERO_ERROR;
  u_strToUTF8(&out_utf8[offset], needed, nullptr, units.data(), unitCount, &status);
  if (U_FAILURE(status)) {
    out_utf8.resize(offset);
    failure.start = 0;
    failure.end = nb;
    failure.reason = "unpaired surrogate in converter output";
    return IcuDecodeStatus::Failed;
  }
  return IcuDecodeStatus::Ok;
}

} // namespace gilbridge::rt::detail
