/***
 * Name: gilbridge::DecodeError (impl)
 */
#include "gilbridge/DecodeError.h"

#include <utility>

namespace gilbridge {

namespace {
constexpr const char* kUtf8 = "utf-8";
}  // namespace

DecodeError::DecodeError(std::string encoding, std::string input, std::size_t start, std::size_t end,
                         std::string reason)
    : encoding_(std::move(encoding)), input_(std::move(input)), start_(start), end_(end), reason_(std::move(reason)) {}

DecodeError DecodeError::fromUtf8(std::string_view input, const support::Utf8Error& err) {
  // A truncated sequence runs to the end of the input.
  const std::size_t end = err.errorLen == 0 ? input.size() : err.validUpTo + err.errorLen;
  return DecodeError(kUtf8, std::string(input), err.validUpTo, end, err.reason);
}

std::string_view DecodeError::offendingBytes() const {
  if (start_ >= input_.size()) { return {}; }
  return std::string_view(input_).substr(start_, end_ - start_);
}

std::string DecodeError::message() const { return toError().message(); }

Error DecodeError::toError() const {
  DecodeInfo info;
  info.encoding = encoding_;
  info.object = input_;
  info.start = start_;
  info.end = end_;
  info.reason = reason_;
  return Error::decode(std::move(info));
}

}  // namespace gilbridge
