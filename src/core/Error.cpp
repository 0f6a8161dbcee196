/***
 * Name: gilbridge::Error (impl)
 * Purpose: Capture foreign exceptions into host values and rebuild them on demand.
 * Theory of Operation:
 *   fetch/take copy type name, message and (for UnicodeDecodeError) the decode
 *   attributes out of the foreign exception and drop the foreign object, so the
 *   Error is plain host data. toObject maps each kind back onto the foreign
 *   hierarchy: TypeMismatch -> TypeError, Decode -> UnicodeDecodeError, and a
 *   ForeignException to its own type when the runtime knows it by name.
 */
#include "gilbridge/Error.h"
#include "gilbridge/OwnedRef.h"
#include "gilbridge/ffi/Api.h"
#include "gilbridge/support/debug.h"

#include <cstdio>
#include <utility>

namespace gilbridge {

namespace {

constexpr const char* kTypeError = "TypeError";
constexpr const char* kDecodeErrorType = "UnicodeDecodeError";
constexpr const char* kSystemError = "SystemError";
constexpr const char* kFallbackType = "Exception";

std::string format_decode_message(const DecodeInfo& info) {
  char buf[256];
  if (info.end == info.start + 1 && info.start < info.object.size()) {
    std::snprintf(buf, sizeof(buf), "'%s' codec can't decode byte 0x%02x in position %zu: %s", info.encoding.c_str(),
                  static_cast<unsigned>(static_cast<unsigned char>(info.object[info.start])), info.start,
                  info.reason.c_str());
  } else {
    std::snprintf(buf, sizeof(buf), "'%s' codec can't decode bytes in position %zu-%zu: %s", info.encoding.c_str(),
                  info.start, info.end == 0 ? 0 : info.end - 1, info.reason.c_str());
  }
  return buf;
}

const char* safe(const char* s) { return s != nullptr ? s : ""; }

}  // namespace

Error::Error(ErrorKind kind, std::string typeName, std::string message, std::optional<DecodeInfo> decode)
    : kind_(kind), typeName_(std::move(typeName)), message_(std::move(message)), decode_(std::move(decode)) {}

Error Error::typeMismatch(const std::string& expected, const std::string& actual) {
  return Error(ErrorKind::TypeMismatch, kTypeError, "'" + actual + "' object cannot be converted to '" + expected + "'",
               std::nullopt);
}

Error Error::foreign(std::string typeName, std::string message) {
  return Error(ErrorKind::ForeignException, std::move(typeName), std::move(message), std::nullopt);
}

Error Error::decode(DecodeInfo info) {
  std::string message = format_decode_message(info);
  return Error(ErrorKind::Decode, kDecodeErrorType, std::move(message), std::move(info));
}

std::optional<Error> Error::take(Token token) {
  token.require();
  auto& api = ffi::api();
  if (!api.errOccurred()) { return std::nullopt; }
  ffi::RawObject* raw = api.errFetch();
  if (raw == nullptr) { return std::nullopt; }
  const OwnedRef exc = OwnedRef::fromOwnedPtr(token, raw);

  std::string typeName = safe(api.typeName(api.typeOf(exc.asPtr())));
  std::string message = safe(api.exceptionMessage(exc.asPtr()));
  ffi::DecodeErrorFields fields;
  if (api.decodeErrorFields(exc.asPtr(), &fields)) {
    DecodeInfo info;
    info.encoding = safe(fields.encoding);
    if (fields.object != nullptr) { info.object.assign(reinterpret_cast<const char*>(fields.object), fields.objectLen); }
    info.start = fields.start;
    info.end = fields.end;
    info.reason = safe(fields.reason);
    return Error(ErrorKind::Decode, std::move(typeName), std::move(message), std::move(info));
  }
  return Error(ErrorKind::ForeignException, std::move(typeName), std::move(message), std::nullopt);
}

Error Error::fetch(Token token) {
  std::optional<Error> pending = take(token);
  if (pending) { return std::move(*pending); }
  support::DebugLog("error fetched with nothing pending");
  return foreign(kSystemError, "error return without exception set");
}

std::string Error::toString() const {
  if (message_.empty()) { return typeName_; }
  return typeName_ + ": " + message_;
}

bool Error::matches(Token token, const char* typeName) const {
  token.require();
  if (typeName == nullptr) { return false; }
  if (typeName_ == typeName) { return true; }
  auto& api = ffi::api();
  const ffi::TypeDescriptor* own = api.exceptionType(typeName_.c_str());
  const ffi::TypeDescriptor* base = api.exceptionType(typeName);
  if (own == nullptr || base == nullptr) { return false; }
  return api.isSubtype(own, base);
}

OwnedRef Error::toObject(Token token) const {
  token.require();
  auto& api = ffi::api();
  switch (kind_) {
    case ErrorKind::TypeMismatch:
      return OwnedRef::fromOwnedPtr(token, api.exceptionNew(api.exceptionType(kTypeError), message_.c_str()));
    case ErrorKind::Decode:
      if (decode_) {
        const auto* object = reinterpret_cast<const unsigned char*>(decode_->object.data());
        return OwnedRef::fromOwnedPtr(
            token, api.decodeErrorNew(decode_->encoding.c_str(), object, decode_->object.size(), decode_->start,
                                      decode_->end, decode_->reason.c_str()));
      }
      break;
    case ErrorKind::ForeignException:
      break;
  }
  if (const ffi::TypeDescriptor* type = api.exceptionType(typeName_.c_str())) {
    return OwnedRef::fromOwnedPtr(token, api.exceptionNew(type, message_.c_str()));
  }
  const std::string rendered = toString();
  return OwnedRef::fromOwnedPtr(token, api.exceptionNew(api.exceptionType(kFallbackType), rendered.c_str()));
}

void Error::restore(Token token) const {
  OwnedRef exc = toObject(token);
  ffi::api().errRestore(exc.intoPtr());
}

}  // namespace gilbridge
