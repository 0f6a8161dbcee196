/***
 * Name: gilbridge (Conversion protocol, impl)
 * Purpose: Built-in ToForeign / FromForeign specializations.
 * Theory of Operation: Text and bytes go through the typed wrappers so their
 *   type checks and decode rules are the only ones in the bridge. Scalars use
 *   the runtime's constructors and accessors directly after a builtin type check.
 */
#include "gilbridge/Conversion.h"
#include "gilbridge/ffi/Api.h"
#include "gilbridge/types/Bytes.h"
#include "gilbridge/types/String.h"

namespace gilbridge {

namespace {
constexpr const char* kBoolName = "bool";
constexpr const char* kIntName = "int";
constexpr const char* kFloatName = "float";
}  // namespace

OwnedRef noneObject(Token token) {
  token.require();
  return OwnedRef::fromOwnedPtr(token, ffi::api().none());
}

OwnedRef ToForeign<std::string_view>::convert(Token token, std::string_view value) {
  return String::create(token, value).intoRef();
}

OwnedRef ToForeign<std::vector<std::uint8_t>>::convert(Token token, const std::vector<std::uint8_t>& value) {
  return Bytes::fromPtr(token, value.data(), value.size()).intoRef();
}

OwnedRef ToForeign<bool>::convert(Token token, bool value) {
  token.require();
  return OwnedRef::fromOwnedPtr(token, ffi::api().boolFrom(value));
}

OwnedRef ToForeign<std::int64_t>::convert(Token token, std::int64_t value) {
  token.require();
  return OwnedRef::fromOwnedPtr(token, ffi::api().intFrom(value));
}

OwnedRef ToForeign<double>::convert(Token token, double value) {
  token.require();
  return OwnedRef::fromOwnedPtr(token, ffi::api().floatFrom(value));
}

Result<std::string_view> FromForeign<std::string_view>::extract(BorrowedRef ref) {
  auto text = downcast<String>(ref);
  if (!text.isOk()) { return std::move(text).error(); }
  auto view = text.value().toText();
  if (!view.isOk()) { return view.error().toError(); }
  return view.value();
}

Result<std::string> FromForeign<std::string>::extract(BorrowedRef ref) {
  auto view = FromForeign<std::string_view>::extract(ref);
  if (!view.isOk()) { return std::move(view).error(); }
  return std::string(view.value());
}

Result<std::vector<std::uint8_t>> FromForeign<std::vector<std::uint8_t>>::extract(BorrowedRef ref) {
  auto bytes = downcast<Bytes>(ref);
  if (!bytes.isOk()) { return std::move(bytes).error(); }
  const unsigned char* data = bytes.value().data();
  return std::vector<std::uint8_t>(data, data + bytes.value().len());
}

Result<bool> FromForeign<bool>::extract(BorrowedRef ref) {
  if (!ref.isInstance(ffi::BuiltinType::Bool)) { return Error::typeMismatch(kBoolName, ref.typeName()); }
  return ffi::api().intValue(ref.asPtr()) != 0;
}

Result<std::int64_t> FromForeign<std::int64_t>::extract(BorrowedRef ref) {
  if (!ref.isInstance(ffi::BuiltinType::Int)) { return Error::typeMismatch(kIntName, ref.typeName()); }
  return ffi::api().intValue(ref.asPtr());
}

Result<double> FromForeign<double>::extract(BorrowedRef ref) {
  auto& api = ffi::api();
  if (ref.isInstance(ffi::BuiltinType::Float)) { return api.floatValue(ref.asPtr()); }
  if (ref.isInstance(ffi::BuiltinType::Int)) { return static_cast<double>(api.intValue(ref.asPtr())); }
  return Error::typeMismatch(kFloatName, ref.typeName());
}

}  // namespace gilbridge
