/***
 * Name: gilbridge::String (impl)
 */
#include "gilbridge/types/String.h"
#include "gilbridge/support/utf8.h"

#include <utility>

namespace gilbridge {

Owned<String> String::create(Token token, std::string_view text) {
  token.require();
  ffi::RawObject* raw = ffi::api().textFromUtf8(text.data(), text.size());
  return Owned<String>(OwnedRef::fromOwnedPtr(token, raw));
}

Result<String> String::tryFrom(BorrowedRef ref) {
  if (!ref.isInstance(ffi::BuiltinType::Text)) { return Error::typeMismatch(kTypeName, ref.typeName()); }
  return String(ref);
}

Result<Owned<String>> String::fromObject(BorrowedRef src, const char* encoding, const char* errors) {
  const Token token = src.token();
  ffi::RawObject* raw = ffi::api().textFromEncoded(src.asPtr(), encoding, errors);
  auto owned = OwnedRef::fromOwnedPtrOrErr(token, raw);
  if (!owned.isOk()) { return std::move(owned).error(); }
  return Owned<String>(std::move(owned).value());
}

std::string_view String::asBytes() const {
  std::size_t len = 0;
  const char* data = ffi::api().textAsUtf8(ref_.asPtr(), &len);
  return std::string_view(data, len);
}

Result<std::string_view, DecodeError> String::toText() const {
  const std::string_view bytes = asBytes();
  const auto* p = reinterpret_cast<const unsigned char*>(bytes.data());
  const auto err = support::ValidateUtf8(p, bytes.size());
  if (!err) { return bytes; }
  // Report against the bytes the text was created from, not their escapes.
  const std::string original = support::UnescapeSurrogates(p, bytes.size());
  const auto originalErr =
      support::ValidateUtf8(reinterpret_cast<const unsigned char*>(original.data()), original.size());
  if (originalErr) { return DecodeError::fromUtf8(original, *originalErr); }
  return DecodeError::fromUtf8(bytes, *err);
}

std::string String::toTextLossy() const {
  const std::string_view bytes = asBytes();
  const std::string original =
      support::UnescapeSurrogates(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size());
  return support::DecodeUtf8Lossy(reinterpret_cast<const unsigned char*>(original.data()), original.size());
}

Owned<String> String::toOwned() const { return Owned<String>(ref_.toOwned()); }

}  // namespace gilbridge
