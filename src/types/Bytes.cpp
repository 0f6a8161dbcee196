/***
 * Name: gilbridge::Bytes (impl)
 */
#include "gilbridge/types/Bytes.h"

namespace gilbridge {

Owned<Bytes> Bytes::create(Token token, std::string_view data) { return fromPtr(token, data.data(), data.size()); }

Owned<Bytes> Bytes::fromPtr(Token token, const void* data, std::size_t len) {
  token.require();
  ffi::RawObject* raw = ffi::api().bytesFrom(static_cast<const unsigned char*>(data), len);
  return Owned<Bytes>(OwnedRef::fromOwnedPtr(token, raw));
}

Result<Bytes> Bytes::tryFrom(BorrowedRef ref) {
  if (!ref.isInstance(ffi::BuiltinType::Bytes)) { return Error::typeMismatch(kTypeName, ref.typeName()); }
  return Bytes(ref);
}

std::string_view Bytes::asBytes() const {
  return std::string_view(reinterpret_cast<const char*>(data()), len());
}

const unsigned char* Bytes::data() const { return ffi::api().bytesData(ref_.asPtr()); }

std::size_t Bytes::len() const { return ffi::api().bytesSize(ref_.asPtr()); }

Owned<Bytes> Bytes::toOwned() const { return Owned<Bytes>(ref_.toOwned()); }

}  // namespace gilbridge
