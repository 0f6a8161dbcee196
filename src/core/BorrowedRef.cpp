/***
 * Name: gilbridge::BorrowedRef (impl)
 * Purpose: Scope-checked access to a borrowed foreign object.
 */
#include "gilbridge/BorrowedRef.h"
#include "gilbridge/OwnedRef.h"
#include "gilbridge/exceptions/invalid_reference.h"

namespace gilbridge {

BorrowedRef BorrowedRef::fromBorrowedPtr(Token token, ffi::RawObject* ptr) {
  token.require();
  if (ptr == nullptr) { throw exceptions::InvalidReference("BorrowedRef::fromBorrowedPtr: null foreign pointer"); }
  return BorrowedRef(token, ptr);
}

ffi::RawObject* BorrowedRef::asPtr() const {
  token_.require();
  return ptr_;
}

const char* BorrowedRef::typeName() const {
  auto& api = ffi::api();
  return api.typeName(api.typeOf(asPtr()));
}

bool BorrowedRef::isInstance(ffi::BuiltinType type) const {
  auto& api = ffi::api();
  return api.isInstance(asPtr(), api.builtinType(type));
}

bool BorrowedRef::isNone() const { return isInstance(ffi::BuiltinType::NoneType); }

OwnedRef BorrowedRef::toOwned() const { return OwnedRef::fromBorrowedPtr(token_, asPtr()); }

}  // namespace gilbridge
