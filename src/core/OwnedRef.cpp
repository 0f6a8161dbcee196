/***
 * Name: gilbridge::OwnedRef (impl)
 * Purpose: One-increment, one-decrement ownership of a foreign reference.
 */
#include "gilbridge/OwnedRef.h"
#include "gilbridge/Error.h"
#include "gilbridge/Fatal.h"
#include "gilbridge/GlobalLock.h"
#include "gilbridge/exceptions/invalid_reference.h"

#include <optional>
#include <utility>

namespace gilbridge {

namespace {
// Holds the lock for a drop without opening a token scope, so releasing a
// reference never allocates.
class DropLock {
 public:
  DropLock() { GlobalLock::instance().acquire(); }
  ~DropLock() { GlobalLock::instance().release(); }
  DropLock(const DropLock&) = delete;
  DropLock& operator=(const DropLock&) = delete;
};
}  // namespace

OwnedRef OwnedRef::fromOwnedPtr(Token token, ffi::RawObject* ptr) {
  token.require();
  if (ptr == nullptr) {
    const std::optional<Error> pending = Error::take(token);
    fatal::allocationFailure("OwnedRef::fromOwnedPtr", pending ? pending->toString() : std::string());
  }
  return OwnedRef(ptr);
}

Result<OwnedRef> OwnedRef::fromOwnedPtrOrErr(Token token, ffi::RawObject* ptr) {
  token.require();
  if (ptr == nullptr) { return Error::fetch(token); }
  return OwnedRef(ptr);
}

OwnedRef OwnedRef::fromBorrowedPtr(Token token, ffi::RawObject* ptr) {
  token.require();
  if (ptr == nullptr) { throw exceptions::InvalidReference("OwnedRef::fromBorrowedPtr: null foreign pointer"); }
  ffi::api().incref(ptr);
  return OwnedRef(ptr);
}

OwnedRef::OwnedRef(OwnedRef&& other) noexcept : ptr_(std::exchange(other.ptr_, nullptr)) {}

OwnedRef& OwnedRef::operator=(OwnedRef&& other) noexcept {
  if (this != &other) {
    reset();
    ptr_ = std::exchange(other.ptr_, nullptr);
  }
  return *this;
}

OwnedRef::~OwnedRef() { reset(); }

void OwnedRef::reset() noexcept {
  if (ptr_ == nullptr) { return; }
  const DropLock lock;
  ffi::api().decref(std::exchange(ptr_, nullptr));
}

OwnedRef OwnedRef::clone(Token token) const {
  token.require();
  if (ptr_ == nullptr) { throw exceptions::InvalidReference("OwnedRef::clone: empty reference"); }
  ffi::api().incref(ptr_);
  return OwnedRef(ptr_);
}

BorrowedRef OwnedRef::asBorrowed(Token token) const {
  if (ptr_ == nullptr) { throw exceptions::InvalidReference("OwnedRef::asBorrowed: empty reference"); }
  return BorrowedRef::fromBorrowedPtr(token, ptr_);
}

ffi::RawObject* OwnedRef::intoPtr() noexcept { return std::exchange(ptr_, nullptr); }

std::size_t OwnedRef::refcount(Token token) const {
  token.require();
  return ptr_ == nullptr ? 0 : ffi::api().refcount(ptr_);
}

}  // namespace gilbridge
