/***
 * Name: gilbridge::OwnedRef
 * Purpose: Host ownership of exactly one strong foreign reference.
 * Inputs: Raw pointers that already carry a reference, or borrowed ones to increment
 * Outputs: Borrowed views, explicit clones, release on destruction
 * Theory of Operation:
 *   Move-only. Each OwnedRef accounts for one increment and performs one
 *   decrement when destroyed; moving transfers that obligation and leaves the
 *   source empty. Cloning needs a token because it touches the refcount. The
 *   destructor re-acquires the lock itself (re-entrantly), so an OwnedRef may
 *   be dropped anywhere a LockGuard could be taken; it must not be dropped
 *   while the calling thread is inside AllowThreads waiting on another lock
 *   owner that waits for it.
 */
#pragma once

#include <cstddef>

#include "gilbridge/BorrowedRef.h"
#include "gilbridge/Result.h"
#include "gilbridge/Token.h"
#include "gilbridge/ffi/Api.h"

namespace gilbridge {

class OwnedRef {
 public:
  // ptr carries one reference. nullptr means the creating call failed to allocate: fatal.
  static OwnedRef fromOwnedPtr(Token token, ffi::RawObject* ptr);
  // ptr carries one reference. nullptr yields the pending foreign exception.
  static Result<OwnedRef> fromOwnedPtrOrErr(Token token, ffi::RawObject* ptr);
  // ptr is borrowed; the new OwnedRef takes its own reference.
  static OwnedRef fromBorrowedPtr(Token token, ffi::RawObject* ptr);

  OwnedRef(OwnedRef&& other) noexcept;
  OwnedRef& operator=(OwnedRef&& other) noexcept;
  OwnedRef(const OwnedRef&) = delete;
  OwnedRef& operator=(const OwnedRef&) = delete;
  ~OwnedRef();

  OwnedRef clone(Token token) const;
  BorrowedRef asBorrowed(Token token) const;

  ffi::RawObject* asPtr() const noexcept { return ptr_; }
  // Give up ownership without decrementing; the caller now owns the reference.
  ffi::RawObject* intoPtr() noexcept;
  bool empty() const noexcept { return ptr_ == nullptr; }

  std::size_t refcount(Token token) const;

  friend bool operator==(const OwnedRef& a, const OwnedRef& b) noexcept { return a.ptr_ == b.ptr_; }
  friend bool operator!=(const OwnedRef& a, const OwnedRef& b) noexcept { return a.ptr_ != b.ptr_; }

 private:
  explicit OwnedRef(ffi::RawObject* ptr) noexcept : ptr_(ptr) {}
  void reset() noexcept;

  ffi::RawObject* ptr_;
};

}  // namespace gilbridge
