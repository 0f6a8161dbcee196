/***
 * Name: gilbridge::LockGuard, gilbridge::AllowThreads (impl)
 * Purpose: Pair lock acquisition with scope registration.
 */
#include "gilbridge/LockGuard.h"
#include "gilbridge/GlobalLock.h"
#include "gilbridge/detail/Scopes.h"

namespace gilbridge {

LockGuard::LockGuard() : scope_(0) {
  GlobalLock::instance().acquire();
  scope_ = detail::open_scope();
}

LockGuard::~LockGuard() {
  detail::close_scope(scope_);
  GlobalLock::instance().release();
}

AllowThreads::AllowThreads(Token token) : depth_(0), scopeMark_(0) {
  token.require();
  depth_ = GlobalLock::instance().suspend();
  scopeMark_ = detail::suspend_open_scopes();
}

AllowThreads::~AllowThreads() {
  GlobalLock::instance().resume(depth_);
  detail::resume_open_scopes(scopeMark_);
}

}  // namespace gilbridge
