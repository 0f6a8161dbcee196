/***
 * Name: gilbridge::GlobalLock (impl)
 * Purpose: Re-entrant, blocking, process-wide lock with usage counters.
 */
#include "gilbridge/GlobalLock.h"
#include "gilbridge/exceptions/scope_violation.h"
#include "gilbridge/support/debug.h"

#include <algorithm>
#include <mutex>
#include <thread>

namespace gilbridge {

GlobalLock& GlobalLock::instance() {
  static GlobalLock lock;
  return lock;
}

void GlobalLock::acquire() {
  const auto self = std::this_thread::get_id();
  std::unique_lock<std::mutex> lk(mu_);
  if (depth_ > 0 && owner_ == self) {
    ++depth_;
    stats_.reentrantAcquisitions++;
    stats_.maxDepth = std::max(stats_.maxDepth, depth_);
    return;
  }
  if (depth_ > 0) {
    stats_.contendedAcquisitions++;
    support::DebugLog("lock contended (depth %zu held elsewhere)", depth_);
    cv_.wait(lk, [this]() { return depth_ == 0; });
  }
  owner_ = self;
  depth_ = 1;
  stats_.acquisitions++;
  stats_.maxDepth = std::max<std::size_t>(stats_.maxDepth, 1);
}

void GlobalLock::release() noexcept {
  std::unique_lock<std::mutex> lk(mu_);
  if (depth_ == 0 || owner_ != std::this_thread::get_id()) {
    support::DebugLog("release by a thread that does not hold the lock ignored");
    return;
  }
  if (--depth_ == 0) {
    owner_ = std::thread::id{};
    lk.unlock();
    cv_.notify_one();
  }
}

std::size_t GlobalLock::suspend() {
  std::unique_lock<std::mutex> lk(mu_);
  if (depth_ == 0 || owner_ != std::this_thread::get_id()) {
    throw exceptions::ScopeViolation("cannot suspend the bridge lock: not held by this thread");
  }
  const std::size_t saved = depth_;
  depth_ = 0;
  owner_ = std::thread::id{};
  stats_.suspensions++;
  lk.unlock();
  cv_.notify_one();
  return saved;
}

void GlobalLock::resume(std::size_t depth) {
  const auto self = std::this_thread::get_id();
  std::unique_lock<std::mutex> lk(mu_);
  if (depth_ > 0 && owner_ == self) {
    // A guard opened while suspended is still alive; the saved depth nests under it.
    support::DebugLog("resume under a guard opened while suspended (depth %zu)", depth_);
    depth_ += depth;
    stats_.maxDepth = std::max(stats_.maxDepth, depth_);
    return;
  }
  if (depth_ > 0) {
    stats_.contendedAcquisitions++;
    cv_.wait(lk, [this]() { return depth_ == 0; });
  }
  owner_ = self;
  depth_ = depth;
}

bool GlobalLock::heldByCurrentThread() const {
  const std::lock_guard<std::mutex> lk(mu_);
  return depth_ > 0 && owner_ == std::this_thread::get_id();
}

std::size_t GlobalLock::depth() const {
  const std::lock_guard<std::mutex> lk(mu_);
  return owner_ == std::this_thread::get_id() ? depth_ : 0;
}

LockStats GlobalLock::stats() const {
  const std::lock_guard<std::mutex> lk(mu_);
  return stats_;
}

}  // namespace gilbridge
