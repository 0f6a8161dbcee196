/***
 * Name: gilbridge::GlobalLock
 * Purpose: The single process-wide serialization point for foreign-object access.
 * Inputs: acquire/release calls from LockGuard and AllowThreads
 * Outputs: Exclusive, re-entrant ownership by one thread at a time
 * Theory of Operation:
 *   A mutex protects (owner, depth). acquire() by the owner only bumps depth;
 *   any other thread waits on a condition variable until depth drops to zero.
 *   There is no timeout and no cancellation. suspend()/resume() drop and restore
 *   the whole recursion depth for AllowThreads. Ordering between waiters is
 *   whatever std::condition_variable provides.
 */
#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <thread>

namespace gilbridge {

struct LockStats {
  uint64_t acquisitions{0};       // outermost acquisitions
  uint64_t reentrantAcquisitions{0};
  uint64_t contendedAcquisitions{0}; // acquisitions that had to wait
  uint64_t suspensions{0};
  std::size_t maxDepth{0};
};

class GlobalLock {
 public:
  static GlobalLock& instance();

  void acquire();
  void release() noexcept;

  // Fully release the calling thread's hold; returns the depth to pass to resume().
  std::size_t suspend();
  // Restore a suspended hold. If this thread re-acquired the lock meanwhile and
  // still holds it, the saved depth is added to the current one.
  void resume(std::size_t depth);

  bool heldByCurrentThread() const;
  std::size_t depth() const;
  LockStats stats() const;

  GlobalLock(const GlobalLock&) = delete;
  GlobalLock& operator=(const GlobalLock&) = delete;

 private:
  GlobalLock() = default;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::thread::id owner_{};
  std::size_t depth_{0};
  LockStats stats_{};
};

}  // namespace gilbridge
