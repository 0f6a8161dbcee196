/**
 * Bridge refcount benchmark: create, clone, convert and drop foreign objects
 * under the bridge lock, with and without re-entrant acquisition.
 * Usage: bench_refcount [iters] [size]
 */
#include "gilbridge/All.h"
#include "observability/Metrics.h"
#include "observability/Snapshot.h"
#include "runtime/All.h"
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

using namespace gilbridge;

int main(int argc, char** argv) {
  std::size_t iters = (argc > 1) ? static_cast<std::size_t>(std::strtoull(argv[1], nullptr, 10)) : 200000;
  std::size_t size  = (argc > 2) ? static_cast<std::size_t>(std::strtoull(argv[2], nullptr, 10)) : 24;

  obs::Metrics metrics;
  const std::string text(size, 'x');

  auto run = [&](const char* phase, bool reentrant) {
    metrics.start(phase);
    LockGuard outer;
    for (std::size_t i = 0; i < iters; ++i) {
      if (reentrant) {
        LockGuard inner;
        const Token token = inner.token();
        auto s = String::create(token, text);
        auto copy = s.clone(token);
        (void)copy.get(token).toText();
      } else {
        const Token token = outer.token();
        auto s = String::create(token, text);
        auto copy = s.clone(token);
        (void)copy.get(token).toText();
      }
      const OwnedRef n = toObject(outer.token(), static_cast<std::int64_t>(i));
      (void)extract<double>(n.asBorrowed(outer.token()));
    }
    metrics.stop(phase);
  };

  run("flat", false);
  run("reentrant", true);

  obs::recordLockStats(metrics, GlobalLock::instance().stats());
  obs::recordRuntimeStats(metrics, rt::runtime_stats());
  std::cout << "iters=" << iters << " size=" << size << "\n" << metrics.summaryText();
  return 0;
}
