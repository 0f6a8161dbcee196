// Utility: progress dots on stderr while a contention test runs
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdio>
#include <mutex>
#include <thread>

namespace testutil {

// Prints one dot per period until destroyed; the destructor wakes the printer
// immediately instead of waiting out the current period.
class Heartbeat {
 public:
  explicit Heartbeat(const char* label = nullptr,
                     std::chrono::milliseconds period = std::chrono::milliseconds(1000))
      : period_(period) {
    if (label != nullptr) { std::fprintf(stderr, "[heartbeat] %s\n", label); }
    printer_ = std::thread([this]() {
      std::unique_lock<std::mutex> lk(mu_);
      while (!cv_.wait_for(lk, period_, [this]() { return stopping_; })) {
        ++ticks_;
        std::fputc('.', stderr);
        std::fflush(stderr);
      }
    });
  }

  ~Heartbeat() {
    {
      const std::lock_guard<std::mutex> lk(mu_);
      stopping_ = true;
    }
    cv_.notify_all();
    if (printer_.joinable()) { printer_.join(); }
    if (ticks_ > 0) { std::fputc('\n', stderr); }
  }

  Heartbeat(const Heartbeat&) = delete;
  Heartbeat& operator=(const Heartbeat&) = delete;

 private:
  std::chrono::milliseconds period_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool stopping_{false};
  std::size_t ticks_{0};
  std::thread printer_;
};

} // namespace testutil
