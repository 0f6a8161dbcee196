/***
 * Name: gilbridge::obs::Metrics
 * Purpose: Collect timings, counters and gauges for bridge and runtime activity.
 * Inputs:
 *   - Calls to start/stop timers for named phases.
 *   - Counter and gauge values (see Snapshot.h for lock and runtime publishers).
 * Outputs:
 *   - Human-readable text and JSON summaries.
 * Theory of Operation:
 *   Uses steady_clock timestamps to measure durations. Stores a map from
 *   phase names to microseconds. Formatting is performed on demand; keys are
 *   emitted in sorted order so summaries are stable.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace gilbridge::obs {

class Metrics {
 public:
  using Clock = std::chrono::steady_clock;

  void start(const std::string& name);
  void stop(const std::string& name);

  void incCounter(const std::string& key, uint64_t delta = 1) { counters_[key] += delta; }
  void setCounter(const std::string& key, uint64_t value) { counters_[key] = value; }
  void setGauge(const std::string& key, uint64_t value) { gauges_[key] = value; }
  const auto& counters() const { return counters_; }
  const auto& gauges() const { return gauges_; }
  const auto& durations() const { return durations_us_; }

  std::string summaryText() const;
  std::string summaryJson() const;

  // Short tags derived from the recorded values (e.g. "lock_contended").
  std::vector<std::string> hints() const;

 private:
  std::map<std::string, Clock::time_point> active_{};
  std::map<std::string, uint64_t> durations_us_{};
  std::map<std::string, uint64_t> counters_{};
  std::map<std::string, uint64_t> gauges_{};
};

} // namespace gilbridge::obs
