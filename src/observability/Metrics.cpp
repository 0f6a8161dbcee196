/***
 * Name: gilbridge::obs::Metrics (impl)
 * Purpose: Timing and text/JSON rendering of the collected values.
 */
#include "observability/Metrics.h"
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <ios>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace gilbridge::obs {

namespace {
constexpr double kUsPerMs = 1000.0;
constexpr int kMsPrecision = 3;

struct HintRule {
  const char* key;
  bool gauge;  // false: look the key up among counters
  const char* hint;
};

// A hint is emitted when its value is non-zero.
constexpr HintRule kHintRules[] = {
    {"lock.contended", false, "lock_contended"},
    {"runtime.failed_allocations", false, "allocation_failures"},
    {"runtime.objects_live", true, "objects_live"},
};

std::string to_lower_copy(std::string s) {
  for (auto& c : s) { if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a'); }
  return s;
}

double to_ms(uint64_t us) { return static_cast<double>(us) / kUsPerMs; }

// ,\n  "name": { "k": v, ... }   (durations in ms with lowercase keys)
void append_section(std::ostringstream& oss, const char* name, const std::map<std::string, uint64_t>& values,
                    bool asMillis, bool first) {
  if (!first) { oss << ","; }
  oss << "\n  \"" << name << "\": {";
  const char* sep = "";
  for (const auto& [key, val] : values) {
    oss << sep << "\n    \"";
    if (asMillis) {
      oss << to_lower_copy(key) << "\": " << std::fixed << std::setprecision(kMsPrecision) << to_ms(val);
    } else {
      oss << key << "\": " << val;
    }
    sep = ",";
  }
  oss << "\n  }";
}
} // namespace

void Metrics::start(const std::string& name) { active_[name] = Clock::now(); }

void Metrics::stop(const std::string& name) {
  auto iter = active_.find(name);
  if (iter == active_.end()) { return; }
  const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - iter->second);
  durations_us_[name] += static_cast<uint64_t>(elapsed.count());
  active_.erase(iter);
}

std::string Metrics::summaryText() const {
  std::ostringstream oss;
  oss << "== Metrics ==\n";
  for (const auto& [key, val] : durations_us_) {
    oss << "  " << key << ": " << std::fixed << std::setprecision(kMsPrecision) << to_ms(val) << " ms\n";
  }
  for (const auto& [key, val] : counters_) { oss << "  " << key << " = " << val << "\n"; }
  for (const auto& [key, val] : gauges_) { oss << "  " << key << " ~ " << val << "\n"; }
  return oss.str();
}

std::string Metrics::summaryJson() const {
  std::ostringstream oss;
  oss << "{";
  append_section(oss, "durations_ms", durations_us_, true, true);
  if (!counters_.empty()) { append_section(oss, "counters", counters_, false, false); }
  if (!gauges_.empty()) { append_section(oss, "gauges", gauges_, false, false); }
  const auto hs = hints();
  if (!hs.empty()) {
    oss << ",\n  \"hints\": [";
    for (std::size_t i = 0; i < hs.size(); ++i) { oss << (i == 0 ? "" : ", ") << "\"" << hs[i] << "\""; }
    oss << "]";
  }
  oss << "\n}\n";
  return oss.str();
}

std::vector<std::string> Metrics::hints() const {
  std::vector<std::string> out;
  for (const auto& rule : kHintRules) {
    const auto& values = rule.gauge ? gauges_ : counters_;
    auto it = values.find(rule.key);
    if (it != values.end() && it->second > 0) { out.emplace_back(rule.hint); }
  }
  return out;
}

} // namespace gilbridge::obs
