/***
 * Name: test_metrics
 * Purpose: Metrics formatting and publication of lock and runtime counters.
 */
#include <gtest/gtest.h>
#include "gilbridge/All.h"
#include "observability/Metrics.h"
#include "observability/Snapshot.h"
#include "runtime/All.h"

#include <string>

using namespace gilbridge;

TEST(Metrics, TimersAccumulate) {
  obs::Metrics m;
  m.start("Phase");
  m.stop("Phase");
  m.stop("NeverStarted");
  ASSERT_EQ(m.durations().count("Phase"), 1u);
  EXPECT_EQ(m.durations().count("NeverStarted"), 0u);
  const std::string json = m.summaryJson();
  EXPECT_NE(json.find("\"durations_ms\""), std::string::npos);
  EXPECT_NE(json.find("\"phase\""), std::string::npos);
  EXPECT_NE(m.summaryText().find("Phase:"), std::string::npos);
}

TEST(Metrics, CountersGaugesAndHints) {
  obs::Metrics m;
  m.incCounter("lock.contended");
  m.incCounter("lock.contended", 2);
  m.setGauge("runtime.objects_live", 0);
  EXPECT_EQ(m.counters().at("lock.contended"), 3u);
  const auto hints = m.hints();
  ASSERT_EQ(hints.size(), 1u);
  EXPECT_EQ(hints[0], "lock_contended");
  const std::string json = m.summaryJson();
  EXPECT_NE(json.find("\"counters\": {"), std::string::npos);
  EXPECT_NE(json.find("\"lock.contended\": 3"), std::string::npos);
  EXPECT_NE(json.find("\"hints\": [\"lock_contended\"]"), std::string::npos);
}

TEST(Metrics, RecordLockStats) {
  {
    LockGuard a;
    LockGuard b;
  }
  obs::Metrics m;
  obs::recordLockStats(m, GlobalLock::instance().stats());
  EXPECT_GE(m.counters().at("lock.acquisitions"), 1u);
  EXPECT_GE(m.counters().at("lock.reentrant"), 1u);
  EXPECT_GE(m.gauges().at("lock.max_depth"), 2u);
}

TEST(Metrics, RecordRuntimeStats) {
  rt::runtime_reset_for_tests();
  obs::Metrics m;
  {
    LockGuard guard;
    OwnedRef s = toObject(guard.token(), "counted");
    obs::recordRuntimeStats(m, rt::runtime_stats());
    EXPECT_GE(m.gauges().at("runtime.objects_live"), 1u);
  }
  const rt::RuntimeStats stats = rt::runtime_stats();
  obs::recordRuntimeStats(m, stats);
  EXPECT_EQ(m.counters().at("runtime.freed"), stats.numFreed);
  EXPECT_EQ(m.gauges().at("runtime.bytes_live"), stats.bytesLive);
}
