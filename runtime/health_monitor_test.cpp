#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "runtime/health_monitor.hpp"

namespace {

using namespace runtime;

class HealthMonitorTest : public ::testing::Test {
 protected:
  HealthMonitorTest()
      : monitor_(MakeOptions(), [this]() { return now_; }) {}

  static HealthMonitor::Options MakeOptions() {
    HealthMonitor::Options options;
    options.failure_threshold = 3;
    options.backoff_min_millis = 100;
    options.backoff_max_millis = 1000;
    return options;
  }

  void Advance(int64_t millis) { now_ += std::chrono::milliseconds(millis); }

  HealthMonitor::Clock::time_point now_ = HealthMonitor::Clock::now();
  HealthMonitor monitor_;
};

TEST_F(HealthMonitorTest, TestStartsUnknown) {
  HealthMonitor::Snapshot snapshot = monitor_.Get();
  EXPECT_EQ(snapshot.state, HealthMonitor::State::UNKNOWN);
  EXPECT_TRUE(snapshot.is_available);
  EXPECT_EQ(snapshot.consecutive_failures, 0);
  EXPECT_EQ(snapshot.backoff_millis, 100);
  EXPECT_TRUE(monitor_.MayAttempt());
}

TEST_F(HealthMonitorTest, TestUnavailableAfterThreshold) {
  monitor_.RecordFailure("down");
  monitor_.RecordFailure("down");
  EXPECT_TRUE(monitor_.Get().is_available);
  EXPECT_TRUE(monitor_.MayAttempt());
  monitor_.RecordFailure("down");
  HealthMonitor::Snapshot snapshot = monitor_.Get();
  EXPECT_EQ(snapshot.state, HealthMonitor::State::UNAVAILABLE);
  EXPECT_FALSE(snapshot.is_available);
  EXPECT_EQ(snapshot.consecutive_failures, 3);
  EXPECT_FALSE(monitor_.MayAttempt());
}

TEST_F(HealthMonitorTest, TestBackoffDoublesUpToCeiling) {
  std::vector<int64_t> backoffs;
  for (int i = 0; i < 6; i++) {
    monitor_.RecordFailure("down");
    backoffs.push_back(monitor_.Get().backoff_millis);
  }
  EXPECT_THAT(backoffs, ::testing::ElementsAre(200, 400, 800, 1000, 1000,
                                               1000));
}

TEST_F(HealthMonitorTest, TestMayAttemptAfterBackoff) {
  for (int i = 0; i < 3; i++) monitor_.RecordFailure("down");
  // Backoff is now 800ms.
  Advance(799);
  EXPECT_FALSE(monitor_.MayAttempt());
  Advance(1);
  EXPECT_TRUE(monitor_.MayAttempt());
  // A new failure restarts the window, with a longer backoff.
  monitor_.RecordFailure("still down");
  Advance(999);
  EXPECT_FALSE(monitor_.MayAttempt());
  Advance(1);
  EXPECT_TRUE(monitor_.MayAttempt());
}

TEST_F(HealthMonitorTest, TestSuccessResets) {
  for (int i = 0; i < 5; i++) monitor_.RecordFailure("down");
  monitor_.RecordSuccess();
  HealthMonitor::Snapshot snapshot = monitor_.Get();
  EXPECT_EQ(snapshot.state, HealthMonitor::State::AVAILABLE);
  EXPECT_TRUE(snapshot.is_available);
  EXPECT_EQ(snapshot.consecutive_failures, 0);
  EXPECT_EQ(snapshot.backoff_millis, 100);
  EXPECT_EQ(snapshot.last_checked, now_);
  EXPECT_TRUE(monitor_.MayAttempt());
}

TEST(HealthMonitorStateTest, TestNames) {
  EXPECT_STREQ(StateName(HealthMonitor::State::UNKNOWN), "UNKNOWN");
  EXPECT_STREQ(StateName(HealthMonitor::State::AVAILABLE), "AVAILABLE");
  EXPECT_STREQ(StateName(HealthMonitor::State::UNAVAILABLE), "UNAVAILABLE");
}

}  // namespace
