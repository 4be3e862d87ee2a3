#ifndef RUNTIME_HEALTH_MONITOR_HPP
#define RUNTIME_HEALTH_MONITOR_HPP

#include <chrono>
#include <functional>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"

namespace runtime {

// Tracks whether the container daemon is reachable. Every call to the daemon
// reports its result here, and new sandboxes are only requested while
// MayAttempt() is true, so that an unreachable daemon is retried with
// exponential backoff instead of on every request.
class HealthMonitor {
 public:
  using Clock = std::chrono::steady_clock;

  enum class State { UNKNOWN, AVAILABLE, UNAVAILABLE };

  struct Options {
    int32_t failure_threshold = 3;
    int64_t backoff_min_millis = 1000;
    int64_t backoff_max_millis = 30000;
  };

  struct Snapshot {
    State state = State::UNKNOWN;
    bool is_available = true;
    int32_t consecutive_failures = 0;
    int64_t backoff_millis = 0;
    Clock::time_point last_checked;
  };

  explicit HealthMonitor(Options options,
                         std::function<Clock::time_point()> now = Clock::now);

  void RecordSuccess();
  void RecordFailure(const std::string& reason);

  // True if the daemon is believed to be available, or if the backoff window
  // since the last check has elapsed.
  bool MayAttempt();

  Snapshot Get();

  HealthMonitor(const HealthMonitor&) = delete;
  HealthMonitor& operator=(const HealthMonitor&) = delete;

 private:
  const Options options_;
  const std::function<Clock::time_point()> now_;

  absl::Mutex mutex_;
  State state_ GUARDED_BY(mutex_) = State::UNKNOWN;
  int32_t consecutive_failures_ GUARDED_BY(mutex_) = 0;
  int64_t backoff_millis_ GUARDED_BY(mutex_);
  Clock::time_point last_checked_ GUARDED_BY(mutex_);
};

const char* StateName(HealthMonitor::State state);

}  // namespace runtime

#endif
