#include "runtime/health_monitor.hpp"

#include <algorithm>

#include "glog/logging.h"

namespace runtime {

HealthMonitor::HealthMonitor(Options options,
                             std::function<Clock::time_point()> now)
    : options_(options),
      now_(std::move(now)),
      backoff_millis_(options.backoff_min_millis),
      last_checked_(now_()) {}

void HealthMonitor::RecordSuccess() {
  absl::MutexLock lck(&mutex_);
  if (state_ == State::UNAVAILABLE) {
    LOG(INFO) << "Container daemon is available again after "
              << consecutive_failures_ << " failures";
  }
  state_ = State::AVAILABLE;
  consecutive_failures_ = 0;
  backoff_millis_ = options_.backoff_min_millis;
  last_checked_ = now_();
}

void HealthMonitor::RecordFailure(const std::string& reason) {
  absl::MutexLock lck(&mutex_);
  consecutive_failures_++;
  backoff_millis_ = std::min(backoff_millis_ * 2, options_.backoff_max_millis);
  last_checked_ = now_();
  if (consecutive_failures_ >= options_.failure_threshold &&
      state_ != State::UNAVAILABLE) {
    LOG(WARNING) << "Container daemon marked unavailable after "
                 << consecutive_failures_ << " failures: " << reason;
    state_ = State::UNAVAILABLE;
  } else {
    VLOG(1) << "Container daemon failure " << consecutive_failures_ << ": "
            << reason << " (backoff " << backoff_millis_ << "ms)";
  }
}

bool HealthMonitor::MayAttempt() {
  absl::MutexLock lck(&mutex_);
  if (state_ != State::UNAVAILABLE) return true;
  return now_() - last_checked_ >= std::chrono::milliseconds(backoff_millis_);
}

HealthMonitor::Snapshot HealthMonitor::Get() {
  absl::MutexLock lck(&mutex_);
  Snapshot snapshot;
  snapshot.state = state_;
  snapshot.is_available = state_ != State::UNAVAILABLE;
  snapshot.consecutive_failures = consecutive_failures_;
  snapshot.backoff_millis = backoff_millis_;
  snapshot.last_checked = last_checked_;
  return snapshot;
}

const char* StateName(HealthMonitor::State state) {
  switch (state) {
    case HealthMonitor::State::UNKNOWN:
      return "UNKNOWN";
    case HealthMonitor::State::AVAILABLE:
      return "AVAILABLE";
    case HealthMonitor::State::UNAVAILABLE:
      return "UNAVAILABLE";
  }
  return "UNKNOWN";
}

}  // namespace runtime
