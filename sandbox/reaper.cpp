#include "sandbox/reaper.hpp"

#include <vector>

#include "glog/logging.h"

namespace sandbox {

Reaper::Reaper(runtime::ContainerRuntime* runtime,
               runtime::HealthMonitor* health, Options options)
    : runtime_(runtime), health_(health), options_(options) {
  thread_ = std::thread(&Reaper::ThreadBody, this);
}

Reaper::~Reaper() { Stop(); }

void Reaper::Enqueue(const std::string& handle, int32_t attempts,
                     Clock::time_point next_attempt) {
  Entry entry;
  entry.handle = handle;
  entry.attempts = attempts;
  entry.next_attempt = next_attempt;
  pending_.push_back(std::move(entry));
}

void Reaper::RemoveAsync(const std::string& handle) {
  absl::MutexLock lck(&mutex_);
  Enqueue(handle, 0, Clock::now());
  wake_ = true;
  VLOG(1) << "Queued removal of " << handle;
}

void Reaper::Schedule(const std::string& handle) {
  absl::MutexLock lck(&mutex_);
  Enqueue(handle, 0,
          Clock::now() + std::chrono::milliseconds(options_.retry_delay_millis));
  VLOG(1) << "Scheduled removal of " << handle;
}

size_t Reaper::Pending() const {
  absl::MutexLock lck(&mutex_);
  return pending_.size() + in_flight_;
}

bool Reaper::Attempt(Entry* entry) {
  entry->attempts++;
  std::string error_msg;
  runtime::CallStatus status = runtime_->Remove(entry->handle, &error_msg);
  if (status == runtime::CallStatus::UNAVAILABLE) {
    health_->RecordFailure(error_msg);
  } else {
    health_->RecordSuccess();
  }
  switch (status) {
    case runtime::CallStatus::OK:
      if (entry->attempts == 1) {
        VLOG(1) << "Removed container " << entry->handle;
      } else {
        LOG(INFO) << "Removed container " << entry->handle << " after "
                  << entry->attempts << " attempts";
      }
      return true;
    case runtime::CallStatus::NOT_FOUND:
      VLOG(1) << "Container " << entry->handle << " is already gone";
      return true;
    default:
      break;
  }
  if (entry->attempts >= options_.retries) {
    LOG(ERROR) << "Giving up on removing container " << entry->handle << ": "
               << error_msg;
    return true;
  }
  LOG(WARNING) << "Removing container " << entry->handle << " failed ("
               << entry->attempts << "/" << options_.retries
               << "): " << error_msg;
  entry->next_attempt =
      Clock::now() + std::chrono::milliseconds(options_.retry_delay_millis);
  return false;
}

void Reaper::ThreadBody() {
  while (true) {
    std::vector<Entry> due;
    {
      absl::MutexLock lck(&mutex_);
      mutex_.AwaitWithTimeout(absl::Condition(this, &Reaper::Woken),
                              absl::Milliseconds(options_.retry_delay_millis));
      if (stopped_) return;
      wake_ = false;
      auto now = Clock::now();
      for (auto it = pending_.begin(); it != pending_.end();) {
        if (it->next_attempt <= now) {
          due.push_back(std::move(*it));
          it = pending_.erase(it);
        } else {
          ++it;
        }
      }
      in_flight_ = due.size();
    }
    for (Entry& entry : due) {
      bool done = false;
      if (health_->MayAttempt()) {
        done = Attempt(&entry);
      } else {
        entry.next_attempt =
            Clock::now() + std::chrono::milliseconds(options_.retry_delay_millis);
      }
      absl::MutexLock lck(&mutex_);
      in_flight_--;
      if (!done) pending_.push_back(std::move(entry));
    }
  }
}

void Reaper::Stop() {
  std::deque<Entry> left;
  {
    absl::MutexLock lck(&mutex_);
    if (stopped_) return;
    stopped_ = true;
    left.swap(pending_);
  }
  if (thread_.joinable()) thread_.join();
  // Entries taken by the thread before it noticed the stop were either
  // completed or pushed back.
  {
    absl::MutexLock lck(&mutex_);
    for (Entry& entry : pending_) left.push_back(std::move(entry));
    pending_.clear();
  }
  for (Entry& entry : left) {
    if (entry.attempts < options_.retries) Attempt(&entry);
  }
}

}  // namespace sandbox
