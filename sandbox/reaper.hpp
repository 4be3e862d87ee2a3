#ifndef SANDBOX_REAPER_HPP
#define SANDBOX_REAPER_HPP

#include <chrono>
#include <deque>
#include <string>
#include <thread>

#include "absl/synchronization/mutex.h"
#include "runtime/container_runtime.hpp"
#include "runtime/health_monitor.hpp"

namespace sandbox {

// Removes containers in a background thread, so that callers never wait for
// the daemon. Each container is attempted a bounded number of times; attempts
// are postponed while the daemon is backing off.
class Reaper {
 public:
  using Clock = std::chrono::steady_clock;

  struct Options {
    int32_t retries = 3;
    int64_t retry_delay_millis = 1000;
  };

  Reaper(runtime::ContainerRuntime* runtime, runtime::HealthMonitor* health,
         Options options);
  ~Reaper();

  // Queues a container for removal as soon as possible.
  void RemoveAsync(const std::string& handle);

  // Queues a container whose removal failed or could not be tried; the first
  // attempt is made after the retry delay.
  void Schedule(const std::string& handle);

  // Number of containers still waiting for removal, including the ones being
  // attempted right now.
  size_t Pending() const;

  // Makes one last attempt on every pending container and stops the thread.
  void Stop();

  Reaper(const Reaper&) = delete;
  Reaper& operator=(const Reaper&) = delete;

 private:
  struct Entry {
    std::string handle;
    int32_t attempts = 0;
    Clock::time_point next_attempt;
  };

  // Returns true if the entry is done with, either removed or given up.
  bool Attempt(Entry* entry);
  void Enqueue(const std::string& handle, int32_t attempts,
               Clock::time_point next_attempt);
  bool Woken() const EXCLUSIVE_LOCKS_REQUIRED(mutex_) {
    return stopped_ || wake_;
  }
  void ThreadBody();

  runtime::ContainerRuntime* runtime_;
  runtime::HealthMonitor* health_;
  Options options_;

  mutable absl::Mutex mutex_;
  std::deque<Entry> pending_ GUARDED_BY(mutex_);
  size_t in_flight_ GUARDED_BY(mutex_) = 0;
  bool stopped_ GUARDED_BY(mutex_) = false;
  bool wake_ GUARDED_BY(mutex_) = false;
  std::thread thread_;
};

}  // namespace sandbox

#endif
