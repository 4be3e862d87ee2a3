#ifndef EXECUTOR_LIMITER_HPP
#define EXECUTOR_LIMITER_HPP

#include <functional>

#include "absl/synchronization/mutex.h"

namespace executor {

// Caps the number of sandboxes that run at the same time. Requests over the
// cap queue for a bounded time.
class Limiter {
 public:
  Limiter(size_t max_running, int64_t max_wait_millis)
      : max_running_(max_running), max_wait_millis_(max_wait_millis) {}

  // Holds one slot of the limiter while alive.
  class Slot {
   public:
    // Waits for a free slot. Throws sandbox::provisioning_error with reason
    // BUSY if none frees up in time, or sandbox::cancelled_error if
    // cancelled returns true while waiting.
    Slot(Limiter* limiter, const std::function<bool()>& cancelled);
    ~Slot();
    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;
    Slot(Slot&&) = delete;
    Slot& operator=(Slot&&) = delete;

   private:
    Limiter* limiter_;
  };

  size_t Running() const;
  size_t Waiting() const;

  Limiter(const Limiter&) = delete;
  Limiter& operator=(const Limiter&) = delete;

 private:
  bool HasFreeSlot() const EXCLUSIVE_LOCKS_REQUIRED(mutex_) {
    return running_ < max_running_;
  }

  const size_t max_running_;
  const int64_t max_wait_millis_;

  mutable absl::Mutex mutex_;
  size_t running_ GUARDED_BY(mutex_) = 0;
  size_t waiting_ GUARDED_BY(mutex_) = 0;
};

}  // namespace executor

#endif
