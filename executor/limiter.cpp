#include "executor/limiter.hpp"

#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "glog/logging.h"
#include "sandbox/errors.hpp"

namespace executor {

namespace {
// Interval between checks of the cancellation of a queued request.
const constexpr int64_t kPollMillis = 10;
}  // namespace

Limiter::Slot::Slot(Limiter* limiter, const std::function<bool()>& cancelled)
    : limiter_(limiter) {
  absl::MutexLock lck(&limiter_->mutex_);
  absl::Time deadline =
      absl::Now() + absl::Milliseconds(limiter_->max_wait_millis_);
  absl::Condition free_slot(limiter_, &Limiter::HasFreeSlot);
  if (!limiter_->HasFreeSlot()) {
    limiter_->waiting_++;
    VLOG(1) << "Queueing for a sandbox slot, " << limiter_->waiting_
            << " waiting";
    while (!limiter_->mutex_.AwaitWithTimeout(
        free_slot, absl::Milliseconds(kPollMillis))) {
      if (cancelled && cancelled()) {
        limiter_->waiting_--;
        throw sandbox::cancelled_error();
      }
      if (absl::Now() >= deadline) {
        limiter_->waiting_--;
        throw sandbox::provisioning_error(
            sandbox::provisioning_error::Reason::BUSY,
            absl::StrCat("All ", limiter_->max_running_,
                         " sandbox slots are busy, retry later"));
      }
    }
    limiter_->waiting_--;
  }
  limiter_->running_++;
}

Limiter::Slot::~Slot() {
  absl::MutexLock lck(&limiter_->mutex_);
  limiter_->running_--;
}

size_t Limiter::Running() const {
  absl::MutexLock lck(&mutex_);
  return running_;
}

size_t Limiter::Waiting() const {
  absl::MutexLock lck(&mutex_);
  return waiting_;
}

}  // namespace executor
