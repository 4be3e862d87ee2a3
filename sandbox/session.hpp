#ifndef SANDBOX_SESSION_HPP
#define SANDBOX_SESSION_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>

#include "proto/language.pb.h"

namespace sandbox {

// Binds one execution request to exactly one container.
//
//   CREATED -> PROVISIONING -> RUNNING -> {COMPLETED | TIMED_OUT |
//   RUNTIME_FAILED | CANCELLED} -> REAPED
//
// PROVISIONING may also end in PROVISIONING_FAILED or CANCELLED. Every state
// except CREATED ends in REAPED through Orchestrator::Teardown or Release.
class Session {
 public:
  using Clock = std::chrono::steady_clock;

  enum class State {
    CREATED,
    PROVISIONING,
    RUNNING,
    COMPLETED,
    TIMED_OUT,
    PROVISIONING_FAILED,
    RUNTIME_FAILED,
    CANCELLED,
    REAPED,
  };

  Session(std::string id, const proto::LanguageConfig& config,
          Clock::time_point created_at, std::chrono::milliseconds timeout)
      : id_(std::move(id)),
        config_(config),
        created_at_(created_at),
        timeout_(timeout),
        deadline_(created_at + timeout) {}

  const std::string& Id() const { return id_; }
  const proto::LanguageConfig& Config() const { return config_; }
  Clock::time_point CreatedAt() const { return created_at_; }
  Clock::time_point Deadline() const { return deadline_; }
  // Restarts the time budget of the session from the given instant, once the
  // sandbox is ready.
  void ArmDeadline(Clock::time_point start) { deadline_ = start + timeout_; }

  // Name given to the container, usable before the daemon returned a handle.
  std::string ContainerName() const { return "coderunner-" + id_; }

  std::string Handle() const;
  void SetHandle(const std::string& handle);
  // The handle if known, the container name otherwise.
  std::string ContainerRef() const;
  // Set once the daemon was asked to create the container, which may exist
  // from then on even if no handle was returned.
  void MarkContainerRequested() { container_requested_ = true; }
  bool ContainerRequested() const { return container_requested_; }

  State GetState() const;
  // Returns false, leaving the state unchanged, if the transition is not
  // allowed. Of several racing terminal transitions only the first succeeds.
  bool TransitionTo(State next);

  // Cancellation requested either through Cancel() or by the caller check.
  bool Cancelled() const;
  void Cancel() { cancelled_ = true; }
  // Installs a caller-provided cancellation check. Must be called before the
  // session is shared with other threads.
  void SetCancelCheck(std::function<bool()> check) {
    cancel_check_ = std::move(check);
  }

  // Held during teardown, so that concurrent teardowns run once.
  std::mutex& TeardownMutex() { return teardown_mutex_; }

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

 private:
  const std::string id_;
  const proto::LanguageConfig& config_;
  const Clock::time_point created_at_;
  const std::chrono::milliseconds timeout_;
  Clock::time_point deadline_;

  mutable std::mutex mutex_;
  std::string handle_;
  State state_ = State::CREATED;

  std::atomic<bool> container_requested_{false};
  std::atomic<bool> cancelled_{false};
  std::function<bool()> cancel_check_;
  std::mutex teardown_mutex_;
};

const char* StateName(Session::State state);
bool IsTerminal(Session::State state);

}  // namespace sandbox

#endif
