#include "sandbox/session.hpp"

#include "glog/logging.h"

namespace sandbox {

namespace {
bool Allowed(Session::State from, Session::State to) {
  using State = Session::State;
  switch (from) {
    case State::CREATED:
      return to == State::PROVISIONING || to == State::CANCELLED;
    case State::PROVISIONING:
      return to == State::RUNNING || to == State::PROVISIONING_FAILED ||
             to == State::CANCELLED;
    case State::RUNNING:
      return to == State::COMPLETED || to == State::TIMED_OUT ||
             to == State::RUNTIME_FAILED || to == State::CANCELLED;
    case State::COMPLETED:
    case State::TIMED_OUT:
    case State::PROVISIONING_FAILED:
    case State::RUNTIME_FAILED:
    case State::CANCELLED:
      return to == State::REAPED;
    case State::REAPED:
      return false;
  }
  return false;
}
}  // namespace

std::string Session::Handle() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return handle_;
}

void Session::SetHandle(const std::string& handle) {
  std::lock_guard<std::mutex> lck(mutex_);
  handle_ = handle;
}

std::string Session::ContainerRef() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return handle_.empty() ? ContainerName() : handle_;
}

Session::State Session::GetState() const {
  std::lock_guard<std::mutex> lck(mutex_);
  return state_;
}

bool Session::TransitionTo(State next) {
  std::lock_guard<std::mutex> lck(mutex_);
  if (!Allowed(state_, next)) {
    VLOG(1) << "Session " << id_ << ": ignoring " << StateName(state_)
            << " -> " << StateName(next);
    return false;
  }
  VLOG(1) << "Session " << id_ << ": " << StateName(state_) << " -> "
          << StateName(next);
  state_ = next;
  return true;
}

bool Session::Cancelled() const {
  return cancelled_ || (cancel_check_ && cancel_check_());
}

const char* StateName(Session::State state) {
  switch (state) {
    case Session::State::CREATED:
      return "CREATED";
    case Session::State::PROVISIONING:
      return "PROVISIONING";
    case Session::State::RUNNING:
      return "RUNNING";
    case Session::State::COMPLETED:
      return "COMPLETED";
    case Session::State::TIMED_OUT:
      return "TIMED_OUT";
    case Session::State::PROVISIONING_FAILED:
      return "PROVISIONING_FAILED";
    case Session::State::RUNTIME_FAILED:
      return "RUNTIME_FAILED";
    case Session::State::CANCELLED:
      return "CANCELLED";
    case Session::State::REAPED:
      return "REAPED";
  }
  return "UNKNOWN";
}

bool IsTerminal(Session::State state) {
  return state == Session::State::COMPLETED ||
         state == Session::State::TIMED_OUT ||
         state == Session::State::PROVISIONING_FAILED ||
         state == Session::State::RUNTIME_FAILED ||
         state == Session::State::CANCELLED;
}

}  // namespace sandbox
