#include "executor/pipeline.hpp"

#include <chrono>

#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "language/registry.hpp"

namespace executor {

namespace {

using Clock = std::chrono::steady_clock;

int64_t MillisSince(Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() -
                                                               start)
      .count();
}

// Releases the session when going out of scope, however the execution
// ended. The container is removed in the background.
class ReapOnExit {
 public:
  ReapOnExit(sandbox::Orchestrator* orchestrator, sandbox::Session* session)
      : orchestrator_(orchestrator), session_(session) {}
  ~ReapOnExit() { orchestrator_->Release(session_); }
  ReapOnExit(const ReapOnExit&) = delete;
  ReapOnExit& operator=(const ReapOnExit&) = delete;

 private:
  sandbox::Orchestrator* orchestrator_;
  sandbox::Session* session_;
};

void SetTimedOut(const ValidRequest& request, proto::ExecuteResponse* response) {
  response->set_success(false);
  response->set_timed_out(true);
  response->clear_exit_code();
  response->set_outcome(proto::Outcome::TIMED_OUT);
  response->set_error(absl::StrCat("Execution timed out after ",
                                   request.timeout_millis, "ms"));
}

}  // namespace

proto::ExecuteResponse Pipeline::Execute(
    const proto::ExecuteRequest& request,
    const std::function<bool()>& cancelled) {
  ValidRequest valid = validator_->Validate(request);
  LOG(INFO) << "Executing " << valid.config->id() << " code ("
            << valid.code.size() << " bytes, " << valid.input.size()
            << " bytes of input, timeout " << valid.timeout_millis << "ms)";

  Limiter::Slot slot(limiter_, cancelled);
  std::unique_ptr<sandbox::Session> session = orchestrator_->Provision(
      *valid.config, valid.timeout_millis, cancelled);
  ReapOnExit reap(orchestrator_, session.get());

  try {
    proto::ExecuteResponse response = Run(session.get(), valid);
    LOG(INFO) << "Session " << session->Id() << " finished: "
              << proto::Outcome_Name(response.outcome()) << " in "
              << response.execution_time_ms() << "ms";
    return response;
  } catch (const sandbox::execution_error& e) {
    LOG(ERROR) << "Session " << session->Id() << " failed: " << e.what();
    session->TransitionTo(sandbox::Session::State::RUNTIME_FAILED);
    throw;
  } catch (const sandbox::provisioning_error& e) {
    LOG(ERROR) << "Session " << session->Id() << " lost its sandbox: "
               << e.what();
    session->TransitionTo(sandbox::Session::State::RUNTIME_FAILED);
    throw;
  }
}

proto::ExecuteResponse Pipeline::Run(sandbox::Session* session,
                                     const ValidRequest& request) {
  using State = sandbox::Session::State;
  const proto::LanguageConfig& config = *request.config;
  proto::ExecuteResponse response;
  response.set_session_id(session->Id());

  Clock::time_point start = Clock::now();
  if (!orchestrator_->Inject(session,
                             language::PrepareSource(config, request.code),
                             request.input)) {
    session->TransitionTo(State::TIMED_OUT);
    SetTimedOut(request, &response);
    response.set_execution_time_ms(MillisSince(start));
    return response;
  }

  if (!config.compile_command().empty()) {
    start = Clock::now();
    auto compile =
        orchestrator_->Start(session, config.compile_command(), {}, false);
    sandbox::Completion completion =
        orchestrator_->AwaitCompletion(session, compile.get(),
                                       session->Deadline());
    response.set_execution_time_ms(MillisSince(start));
    if (completion.cancelled) throw sandbox::cancelled_error();
    if (completion.timed_out) {
      session->TransitionTo(State::TIMED_OUT);
      SetTimedOut(request, &response);
      response.set_output(completion.output.stdout_data);
      response.set_truncated(completion.output.truncated);
      return response;
    }
    if (*completion.exit_code != 0) {
      session->TransitionTo(State::COMPLETED);
      response.set_success(false);
      response.set_outcome(proto::Outcome::COMPILE_ERROR);
      response.set_exit_code(*completion.exit_code);
      response.set_output(completion.output.stdout_data);
      // Some compilers print their diagnostics on stdout.
      response.set_error(completion.output.stderr_data.empty()
                             ? completion.output.stdout_data
                             : completion.output.stderr_data);
      response.set_truncated(completion.output.truncated);
      return response;
    }
    VLOG(1) << "Session " << session->Id() << ": compiled in "
            << response.execution_time_ms() << "ms";
  }

  start = Clock::now();
  auto run = orchestrator_->Start(session, config.run_command(), request.args,
                                  true);
  sandbox::Completion completion =
      orchestrator_->AwaitCompletion(session, run.get(), session->Deadline());
  response.set_execution_time_ms(MillisSince(start));
  if (completion.cancelled) throw sandbox::cancelled_error();
  response.set_output(completion.output.stdout_data);
  response.set_truncated(completion.output.truncated);
  if (completion.timed_out) {
    session->TransitionTo(State::TIMED_OUT);
    SetTimedOut(request, &response);
    return response;
  }
  session->TransitionTo(State::COMPLETED);
  response.set_exit_code(*completion.exit_code);
  response.set_error(completion.output.stderr_data);
  response.set_success(*completion.exit_code == 0);
  response.set_outcome(*completion.exit_code == 0
                           ? proto::Outcome::COMPLETED
                           : proto::Outcome::RUNTIME_ERROR);
  return response;
}

}  // namespace executor
