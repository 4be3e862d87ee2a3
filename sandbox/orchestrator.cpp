#include "sandbox/orchestrator.hpp"

#include "absl/memory/memory.h"
#include "absl/random/random.h"
#include "absl/strings/ascii.h"
#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"
#include "glog/logging.h"
#include "language/registry.hpp"

namespace sandbox {

namespace {

// Decodes its standard input into the file given as first parameter.
const char* const kDecodeScript = "base64 -d > \"$1\"";
const char* const kInputFileName = ".stdin";

std::string RandomPrefix() {
  absl::BitGen gen;
  return absl::StrCat(
      absl::Hex(absl::Uniform<uint32_t>(gen), absl::kZeroPad8));
}

provisioning_error::Reason ReasonFor(runtime::CallStatus status) {
  switch (status) {
    case runtime::CallStatus::UNAVAILABLE:
      return provisioning_error::Reason::UNAVAILABLE;
    case runtime::CallStatus::NOT_FOUND:
      return provisioning_error::Reason::IMAGE_MISSING;
    default:
      return provisioning_error::Reason::FAILED;
  }
}

}  // namespace

const char* const Orchestrator::kManagedLabel = "coderunner.managed";

Orchestrator::Orchestrator(runtime::ContainerRuntime* runtime,
                           runtime::HealthMonitor* health, Reaper* reaper,
                           Options options)
    : runtime_(runtime),
      health_(health),
      reaper_(reaper),
      options_(std::move(options)),
      id_prefix_(RandomPrefix()) {}

runtime::CallStatus Orchestrator::Track(runtime::CallStatus status,
                                        const std::string& error_msg) {
  if (status == runtime::CallStatus::UNAVAILABLE) {
    health_->RecordFailure(error_msg);
  } else {
    health_->RecordSuccess();
  }
  return status;
}

std::string Orchestrator::NewSessionId() {
  return absl::StrCat(id_prefix_, "-", next_id_++);
}

runtime::ContainerSpec Orchestrator::SpecFor(const Session& session,
                                             int64_t timeout_millis) const {
  const proto::LanguageConfig& config = session.Config();
  runtime::ContainerSpec spec;
  spec.name = session.ContainerName();
  spec.image = config.image();
  spec.labels[kManagedLabel] = "true";
  spec.labels["coderunner.session"] = session.Id();
  spec.labels["coderunner.language"] = config.id();
  spec.memory_limit_bytes = config.memory_limit_bytes();
  spec.cpu_limit = config.cpu_limit();
  spec.pids_limit = config.pids_limit();
  spec.max_files = config.max_files();
  spec.network_disabled = config.network_disabled();
  spec.run_as_non_root = config.run_as_non_root();
  spec.work_dir = options_.work_dir;
  spec.lifetime_seconds = (timeout_millis + options_.grace_millis + 999) / 1000;
  return spec;
}

void Orchestrator::Register(Session* session) {
  absl::MutexLock lck(&mutex_);
  live_[session->Id()] = session;
}

void Orchestrator::Unregister(Session* session) {
  absl::MutexLock lck(&mutex_);
  live_.erase(session->Id());
}

std::unique_ptr<Session> Orchestrator::Provision(
    const proto::LanguageConfig& config, int64_t timeout_millis,
    const std::function<bool()>& cancelled) {
  if (!health_->MayAttempt()) {
    throw provisioning_error(provisioning_error::Reason::UNAVAILABLE,
                             "Container daemon is unavailable, retry later");
  }
  auto session = absl::make_unique<Session>(
      NewSessionId(), config, Session::Clock::now(),
      std::chrono::milliseconds(timeout_millis));
  session->SetCancelCheck(cancelled);
  session->TransitionTo(Session::State::PROVISIONING);
  Register(session.get());

  std::string error_msg;
  auto fail = [&](runtime::CallStatus status, const std::string& what) {
    session->TransitionTo(Session::State::PROVISIONING_FAILED);
    Release(session.get());
    LOG(WARNING) << "Session " << session->Id() << ": " << what << ": "
                 << error_msg;
    throw provisioning_error(ReasonFor(status),
                             absl::StrCat(what, ": ", error_msg));
  };
  auto check_cancelled = [&]() {
    if (!session->Cancelled()) return;
    LOG(INFO) << "Session " << session->Id()
              << " was cancelled while provisioning";
    Release(session.get());
    throw cancelled_error();
  };

  if (health_->Get().state != runtime::HealthMonitor::State::AVAILABLE) {
    runtime::CallStatus status = Track(runtime_->Ping(&error_msg), error_msg);
    if (status != runtime::CallStatus::OK) {
      fail(runtime::CallStatus::UNAVAILABLE, "Container daemon is unavailable");
    }
  }
  check_cancelled();

  session->MarkContainerRequested();
  std::string handle;
  runtime::CallStatus status = Track(
      runtime_->Create(SpecFor(*session, timeout_millis), &handle, &error_msg),
      error_msg);
  if (status == runtime::CallStatus::NOT_FOUND) {
    fail(status, absl::StrCat("Image ", config.image(), " is not available"));
  } else if (status != runtime::CallStatus::OK) {
    fail(status, "Cannot create container");
  }
  session->SetHandle(handle);
  check_cancelled();

  status = Track(runtime_->Start(handle, &error_msg), error_msg);
  if (status != runtime::CallStatus::OK) {
    fail(status == runtime::CallStatus::NOT_FOUND
             ? runtime::CallStatus::FAILED
             : status,
         "Cannot start container");
  }
  check_cancelled();
  session->ArmDeadline(Session::Clock::now());
  session->TransitionTo(Session::State::RUNNING);
  LOG(INFO) << "Session " << session->Id() << ": " << config.id()
            << " sandbox " << handle.substr(0, 12) << " is running";
  return session;
}

Completion Orchestrator::RunInSession(Session* session,
                                      runtime::ExecSpec spec) {
  std::unique_ptr<runtime::RunningExec> exec;
  std::string error_msg;
  runtime::CallStatus status = Track(
      runtime_->Exec(session->ContainerRef(), spec, &exec, &error_msg),
      error_msg);
  if (status != runtime::CallStatus::OK) {
    throw execution_error(absl::StrCat("Cannot run ", spec.command[0],
                                       " in sandbox: ", error_msg));
  }
  return AwaitCompletion(session, exec.get(), session->Deadline());
}

bool Orchestrator::Inject(Session* session, const std::string& source,
                          const std::string& input) {
  const std::string source_path = absl::StrCat(
      options_.work_dir, "/", language::SourceFileName(session->Config()));
  const std::string input_path =
      absl::StrCat(options_.work_dir, "/", kInputFileName);
  for (const auto& file : {std::make_pair(&source_path, &source),
                           std::make_pair(&input_path, &input)}) {
    runtime::ExecSpec spec;
    spec.command = {"sh", "-c", kDecodeScript, "sh", *file.first};
    spec.input = absl::Base64Escape(*file.second);
    spec.output_limit = options_.output_limit_bytes;
    Completion completion = RunInSession(session, std::move(spec));
    if (completion.cancelled) throw cancelled_error();
    if (completion.timed_out) return false;
    if (*completion.exit_code != 0) {
      throw execution_error(absl::StrCat(
          "Cannot write ", *file.first, ": ",
          absl::StripAsciiWhitespace(completion.output.stderr_data)));
    }
  }
  VLOG(1) << "Session " << session->Id() << ": injected " << source.size()
          << " bytes of code and " << input.size() << " bytes of input";
  return true;
}

std::unique_ptr<runtime::RunningExec> Orchestrator::Start(
    Session* session, const std::string& command_template,
    const std::vector<std::string>& args, bool attach_input) {
  std::string command = language::ExpandCommand(
      command_template, session->Config(), options_.work_dir);
  std::string input_path =
      attach_input ? absl::StrCat(options_.work_dir, "/", kInputFileName)
                   : "/dev/null";
  runtime::ExecSpec spec;
  spec.command = {"sh", "-c",
                  absl::StrCat("{ ", command, "\n} < ", input_path), "sh"};
  spec.command.insert(spec.command.end(), args.begin(), args.end());
  spec.output_limit = options_.output_limit_bytes;

  std::unique_ptr<runtime::RunningExec> exec;
  std::string error_msg;
  runtime::CallStatus status = Track(
      runtime_->Exec(session->ContainerRef(), spec, &exec, &error_msg),
      error_msg);
  if (status != runtime::CallStatus::OK) {
    throw execution_error(
        absl::StrCat("Cannot start command in sandbox: ", error_msg));
  }
  VLOG(1) << "Session " << session->Id() << ": started " << command;
  return exec;
}

Completion Orchestrator::AwaitCompletion(Session* session,
                                         runtime::RunningExec* exec,
                                         Session::Clock::time_point deadline) {
  Completion completion;
  switch (exec->Wait(deadline, [session]() { return session->Cancelled(); })) {
    case runtime::RunningExec::WaitResult::EXITED:
      completion.output = exec->Output();
      CheckExecClient(session, completion.output);
      completion.exit_code = completion.output.exit_code;
      return completion;
    case runtime::RunningExec::WaitResult::DEADLINE:
      LOG(INFO) << "Session " << session->Id() << " hit its deadline";
      completion.timed_out = true;
      break;
    case runtime::RunningExec::WaitResult::INTERRUPTED:
      LOG(INFO) << "Session " << session->Id() << " was cancelled";
      completion.cancelled = true;
      break;
  }
  std::string error_msg;
  runtime::CallStatus status =
      Track(runtime_->Kill(session->ContainerRef(), &error_msg), error_msg);
  if (status == runtime::CallStatus::NOT_FOUND) {
    VLOG(1) << "Session " << session->Id()
            << ": container already stopped: " << error_msg;
  } else if (status != runtime::CallStatus::OK) {
    LOG(WARNING) << "Session " << session->Id()
                 << ": cannot kill container: " << error_msg;
  }
  exec->Abort();
  completion.output = exec->Output();
  return completion;
}

void Orchestrator::CheckExecClient(Session* session,
                                   const runtime::ExecOutput& output) {
  switch (output.client_status) {
    case runtime::CallStatus::OK:
      return;
    case runtime::CallStatus::UNAVAILABLE: {
      // The command itself may have printed the same words, so the daemon
      // is only blamed if it does not answer a ping either.
      std::string error_msg;
      if (Track(runtime_->Ping(&error_msg), error_msg) ==
          runtime::CallStatus::OK) {
        VLOG(1) << "Session " << session->Id()
                << ": daemon answers, keeping the command result";
        return;
      }
      LOG(WARNING) << "Session " << session->Id()
                   << ": lost the container daemon: " << error_msg;
      throw provisioning_error(
          provisioning_error::Reason::UNAVAILABLE,
          absl::StrCat("Lost the container daemon: ", output.client_error));
    }
    case runtime::CallStatus::NOT_FOUND:
      Track(output.client_status, output.client_error);
      throw execution_error(absl::StrCat("Sandbox container vanished: ",
                                         output.client_error));
    case runtime::CallStatus::FAILED:
      Track(output.client_status, output.client_error);
      break;
  }
  throw execution_error(
      absl::StrCat("Cannot run command in sandbox: ", output.client_error));
}

void Orchestrator::Teardown(Session* session) { Dispose(session, true); }

void Orchestrator::Release(Session* session) { Dispose(session, false); }

void Orchestrator::Dispose(Session* session, bool wait_for_removal) {
  std::lock_guard<std::mutex> lck(session->TeardownMutex());
  Session::State state = session->GetState();
  if (state == Session::State::REAPED) {
    VLOG(1) << "Session " << session->Id() << " is already reaped";
    return;
  }
  if (!IsTerminal(state)) session->TransitionTo(Session::State::CANCELLED);

  if (session->ContainerRequested()) {
    std::string ref = session->ContainerRef();
    if (!wait_for_removal) {
      reaper_->RemoveAsync(ref);
    } else if (!health_->MayAttempt()) {
      LOG(WARNING) << "Container daemon is unavailable, deferring removal of "
                   << ref;
      reaper_->Schedule(ref);
    } else {
      std::string error_msg;
      switch (Track(runtime_->Remove(ref, &error_msg), error_msg)) {
        case runtime::CallStatus::OK:
          VLOG(1) << "Session " << session->Id() << ": removed " << ref;
          break;
        case runtime::CallStatus::NOT_FOUND:
          VLOG(1) << "Session " << session->Id() << ": " << ref
                  << " is already gone: " << error_msg;
          break;
        default:
          LOG(WARNING) << "Session " << session->Id() << ": cannot remove "
                       << ref << ": " << error_msg;
          reaper_->Schedule(ref);
          break;
      }
    }
  }
  session->TransitionTo(Session::State::REAPED);
  Unregister(session);
}

void Orchestrator::Abort(Session* session) {
  session->Cancel();
  Teardown(session);
}

void Orchestrator::CancelAll() {
  absl::MutexLock lck(&mutex_);
  for (auto& kv : live_) {
    LOG(INFO) << "Cancelling session " << kv.first;
    kv.second->Cancel();
  }
}

size_t Orchestrator::LiveSessions() const {
  absl::MutexLock lck(&mutex_);
  return live_.size();
}

int Orchestrator::SweepOrphans() {
  std::vector<std::string> handles;
  std::string error_msg;
  runtime::CallStatus status = Track(
      runtime_->List(absl::StrCat(kManagedLabel, "=true"), &handles,
                     &error_msg),
      error_msg);
  if (status != runtime::CallStatus::OK) {
    LOG(WARNING) << "Cannot list leftover containers: " << error_msg;
    return 0;
  }
  std::set<std::string> in_use;
  {
    absl::MutexLock lck(&mutex_);
    for (const auto& kv : live_) in_use.insert(kv.second->Handle());
  }
  int removed = 0;
  for (const std::string& handle : handles) {
    if (in_use.count(handle)) continue;
    status = Track(runtime_->Remove(handle, &error_msg), error_msg);
    if (status == runtime::CallStatus::OK) {
      removed++;
    } else if (status != runtime::CallStatus::NOT_FOUND) {
      LOG(WARNING) << "Cannot remove leftover container " << handle << ": "
                   << error_msg;
    }
  }
  if (removed > 0) LOG(INFO) << "Removed " << removed << " leftover containers";
  return removed;
}

int Orchestrator::PullImages(const std::vector<std::string>& images) {
  int failed = 0;
  for (const std::string& image : images) {
    LOG(INFO) << "Pulling " << image;
    std::string error_msg;
    if (Track(runtime_->Pull(image, &error_msg), error_msg) !=
        runtime::CallStatus::OK) {
      LOG(WARNING) << "Cannot pull " << image << ": " << error_msg;
      failed++;
    }
  }
  return failed;
}

}  // namespace sandbox
