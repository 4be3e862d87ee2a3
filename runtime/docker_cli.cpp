#include "runtime/docker_cli.hpp"

#include "absl/memory/memory.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "glog/logging.h"

namespace runtime {

namespace {

const char* const kUnavailableMarkers[] = {
    "Cannot connect to the Docker daemon",
    "Is the docker daemon running",
    "error during connect",
    "connection refused",
    "context deadline exceeded",
};

const char* const kNotFoundMarkers[] = {
    "No such container",
    "No such object",
    "No such image",
    "is not running",
    "pull access denied",
    "manifest unknown",
};

// Prefixes of the lines "docker exec" prints when it cannot reach the daemon
// or the daemon refuses the exec.
const char* const kExecUnreachablePrefixes[] = {
    "Cannot connect to the Docker daemon",
    "error during connect",
};
const char* const kExecDaemonErrorPrefix = "Error response from daemon:";

// Uid and gid of "nobody".
const char* const kNonRootUser = "65534:65534";

std::string ErrorText(const util::SubprocessInfo& info) {
  std::string text(absl::StripAsciiWhitespace(info.stderr_data));
  if (text.empty()) {
    text = absl::StrCat("exit status ", info.status_code);
  }
  return text;
}

class DockerExec : public RunningExec {
 public:
  explicit DockerExec(util::SubprocessOptions options)
      : process_(std::move(options)) {}

  bool Start(std::string* error_msg) { return process_.Start(error_msg); }

  WaitResult Wait(Clock::time_point deadline,
                  const std::function<bool()>& interrupted) override {
    switch (process_.Wait(deadline, interrupted)) {
      case util::Subprocess::WaitResult::EXITED:
        Collect();
        return WaitResult::EXITED;
      case util::Subprocess::WaitResult::DEADLINE:
        return WaitResult::DEADLINE;
      case util::Subprocess::WaitResult::INTERRUPTED:
        return WaitResult::INTERRUPTED;
    }
    return WaitResult::EXITED;
  }

  void Abort() override {
    if (!process_.Running()) return;
    process_.Kill();
    Collect();
  }

  const ExecOutput& Output() const override { return output_; }

 private:
  void Collect() {
    const util::SubprocessInfo& info = process_.Info();
    output_.exit_code =
        info.signal != 0 ? 128 + info.signal : info.status_code;
    output_.stdout_data = info.stdout_data;
    output_.stderr_data = info.stderr_data;
    output_.truncated = info.truncated;
    output_.client_error.clear();
    output_.client_status =
        DockerCli::ClassifyExec(info, &output_.client_error);
  }

  util::Subprocess process_;
  ExecOutput output_;
};

}  // namespace

std::vector<std::string> DockerCli::Command(
    std::vector<std::string> subcommand) const {
  std::vector<std::string> args = {options_.binary};
  if (!options_.host.empty()) {
    args.push_back("--host");
    args.push_back(options_.host);
  }
  args.insert(args.end(), std::make_move_iterator(subcommand.begin()),
              std::make_move_iterator(subcommand.end()));
  return args;
}

std::vector<std::string> DockerCli::CreateArgs(const ContainerSpec& spec) {
  std::vector<std::string> args = {"create", "--pull=never"};
  auto add = [&args](const std::string& flag, const std::string& value) {
    args.push_back(flag);
    args.push_back(value);
  };
  if (!spec.name.empty()) add("--name", spec.name);
  for (const auto& label : spec.labels) {
    add("--label", absl::StrCat(label.first, "=", label.second));
  }
  if (spec.network_disabled) add("--network", "none");
  if (spec.memory_limit_bytes) {
    add("--memory", absl::StrCat(spec.memory_limit_bytes));
    // Equal to --memory, so that the container cannot swap.
    add("--memory-swap", absl::StrCat(spec.memory_limit_bytes));
  }
  if (spec.cpu_limit > 0) add("--cpus", absl::StrCat(spec.cpu_limit));
  if (spec.pids_limit) add("--pids-limit", absl::StrCat(spec.pids_limit));
  if (spec.max_files) {
    add("--ulimit",
        absl::StrCat("nofile=", spec.max_files, ":", spec.max_files));
  }
  if (spec.run_as_non_root) add("--user", kNonRootUser);
  add("--cap-drop", "ALL");
  add("--security-opt", "no-new-privileges");
  add("--tmpfs", absl::StrCat(spec.work_dir, ":rw,exec,nosuid,size=",
                              spec.tmpfs_size_bytes));
  add("--workdir", spec.work_dir);
  add("--env", absl::StrCat("HOME=", spec.work_dir));
  add("--entrypoint", "sleep");
  args.push_back(spec.image);
  args.push_back(absl::StrCat(spec.lifetime_seconds));
  return args;
}

CallStatus DockerCli::Classify(const util::SubprocessInfo& info) {
  if (info.status_code == 0 && info.signal == 0) return CallStatus::OK;
  for (const char* marker : kUnavailableMarkers) {
    if (absl::StrContainsIgnoreCase(info.stderr_data, marker)) {
      return CallStatus::UNAVAILABLE;
    }
  }
  for (const char* marker : kNotFoundMarkers) {
    if (absl::StrContainsIgnoreCase(info.stderr_data, marker)) {
      return CallStatus::NOT_FOUND;
    }
  }
  return CallStatus::FAILED;
}

CallStatus DockerCli::ClassifyExec(const util::SubprocessInfo& info,
                                   std::string* error_msg) {
  if (info.signal != 0) {
    *error_msg = absl::StrCat("docker exec was killed by signal ", info.signal);
    return CallStatus::FAILED;
  }
  if (info.status_code == util::SubprocessInfo::kStatusLost) {
    *error_msg = "exit status of docker exec was lost";
    return CallStatus::FAILED;
  }
  if (info.status_code == 0) return CallStatus::OK;
  absl::string_view last_line;
  for (absl::string_view line :
       absl::StrSplit(info.stderr_data, '\n', absl::SkipWhitespace())) {
    last_line = line;
  }
  last_line = absl::StripAsciiWhitespace(last_line);
  for (const char* prefix : kExecUnreachablePrefixes) {
    if (absl::StartsWith(last_line, prefix)) {
      *error_msg = std::string(last_line);
      return CallStatus::UNAVAILABLE;
    }
  }
  if (!absl::StartsWith(last_line, kExecDaemonErrorPrefix)) {
    return CallStatus::OK;
  }
  *error_msg = std::string(last_line);
  for (const char* marker : kNotFoundMarkers) {
    if (absl::StrContainsIgnoreCase(last_line, marker)) {
      return CallStatus::NOT_FOUND;
    }
  }
  return CallStatus::FAILED;
}

CallStatus DockerCli::Call(std::vector<std::string> subcommand,
                           int64_t timeout_millis, std::string* output,
                           std::string* error_msg) {
  util::SubprocessOptions options;
  options.args = Command(std::move(subcommand));
  util::SubprocessInfo info;
  std::string run_error;
  VLOG(2) << "Running " << absl::StrJoin(options.args, " ");
  if (!util::RunSubprocess(options, timeout_millis, &info, &run_error)) {
    // Either the client is missing or the daemon did not answer in time.
    *error_msg = absl::StrCat(options_.binary, ": ", run_error);
    return CallStatus::UNAVAILABLE;
  }
  CallStatus status = Classify(info);
  if (status != CallStatus::OK) {
    *error_msg = ErrorText(info);
    return status;
  }
  if (output != nullptr) {
    *output = std::string(absl::StripAsciiWhitespace(info.stdout_data));
  }
  return status;
}

CallStatus DockerCli::Ping(std::string* error_msg) {
  return Call({"version", "--format", "{{.Server.Version}}"},
              options_.call_timeout_millis, nullptr, error_msg);
}

CallStatus DockerCli::Create(const ContainerSpec& spec, std::string* handle,
                             std::string* error_msg) {
  return Call(CreateArgs(spec), options_.call_timeout_millis, handle,
              error_msg);
}

CallStatus DockerCli::Start(const std::string& handle, std::string* error_msg) {
  return Call({"start", handle}, options_.call_timeout_millis, nullptr,
              error_msg);
}

CallStatus DockerCli::Exec(const std::string& handle, const ExecSpec& spec,
                           std::unique_ptr<RunningExec>* exec,
                           std::string* error_msg) {
  std::vector<std::string> subcommand = {"exec", "--interactive", handle};
  subcommand.insert(subcommand.end(), spec.command.begin(),
                    spec.command.end());
  util::SubprocessOptions options;
  options.args = Command(std::move(subcommand));
  options.input = spec.input;
  options.output_limit = spec.output_limit;
  auto docker_exec = absl::make_unique<DockerExec>(std::move(options));
  std::string start_error;
  if (!docker_exec->Start(&start_error)) {
    *error_msg = absl::StrCat(options_.binary, ": ", start_error);
    return CallStatus::UNAVAILABLE;
  }
  *exec = std::move(docker_exec);
  return CallStatus::OK;
}

CallStatus DockerCli::Kill(const std::string& handle, std::string* error_msg) {
  return Call({"kill", handle}, options_.call_timeout_millis, nullptr,
              error_msg);
}

CallStatus DockerCli::Remove(const std::string& handle,
                             std::string* error_msg) {
  return Call({"rm", "--force", handle}, options_.call_timeout_millis, nullptr,
              error_msg);
}

CallStatus DockerCli::List(const std::string& label,
                           std::vector<std::string>* handles,
                           std::string* error_msg) {
  std::string output;
  CallStatus status =
      Call({"ps", "--all", "--quiet", "--no-trunc", "--filter",
            absl::StrCat("label=", label)},
           options_.call_timeout_millis, &output, error_msg);
  if (status != CallStatus::OK) return status;
  handles->clear();
  for (absl::string_view line :
       absl::StrSplit(output, '\n', absl::SkipWhitespace())) {
    handles->emplace_back(absl::StripAsciiWhitespace(line));
  }
  return status;
}

CallStatus DockerCli::Pull(const std::string& image, std::string* error_msg) {
  return Call({"pull", "--quiet", image}, options_.pull_timeout_millis,
              nullptr, error_msg);
}

}  // namespace runtime
