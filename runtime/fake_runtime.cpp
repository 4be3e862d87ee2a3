#include "runtime/fake_runtime.hpp"

#include <thread>

#include "absl/memory/memory.h"
#include "absl/strings/escaping.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"

namespace runtime {

namespace {

class FakeExec : public RunningExec {
 public:
  FakeExec(const FakeRuntime::Program& program, size_t output_limit)
      : hang_(program.hang) {
    output_.exit_code = program.exit_code;
    output_.stdout_data = Cap(program.stdout_data, output_limit);
    output_.stderr_data = Cap(program.stderr_data, output_limit);
    output_.client_status = program.client_status;
    if (program.client_status != CallStatus::OK) {
      output_.client_error = program.stderr_data;
    }
  }

  WaitResult Wait(Clock::time_point deadline,
                  const std::function<bool()>& interrupted) override {
    if (!hang_) return WaitResult::EXITED;
    while (true) {
      if (interrupted && interrupted()) return WaitResult::INTERRUPTED;
      if (Clock::now() >= deadline) return WaitResult::DEADLINE;
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }

  void Abort() override {}

  const ExecOutput& Output() const override { return output_; }

 private:
  std::string Cap(const std::string& data, size_t limit) {
    if (limit == 0 || data.size() <= limit) return data;
    output_.truncated = true;
    return data.substr(0, limit);
  }

  bool hang_;
  ExecOutput output_;
};

}  // namespace

bool FakeRuntime::Down(std::string* error_msg) const {
  if (!unavailable_) return false;
  *error_msg = "Cannot connect to the Docker daemon";
  return true;
}

CallStatus FakeRuntime::Ping(std::string* error_msg) {
  absl::MutexLock lck(&mutex_);
  ping_calls_++;
  if (Down(error_msg)) return CallStatus::UNAVAILABLE;
  return CallStatus::OK;
}

CallStatus FakeRuntime::Create(const ContainerSpec& spec, std::string* handle,
                               std::string* error_msg) {
  absl::MutexLock lck(&mutex_);
  create_calls_++;
  if (Down(error_msg)) return CallStatus::UNAVAILABLE;
  if (missing_images_.count(spec.image)) {
    *error_msg = absl::StrCat("No such image: ", spec.image);
    return CallStatus::NOT_FOUND;
  }
  *handle = absl::StrCat("fake", next_handle_++);
  containers_[*handle].spec = spec;
  return CallStatus::OK;
}

CallStatus FakeRuntime::Start(const std::string& handle,
                              std::string* error_msg) {
  absl::MutexLock lck(&mutex_);
  if (Down(error_msg)) return CallStatus::UNAVAILABLE;
  auto it = containers_.find(handle);
  if (it == containers_.end()) {
    *error_msg = "No such container: " + handle;
    return CallStatus::NOT_FOUND;
  }
  it->second.started = true;
  return CallStatus::OK;
}

CallStatus FakeRuntime::Exec(const std::string& handle, const ExecSpec& spec,
                             std::unique_ptr<RunningExec>* exec,
                             std::string* error_msg) {
  Handler handler;
  Files files;
  {
    absl::MutexLock lck(&mutex_);
    if (Down(error_msg)) return CallStatus::UNAVAILABLE;
    auto it = containers_.find(handle);
    if (it == containers_.end() || !it->second.started) {
      *error_msg = "No such container: " + handle;
      return CallStatus::NOT_FOUND;
    }
    const std::vector<std::string>& cmd = spec.command;
    if (cmd.size() == 5 && cmd[0] == "sh" &&
        absl::StrContains(cmd[2], "base64 -d")) {
      Program program;
      std::string decoded;
      if (absl::Base64Unescape(spec.input, &decoded)) {
        it->second.files[cmd[4]] = decoded;
      } else {
        program.exit_code = 1;
        program.stderr_data = "base64: invalid input";
      }
      *exec = absl::make_unique<FakeExec>(program, spec.output_limit);
      return CallStatus::OK;
    }
    scripts_.push_back(cmd.size() > 2 ? cmd[2] : "");
    handler = handler_;
    files = it->second.files;
  }
  Program program;
  if (handler && spec.command.size() >= 4) {
    std::vector<std::string> args(spec.command.begin() + 4,
                                  spec.command.end());
    program = handler(spec.command[2], args, files);
  }
  *exec = absl::make_unique<FakeExec>(program, spec.output_limit);
  return CallStatus::OK;
}

CallStatus FakeRuntime::Kill(const std::string& handle,
                             std::string* error_msg) {
  absl::MutexLock lck(&mutex_);
  kill_calls_++;
  if (Down(error_msg)) return CallStatus::UNAVAILABLE;
  auto it = containers_.find(handle);
  if (it == containers_.end() || !it->second.started) {
    *error_msg = "Container " + handle + " is not running";
    return CallStatus::NOT_FOUND;
  }
  it->second.started = false;
  return CallStatus::OK;
}

CallStatus FakeRuntime::Remove(const std::string& handle,
                               std::string* error_msg) {
  int64_t delay_millis;
  {
    absl::MutexLock lck(&mutex_);
    delay_millis = remove_delay_millis_;
  }
  if (delay_millis > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(delay_millis));
  }
  absl::MutexLock lck(&mutex_);
  remove_calls_++;
  if (Down(error_msg)) return CallStatus::UNAVAILABLE;
  if (failing_removals_ > 0) {
    failing_removals_--;
    *error_msg = "removal of container " + handle + " is already in progress";
    return CallStatus::FAILED;
  }
  auto it = containers_.find(handle);
  if (it == containers_.end()) {
    // Removal by name.
    for (auto cur = containers_.begin(); cur != containers_.end(); ++cur) {
      if (cur->second.spec.name == handle) it = cur;
    }
  }
  if (it == containers_.end()) {
    *error_msg = "No such container: " + handle;
    return CallStatus::NOT_FOUND;
  }
  containers_.erase(it);
  return CallStatus::OK;
}

CallStatus FakeRuntime::List(const std::string& label,
                             std::vector<std::string>* handles,
                             std::string* error_msg) {
  absl::MutexLock lck(&mutex_);
  if (Down(error_msg)) return CallStatus::UNAVAILABLE;
  handles->clear();
  for (const auto& kv : containers_) {
    for (const auto& container_label : kv.second.spec.labels) {
      if (absl::StrCat(container_label.first, "=", container_label.second) ==
          label) {
        handles->push_back(kv.first);
      }
    }
  }
  return CallStatus::OK;
}

CallStatus FakeRuntime::Pull(const std::string& image,
                             std::string* error_msg) {
  absl::MutexLock lck(&mutex_);
  if (Down(error_msg)) return CallStatus::UNAVAILABLE;
  if (missing_images_.count(image)) {
    *error_msg = "pull access denied for " + image;
    return CallStatus::NOT_FOUND;
  }
  return CallStatus::OK;
}

void FakeRuntime::SetHandler(Handler handler) {
  absl::MutexLock lck(&mutex_);
  handler_ = std::move(handler);
}

void FakeRuntime::SetUnavailable(bool unavailable) {
  absl::MutexLock lck(&mutex_);
  unavailable_ = unavailable;
}

void FakeRuntime::SetMissingImage(const std::string& image) {
  absl::MutexLock lck(&mutex_);
  missing_images_.insert(image);
}

void FakeRuntime::FailRemovals(int count) {
  absl::MutexLock lck(&mutex_);
  failing_removals_ = count;
}

void FakeRuntime::SetRemoveDelay(int64_t millis) {
  absl::MutexLock lck(&mutex_);
  remove_delay_millis_ = millis;
}

std::string FakeRuntime::AddOrphan(
    const std::map<std::string, std::string>& labels) {
  absl::MutexLock lck(&mutex_);
  std::string handle = absl::StrCat("orphan", next_handle_++);
  containers_[handle].spec.labels = labels;
  return handle;
}

std::vector<std::string> FakeRuntime::Containers() const {
  absl::MutexLock lck(&mutex_);
  std::vector<std::string> handles;
  for (const auto& kv : containers_) handles.push_back(kv.first);
  return handles;
}

ContainerSpec FakeRuntime::SpecOf(const std::string& handle) const {
  absl::MutexLock lck(&mutex_);
  auto it = containers_.find(handle);
  return it == containers_.end() ? ContainerSpec() : it->second.spec;
}

FakeRuntime::Files FakeRuntime::FilesOf(const std::string& handle) const {
  absl::MutexLock lck(&mutex_);
  auto it = containers_.find(handle);
  return it == containers_.end() ? Files() : it->second.files;
}

std::vector<std::string> FakeRuntime::Scripts() const {
  absl::MutexLock lck(&mutex_);
  return scripts_;
}

int FakeRuntime::CreateCalls() const {
  absl::MutexLock lck(&mutex_);
  return create_calls_;
}

int FakeRuntime::RemoveCalls() const {
  absl::MutexLock lck(&mutex_);
  return remove_calls_;
}

int FakeRuntime::KillCalls() const {
  absl::MutexLock lck(&mutex_);
  return kill_calls_;
}

int FakeRuntime::PingCalls() const {
  absl::MutexLock lck(&mutex_);
  return ping_calls_;
}

}  // namespace runtime
