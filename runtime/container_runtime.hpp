#ifndef RUNTIME_CONTAINER_RUNTIME_HPP
#define RUNTIME_CONTAINER_RUNTIME_HPP

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace runtime {

// Outcome of a single call to the container daemon.
enum class CallStatus {
  OK,
  // The container or image does not exist.
  NOT_FOUND,
  // The daemon could not be reached or did not answer in time.
  UNAVAILABLE,
  // The daemon answered with an error.
  FAILED,
};

const char* CallStatusName(CallStatus status);

// Settings of a sandbox container.
struct ContainerSpec {
  std::string name;
  std::string image;
  std::map<std::string, std::string> labels;

  int64_t memory_limit_bytes = 0;
  float cpu_limit = 0;
  int32_t pids_limit = 0;
  int32_t max_files = 0;
  int64_t tmpfs_size_bytes = 100 * 1024 * 1024;

  bool network_disabled = true;
  bool run_as_non_root = true;
  std::string work_dir = "/tmp";

  // The container stops by itself after this many seconds.
  int64_t lifetime_seconds = 0;
};

// A command to run inside a started container.
struct ExecSpec {
  std::vector<std::string> command;
  std::string input;
  size_t output_limit = 0;
};

struct ExecOutput {
  int32_t exit_code = 0;
  std::string stdout_data;
  std::string stderr_data;
  bool truncated = false;
  // Whether the command ran at all. Anything but OK means that the client
  // failed to reach the container, and the fields above are its own output
  // rather than the command's.
  CallStatus client_status = CallStatus::OK;
  std::string client_error;
};

// A command running inside a container.
class RunningExec {
 public:
  using Clock = std::chrono::steady_clock;
  enum class WaitResult { EXITED, DEADLINE, INTERRUPTED };

  // Blocks until the command exits, the deadline passes or interrupted
  // returns true. Exactly one of the three is reported.
  virtual WaitResult Wait(Clock::time_point deadline,
                          const std::function<bool()>& interrupted) = 0;

  // Detaches from the command. Does not stop the processes inside the
  // container, which are stopped by killing the container.
  virtual void Abort() = 0;

  // Valid after Wait returned EXITED or after Abort. The exit code is only
  // meaningful in the first case.
  virtual const ExecOutput& Output() const = 0;

  RunningExec() = default;
  virtual ~RunningExec() = default;
  RunningExec(const RunningExec&) = delete;
  RunningExec& operator=(const RunningExec&) = delete;
  RunningExec(RunningExec&&) = delete;
  RunningExec& operator=(RunningExec&&) = delete;
};

// Interface to the daemon that creates, runs and removes containers.
// Implementations must be safe to call from multiple threads at once.
class ContainerRuntime {
 public:
  virtual CallStatus Ping(std::string* error_msg) = 0;

  // Creates a container and sets its opaque handle.
  virtual CallStatus Create(const ContainerSpec& spec, std::string* handle,
                            std::string* error_msg) = 0;
  virtual CallStatus Start(const std::string& handle,
                           std::string* error_msg) = 0;

  // Starts a command in the container and returns a handle to it.
  virtual CallStatus Exec(const std::string& handle, const ExecSpec& spec,
                          std::unique_ptr<RunningExec>* exec,
                          std::string* error_msg) = 0;

  virtual CallStatus Kill(const std::string& handle,
                          std::string* error_msg) = 0;

  // Force-removes the container, stopping it if needed.
  virtual CallStatus Remove(const std::string& handle,
                            std::string* error_msg) = 0;

  // Lists the containers carrying the given label.
  virtual CallStatus List(const std::string& label,
                          std::vector<std::string>* handles,
                          std::string* error_msg) = 0;

  virtual CallStatus Pull(const std::string& image, std::string* error_msg) = 0;

  ContainerRuntime() = default;
  virtual ~ContainerRuntime() = default;
  ContainerRuntime(const ContainerRuntime&) = delete;
  ContainerRuntime& operator=(const ContainerRuntime&) = delete;
  ContainerRuntime(ContainerRuntime&&) = delete;
  ContainerRuntime& operator=(ContainerRuntime&&) = delete;
};

}  // namespace runtime

#endif
