#ifndef UTIL_SUBPROCESS_HPP
#define UTIL_SUBPROCESS_HPP

#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace util {

// Settings to start a child process.
struct SubprocessOptions {
  // args[0] is searched in PATH.
  std::vector<std::string> args;
  // Written to the standard input of the child, which is then closed.
  std::string input;
  // Maximum number of bytes kept for each of stdout and stderr. Further bytes
  // are read and dropped. Zero means no limit.
  size_t output_limit = 0;
};

// Results of the execution.
struct SubprocessInfo {
  // Set as status_code when the exit status of the child could not be
  // collected.
  static const constexpr int32_t kStatusLost = -1;

  int32_t status_code = 0;
  int32_t signal = 0;
  int64_t wall_time_millis = 0;
  std::string stdout_data;
  std::string stderr_data;
  bool truncated = false;
};

class Subprocess {
 public:
  using Clock = std::chrono::steady_clock;

  enum class WaitResult { EXITED, DEADLINE, INTERRUPTED };

  explicit Subprocess(SubprocessOptions options)
      : options_(std::move(options)) {}
  ~Subprocess();

  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;
  Subprocess(Subprocess&&) = delete;
  Subprocess& operator=(Subprocess&&) = delete;

  // Starts the child in its own process group. Returns false and sets
  // error_msg if the program could not be executed.
  bool Start(std::string* error_msg);

  // Waits for the termination of the child, for the deadline or for
  // interrupted to return true, whatever comes first. The child is not killed
  // when the wait is given up.
  WaitResult Wait(Clock::time_point deadline,
                  const std::function<bool()>& interrupted = nullptr);

  // Kills the whole process group of the child and reaps it. Safe to call
  // more than once.
  void Kill();

  bool Running() const { return child_pid_ > 0; }
  int Pid() const { return child_pid_; }

  // Valid after Wait returned EXITED or after Kill.
  const SubprocessInfo& Info() const { return info_; }

 private:
  // Kills what is left of the process group and collects the child.
  void Reap();
  void JoinIO();

  SubprocessOptions options_;
  SubprocessInfo info_;
  int child_pid_ = 0;
  Clock::time_point start_;
  std::thread writer_;
  std::thread stdout_reader_;
  std::thread stderr_reader_;
  bool stdout_truncated_ = false;
  bool stderr_truncated_ = false;
};

// Runs a program to completion, killing it after timeout_millis. Returns false
// and sets error_msg if it could not be started or did not finish in time.
bool RunSubprocess(const SubprocessOptions& options, int64_t timeout_millis,
                   SubprocessInfo* info, std::string* error_msg);

}  // namespace util

#endif
