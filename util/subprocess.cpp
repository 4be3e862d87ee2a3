#include "util/subprocess.hpp"

#include <mutex>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

static const constexpr size_t kStrErrorBufSize = 2048;
static const constexpr size_t kReadChunk = 4096;

std::string ErrnoMessage(const char* prefix, int err) {
  char buf[kStrErrorBufSize] = {};
  std::string msg = prefix;
  msg += ": ";
  msg += mystrerror(err, buf, kStrErrorBufSize);
  return msg;
}

bool MakePipe(int fds[2], std::string* error_msg) {
  if (pipe2(fds, O_CLOEXEC) == -1) {
    *error_msg = ErrnoMessage("pipe2", errno);
    return false;
  }
  return true;
}

void CloseFd(int* fd) {
  if (*fd != -1) close(*fd);
  *fd = -1;
}

// Reads fd until EOF, keeping at most limit bytes.
void Drain(int fd, size_t limit, std::string* out, bool* truncated) {
  char buf[kReadChunk];
  while (true) {
    ssize_t cur = read(fd, buf, kReadChunk);
    if (cur < 0 && errno == EINTR) continue;
    if (cur <= 0) break;
    size_t len = static_cast<size_t>(cur);
    if (limit != 0 && out->size() + len > limit) {
      out->append(buf, limit - out->size());
      *truncated = true;
    } else {
      out->append(buf, len);
    }
  }
  close(fd);
}

void Feed(int fd, const std::string& input) {
  size_t written = 0;
  while (written < input.size()) {
    ssize_t cur = write(fd, input.data() + written, input.size() - written);
    if (cur < 0 && errno == EINTR) continue;
    // The child closed its stdin.
    if (cur <= 0) break;
    written += static_cast<size_t>(cur);
  }
  close(fd);
}

void IgnoreSigpipe() {
  static std::once_flag once;
  std::call_once(once, []() { signal(SIGPIPE, SIG_IGN); });
}
}  // namespace

namespace util {

constexpr int32_t SubprocessInfo::kStatusLost;

Subprocess::~Subprocess() {
  Kill();
  JoinIO();
}

bool Subprocess::Start(std::string* error_msg) {
  IgnoreSigpipe();
  int stdin_fds[2] = {-1, -1};
  int stdout_fds[2] = {-1, -1};
  int stderr_fds[2] = {-1, -1};
  int error_fds[2] = {-1, -1};
  auto close_all = [&]() {
    for (int* fd : {&stdin_fds[0], &stdin_fds[1], &stdout_fds[0],
                    &stdout_fds[1], &stderr_fds[0], &stderr_fds[1],
                    &error_fds[0], &error_fds[1]}) {
      CloseFd(fd);
    }
  };
  if (!MakePipe(stdin_fds, error_msg) || !MakePipe(stdout_fds, error_msg) ||
      !MakePipe(stderr_fds, error_msg) || !MakePipe(error_fds, error_msg)) {
    close_all();
    return false;
  }

  // Prepare args before forking, the child must not allocate.
  std::vector<std::vector<char>> vec_args;
  for (const std::string& arg : options_.args) {
    vec_args.emplace_back(arg.begin(), arg.end());
    vec_args.back().push_back(0);
  }
  std::vector<char*> args;
  for (std::vector<char>& arg : vec_args) args.push_back(arg.data());
  args.push_back(nullptr);
  if (args.size() == 1) {
    *error_msg = "exec: no program given";
    close_all();
    return false;
  }

  start_ = Clock::now();
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = ErrnoMessage("fork", errno);
    close_all();
    return false;
  }
  if (fork_result == 0) {
    auto die = [&error_fds](int err) {
      char buf[kStrErrorBufSize] = {};
      const char* msg = mystrerror(err, buf, kStrErrorBufSize);
      int len = strlen(msg);
      write(error_fds[1], &len, sizeof(len));
      write(error_fds[1], msg, len);
      _Exit(127);
    };
    // Change process group, so that the whole tree can be killed at once.
    if (setsid() == -1) die(errno);
    signal(SIGPIPE, SIG_DFL);
    if (dup2(stdin_fds[0], STDIN_FILENO) == -1) die(errno);
    if (dup2(stdout_fds[1], STDOUT_FILENO) == -1) die(errno);
    if (dup2(stderr_fds[1], STDERR_FILENO) == -1) die(errno);
    execvp(args[0], args.data());
    die(errno);
  }

  child_pid_ = fork_result;
  CloseFd(&stdin_fds[0]);
  CloseFd(&stdout_fds[1]);
  CloseFd(&stderr_fds[1]);
  CloseFd(&error_fds[1]);

  int error_len = 0;
  if (read(error_fds[0], &error_len, sizeof(error_len)) == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len < 0 || error_len >= static_cast<int>(PIPE_BUF)) {
      error_len = PIPE_BUF - 1;
    }
    read(error_fds[0], error, error_len);
    *error_msg = std::string("exec: ") + error;
    close_all();
    int child_status = 0;
    waitpid(child_pid_, &child_status, 0);
    child_pid_ = 0;
    return false;
  }
  CloseFd(&error_fds[0]);

  int stdin_fd = stdin_fds[1];
  int stdout_fd = stdout_fds[0];
  int stderr_fd = stderr_fds[0];
  writer_ = std::thread(Feed, stdin_fd, options_.input);
  stdout_reader_ = std::thread(Drain, stdout_fd, options_.output_limit,
                               &info_.stdout_data, &stdout_truncated_);
  stderr_reader_ = std::thread(Drain, stderr_fd, options_.output_limit,
                               &info_.stderr_data, &stderr_truncated_);
  return true;
}

Subprocess::WaitResult Subprocess::Wait(
    Clock::time_point deadline, const std::function<bool()>& interrupted) {
  while (child_pid_ > 0) {
    // The child is left as a zombie, so that its pid, which is also the id of
    // its process group, cannot be reused before Reap.
    siginfo_t child_info;
    memset(&child_info, 0, sizeof(child_info));
    int ret = waitid(P_PID, child_pid_, &child_info,
                     WEXITED | WNOHANG | WNOWAIT);
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1 || child_info.si_pid == child_pid_) {
      Reap();
      return WaitResult::EXITED;
    }
    if (interrupted && interrupted()) return WaitResult::INTERRUPTED;
    if (Clock::now() >= deadline) return WaitResult::DEADLINE;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return WaitResult::EXITED;
}

void Subprocess::Kill() {
  if (child_pid_ <= 0) return;
  kill(child_pid_, SIGKILL);
  Reap();
}

void Subprocess::Reap() {
  // Processes left behind in the group would keep the pipes open.
  kill(-child_pid_, SIGKILL);
  int child_status = 0;
  int ret;
  while ((ret = waitpid(child_pid_, &child_status, 0)) == -1 &&
         errno == EINTR) {
  }
  child_pid_ = 0;
  JoinIO();
  if (ret == -1) {
    // Somebody else collected the child.
    info_.status_code = SubprocessInfo::kStatusLost;
    info_.signal = 0;
  } else {
    info_.status_code =
        WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
    info_.signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  }
  info_.wall_time_millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() -
                                                            start_)
          .count();
  info_.truncated = stdout_truncated_ || stderr_truncated_;
}

void Subprocess::JoinIO() {
  if (writer_.joinable()) writer_.join();
  if (stdout_reader_.joinable()) stdout_reader_.join();
  if (stderr_reader_.joinable()) stderr_reader_.join();
}

bool RunSubprocess(const SubprocessOptions& options, int64_t timeout_millis,
                   SubprocessInfo* info, std::string* error_msg) {
  Subprocess process(options);
  if (!process.Start(error_msg)) return false;
  auto deadline =
      Subprocess::Clock::now() + std::chrono::milliseconds(timeout_millis);
  if (process.Wait(deadline) != Subprocess::WaitResult::EXITED) {
    process.Kill();
    *info = process.Info();
    *error_msg = "timed out after " + std::to_string(timeout_millis) + "ms";
    return false;
  }
  *info = process.Info();
  if (info->status_code == SubprocessInfo::kStatusLost) {
    *error_msg = "exit status of " + options.args[0] + " was lost";
    return false;
  }
  return true;
}

}  // namespace util
