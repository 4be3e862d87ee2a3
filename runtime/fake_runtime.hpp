#ifndef RUNTIME_FAKE_RUNTIME_HPP
#define RUNTIME_FAKE_RUNTIME_HPP

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "runtime/container_runtime.hpp"

namespace runtime {

// In-memory container runtime for tests. Commands that write a file from
// base64 on their stdin are emulated; every other command is answered by a
// handler installed by the test.
class FakeRuntime : public ContainerRuntime {
 public:
  struct Program {
    int32_t exit_code = 0;
    std::string stdout_data;
    std::string stderr_data;
    // Never exits on its own.
    bool hang = false;
    // Anything but OK makes the program a failure of the exec client, with
    // stderr_data as its error.
    CallStatus client_status = CallStatus::OK;
  };
  using Files = std::map<std::string, std::string>;
  // Receives the sh script, its positional parameters and the files written
  // into the container so far.
  using Handler = std::function<Program(const std::string& script,
                                        const std::vector<std::string>& args,
                                        const Files& files)>;

  CallStatus Ping(std::string* error_msg) override;
  CallStatus Create(const ContainerSpec& spec, std::string* handle,
                    std::string* error_msg) override;
  CallStatus Start(const std::string& handle, std::string* error_msg) override;
  CallStatus Exec(const std::string& handle, const ExecSpec& spec,
                  std::unique_ptr<RunningExec>* exec,
                  std::string* error_msg) override;
  CallStatus Kill(const std::string& handle, std::string* error_msg) override;
  CallStatus Remove(const std::string& handle,
                    std::string* error_msg) override;
  CallStatus List(const std::string& label, std::vector<std::string>* handles,
                  std::string* error_msg) override;
  CallStatus Pull(const std::string& image, std::string* error_msg) override;

  void SetHandler(Handler handler);
  // Every call fails as if the daemon was down.
  void SetUnavailable(bool unavailable);
  void SetMissingImage(const std::string& image);
  // The next count removals fail.
  void FailRemovals(int count);
  // Every removal takes this long before it reaches the daemon.
  void SetRemoveDelay(int64_t millis);
  // Adds a container that was not created through this runtime.
  std::string AddOrphan(const std::map<std::string, std::string>& labels);

  // Containers that exist, removed ones excluded.
  std::vector<std::string> Containers() const;
  ContainerSpec SpecOf(const std::string& handle) const;
  Files FilesOf(const std::string& handle) const;
  // Scripts run through Exec, file writes excluded.
  std::vector<std::string> Scripts() const;

  int CreateCalls() const;
  int RemoveCalls() const;
  int KillCalls() const;
  int PingCalls() const;

 private:
  struct Container {
    ContainerSpec spec;
    bool started = false;
    Files files;
  };

  bool Down(std::string* error_msg) const EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  mutable absl::Mutex mutex_;
  Handler handler_ GUARDED_BY(mutex_);
  bool unavailable_ GUARDED_BY(mutex_) = false;
  std::set<std::string> missing_images_ GUARDED_BY(mutex_);
  int failing_removals_ GUARDED_BY(mutex_) = 0;
  int64_t remove_delay_millis_ GUARDED_BY(mutex_) = 0;
  std::map<std::string, Container> containers_ GUARDED_BY(mutex_);
  std::vector<std::string> scripts_ GUARDED_BY(mutex_);
  int next_handle_ GUARDED_BY(mutex_) = 0;
  int create_calls_ GUARDED_BY(mutex_) = 0;
  int remove_calls_ GUARDED_BY(mutex_) = 0;
  int kill_calls_ GUARDED_BY(mutex_) = 0;
  int ping_calls_ GUARDED_BY(mutex_) = 0;
};

}  // namespace runtime

#endif
