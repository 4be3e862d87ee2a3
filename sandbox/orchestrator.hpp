#ifndef SANDBOX_ORCHESTRATOR_HPP
#define SANDBOX_ORCHESTRATOR_HPP

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "absl/synchronization/mutex.h"
#include "absl/types/optional.h"
#include "proto/language.pb.h"
#include "runtime/container_runtime.hpp"
#include "runtime/health_monitor.hpp"
#include "sandbox/errors.hpp"
#include "sandbox/reaper.hpp"
#include "sandbox/session.hpp"

namespace sandbox {

// How a command started in a session ended. Exactly one of exit_code,
// timed_out and cancelled is set.
struct Completion {
  absl::optional<int32_t> exit_code;
  bool timed_out = false;
  bool cancelled = false;
  runtime::ExecOutput output;
};

// Owns every operation on sandbox containers. Each session gets a fresh
// container that no other session ever touches.
class Orchestrator {
 public:
  struct Options {
    // Working directory of the sandbox, where the source is written.
    std::string work_dir = "/tmp";
    size_t output_limit_bytes = 64 * 1024;
    // The container outlives the session deadline by this much at most.
    int64_t grace_millis = 2000;
  };

  static const char* const kManagedLabel;

  Orchestrator(runtime::ContainerRuntime* runtime,
               runtime::HealthMonitor* health, Reaper* reaper,
               Options options);

  // Creates and starts a container for the language. Fails fast with
  // provisioning_error if the daemon is backing off, and throws
  // cancelled_error as soon as cancelled returns true. cancelled becomes the
  // cancellation check of the session. On failure nothing is left behind:
  // whatever was created is released before throwing.
  std::unique_ptr<Session> Provision(
      const proto::LanguageConfig& config, int64_t timeout_millis,
      const std::function<bool()>& cancelled = nullptr);

  // Writes the source, and the standard input for the program, into the
  // sandbox. The bytes travel base64-encoded on the stdin of a fixed decoding
  // command, never on a command line. Returns false if the session deadline
  // passed first. Throws execution_error or cancelled_error.
  bool Inject(Session* session, const std::string& source,
              const std::string& input);

  // Starts the command template of the session language. args become the
  // positional parameters of the command. If attach_input is true the
  // injected standard input is redirected to the command.
  std::unique_ptr<runtime::RunningExec> Start(
      Session* session, const std::string& command_template,
      const std::vector<std::string>& args, bool attach_input);

  // Waits for the command, the deadline or the cancellation of the session.
  // On deadline or cancellation the container is killed. If the client could
  // not run the command at all, throws execution_error, or
  // provisioning_error when the daemon turns out to be unreachable.
  Completion AwaitCompletion(Session* session, runtime::RunningExec* exec,
                             Session::Clock::time_point deadline);

  // Removes the container of the session and moves it to REAPED. Idempotent
  // and never throws; a container that is already gone counts as removed,
  // and failed removals are handed to the reaper.
  void Teardown(Session* session);

  // Like Teardown, but the removal happens in the reaper so that the caller
  // does not wait for the daemon. The session is REAPED on return.
  void Release(Session* session);

  // Cancels the session and tears it down immediately.
  void Abort(Session* session);

  // Requests the cancellation of every live session.
  void CancelAll();
  size_t LiveSessions() const;

  // Removes containers left behind by previous processes. Returns the number
  // of removed containers.
  int SweepOrphans();

  // Pulls the given images. Returns the number of images that failed.
  int PullImages(const std::vector<std::string>& images);

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

 private:
  runtime::CallStatus Track(runtime::CallStatus status,
                            const std::string& error_msg);
  // Runs a command to completion in the session, within its deadline.
  Completion RunInSession(Session* session, runtime::ExecSpec spec);
  std::string NewSessionId();
  runtime::ContainerSpec SpecFor(const Session& session,
                                 int64_t timeout_millis) const;
  void Dispose(Session* session, bool wait_for_removal);
  void CheckExecClient(Session* session, const runtime::ExecOutput& output);
  void Register(Session* session);
  void Unregister(Session* session);

  runtime::ContainerRuntime* runtime_;
  runtime::HealthMonitor* health_;
  Reaper* reaper_;
  const Options options_;

  const std::string id_prefix_;
  std::atomic<uint64_t> next_id_{0};

  mutable absl::Mutex mutex_;
  std::map<std::string, Session*> live_ GUARDED_BY(mutex_);
};

}  // namespace sandbox

#endif
