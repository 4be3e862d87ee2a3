#ifndef RUNTIME_DOCKER_CLI_HPP
#define RUNTIME_DOCKER_CLI_HPP

#include "runtime/container_runtime.hpp"
#include "util/subprocess.hpp"

namespace runtime {

// Container runtime backed by the docker command line client. Every call
// spawns the client with an explicit argument vector, no shell is involved.
class DockerCli : public ContainerRuntime {
 public:
  struct Options {
    std::string binary = "docker";
    // Opaque daemon endpoint, passed through as --host when not empty.
    std::string host;
    int64_t call_timeout_millis = 10000;
    int64_t pull_timeout_millis = 10 * 60 * 1000;
  };

  explicit DockerCli(Options options) : options_(std::move(options)) {}

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

  // Full argument vector of the client for the given subcommand.
  std::vector<std::string> Command(std::vector<std::string> subcommand) const;

  // The "create" subcommand for the given container.
  static std::vector<std::string> CreateArgs(const ContainerSpec& spec);

  // Maps the result of a client invocation to a CallStatus by looking at its
  // exit code and error output.
  static CallStatus Classify(const util::SubprocessInfo& info);

  // Tells apart a failure of "docker exec" itself from a command that ran
  // and failed. The client reports its own errors as the last line of its
  // error output; anything else is the command's result and is OK. Sets
  // error_msg when the status is not OK.
  static CallStatus ClassifyExec(const util::SubprocessInfo& info,
                                 std::string* error_msg);

 private:
  CallStatus Call(std::vector<std::string> subcommand, int64_t timeout_millis,
                  std::string* output, std::string* error_msg);

  Options options_;
};

}  // namespace runtime

#endif
