#include <signal.h>

#include <algorithm>
#include <chrono>
#include <thread>

#include "absl/memory/memory.h"
#include "executor/limiter.hpp"
#include "executor/pipeline.hpp"
#include "executor/validator.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "grpc++/security/server_credentials.h"
#include "grpc++/server.h"
#include "grpc++/server_builder.h"
#include "language/registry.hpp"
#include "runtime/docker_cli.hpp"
#include "runtime/health_monitor.hpp"
#include "sandbox/orchestrator.hpp"
#include "sandbox/reaper.hpp"
#include "server/service.hpp"
#include "util/flags.hpp"

namespace {

// Time given to running executions to notice the shutdown.
const auto kShutdownGrace = std::chrono::seconds(5);  // NOLINT

std::vector<std::string> CatalogImages(const language::Registry& registry) {
  std::vector<std::string> images;
  for (const proto::LanguageConfig* config : registry.List()) {
    if (std::find(images.begin(), images.end(), config->image()) ==
        images.end()) {
      images.push_back(config->image());
    }
  }
  return images;
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage("Runs untrusted code in disposable containers");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  // Termination signals are handled by a dedicated thread; every other thread
  // inherits the blocked mask.
  sigset_t stop_signals;
  sigemptyset(&stop_signals);
  sigaddset(&stop_signals, SIGINT);
  sigaddset(&stop_signals, SIGTERM);
  CHECK_EQ(pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr), 0);

  language::Registry registry;
  if (!FLAGS_languages_file.empty()) {
    registry.LoadOverrides(FLAGS_languages_file);
  }
  LOG(INFO) << registry.List().size() << " languages available";

  runtime::DockerCli::Options docker_options;
  docker_options.binary = FLAGS_docker_binary;
  docker_options.host = FLAGS_docker_host;
  docker_options.call_timeout_millis = FLAGS_docker_call_timeout_ms;
  runtime::DockerCli docker(docker_options);

  runtime::HealthMonitor::Options health_options;
  health_options.failure_threshold = FLAGS_health_failure_threshold;
  health_options.backoff_min_millis = FLAGS_health_backoff_min_ms;
  health_options.backoff_max_millis = FLAGS_health_backoff_max_ms;
  runtime::HealthMonitor health(health_options);

  sandbox::Reaper::Options reaper_options;
  reaper_options.retries = FLAGS_teardown_retries;
  reaper_options.retry_delay_millis = FLAGS_teardown_retry_delay_ms;
  sandbox::Reaper reaper(&docker, &health, reaper_options);

  sandbox::Orchestrator::Options orchestrator_options;
  orchestrator_options.output_limit_bytes = FLAGS_output_limit_bytes;
  orchestrator_options.grace_millis = FLAGS_timeout_grace_ms;
  sandbox::Orchestrator orchestrator(&docker, &health, &reaper,
                                     orchestrator_options);

  executor::Validator::Options validator_options;
  validator_options.max_code_bytes = FLAGS_max_code_bytes;
  validator_options.max_input_bytes = FLAGS_max_stdin_bytes;
  executor::Validator validator(&registry, validator_options);

  if (FLAGS_max_concurrency <= 0) {
    FLAGS_max_concurrency =
        std::max(1U, std::thread::hardware_concurrency());
  }
  executor::Limiter limiter(FLAGS_max_concurrency, FLAGS_max_queue_wait_ms);
  executor::Pipeline pipeline(&validator, &orchestrator, &limiter);

  std::string error_msg;
  if (docker.Ping(&error_msg) == runtime::CallStatus::OK) {
    health.RecordSuccess();
    orchestrator.SweepOrphans();
    if (FLAGS_prepull_images) {
      int failed = orchestrator.PullImages(CatalogImages(registry));
      if (failed > 0) LOG(WARNING) << failed << " images could not be pulled";
    }
  } else {
    health.RecordFailure(error_msg);
    LOG(WARNING) << "Container daemon not reachable at startup: "
                 << error_msg;
  }

  std::string server_address = FLAGS_address + ":" + std::to_string(FLAGS_port);
  server::CodeRunnerService service(&pipeline, &registry, &health);
  grpc::ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  CHECK(server) << "Cannot listen on " << server_address;
  LOG(INFO) << "Server listening on " << server_address << " with "
            << FLAGS_max_concurrency << " sandbox slots";

  std::thread stopper([&]() {
    int signal = 0;
    sigwait(&stop_signals, &signal);
    LOG(INFO) << "Received signal " << signal << ", shutting down";
    orchestrator.CancelAll();
    server->Shutdown(std::chrono::system_clock::now() + kShutdownGrace);
  });
  server->Wait();
  stopper.join();

  reaper.Stop();
  LOG(INFO) << "Server stopped, " << orchestrator.LiveSessions()
            << " sessions left";
}
