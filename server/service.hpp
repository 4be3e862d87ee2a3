#ifndef SERVER_SERVICE_HPP
#define SERVER_SERVICE_HPP

#include "executor/pipeline.hpp"
#include "grpc++/server_context.h"
#include "language/registry.hpp"
#include "proto/execution.grpc.pb.h"
#include "runtime/health_monitor.hpp"

namespace server {

// gRPC front end of the execution pipeline. Failures of the infrastructure
// become non-OK statuses; failures of the user program are OK responses with
// success unset.
class CodeRunnerService : public proto::CodeRunner::Service {
 public:
  CodeRunnerService(executor::Pipeline* pipeline,
                    const language::Registry* registry,
                    runtime::HealthMonitor* health)
      : pipeline_(pipeline), registry_(registry), health_(health) {}

  grpc::Status Execute(grpc::ServerContext* context,
                       const proto::ExecuteRequest* request,
                       proto::ExecuteResponse* response) override;
  grpc::Status ListLanguages(grpc::ServerContext* context,
                             const proto::ListLanguagesRequest* request,
                             proto::ListLanguagesResponse* response) override;
  grpc::Status Health(grpc::ServerContext* context,
                      const proto::HealthRequest* request,
                      proto::HealthResponse* response) override;

 private:
  executor::Pipeline* pipeline_;
  const language::Registry* registry_;
  runtime::HealthMonitor* health_;
};

}  // namespace server

#endif
