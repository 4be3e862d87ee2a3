#include "server/service.hpp"

#include "glog/logging.h"
#include "sandbox/errors.hpp"

namespace server {

namespace {

grpc::Status ProvisioningStatus(const sandbox::provisioning_error& e) {
  switch (e.reason()) {
    case sandbox::provisioning_error::Reason::UNAVAILABLE:
      return grpc::Status(grpc::StatusCode::UNAVAILABLE, e.what());
    case sandbox::provisioning_error::Reason::IMAGE_MISSING:
      return grpc::Status(grpc::StatusCode::FAILED_PRECONDITION, e.what());
    case sandbox::provisioning_error::Reason::BUSY:
      return grpc::Status(grpc::StatusCode::RESOURCE_EXHAUSTED, e.what());
    case sandbox::provisioning_error::Reason::FAILED:
      break;
  }
  return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
}

proto::DaemonState ToProto(runtime::HealthMonitor::State state) {
  switch (state) {
    case runtime::HealthMonitor::State::AVAILABLE:
      return proto::DaemonState::AVAILABLE;
    case runtime::HealthMonitor::State::UNAVAILABLE:
      return proto::DaemonState::UNAVAILABLE;
    case runtime::HealthMonitor::State::UNKNOWN:
      break;
  }
  return proto::DaemonState::UNKNOWN;
}

}  // namespace

grpc::Status CodeRunnerService::Execute(grpc::ServerContext* context,
                                        const proto::ExecuteRequest* request,
                                        proto::ExecuteResponse* response) {
  try {
    *response = pipeline_->Execute(
        *request, [context]() { return context->IsCancelled(); });
    return grpc::Status::OK;
  } catch (const executor::validation_error& e) {
    LOG(INFO) << "Rejected request: " << e.what();
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, e.what());
  } catch (const sandbox::provisioning_error& e) {
    LOG(WARNING) << "Cannot provision a sandbox: " << e.what();
    return ProvisioningStatus(e);
  } catch (const sandbox::cancelled_error& e) {
    LOG(INFO) << "Request cancelled";
    return grpc::Status(grpc::StatusCode::CANCELLED, e.what());
  } catch (const std::exception& e) {
    LOG(ERROR) << "Execute failed: " << e.what();
    return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
  }
}

grpc::Status CodeRunnerService::ListLanguages(
    grpc::ServerContext* /*context*/,
    const proto::ListLanguagesRequest* /*request*/,
    proto::ListLanguagesResponse* response) {
  for (const proto::LanguageConfig* config : registry_->List()) {
    proto::LanguageInfo* info = response->add_language();
    info->set_id(config->id());
    info->set_display_name(config->display_name());
    info->set_file_extension(config->file_extension());
  }
  return grpc::Status::OK;
}

grpc::Status CodeRunnerService::Health(grpc::ServerContext* /*context*/,
                                       const proto::HealthRequest* /*request*/,
                                       proto::HealthResponse* response) {
  runtime::HealthMonitor::Snapshot snapshot = health_->Get();
  response->set_is_available(snapshot.is_available);
  response->set_consecutive_failures(snapshot.consecutive_failures);
  response->set_backoff_ms(snapshot.backoff_millis);
  response->set_state(ToProto(snapshot.state));
  return grpc::Status::OK;
}

}  // namespace server
