#ifndef EXECUTOR_PIPELINE_HPP
#define EXECUTOR_PIPELINE_HPP

#include <functional>

#include "executor/limiter.hpp"
#include "executor/validator.hpp"
#include "proto/execution.pb.h"
#include "sandbox/orchestrator.hpp"

namespace executor {

// Serves one execution request end to end: validation, a slot of the
// limiter, a fresh sandbox, code injection, the optional compilation, the run
// and the teardown of the sandbox.
class Pipeline {
 public:
  Pipeline(const Validator* validator, sandbox::Orchestrator* orchestrator,
           Limiter* limiter)
      : validator_(validator), orchestrator_(orchestrator), limiter_(limiter) {}

  // Compile errors, runtime errors and timeouts are reported in the
  // response. Throws validation_error, sandbox::provisioning_error,
  // sandbox::execution_error, or sandbox::cancelled_error if cancelled
  // returns true before the execution ended.
  proto::ExecuteResponse Execute(
      const proto::ExecuteRequest& request,
      const std::function<bool()>& cancelled = nullptr);

  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;

 private:
  proto::ExecuteResponse Run(sandbox::Session* session,
                             const ValidRequest& request);

  const Validator* validator_;
  sandbox::Orchestrator* orchestrator_;
  Limiter* limiter_;
};

}  // namespace executor

#endif
