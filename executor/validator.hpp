#ifndef EXECUTOR_VALIDATOR_HPP
#define EXECUTOR_VALIDATOR_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include "language/registry.hpp"
#include "proto/execution.pb.h"
#include "proto/language.pb.h"

namespace executor {

class validation_error : public std::runtime_error {
 public:
  explicit validation_error(const std::string& msg)
      : std::runtime_error(msg) {}
};

// A request that passed validation, with its language resolved.
struct ValidRequest {
  const proto::LanguageConfig* config = nullptr;
  std::string code;
  // Already normalized, see NormalizeInput.
  std::string input;
  std::vector<std::string> args;
  int64_t timeout_millis = 0;
};

// Rejects malformed requests before any sandbox is requested for them.
class Validator {
 public:
  struct Options {
    size_t max_code_bytes = 1024 * 1024;
    size_t max_input_bytes = 10 * 1024;
    // Range of the timeout a request may ask for.
    int64_t min_timeout_millis = 1000;
    int64_t max_timeout_millis = 30000;
    size_t max_args = 64;
    size_t max_arg_bytes = 4096;
  };

  Validator(const language::Registry* registry, Options options)
      : registry_(registry), options_(options) {}

  // Throws validation_error.
  ValidRequest Validate(const proto::ExecuteRequest& request) const;

 private:
  const language::Registry* registry_;
  Options options_;
};

// Converts CRLF line endings to LF and terminates non-empty input with a
// newline, so that line-oriented reads behave the same for every client.
std::string NormalizeInput(const std::string& input);

}  // namespace executor

#endif
