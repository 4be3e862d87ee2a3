#include "executor/validator.hpp"

#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"

namespace executor {

ValidRequest Validator::Validate(const proto::ExecuteRequest& request) const {
  ValidRequest valid;
  if (request.language().empty()) {
    throw validation_error("Missing language");
  }
  valid.config = registry_->Find(request.language());
  if (valid.config == nullptr) {
    throw validation_error(
        absl::StrCat("Language '", request.language(), "' is not supported"));
  }
  if (request.code().empty()) {
    throw validation_error("Missing code");
  }
  if (request.code().size() > options_.max_code_bytes) {
    throw validation_error(absl::StrCat("Code is ", request.code().size(),
                                        " bytes, the limit is ",
                                        options_.max_code_bytes));
  }
  if (request.input().size() > options_.max_input_bytes) {
    throw validation_error(absl::StrCat("Input is ", request.input().size(),
                                        " bytes, the limit is ",
                                        options_.max_input_bytes));
  }
  if (static_cast<size_t>(request.arg_size()) > options_.max_args) {
    throw validation_error(absl::StrCat("Too many arguments, the limit is ",
                                        options_.max_args));
  }
  for (const std::string& arg : request.arg()) {
    if (arg.size() > options_.max_arg_bytes) {
      throw validation_error(absl::StrCat(
          "Argument too long, the limit is ", options_.max_arg_bytes));
    }
    if (arg.find('\0') != std::string::npos) {
      throw validation_error("Arguments cannot contain NUL bytes");
    }
  }
  if (request.timeout_ms() != 0 &&
      (request.timeout_ms() < options_.min_timeout_millis ||
       request.timeout_ms() > options_.max_timeout_millis)) {
    throw validation_error(absl::StrCat(
        "Timeout must be between ", options_.min_timeout_millis, " and ",
        options_.max_timeout_millis, " ms"));
  }

  valid.code = request.code();
  valid.input = NormalizeInput(request.input());
  valid.args.assign(request.arg().begin(), request.arg().end());
  valid.timeout_millis = request.timeout_ms() != 0
                             ? request.timeout_ms()
                             : valid.config->timeout_ms();
  return valid;
}

std::string NormalizeInput(const std::string& input) {
  std::string normalized = absl::StrReplaceAll(input, {{"\r\n", "\n"}});
  if (!normalized.empty() && normalized.back() != '\n') normalized += '\n';
  return normalized;
}

}  // namespace executor
