#ifndef SANDBOX_ERRORS_HPP
#define SANDBOX_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace sandbox {

// A sandbox could not be obtained for a request.
class provisioning_error : public std::runtime_error {
 public:
  enum class Reason {
    // The container daemon is unreachable or backing off.
    UNAVAILABLE,
    // The language image is not present on the daemon.
    IMAGE_MISSING,
    // No execution slot became free in time.
    BUSY,
    // The daemon refused to create or start the container.
    FAILED,
  };

  provisioning_error(Reason reason, const std::string& msg)
      : std::runtime_error(msg), reason_(reason) {}

  Reason reason() const { return reason_; }

 private:
  Reason reason_;
};

// The sandbox was obtained but could not be used, e.g. the code could not be
// copied into it.
class execution_error : public std::runtime_error {
 public:
  explicit execution_error(const std::string& msg) : std::runtime_error(msg) {}
};

// The caller went away before the execution finished.
class cancelled_error : public std::runtime_error {
 public:
  cancelled_error() : std::runtime_error("Execution cancelled") {}
};

}  // namespace sandbox

#endif
