#include "runtime/container_runtime.hpp"

namespace runtime {

const char* CallStatusName(CallStatus status) {
  switch (status) {
    case CallStatus::OK:
      return "OK";
    case CallStatus::NOT_FOUND:
      return "NOT_FOUND";
    case CallStatus::UNAVAILABLE:
      return "UNAVAILABLE";
    case CallStatus::FAILED:
      return "FAILED";
  }
  return "UNKNOWN";
}

}  // namespace runtime
