#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Server
DECLARE_string(address);
DECLARE_int32(port);

// Container runtime
DECLARE_string(docker_binary);
DECLARE_string(docker_host);
DECLARE_int32(docker_call_timeout_ms);
DECLARE_bool(prepull_images);

// Languages and request limits
DECLARE_string(languages_file);
DECLARE_int32(max_code_bytes);
DECLARE_int32(max_stdin_bytes);
DECLARE_int32(output_limit_bytes);

// Scheduling
DECLARE_int32(max_concurrency);
DECLARE_int32(max_queue_wait_ms);
DECLARE_int32(timeout_grace_ms);

// Daemon health
DECLARE_int32(health_failure_threshold);
DECLARE_int32(health_backoff_min_ms);
DECLARE_int32(health_backoff_max_ms);

// Teardown
DECLARE_int32(teardown_retries);
DECLARE_int32(teardown_retry_delay_ms);

#endif
