#include "util/flags.hpp"

DEFINE_string(address, "0.0.0.0", "address to listen on");  // NOLINT
DEFINE_int32(port, 7070, "port to listen on");               // NOLINT

DEFINE_string(docker_binary, "docker",  // NOLINT
              "Container runtime client used to reach the daemon");
DEFINE_string(docker_host, "",  // NOLINT
              "Daemon endpoint. If unset, the client default is used");
DEFINE_int32(docker_call_timeout_ms, 10000,  // NOLINT
             "Maximum duration of a single call to the daemon");
DEFINE_bool(prepull_images, false,  // NOLINT
            "Pull the image of every language at startup");

DEFINE_string(languages_file, "",  // NOLINT
              "Text-format LanguageCatalog that overrides the built-in one");
DEFINE_int32(max_code_bytes, 1048576, "Maximum source code size");  // NOLINT
DEFINE_int32(max_stdin_bytes, 10240, "Maximum standard input size");  // NOLINT
DEFINE_int32(output_limit_bytes, 65536,  // NOLINT
             "Captured bytes per output stream, the rest is dropped");

DEFINE_int32(max_concurrency, 0,  // NOLINT
             "Number of sandboxes that may run at once. If unset, autodetect");
DEFINE_int32(max_queue_wait_ms, 30000,  // NOLINT
             "How long a request may wait for a free sandbox slot");
DEFINE_int32(timeout_grace_ms, 2000,  // NOLINT
             "Extra lifetime of a container past its execution deadline");

DEFINE_int32(health_failure_threshold, 3,  // NOLINT
             "Consecutive daemon failures before it is considered down");
DEFINE_int32(health_backoff_min_ms, 1000,  // NOLINT
             "Initial wait before retrying an unavailable daemon");
DEFINE_int32(health_backoff_max_ms, 30000,  // NOLINT
             "Maximum wait before retrying an unavailable daemon");

DEFINE_int32(teardown_retries, 3,  // NOLINT
             "Background attempts to remove a container that failed teardown");
DEFINE_int32(teardown_retry_delay_ms, 1000,  // NOLINT
             "Delay between background teardown attempts");
