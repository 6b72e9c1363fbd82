#pragma once

#include <cstddef>  // for size_t

namespace confrun {

// Time limits
constexpr int DEFAULT_TIMEOUT_SECONDS = 30;                       // Per-request default deadline
constexpr int DEFAULT_MAX_TIMEOUT_SECONDS = 0;                    // Request deadline cap, 0 = uncapped
constexpr int POLL_INTERVAL_MS = 50;                              // Child status poll granularity

// Output limits
constexpr size_t MAX_OUTPUT_SIZE = 10 * 1024 * 1024;              // 10MB per captured stream
constexpr size_t MAX_REQUEST_SIZE = 100 * 1024 * 1024;            // 100MB max request

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                        // Read buffer size
constexpr size_t INITIAL_HTTP_BUFFER = 8192;                     // Initial HTTP buffer

// Network
constexpr int DEFAULT_PORT = 5000;                               // Default server port
constexpr int LISTEN_BACKLOG = 10;                               // Socket listen backlog
constexpr int CLIENT_RECV_TIMEOUT_SECONDS = 30;                  // Server-side read timeout per connection
constexpr long UPLOAD_CONNECT_TIMEOUT_SECONDS = 30;              // Uploader connect timeout
constexpr long UPLOAD_TIMEOUT_SECONDS = 0;                       // Uploader total timeout, 0 = wait for the verdict

// Conformance runner defaults
constexpr const char* DEFAULT_RUNNER_PATH = "/usr/local/bin/bpf_conformance_runner";
constexpr const char* DEFAULT_PLUGIN_PATH = "/usr/local/bin/libbpf_plugin";
constexpr const char* DEFAULT_INCLUDE_DIR = "/usr/local/include/bpf_conformance";
constexpr const char* DEFAULT_CPU_VERSION = "v4";
constexpr const char* DEFAULT_EXCLUDE_REGEX = "lock|callx";
constexpr const char* STAGED_PROGRAM_NAME = "program.data";

} // namespace confrun
