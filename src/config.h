#pragma once

#include <string>
#include "constants.h"

namespace confrun {

// Where the conformance runner lives and the fixed options it is given.
// Deployment constants: never derived from request input.
struct RunnerConfig {
    std::string runner_path = DEFAULT_RUNNER_PATH;
    std::string plugin_path = DEFAULT_PLUGIN_PATH;
    std::string include_dir = DEFAULT_INCLUDE_DIR;
    std::string cpu_version = DEFAULT_CPU_VERSION;
    std::string exclude_regex = DEFAULT_EXCLUDE_REGEX;
};

// Daemon configuration.
// Precedence: built-in defaults < CONFRUN_* environment < command line.
struct ServiceConfig {
    std::string host = "0.0.0.0";
    int port = DEFAULT_PORT;
    std::string staging_dir;               // Empty means the system temp directory
    int default_timeout = DEFAULT_TIMEOUT_SECONDS;
    int max_timeout = DEFAULT_MAX_TIMEOUT_SECONDS;  // 0 means requests are not capped
    RunnerConfig runner;

    // Defaults overlaid with CONFRUN_* environment variables
    static ServiceConfig from_environment();

    // Overlay command line flags. Returns false when --help was given.
    // Throws std::invalid_argument on unknown flags or malformed values.
    bool apply_args(int argc, char* argv[]);

    // Check paths and ranges once at startup. Throws std::runtime_error.
    void validate() const;

    // staging_dir, or the system temp directory when unset
    std::string resolved_staging_dir() const;

    static std::string usage(const std::string& program);
};

} // namespace confrun
