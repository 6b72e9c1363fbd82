#include "config.h"

#include <unistd.h>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace confrun {

namespace fs = std::filesystem;

namespace {

int parse_int(const std::string& name, const std::string& value) {
    size_t used = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument(name + " expects an integer, got '" + value + "'");
    }
    if (used != value.size()) {
        throw std::invalid_argument(name + " expects an integer, got '" + value + "'");
    }
    return parsed;
}

void override_from_env(const char* name, std::string& target) {
    const char* value = std::getenv(name);
    if (value && *value) {
        target = value;
    }
}

} // namespace

ServiceConfig ServiceConfig::from_environment() {
    ServiceConfig config;
    override_from_env("CONFRUN_RUNNER", config.runner.runner_path);
    override_from_env("CONFRUN_PLUGIN", config.runner.plugin_path);
    override_from_env("CONFRUN_INCLUDE_DIR", config.runner.include_dir);
    override_from_env("CONFRUN_CPU_VERSION", config.runner.cpu_version);
    override_from_env("CONFRUN_EXCLUDE_REGEX", config.runner.exclude_regex);
    override_from_env("CONFRUN_STAGING_DIR", config.staging_dir);

    std::string port;
    override_from_env("CONFRUN_PORT", port);
    if (!port.empty()) {
        config.port = parse_int("CONFRUN_PORT", port);
    }
    return config;
}

bool ServiceConfig::apply_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            return false;
        }

        if (i + 1 >= argc) {
            throw std::invalid_argument("Unknown or incomplete option: " + arg);
        }
        std::string value = argv[++i];

        if (arg == "--host") {
            host = value;
        } else if (arg == "--port") {
            port = parse_int(arg, value);
        } else if (arg == "--runner") {
            runner.runner_path = value;
        } else if (arg == "--plugin") {
            runner.plugin_path = value;
        } else if (arg == "--include-dir") {
            runner.include_dir = value;
        } else if (arg == "--cpu-version") {
            runner.cpu_version = value;
        } else if (arg == "--exclude-regex") {
            runner.exclude_regex = value;
        } else if (arg == "--staging-dir") {
            staging_dir = value;
        } else if (arg == "--default-timeout") {
            default_timeout = parse_int(arg, value);
        } else if (arg == "--max-timeout") {
            max_timeout = parse_int(arg, value);
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }
    return true;
}

void ServiceConfig::validate() const {
    if (port < 1 || port > 65535) {
        throw std::runtime_error("Port out of range: " + std::to_string(port));
    }
    if (default_timeout <= 0) {
        throw std::runtime_error("Default timeout must be positive");
    }
    if (max_timeout < 0) {
        throw std::runtime_error("Maximum timeout must be 0 (uncapped) or positive");
    }
    if (max_timeout > 0 && default_timeout > max_timeout) {
        throw std::runtime_error("Default timeout " + std::to_string(default_timeout) +
                                 "s exceeds maximum " + std::to_string(max_timeout) + "s");
    }

    const fs::path runner_path(runner.runner_path);
    if (!runner_path.is_absolute()) {
        throw std::runtime_error("Runner path must be absolute: " + runner.runner_path);
    }
    if (!fs::is_regular_file(runner_path) || access(runner_path.c_str(), X_OK) != 0) {
        throw std::runtime_error("Runner is not an executable file: " + runner.runner_path);
    }
    if (!fs::exists(runner.plugin_path)) {
        throw std::runtime_error("Plugin not found: " + runner.plugin_path);
    }
    if (runner.cpu_version.empty()) {
        throw std::runtime_error("CPU version must not be empty");
    }

    std::string staging = resolved_staging_dir();
    if (!fs::is_directory(staging) || access(staging.c_str(), W_OK | X_OK) != 0) {
        throw std::runtime_error("Staging directory is not writable: " + staging);
    }
}

std::string ServiceConfig::resolved_staging_dir() const {
    if (!staging_dir.empty()) {
        return staging_dir;
    }
    return fs::temp_directory_path().string();
}

std::string ServiceConfig::usage(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  --host ADDR             Listen address (default 0.0.0.0)\n"
        << "  --port N                Listen port (default " << DEFAULT_PORT << ", env CONFRUN_PORT)\n"
        << "  --runner PATH           Conformance runner executable (env CONFRUN_RUNNER)\n"
        << "  --plugin PATH           Runner plugin (env CONFRUN_PLUGIN)\n"
        << "  --include-dir DIR       Include path passed to the plugin (env CONFRUN_INCLUDE_DIR)\n"
        << "  --cpu-version V         CPU version flag (default " << DEFAULT_CPU_VERSION
        << ", env CONFRUN_CPU_VERSION)\n"
        << "  --exclude-regex RE      Tests to exclude (env CONFRUN_EXCLUDE_REGEX)\n"
        << "  --staging-dir DIR       Parent of per-request staging directories (env CONFRUN_STAGING_DIR)\n"
        << "  --default-timeout SECS  Deadline when a request gives none (default "
        << DEFAULT_TIMEOUT_SECONDS << ")\n"
        << "  --max-timeout SECS      Largest deadline a request may ask for (default "
        << DEFAULT_MAX_TIMEOUT_SECONDS << ", 0 = no cap)\n";
    return out.str();
}

} // namespace confrun
