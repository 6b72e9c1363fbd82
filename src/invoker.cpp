#include "invoker.h"
#include "process.h"

#include <chrono>
#include <utility>

namespace confrun {

ConformanceInvoker::ConformanceInvoker(RunnerConfig config) : config_(std::move(config)) {}

std::vector<std::string> ConformanceInvoker::build_command(const std::string& program_path) const {
    return {
        config_.runner_path,
        "--test_file_path", program_path,
        "--cpu_version", config_.cpu_version,
        "--exclude_regex", config_.exclude_regex,
        "--plugin_path", config_.plugin_path,
        "--debug", "true",
        "--plugin_options", "--include " + config_.include_dir,
    };
}

RunResult ConformanceInvoker::invoke(const std::string& program_path, int timeout_seconds) {
    ProcessOutcome outcome = run_process(build_command(program_path),
                                         std::chrono::seconds(timeout_seconds));

    switch (outcome.kind) {
        case ProcessOutcome::Kind::EXITED:
            return RunResult::completed(outcome.exit_code,
                                        std::move(outcome.stdout_output),
                                        std::move(outcome.stderr_output));
        case ProcessOutcome::Kind::TIMED_OUT:
            return RunResult::timed_out(timeout_seconds);
        case ProcessOutcome::Kind::LAUNCH_FAILED:
            break;
    }
    return RunResult::launch_failure(outcome.error);
}

} // namespace confrun
