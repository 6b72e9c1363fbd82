#include "run_result.h"
#include <utility>

namespace confrun {

RunResult RunResult::completed(int return_code, std::string stdout_output, std::string stderr_output) {
    RunResult result;
    result.kind = Kind::COMPLETED;
    result.return_code = return_code;
    result.stdout_output = std::move(stdout_output);
    result.stderr_output = std::move(stderr_output);
    return result;
}

RunResult RunResult::timed_out(int timeout_seconds) {
    RunResult result;
    result.kind = Kind::TIMED_OUT;
    result.error = "Process timed out after " + std::to_string(timeout_seconds) + " seconds";
    return result;
}

RunResult RunResult::launch_failure(const std::string& description) {
    RunResult result;
    result.kind = Kind::LAUNCH_FAILURE;
    result.error = "Failed to run conformance test: " + description;
    return result;
}

Json::Value RunResult::to_json() const {
    Json::Value json(Json::objectValue);
    json["success"] = success();
    if (kind == Kind::COMPLETED) {
        json["stdout"] = stdout_output;
        json["stderr"] = stderr_output;
        json["return_code"] = return_code;
    } else {
        json["error"] = error;
    }
    return json;
}

std::string kind_to_string(RunResult::Kind kind) {
    switch (kind) {
        case RunResult::Kind::COMPLETED: return "completed";
        case RunResult::Kind::TIMED_OUT: return "timed_out";
        case RunResult::Kind::LAUNCH_FAILURE: return "launch_failure";
    }
    return "unknown";
}

} // namespace confrun
