#pragma once

#include <json/json.h>
#include <string>

namespace confrun {

// Outcome of one conformance-test invocation.
//
//  - COMPLETED:      the runner exited normally; success iff return_code == 0
//  - TIMED_OUT:      the deadline elapsed and the runner was killed
//  - LAUNCH_FAILURE: the runner could not be started or died abnormally
//
// Only COMPLETED carries stdout/stderr/return_code; the other two carry an
// error message.
struct RunResult {
    enum class Kind {
        COMPLETED,
        TIMED_OUT,
        LAUNCH_FAILURE
    };

    Kind kind = Kind::LAUNCH_FAILURE;
    std::string stdout_output;
    std::string stderr_output;
    int return_code = -1;
    std::string error;

    static RunResult completed(int return_code, std::string stdout_output, std::string stderr_output);
    static RunResult timed_out(int timeout_seconds);
    static RunResult launch_failure(const std::string& description);

    bool success() const { return kind == Kind::COMPLETED && return_code == 0; }

    // The "result" object of the /run response envelope
    Json::Value to_json() const;
};

std::string kind_to_string(RunResult::Kind kind);

} // namespace confrun
