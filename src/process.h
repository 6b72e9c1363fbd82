#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace confrun {

// What happened to a spawned process
struct ProcessOutcome {
    enum class Kind {
        EXITED,         // Ran to completion and returned an exit code
        TIMED_OUT,      // Deadline elapsed; process group was killed
        LAUNCH_FAILED   // Could not be started, or died on a signal
    };

    Kind kind = Kind::LAUNCH_FAILED;
    int exit_code = -1;
    int term_signal = 0;
    std::string stdout_output;
    std::string stderr_output;
    std::string error;
};

// Run argv[0] (an absolute path, no PATH lookup) with argv[1..] as arguments.
// Blocks until the process exits or `timeout` elapses. The child runs in its
// own process group, stdin is /dev/null, and stdout/stderr are captured (each
// capped at MAX_OUTPUT_SIZE). Process-level failures are reported through
// the returned outcome; this function does not throw for them.
ProcessOutcome run_process(const std::vector<std::string>& argv,
                           std::chrono::milliseconds timeout);

} // namespace confrun
