#pragma once

#include <string>
#include <vector>
#include "config.h"
#include "run_result.h"

namespace confrun {

// Runs one staged program through the conformance tool
class Invoker {
public:
    virtual ~Invoker() = default;

    // Blocks until the tool finishes or `timeout_seconds` elapses
    virtual RunResult invoke(const std::string& program_path, int timeout_seconds) = 0;
};

// Invokes the external conformance runner as a subprocess
class ConformanceInvoker : public Invoker {
public:
    explicit ConformanceInvoker(RunnerConfig config);

    RunResult invoke(const std::string& program_path, int timeout_seconds) override;

    // The exact argument vector used for `program_path`. The staged path is
    // the only per-request value in it.
    std::vector<std::string> build_command(const std::string& program_path) const;

private:
    RunnerConfig config_;
};

} // namespace confrun
