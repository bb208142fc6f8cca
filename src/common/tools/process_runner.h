#ifndef AGENTGRAPH_COMMON_TOOLS_PROCESS_RUNNER_H
#define AGENTGRAPH_COMMON_TOOLS_PROCESS_RUNNER_H

#include <string>
#include <vector>

namespace agentgraph {

struct ProcessResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = -1;     // 127: executable not found; -1: killed by signal
    bool timed_out = false;
    std::string error;      // launch/timeout description, empty when the process ran normally

    bool ok() const { return !timed_out && exit_code == 0; }
};

class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Never throws for process-level failures: timeouts and missing executables
    // are reported in the result.
    virtual ProcessResult run(const std::string& executable,
                              const std::vector<std::string>& args,
                              int timeout_sec,
                              const std::string& working_dir = "") = 0;
};

// fork/exec with stdout/stderr pipes drained by poll(2). On timeout the whole
// process group gets SIGTERM, then SIGKILL. Captured output is capped at
// max_output_bytes and always valid UTF-8.
class PosixProcessRunner : public ProcessRunner {
public:
    explicit PosixProcessRunner(size_t max_output_bytes = 1 << 20) : max_output_bytes_(max_output_bytes) {}

    ProcessResult run(const std::string& executable,
                      const std::vector<std::string>& args,
                      int timeout_sec,
                      const std::string& working_dir = "") override;

private:
    ProcessResult capture(const std::string& executable,
                          const std::vector<std::string>& args,
                          int timeout_sec,
                          const std::string& working_dir);

    size_t max_output_bytes_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_TOOLS_PROCESS_RUNNER_H
