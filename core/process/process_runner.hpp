#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace sonar {
namespace process {

struct ProcessOutput {
    int exit_code = -1;
    std::string stdout_data;
    bool timed_out = false;
};

// ProcessRunner runs short-lived helper tools (nmap, bluetoothctl)
// Responsibilities:
// - Spawn the child with stdout redirected to a pipe
// - Collect stdout until exit or timeout
// - Force termination and reap on timeout
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Run executable with args. Returns false when the process could not be
    // started or was killed for exceeding timeout (sets error).
    virtual bool run(const std::string &executable, const std::vector<std::string> &args,
                     std::chrono::milliseconds timeout, ProcessOutput &output, std::string &error);

    // Absolute path of an executable, searching PATH when name has no slash
    static std::optional<std::string> find_executable(const std::string &name);

private:
    static constexpr size_t kMaxOutputBytes = 1024 * 1024;
};

}  // namespace process
}  // namespace sonar
