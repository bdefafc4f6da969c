#pragma once

#include <atomic>

namespace sonar {
namespace runtime {

// SIGINT/SIGTERM record the signal number; Runtime::run() polls for it
class SignalHandler {
public:
    static void install();

    static bool is_shutdown_requested() { return received_signal_.load() != 0; }

    // Signal that requested shutdown, 0 if none yet
    static int received_signal() { return received_signal_.load(); }

private:
    static void handle_signal(int signal);
    static std::atomic<int> received_signal_;
};

}  // namespace runtime
}  // namespace sonar
