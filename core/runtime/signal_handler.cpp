#include "signal_handler.hpp"

#include <signal.h>

#include <cstring>

namespace sonar {
namespace runtime {

std::atomic<int> SignalHandler::received_signal_{0};

void SignalHandler::install() {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = handle_signal;
    sigemptyset(&action.sa_mask);
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    // Writing to a peer that already reset the connection must not end the process
    struct sigaction ignore;
    std::memset(&ignore, 0, sizeof(ignore));
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGPIPE, &ignore, nullptr);
}

void SignalHandler::handle_signal(int signal) {
    // Only lock-free atomics here
    received_signal_.store(signal);
}

}  // namespace runtime
}  // namespace sonar
