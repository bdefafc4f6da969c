#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "net/i_network.hpp"
#include "scan_options.hpp"

namespace sonar {
namespace scan {

struct Reachability {
    bool reachable = false;
    std::optional<uint32_t> latency_ms;
    std::string method;  // "icmp", "tcp" or empty when nothing answered
};

/**
 * @brief Single liveness check with at most one retry.
 *
 * ICMP echo first; when the host refuses ICMP sockets, a TCP knock on a few
 * well-known ports stands in. A refused connection still proves the host is up.
 * Unreachable is a normal outcome, never an error.
 */
class ReachabilityProbe {
public:
    ReachabilityProbe(net::INetwork &network, const ScanOptions &options) : network_(network), options_(options) {}

    Reachability check(const std::string &host, const net::Deadline &deadline) const;

private:
    Reachability tcp_knock(const std::string &host, const net::Deadline &deadline) const;

    net::INetwork &network_;
    const ScanOptions &options_;
};

}  // namespace scan
}  // namespace sonar
