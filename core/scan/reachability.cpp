#include "reachability.hpp"

#include <algorithm>
#include <array>

#include "logging/logger.hpp"

namespace sonar {
namespace scan {

namespace {
constexpr std::array<uint16_t, 3> kKnockPorts = {80, 443, 22};
}

Reachability ReachabilityProbe::check(const std::string &host, const net::Deadline &deadline) const {
    const auto timeout = std::chrono::milliseconds(options_.ping_timeout_ms);
    const int attempts = 1 + std::clamp(options_.ping_retries, 0, 1);

    for (int attempt = 0; attempt < attempts && !deadline.expired(); ++attempt) {
        net::PingResult ping = network_.ping(host, timeout, deadline);
        if (!ping.icmp_permitted) {
            LOG_DEBUG("[Reach] ICMP not permitted, knocking TCP on " << host);
            return tcp_knock(host, deadline);
        }
        if (ping.reachable) {
            Reachability result;
            result.reachable = true;
            result.latency_ms = ping.latency_ms;
            result.method = "icmp";
            return result;
        }
    }

    // Many hosts drop ICMP but answer on TCP
    if (!deadline.expired()) {
        Reachability knock = tcp_knock(host, deadline);
        if (knock.reachable) {
            return knock;
        }
    }

    LOG_DEBUG("[Reach] " << host << " did not answer");
    return Reachability{};
}

Reachability ReachabilityProbe::tcp_knock(const std::string &host, const net::Deadline &deadline) const {
    const auto timeout = std::chrono::milliseconds(options_.connect_timeout_ms);
    for (uint16_t port : kKnockPorts) {
        if (deadline.expired()) {
            break;
        }
        net::ConnectResult connect = network_.tcp_connect(host, port, timeout, deadline);
        if (connect.status == net::ConnectStatus::OPEN || connect.status == net::ConnectStatus::REFUSED) {
            Reachability result;
            result.reachable = true;
            result.latency_ms = connect.latency_ms;
            result.method = "tcp";
            return result;
        }
    }
    return Reachability{};
}

}  // namespace scan
}  // namespace sonar
