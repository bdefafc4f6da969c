#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "deadline.hpp"

namespace sonar {
namespace net {

enum class ConnectStatus { OPEN, REFUSED, TIMEOUT, UNREACHABLE, CANCELLED, FAILED };

struct ConnectResult {
    ConnectStatus status = ConnectStatus::FAILED;
    std::optional<uint32_t> latency_ms;
};

struct PingResult {
    bool reachable = false;
    std::optional<uint32_t> latency_ms;
    bool icmp_permitted = true;  // false when the host OS refused an ICMP socket
};

struct HttpRequest {
    std::string method = "GET";
    std::string path = "/";
    std::string body;
    std::string content_type;
    std::map<std::string, std::string> headers;
    bool tls = false;
};

struct HttpReply {
    int status = 0;
    std::map<std::string, std::string> headers;  // keys lowercased
    std::string body;                            // at most body_limit bytes

    std::string header(const std::string &lower_name) const {
        auto it = headers.find(lower_name);
        return it == headers.end() ? std::string() : it->second;
    }
};

/**
 * @brief Interface for every network round trip the scan engine makes
 *
 * All calls are blocking, bounded by min(timeout, deadline.remaining()),
 * and never throw for network conditions: failures are reported through
 * the return value. This is the seam the unit tests mock.
 */
class INetwork {
public:
    virtual ~INetwork() = default;

    // ICMP echo with a single attempt
    virtual PingResult ping(const std::string &host, std::chrono::milliseconds timeout, const Deadline &deadline) = 0;

    // Connect and immediately close
    virtual ConnectResult tcp_connect(const std::string &host, uint16_t port, std::chrono::milliseconds timeout,
                                      const Deadline &deadline) = 0;

    // Connect, send request (if non-empty), collect up to max_bytes.
    // nullopt when the connection could not be made; empty string when the
    // peer said nothing within the window.
    virtual std::optional<std::string> tcp_exchange(const std::string &host, uint16_t port, const std::string &request,
                                                    std::chrono::milliseconds timeout, size_t max_bytes,
                                                    const Deadline &deadline) = 0;

    // Send one datagram and wait for one reply. nullopt on no reply.
    virtual std::optional<std::string> udp_exchange(const std::string &host, uint16_t port, const std::string &payload,
                                                    std::chrono::milliseconds timeout, size_t max_bytes,
                                                    const Deadline &deadline) = 0;

    // Single HTTP(S) request without redirects; nullopt on transport failure
    virtual std::optional<HttpReply> http_request(const std::string &host, uint16_t port, const HttpRequest &request,
                                                  std::chrono::milliseconds timeout, size_t body_limit,
                                                  const Deadline &deadline) = 0;
};

const char *connect_status_to_string(ConnectStatus status);

}  // namespace net
}  // namespace sonar
