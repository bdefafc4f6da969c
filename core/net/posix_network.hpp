#pragma once

#include "i_network.hpp"

namespace sonar {
namespace net {

/**
 * @brief INetwork over POSIX sockets (TCP/UDP/ICMP) and cpp-httplib
 *
 * Sockets are non-blocking and waited on with poll() in short slices so a
 * cancelled Deadline releases the descriptor promptly. Stateless; one
 * instance may be shared by any number of concurrent scans.
 */
class PosixNetwork : public INetwork {
public:
    PosixNetwork() = default;

    PingResult ping(const std::string &host, std::chrono::milliseconds timeout, const Deadline &deadline) override;

    ConnectResult tcp_connect(const std::string &host, uint16_t port, std::chrono::milliseconds timeout,
                              const Deadline &deadline) override;

    std::optional<std::string> tcp_exchange(const std::string &host, uint16_t port, const std::string &request,
                                            std::chrono::milliseconds timeout, size_t max_bytes,
                                            const Deadline &deadline) override;

    std::optional<std::string> udp_exchange(const std::string &host, uint16_t port, const std::string &payload,
                                            std::chrono::milliseconds timeout, size_t max_bytes,
                                            const Deadline &deadline) override;

    std::optional<HttpReply> http_request(const std::string &host, uint16_t port, const HttpRequest &request,
                                          std::chrono::milliseconds timeout, size_t body_limit,
                                          const Deadline &deadline) override;
};

}  // namespace net
}  // namespace sonar
