#include "posix_network.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <httplib.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/ip_icmp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <memory>

#include "logging/logger.hpp"

namespace sonar {
namespace net {

namespace {
constexpr int kPollSliceMs = 50;
constexpr std::chrono::milliseconds kIdleGap(250);
constexpr size_t kRecvChunk = 1024;
constexpr const char *kUserAgent = "sonar/1.0";

using Clock = Deadline::Clock;

// Owns a socket descriptor and closes it on scope exit
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    SocketGuard(const SocketGuard &) = delete;
    SocketGuard &operator=(const SocketGuard &) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

private:
    int fd_;
};

struct AddrInfoDeleter {
    void operator()(addrinfo *ai) const {
        if (ai != nullptr) {
            ::freeaddrinfo(ai);
        }
    }
};
using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

AddrInfoPtr resolve(const std::string &host, uint16_t port, int family, int socktype) {
    addrinfo hints{};
    hints.ai_family = family;
    hints.ai_socktype = socktype;

    addrinfo *res = nullptr;
    const std::string service = std::to_string(port);
    const int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (rc != 0) {
        LOG_DEBUG("[Net] Cannot resolve " << host << ": " << ::gai_strerror(rc));
        return AddrInfoPtr(nullptr);
    }
    return AddrInfoPtr(res);
}

uint32_t elapsed_ms(Clock::time_point start) {
    return static_cast<uint32_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count());
}

bool set_nonblocking(int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

enum class WaitResult { READY, TIMEOUT, CANCELLED, FAILED };

WaitResult wait_for(int fd, short events, std::chrono::milliseconds timeout, const Deadline &deadline) {
    const auto until = Clock::now() + timeout;
    while (true) {
        if (deadline.expired()) {
            return WaitResult::CANCELLED;
        }
        const auto now = Clock::now();
        if (now >= until) {
            return WaitResult::TIMEOUT;
        }

        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - now).count();
        const int slice = static_cast<int>(std::min<long long>(kPollSliceMs, std::max<long long>(left, 1)));

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;
        const int rc = ::poll(&pfd, 1, slice);
        if (rc > 0) {
            return WaitResult::READY;
        }
        if (rc < 0 && errno != EINTR) {
            return WaitResult::FAILED;
        }
    }
}

ConnectStatus classify_errno(int err) {
    switch (err) {
        case ECONNREFUSED:
            return ConnectStatus::REFUSED;
        case EHOSTUNREACH:
        case ENETUNREACH:
        case EHOSTDOWN:
            return ConnectStatus::UNREACHABLE;
        case ETIMEDOUT:
            return ConnectStatus::TIMEOUT;
        default:
            return ConnectStatus::FAILED;
    }
}

ConnectStatus connect_with_timeout(int fd, const addrinfo *ai, std::chrono::milliseconds timeout,
                                   const Deadline &deadline) {
    if (!set_nonblocking(fd)) {
        return ConnectStatus::FAILED;
    }

    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
        return ConnectStatus::OPEN;
    }
    if (errno != EINPROGRESS) {
        return classify_errno(errno);
    }

    switch (wait_for(fd, POLLOUT, timeout, deadline)) {
        case WaitResult::READY:
            break;
        case WaitResult::TIMEOUT:
            return ConnectStatus::TIMEOUT;
        case WaitResult::CANCELLED:
            return ConnectStatus::CANCELLED;
        default:
            return ConnectStatus::FAILED;
    }

    int err = 0;
    socklen_t len = sizeof(err);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0) {
        return ConnectStatus::FAILED;
    }
    return err == 0 ? ConnectStatus::OPEN : classify_errno(err);
}

// Tries each resolved address in turn; returns the connected descriptor or -1
int open_stream(const std::string &host, uint16_t port, std::chrono::milliseconds timeout, const Deadline &deadline,
                ConnectStatus &status) {
    status = ConnectStatus::FAILED;
    auto addresses = resolve(host, port, AF_UNSPEC, SOCK_STREAM);
    if (!addresses) {
        status = ConnectStatus::UNREACHABLE;
        return -1;
    }

    for (addrinfo *ai = addresses.get(); ai != nullptr; ai = ai->ai_next) {
        const int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            continue;
        }
        status = connect_with_timeout(fd, ai, deadline.clamp(timeout), deadline);
        if (status == ConnectStatus::OPEN) {
            return fd;
        }
        ::close(fd);
        if (status == ConnectStatus::CANCELLED || status == ConnectStatus::REFUSED) {
            break;
        }
    }
    return -1;
}

bool send_all(int fd, const std::string &data, std::chrono::milliseconds timeout, const Deadline &deadline) {
    size_t sent = 0;
    while (sent < data.size()) {
        const ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) {
            if (wait_for(fd, POLLOUT, timeout, deadline) != WaitResult::READY) {
                return false;
            }
            continue;
        }
        return false;
    }
    return true;
}

// Reads until max_bytes, EOF, the overall timeout, or a quiet gap after data arrived
std::string read_available(int fd, size_t max_bytes, std::chrono::milliseconds timeout, const Deadline &deadline) {
    std::string data;
    char buf[kRecvChunk];
    const auto until = Clock::now() + timeout;

    while (data.size() < max_bytes) {
        const auto now = Clock::now();
        if (now >= until) {
            break;
        }
        auto window = std::chrono::duration_cast<std::chrono::milliseconds>(until - now);
        if (!data.empty()) {
            window = std::min(window, kIdleGap);
        }
        if (wait_for(fd, POLLIN, window, deadline) != WaitResult::READY) {
            break;
        }

        const size_t want = std::min(sizeof(buf), max_bytes - data.size());
        const ssize_t n = ::recv(fd, buf, want, 0);
        if (n > 0) {
            data.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            break;
        }
    }
    return data;
}

uint16_t icmp_checksum(const unsigned char *data, size_t size) {
    uint32_t sum = 0;
    for (size_t i = 0; i + 1 < size; i += 2) {
        sum += static_cast<uint32_t>((data[i] << 8) | data[i + 1]);
    }
    if (size % 2 != 0) {
        sum += static_cast<uint32_t>(data[size - 1] << 8);
    }
    while ((sum >> 16) != 0) {
        sum = (sum & 0xFFFF) + (sum >> 16);
    }
    return static_cast<uint16_t>(~sum);
}

std::string bracket_host(const std::string &host) {
    if (host.find(':') != std::string::npos && host.front() != '[') {
        return "[" + host + "]";
    }
    return host;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

}  // namespace

const char *connect_status_to_string(ConnectStatus status) {
    switch (status) {
        case ConnectStatus::OPEN:
            return "open";
        case ConnectStatus::REFUSED:
            return "refused";
        case ConnectStatus::TIMEOUT:
            return "timeout";
        case ConnectStatus::UNREACHABLE:
            return "unreachable";
        case ConnectStatus::CANCELLED:
            return "cancelled";
        case ConnectStatus::FAILED:
        default:
            return "failed";
    }
}

PingResult PosixNetwork::ping(const std::string &host, std::chrono::milliseconds timeout, const Deadline &deadline) {
    PingResult result;

    auto addresses = resolve(host, 0, AF_INET, SOCK_DGRAM);
    if (!addresses) {
        // No IPv4 route for ICMP; let the caller fall back to TCP
        result.icmp_permitted = false;
        return result;
    }

    SocketGuard sock(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_ICMP));
    if (!sock.valid()) {
        LOG_DEBUG("[Net] ICMP socket unavailable: " << std::strerror(errno));
        result.icmp_permitted = false;
        return result;
    }
    if (!set_nonblocking(sock.get())) {
        result.icmp_permitted = false;
        return result;
    }

    unsigned char packet[sizeof(icmphdr) + 16] = {};
    auto *header = reinterpret_cast<icmphdr *>(packet);
    header->type = ICMP_ECHO;
    header->code = 0;
    header->un.echo.id = htons(static_cast<uint16_t>(::getpid() & 0xFFFF));
    header->un.echo.sequence = htons(1);
    std::memcpy(packet + sizeof(icmphdr), "sonar-reach-0001", 16);
    header->checksum = htons(icmp_checksum(packet, sizeof(packet)));

    const auto start = Clock::now();
    const addrinfo *target = addresses.get();
    if (::sendto(sock.get(), packet, sizeof(packet), 0, target->ai_addr, target->ai_addrlen) < 0) {
        LOG_DEBUG("[Net] ICMP send to " << host << " failed: " << std::strerror(errno));
        return result;
    }

    const auto budget = deadline.clamp(timeout);
    const auto until = start + budget;
    unsigned char reply[512];
    while (Clock::now() < until) {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(until - Clock::now());
        if (wait_for(sock.get(), POLLIN, left, deadline) != WaitResult::READY) {
            break;
        }
        const ssize_t n = ::recv(sock.get(), reply, sizeof(reply), 0);
        if (n < static_cast<ssize_t>(sizeof(icmphdr))) {
            continue;
        }
        const auto *reply_header = reinterpret_cast<const icmphdr *>(reply);
        if (reply_header->type == ICMP_ECHOREPLY) {
            result.reachable = true;
            result.latency_ms = elapsed_ms(start);
            break;
        }
    }
    return result;
}

ConnectResult PosixNetwork::tcp_connect(const std::string &host, uint16_t port, std::chrono::milliseconds timeout,
                                        const Deadline &deadline) {
    ConnectResult result;
    const auto start = Clock::now();
    SocketGuard sock(open_stream(host, port, timeout, deadline, result.status));
    if (result.status == ConnectStatus::OPEN) {
        result.latency_ms = elapsed_ms(start);
    }
    return result;
}

std::optional<std::string> PosixNetwork::tcp_exchange(const std::string &host, uint16_t port,
                                                      const std::string &request, std::chrono::milliseconds timeout,
                                                      size_t max_bytes, const Deadline &deadline) {
    ConnectStatus status = ConnectStatus::FAILED;
    SocketGuard sock(open_stream(host, port, timeout, deadline, status));
    if (!sock.valid()) {
        return std::nullopt;
    }

    if (!request.empty() && !send_all(sock.get(), request, deadline.clamp(timeout), deadline)) {
        LOG_DEBUG("[Net] Send to " << host << ":" << port << " failed");
        return std::string();
    }
    return read_available(sock.get(), max_bytes, deadline.clamp(timeout), deadline);
}

std::optional<std::string> PosixNetwork::udp_exchange(const std::string &host, uint16_t port,
                                                      const std::string &payload, std::chrono::milliseconds timeout,
                                                      size_t max_bytes, const Deadline &deadline) {
    auto addresses = resolve(host, port, AF_UNSPEC, SOCK_DGRAM);
    if (!addresses) {
        return std::nullopt;
    }

    const addrinfo *target = addresses.get();
    SocketGuard sock(::socket(target->ai_family, target->ai_socktype | SOCK_CLOEXEC, target->ai_protocol));
    if (!sock.valid() || !set_nonblocking(sock.get())) {
        return std::nullopt;
    }

    // A connected UDP socket surfaces ICMP port-unreachable as ECONNREFUSED
    if (::connect(sock.get(), target->ai_addr, target->ai_addrlen) != 0) {
        return std::nullopt;
    }
    if (::send(sock.get(), payload.data(), payload.size(), MSG_NOSIGNAL) < 0) {
        return std::nullopt;
    }

    if (wait_for(sock.get(), POLLIN, deadline.clamp(timeout), deadline) != WaitResult::READY) {
        return std::nullopt;
    }

    std::string data(std::max<size_t>(max_bytes, 1), '\0');
    const ssize_t n = ::recv(sock.get(), &data[0], data.size(), 0);
    if (n <= 0) {
        return std::nullopt;
    }
    data.resize(static_cast<size_t>(n));
    return data;
}

std::optional<HttpReply> PosixNetwork::http_request(const std::string &host, uint16_t port,
                                                    const HttpRequest &request, std::chrono::milliseconds timeout,
                                                    size_t body_limit, const Deadline &deadline) {
    const auto budget = deadline.clamp(timeout);
    if (budget.count() <= 0) {
        return std::nullopt;
    }

    const std::string origin =
        std::string(request.tls ? "https://" : "http://") + bracket_host(host) + ":" + std::to_string(port);
    httplib::Client client(origin);
    if (!client.is_valid()) {
        LOG_DEBUG("[Net] HTTP client unavailable for " << origin);
        return std::nullopt;
    }

    client.set_connection_timeout(budget);
    client.set_read_timeout(budget);
    client.set_write_timeout(budget);
    client.set_follow_location(false);

    httplib::Headers headers;
    for (const auto &[name, value] : request.headers) {
        headers.emplace(name, value);
    }
    if (request.headers.find("User-Agent") == request.headers.end()) {
        headers.emplace("User-Agent", kUserAgent);
    }

    HttpReply reply;
    bool got_response = false;
    auto capture_headers = [&reply](const httplib::Response &response) {
        reply.status = response.status;
        for (const auto &[name, value] : response.headers) {
            reply.headers[lowercase(name)] = value;
        }
    };

    httplib::Result result;
    if (request.method == "HEAD") {
        result = client.Head(request.path, headers);
    } else if (request.method == "POST") {
        result = client.Post(request.path, headers, request.body, request.content_type);
    } else {
        result = client.Get(
            request.path, headers,
            [&](const httplib::Response &response) {
                capture_headers(response);
                got_response = true;
                return true;
            },
            [&](const char *data, size_t length) {
                const size_t room = body_limit - std::min(body_limit, reply.body.size());
                reply.body.append(data, std::min(room, length));
                return reply.body.size() < body_limit;
            });
    }

    if (result) {
        capture_headers(*result);
        if (request.method != "GET") {
            reply.body = result->body.substr(0, body_limit);
        }
        return reply;
    }

    // Stopping the body download early surfaces as a cancelled request
    if (got_response) {
        return reply;
    }

    LOG_DEBUG("[Net] HTTP " << request.method << " " << origin << request.path
                            << " failed: " << httplib::to_string(result.error()));
    return std::nullopt;
}

}  // namespace net
}  // namespace sonar
