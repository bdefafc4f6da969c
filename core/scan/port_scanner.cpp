#include "port_scanner.hpp"

#include <algorithm>
#include <future>

#include "logging/logger.hpp"
#include "net/wire.hpp"

namespace sonar {
namespace scan {

namespace {
constexpr uint16_t kDnsPort = 53;
constexpr uint16_t kSnmpPort = 161;
constexpr size_t kUdpReplyLimit = 1500;

using net::bytes;
}  // namespace

std::string PortScanner::dns_query_packet() {
    // id 0xAAAA, RD, one question: example.com A IN
    std::string packet = bytes({0xAA, 0xAA, 0x01, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00});
    packet += bytes({7}) + "example" + bytes({3}) + "com" + bytes({0});
    packet += bytes({0x00, 0x01, 0x00, 0x01});
    return packet;
}

std::string PortScanner::snmp_get_sysdescr_packet(const std::string &community) {
    // SNMPv1 GetRequest for sysDescr.0 (1.3.6.1.2.1.1.1.0)
    const std::string varbind_list =
        bytes({0x30, 0x0e, 0x30, 0x0c, 0x06, 0x08, 0x2b, 0x06, 0x01, 0x02, 0x01, 0x01, 0x01, 0x00, 0x05, 0x00});
    std::string pdu_body = bytes({0x02, 0x04, 0x53, 0x4f, 0x4e, 0x52,  // request-id
                                  0x02, 0x01, 0x00,                    // error-status
                                  0x02, 0x01, 0x00});                  // error-index
    pdu_body += varbind_list;
    const std::string pdu = bytes({0xa0, static_cast<int>(pdu_body.size())}) + pdu_body;

    std::string message = bytes({0x02, 0x01, 0x00});  // version-1
    message += bytes({0x04, static_cast<int>(community.size())}) + community;
    message += pdu;
    return bytes({0x30, static_cast<int>(message.size())}) + message;
}

std::string PortScanner::udp_probe_payload(uint16_t port) {
    switch (port) {
        case kDnsPort:
            return dns_query_packet();
        case kSnmpPort:
            return snmp_get_sysdescr_packet();
        default:
            return std::string(1, '\0');
    }
}

std::set<uint16_t> PortScanner::open_ports(const std::vector<ProbeResult> &results) {
    std::set<uint16_t> ports;
    for (const auto &probe : results) {
        if (probe.open) {
            ports.insert(probe.port);
        }
    }
    return ports;
}

ProbeResult PortScanner::probe_tcp(const std::string &host, uint16_t port, const net::Deadline &deadline) const {
    ProbeResult probe;
    probe.port = port;
    probe.protocol = Transport::TCP;
    if (deadline.expired()) {
        return probe;
    }

    net::ConnectResult connect =
        network_.tcp_connect(host, port, std::chrono::milliseconds(options_.connect_timeout_ms), deadline);
    probe.open = connect.status == net::ConnectStatus::OPEN;
    if (probe.open) {
        probe.latency_ms = connect.latency_ms;
    } else {
        LOG_DEBUG("[PortScanner] " << host << ":" << port << "/tcp " << net::connect_status_to_string(connect.status));
    }
    return probe;
}

ProbeResult PortScanner::probe_udp(const std::string &host, uint16_t port, const net::Deadline &deadline) const {
    ProbeResult probe;
    probe.port = port;
    probe.protocol = Transport::UDP;
    if (deadline.expired()) {
        return probe;
    }

    const auto start = net::Deadline::Clock::now();
    auto reply = network_.udp_exchange(host, port, udp_probe_payload(port),
                                       std::chrono::milliseconds(options_.probe_timeout_ms), kUdpReplyLimit, deadline);
    if (reply && !reply->empty()) {
        probe.open = true;
        probe.banner = *reply;
        probe.latency_ms = static_cast<uint32_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(net::Deadline::Clock::now() - start).count());
    }
    return probe;
}

PortScanReport PortScanner::scan(const std::string &host, WorkerPool &pool, const net::Deadline &deadline) const {
    PortScanReport report;
    std::vector<std::future<ProbeResult>> pending;

    bool tcp_done = false;
    if (external_ != nullptr && external_->available()) {
        auto external = external_->scan_tcp(host, options_.tcp_ports, deadline);
        if (external) {
            report.results = std::move(*external);
            report.backend = external_->name();
            tcp_done = true;
        } else {
            LOG_WARN("[PortScanner] " << external_->name() << " unavailable for " << host
                                      << ", falling back to connect scan");
        }
    }

    if (!tcp_done) {
        report.backend = "connect";
        for (uint16_t port : options_.tcp_ports) {
            pending.push_back(pool.submit([this, &host, port, &deadline] { return probe_tcp(host, port, deadline); }));
        }
    }
    for (uint16_t port : options_.udp_ports) {
        pending.push_back(pool.submit([this, &host, port, &deadline] { return probe_udp(host, port, deadline); }));
    }

    for (auto &future : pending) {
        if (future.wait_until(deadline.expires_at()) != std::future_status::ready) {
            report.partial = true;
            continue;
        }
        try {
            report.results.push_back(future.get());
        } catch (const std::exception &e) {
            LOG_WARN("[PortScanner] Probe task failed: " << e.what());
        }
    }

    std::sort(report.results.begin(), report.results.end(), [](const ProbeResult &a, const ProbeResult &b) {
        if (a.port != b.port) {
            return a.port < b.port;
        }
        return static_cast<int>(a.protocol) < static_cast<int>(b.protocol);
    });

    LOG_INFO("[PortScanner] " << host << ": " << open_ports(report.results).size() << " open via " << report.backend
                              << (report.partial ? " (partial)" : ""));
    return report;
}

}  // namespace scan
}  // namespace sonar
