#pragma once

#include <set>
#include <string>
#include <vector>

#include "external_scanner.hpp"
#include "net/i_network.hpp"
#include "scan_options.hpp"
#include "types.hpp"
#include "worker_pool.hpp"

namespace sonar {
namespace scan {

struct PortScanReport {
    std::vector<ProbeResult> results;  // sorted by (port, protocol)
    std::string backend;               // "nmap", "connect" ...
    bool partial = false;              // deadline cut the scan short
};

/**
 * @brief Probes the configured TCP and UDP port sets on one host.
 *
 * TCP prefers the injected external scanner and falls back to a connect
 * loop dispatched on the worker pool. UDP always uses a protocol-specific
 * request (DNS query, SNMP get) since UDP has no handshake; the reply is
 * kept as the probe banner for the fingerprinters.
 */
class PortScanner {
public:
    PortScanner(net::INetwork &network, const ScanOptions &options, IExternalScanner *external)
        : network_(network), options_(options), external_(external) {}

    PortScanReport scan(const std::string &host, WorkerPool &pool, const net::Deadline &deadline) const;

    static std::set<uint16_t> open_ports(const std::vector<ProbeResult> &results);

    // Request payload used to elicit a reply from a UDP port
    static std::string udp_probe_payload(uint16_t port);

    static std::string dns_query_packet();
    static std::string snmp_get_sysdescr_packet(const std::string &community = "public");

private:
    ProbeResult probe_tcp(const std::string &host, uint16_t port, const net::Deadline &deadline) const;
    ProbeResult probe_udp(const std::string &host, uint16_t port, const net::Deadline &deadline) const;

    net::INetwork &network_;
    const ScanOptions &options_;
    IExternalScanner *external_;
};

}  // namespace scan
}  // namespace sonar
