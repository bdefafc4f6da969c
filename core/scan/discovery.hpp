#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "net/i_network.hpp"
#include "scan_options.hpp"
#include "types.hpp"

namespace sonar {
namespace scan {

struct DiscoveryFinding {
    std::string protocol;  // "ssdp", "mdns", "wsd"
    std::map<std::string, std::string> details;
    std::vector<Capability> capabilities;
};

/**
 * @brief Unicast probes for the local-network discovery protocols.
 *
 * SSDP M-SEARCH (udp/1900), mDNS service enumeration (udp/5353) and a
 * WS-Discovery Probe (udp/3702). Findings add metadata and capabilities
 * only; a silent or garbled answer simply yields no finding.
 */
class DiscoveryProbe {
public:
    static constexpr uint16_t kSsdpPort = 1900;
    static constexpr uint16_t kMdnsPort = 5353;
    static constexpr uint16_t kWsdPort = 3702;

    DiscoveryProbe(net::INetwork &network, const DiscoveryOptions &options) : network_(network), options_(options) {}

    using Task = std::function<std::optional<DiscoveryFinding>()>;

    // One task per enabled protocol, none when discovery is off. Tasks keep
    // references to this probe, host and deadline.
    std::vector<Task> tasks(const std::string &host, const net::Deadline &deadline) const;

    std::optional<DiscoveryFinding> probe_ssdp(const std::string &host, const net::Deadline &deadline) const;
    std::optional<DiscoveryFinding> probe_mdns(const std::string &host, const net::Deadline &deadline) const;
    std::optional<DiscoveryFinding> probe_wsd(const std::string &host, const net::Deadline &deadline) const;

    static std::string ssdp_search_request();
    static std::string mdns_services_query();
    static std::string wsd_probe_message();

    // Header map (lowercased names) of an SSDP reply; nullopt if not HTTP-like
    static std::optional<std::map<std::string, std::string>> parse_ssdp_response(const std::string &reply);

    // PTR targets in an mDNS reply, e.g. "_ipp._tcp.local"
    static std::optional<std::vector<std::string>> parse_mdns_ptr_records(const std::string &packet);

    // Text content of the first element with this local name (namespace prefix ignored)
    static std::optional<std::string> xml_element_text(const std::string &xml, const std::string &local_name);

private:
    std::chrono::milliseconds timeout() const { return std::chrono::milliseconds(options_.timeout_ms); }

    net::INetwork &network_;
    const DiscoveryOptions &options_;
};

}  // namespace scan
}  // namespace sonar
