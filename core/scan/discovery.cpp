#include "discovery.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>

#include "capability_catalog.hpp"
#include "logging/logger.hpp"
#include "net/wire.hpp"

namespace sonar {
namespace scan {

namespace {

using net::byte_at;
using net::read_be16;

constexpr size_t kReplyLimit = 4096;
constexpr size_t kDnsHeaderSize = 12;
constexpr int kMaxPointerJumps = 16;
constexpr uint16_t kDnsTypePtr = 12;

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::string trim(const std::string &s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool contains(const std::string &haystack, const std::string &needle) {
    return haystack.find(needle) != std::string::npos;
}

Capability discovered(const CapabilityText &text, const std::string &protocol, uint16_t port,
                      const std::string &operation) {
    return service_capability(text.name, text.description, protocol, port, operation);
}

// DNS name at offset with compression pointers; end receives the offset after the name
std::optional<std::string> read_name(const std::string &packet, size_t offset, size_t &end) {
    std::string name;
    size_t pos = offset;
    bool jumped = false;
    int jumps = 0;
    while (true) {
        if (pos >= packet.size()) {
            return std::nullopt;
        }
        const uint8_t len = byte_at(packet, pos);
        if (len == 0) {
            if (!jumped) {
                end = pos + 1;
            }
            return name;
        }
        if ((len & 0xC0) == 0xC0) {
            if (pos + 1 >= packet.size() || ++jumps > kMaxPointerJumps) {
                return std::nullopt;
            }
            if (!jumped) {
                end = pos + 2;
            }
            pos = static_cast<size_t>(((len & 0x3F) << 8) | byte_at(packet, pos + 1));
            jumped = true;
            continue;
        }
        if ((len & 0xC0) != 0 || pos + 1 + len > packet.size()) {
            return std::nullopt;
        }
        if (!name.empty()) {
            name += '.';
        }
        name.append(packet, pos + 1, len);
        pos += 1 + len;
    }
}

void append_label(std::string &out, const std::string &label) {
    out.push_back(static_cast<char>(label.size()));
    out += label;
}

}  // namespace

std::string DiscoveryProbe::ssdp_search_request() {
    return "M-SEARCH * HTTP/1.1\r\n"
           "HOST: 239.255.255.250:1900\r\n"
           "MAN: \"ssdp:discover\"\r\n"
           "MX: 1\r\n"
           "ST: ssdp:all\r\n"
           "USER-AGENT: sonar/1.0 UPnP/1.1\r\n"
           "\r\n";
}

std::string DiscoveryProbe::mdns_services_query() {
    std::string packet = net::bytes({0x00, 0x00,    // id
                                     0x00, 0x00,    // standard query
                                     0x00, 0x01,    // one question
                                     0x00, 0x00, 0x00, 0x00, 0x00, 0x00});
    for (const char *label : {"_services", "_dns-sd", "_udp", "local"}) {
        append_label(packet, label);
    }
    packet.push_back('\0');
    packet += net::bytes({0x00, 0x0c,    // PTR
                          0x80, 0x01});  // IN, unicast response requested
    return packet;
}

std::string DiscoveryProbe::wsd_probe_message() {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
           "<soap:Envelope xmlns:soap=\"http://www.w3.org/2003/05/soap-envelope\" "
           "xmlns:wsa=\"http://schemas.xmlsoap.org/ws/2004/08/addressing\" "
           "xmlns:wsd=\"http://schemas.xmlsoap.org/ws/2005/04/discovery\">"
           "<soap:Header>"
           "<wsa:To>urn:schemas-xmlsoap-org:ws:2005:04:discovery</wsa:To>"
           "<wsa:Action>http://schemas.xmlsoap.org/ws/2005/04/discovery/Probe</wsa:Action>"
           "<wsa:MessageID>urn:uuid:736f6e61-7200-4000-8000-70726f626531</wsa:MessageID>"
           "</soap:Header>"
           "<soap:Body><wsd:Probe/></soap:Body>"
           "</soap:Envelope>";
}

std::optional<std::map<std::string, std::string>> DiscoveryProbe::parse_ssdp_response(const std::string &reply) {
    if (reply.rfind("HTTP/1.1 200", 0) != 0 && reply.rfind("HTTP/1.0 200", 0) != 0 && reply.rfind("NOTIFY", 0) != 0) {
        return std::nullopt;
    }

    std::map<std::string, std::string> headers;
    std::istringstream lines(reply);
    std::string line;
    std::getline(lines, line);  // status line
    while (std::getline(lines, line)) {
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        headers[lower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return headers;
}

std::optional<std::vector<std::string>> DiscoveryProbe::parse_mdns_ptr_records(const std::string &packet) {
    if (packet.size() < kDnsHeaderSize || (byte_at(packet, 2) & 0x80) == 0) {
        return std::nullopt;
    }

    const size_t questions = read_be16(packet, 4);
    const size_t records = static_cast<size_t>(read_be16(packet, 6)) + read_be16(packet, 8) + read_be16(packet, 10);

    size_t pos = kDnsHeaderSize;
    for (size_t i = 0; i < questions; ++i) {
        size_t end = pos;
        if (!read_name(packet, pos, end) || end + 4 > packet.size()) {
            return std::nullopt;
        }
        pos = end + 4;
    }

    std::vector<std::string> targets;
    for (size_t i = 0; i < records; ++i) {
        size_t end = pos;
        if (!read_name(packet, pos, end) || end + 10 > packet.size()) {
            break;
        }
        const uint16_t type = read_be16(packet, end);
        const size_t rdlength = read_be16(packet, end + 8);
        const size_t rdata = end + 10;
        if (rdata + rdlength > packet.size()) {
            break;
        }
        if (type == kDnsTypePtr) {
            size_t ignored = rdata;
            auto target = read_name(packet, rdata, ignored);
            if (target && std::find(targets.begin(), targets.end(), *target) == targets.end()) {
                targets.push_back(*target);
            }
        }
        pos = rdata + rdlength;
    }
    return targets;
}

std::optional<std::string> DiscoveryProbe::xml_element_text(const std::string &xml, const std::string &local_name) {
    size_t pos = 0;
    while ((pos = xml.find('<', pos)) != std::string::npos) {
        const size_t name_start = pos + 1;
        if (name_start >= xml.size() || xml[name_start] == '/' || xml[name_start] == '?') {
            ++pos;
            continue;
        }
        const size_t name_end = xml.find_first_of(" \t\r\n/>", name_start);
        if (name_end == std::string::npos) {
            return std::nullopt;
        }
        std::string tag = xml.substr(name_start, name_end - name_start);
        const auto colon = tag.find(':');
        if (colon != std::string::npos) {
            tag = tag.substr(colon + 1);
        }

        const size_t gt = xml.find('>', name_end);
        if (gt == std::string::npos) {
            return std::nullopt;
        }
        if (tag == local_name && xml[gt - 1] != '/') {
            const size_t close = xml.find("</", gt);
            if (close == std::string::npos) {
                return std::nullopt;
            }
            return trim(xml.substr(gt + 1, close - gt - 1));
        }
        pos = gt;
    }
    return std::nullopt;
}

std::optional<DiscoveryFinding> DiscoveryProbe::probe_ssdp(const std::string &host,
                                                           const net::Deadline &deadline) const {
    auto reply = network_.udp_exchange(host, kSsdpPort, ssdp_search_request(), timeout(), kReplyLimit, deadline);
    if (!reply) {
        return std::nullopt;
    }
    auto headers = parse_ssdp_response(*reply);
    if (!headers) {
        LOG_DEBUG("[Discovery] Unrecognized SSDP reply from " << host);
        return std::nullopt;
    }

    DiscoveryFinding finding;
    finding.protocol = "ssdp";
    for (const char *key : {"location", "server", "st", "usn"}) {
        auto it = headers->find(key);
        if (it != headers->end() && !it->second.empty()) {
            finding.details[key] = it->second;
        }
    }

    Capability description = service_capability("UPnP device description", "Read the device's UPnP description",
                                                "upnp", kSsdpPort, "upnp_describe");
    if (finding.details.count("location") > 0) {
        description.url = finding.details["location"];
    }
    finding.capabilities.push_back(description);

    const std::string advertised = finding.details["st"] + " " + finding.details["usn"] + " " + finding.details["server"];
    if (contains(advertised, "MediaRenderer") || contains(advertised, "MediaServer")) {
        finding.capabilities.push_back(discovered(catalog::kCastMedia, "upnp", kSsdpPort, "cast"));
    }
    if (contains(advertised, "InternetGatewayDevice") || contains(advertised, "WANIPConnection")) {
        finding.capabilities.push_back(service_capability("Port forwarding (UPnP)",
                                                          "Manage port mappings through UPnP IGD", "upnp", kSsdpPort,
                                                          "upnp_port_map"));
    }
    return finding;
}

std::optional<DiscoveryFinding> DiscoveryProbe::probe_mdns(const std::string &host,
                                                           const net::Deadline &deadline) const {
    auto reply = network_.udp_exchange(host, kMdnsPort, mdns_services_query(), timeout(), kReplyLimit, deadline);
    if (!reply) {
        return std::nullopt;
    }
    auto targets = parse_mdns_ptr_records(*reply);
    if (!targets) {
        LOG_DEBUG("[Discovery] Malformed mDNS reply from " << host);
        return std::nullopt;
    }

    DiscoveryFinding finding;
    finding.protocol = "mdns";
    std::string joined;
    for (const auto &target : *targets) {
        joined += (joined.empty() ? "" : ",") + target;
    }
    if (!joined.empty()) {
        finding.details["services"] = joined;
    }

    finding.capabilities.push_back(service_capability("Service discovery (mDNS)",
                                                      "Enumerate services advertised over mDNS", "mdns", kMdnsPort,
                                                      "mdns_browse"));

    const std::string types = lower(joined);
    if (contains(types, "_ipp.") || contains(types, "_ipps.") || contains(types, "_printer.") ||
        contains(types, "_pdl-datastream.")) {
        finding.capabilities.push_back(discovered(catalog::kPrintDocument, "mdns", kMdnsPort, "print"));
    }
    if (contains(types, "_airplay.") || contains(types, "_raop.") || contains(types, "_googlecast.") ||
        contains(types, "_spotify-connect.")) {
        finding.capabilities.push_back(discovered(catalog::kCastMedia, "mdns", kMdnsPort, "cast"));
    }
    if (contains(types, "_smb.") || contains(types, "_afpovertcp.") || contains(types, "_nfs.")) {
        finding.capabilities.push_back(discovered(catalog::kBrowseFiles, "mdns", kMdnsPort, "browse_files"));
    }
    if (contains(types, "_hap.")) {
        finding.capabilities.push_back(service_capability("Smart home control", "Control the accessory through HomeKit",
                                                          "hap", kMdnsPort, "homekit"));
    }
    return finding;
}

std::optional<DiscoveryFinding> DiscoveryProbe::probe_wsd(const std::string &host,
                                                          const net::Deadline &deadline) const {
    auto reply = network_.udp_exchange(host, kWsdPort, wsd_probe_message(), timeout(), kReplyLimit, deadline);
    if (!reply || !contains(*reply, "ProbeMatch")) {
        return std::nullopt;
    }

    DiscoveryFinding finding;
    finding.protocol = "wsd";
    const std::string types = xml_element_text(*reply, "Types").value_or("");
    const std::string xaddrs = xml_element_text(*reply, "XAddrs").value_or("");
    if (!types.empty()) {
        finding.details["types"] = types;
    }
    if (!xaddrs.empty()) {
        finding.details["xaddrs"] = xaddrs;
    }

    finding.capabilities.push_back(service_capability("WS-Discovery endpoint",
                                                      "Device advertises services over WS-Discovery", "wsd", kWsdPort,
                                                      "wsd_probe"));
    if (contains(types, "NetworkVideoTransmitter")) {
        finding.details["onvif"] = "true";
        finding.capabilities.push_back(discovered(catalog::kLiveView, "onvif", kWsdPort, "live_view"));
    }
    if (contains(types, "Print")) {
        finding.capabilities.push_back(discovered(catalog::kPrintDocument, "wsd", kWsdPort, "print"));
    }
    return finding;
}

std::vector<DiscoveryProbe::Task> DiscoveryProbe::tasks(const std::string &host,
                                                       const net::Deadline &deadline) const {
    std::vector<Task> out;
    if (!options_.enabled) {
        return out;
    }
    if (options_.ssdp) {
        out.emplace_back([this, &host, &deadline]() { return probe_ssdp(host, deadline); });
    }
    if (options_.mdns) {
        out.emplace_back([this, &host, &deadline]() { return probe_mdns(host, deadline); });
    }
    if (options_.wsd) {
        out.emplace_back([this, &host, &deadline]() { return probe_wsd(host, deadline); });
    }
    return out;
}

}  // namespace scan
}  // namespace sonar
