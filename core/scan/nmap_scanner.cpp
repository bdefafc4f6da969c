#include "nmap_scanner.hpp"

#include <algorithm>
#include <set>
#include <sstream>

#include "address_classifier.hpp"
#include "logging/logger.hpp"

namespace sonar {
namespace scan {

namespace {
constexpr const char *kPortsField = "Ports: ";
constexpr const char *kDoneMarker = "# Nmap done";

std::vector<std::string> split(const std::string &s, const std::string &delim) {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (true) {
        size_t next = s.find(delim, pos);
        parts.push_back(s.substr(pos, next == std::string::npos ? std::string::npos : next - pos));
        if (next == std::string::npos) {
            break;
        }
        pos = next + delim.size();
    }
    return parts;
}

std::string trim(const std::string &s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}
}  // namespace

bool NmapScanner::available() const { return process::ProcessRunner::find_executable(nmap_path_).has_value(); }

std::optional<std::vector<ProbeResult>> NmapScanner::scan_tcp(const std::string &host,
                                                               const std::vector<uint16_t> &ports,
                                                               const net::Deadline &deadline) {
    if (ports.empty()) {
        return std::vector<ProbeResult>{};
    }

    // At most half of what is left, the rest belongs to fingerprinting
    const auto budget = deadline.remaining() / 2;
    if (budget.count() < 1000) {
        return std::nullopt;
    }

    std::ostringstream port_list;
    for (size_t i = 0; i < ports.size(); ++i) {
        port_list << (i == 0 ? "" : ",") << ports[i];
    }

    // Leave nmap a little headroom below our own kill timeout
    const long long host_timeout_s = std::max<long long>(1, budget.count() / 1000 - 1);

    std::vector<std::string> args = {"-Pn", "-n", "-sT", "-T4", "--host-timeout", std::to_string(host_timeout_s) + "s",
                                     "-p",  port_list.str(), "-oG", "-"};
    if (AddressClassifier::is_ipv6_literal(host)) {
        args.push_back("-6");
    }
    args.push_back(host);

    process::ProcessOutput output;
    std::string error;
    if (!runner_.run(nmap_path_, args, budget, output, error)) {
        LOG_WARN("[PortScanner] nmap failed: " << error);
        return std::nullopt;
    }
    if (output.exit_code != 0) {
        LOG_WARN("[PortScanner] nmap exited with code " << output.exit_code);
        return std::nullopt;
    }

    auto results = parse_grepable_ports(output.stdout_data, ports);
    if (!results) {
        LOG_WARN("[PortScanner] nmap output incomplete, ignoring");
    }
    return results;
}

std::optional<std::vector<ProbeResult>> NmapScanner::parse_grepable_ports(const std::string &output,
                                                                          const std::vector<uint16_t> &ports) {
    if (output.find(kDoneMarker) == std::string::npos) {
        return std::nullopt;
    }

    std::set<uint16_t> open;
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.rfind("Host:", 0) != 0) {
            continue;
        }
        const auto start = line.find(kPortsField);
        if (start == std::string::npos) {
            continue;
        }
        std::string field = line.substr(start + std::char_traits<char>::length(kPortsField));
        const auto tab = field.find('\t');
        if (tab != std::string::npos) {
            field = field.substr(0, tab);
        }

        // 22/open/tcp//ssh///, 80/closed/tcp//http///
        for (const auto &entry : split(field, ",")) {
            const auto parts = split(trim(entry), "/");
            if (parts.size() < 3 || parts[1] != "open" || parts[2] != "tcp") {
                continue;
            }
            try {
                const unsigned long port = std::stoul(parts[0]);
                if (port > 0 && port <= 65535) {
                    open.insert(static_cast<uint16_t>(port));
                }
            } catch (const std::exception &e) {
                LOG_DEBUG("[PortScanner] Bad nmap port entry '" << entry << "': " << e.what());
            }
        }
    }

    std::vector<ProbeResult> results;
    results.reserve(ports.size());
    for (uint16_t port : ports) {
        ProbeResult probe;
        probe.port = port;
        probe.protocol = Transport::TCP;
        probe.open = open.count(port) > 0;
        results.push_back(probe);
    }
    return results;
}

}  // namespace scan
}  // namespace sonar
