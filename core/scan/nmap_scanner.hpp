#pragma once

#include <string>

#include "external_scanner.hpp"
#include "process/process_runner.hpp"

namespace sonar {
namespace scan {

// nmap connect scan with grepable output (-oG -)
class NmapScanner : public IExternalScanner {
public:
    NmapScanner(process::ProcessRunner &runner, std::string nmap_path)
        : runner_(runner), nmap_path_(std::move(nmap_path)) {}

    std::string name() const override { return "nmap"; }
    bool available() const override;
    std::optional<std::vector<ProbeResult>> scan_tcp(const std::string &host, const std::vector<uint16_t> &ports,
                                                     const net::Deadline &deadline) override;

    // Parse grepable output; nullopt when the run did not complete.
    // Every requested port appears in the result, open or not.
    static std::optional<std::vector<ProbeResult>> parse_grepable_ports(const std::string &output,
                                                                        const std::vector<uint16_t> &ports);

private:
    process::ProcessRunner &runner_;
    std::string nmap_path_;
};

}  // namespace scan
}  // namespace sonar
