#pragma once

#include <string>

#include "fingerprinter.hpp"
#include "scan/capability_catalog.hpp"

namespace sonar {
namespace fingerprint {

inline scan::ServiceDescriptor make_descriptor(const FingerprintContext &ctx, const char *service_name) {
    scan::ServiceDescriptor desc;
    desc.port = ctx.probe.port;
    desc.transport = ctx.probe.protocol;
    desc.service_name = service_name;
    return desc;
}

inline scan::Capability catalog_capability(const scan::CapabilityText &text, const std::string &protocol,
                                           uint16_t port, const std::string &operation, const std::string &url = "") {
    return scan::service_capability(text.name, text.description, protocol, port, operation, url);
}

inline std::string first_line(const std::string &data) {
    const auto end = data.find_first_of("\r\n");
    return end == std::string::npos ? data : data.substr(0, end);
}

inline std::string port_suffix(uint16_t port) { return " on port " + std::to_string(port); }

}  // namespace fingerprint
}  // namespace sonar
