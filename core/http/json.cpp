#include "json.hpp"

namespace sonar {
namespace http {

nlohmann::json encode_capability(const scan::Capability &capability) {
    nlohmann::json j = {
        {"name", capability.name}, {"description", capability.description}, {"available", capability.available}};
    if (capability.protocol) {
        j["protocol"] = *capability.protocol;
    }
    if (capability.port) {
        j["port"] = *capability.port;
    }
    if (capability.operation) {
        j["operation"] = *capability.operation;
    }
    if (capability.url) {
        j["url"] = *capability.url;
    }
    return j;
}

nlohmann::json encode_capabilities(const std::vector<scan::Capability> &capabilities) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto &capability : capabilities) {
        list.push_back(encode_capability(capability));
    }
    return list;
}

nlohmann::json encode_service(const scan::ServiceDescriptor &service) {
    nlohmann::json j = {{"port", service.port},
                        {"transport", scan::transport_to_string(service.transport)},
                        {"service_name", service.service_name},
                        {"details", service.details},
                        {"operations", encode_capabilities(service.operations)}};
    if (service.version_hint) {
        j["version_hint"] = *service.version_hint;
    }
    return j;
}

nlohmann::json encode_device_profile(const scan::DeviceProfile &profile) {
    nlohmann::json services = nlohmann::json::array();
    for (const auto &service : profile.services) {
        services.push_back(encode_service(service));
    }

    // std::set iterates in ascending order, which is the wire order
    nlohmann::json open_ports = nlohmann::json::array();
    for (uint16_t port : profile.open_ports) {
        open_ports.push_back(port);
    }

    nlohmann::json j = {{"address", profile.address},
                        {"type", profile.declared_type},
                        {"kind", scan::address_kind_to_string(profile.kind)},
                        {"status", scan::device_status_to_string(profile.status)},
                        {"open_ports", open_ports},
                        {"services", services},
                        {"device_type", profile.archetype.value_or("unknown")},
                        {"protocols_seen", profile.protocols_seen},
                        {"metadata", profile.metadata},
                        {"partial", profile.partial}};
    if (profile.latency_ms) {
        j["latency_ms"] = *profile.latency_ms;
    }
    if (profile.signal_strength) {
        j["signal_strength"] = *profile.signal_strength;
    }
    return j;
}

nlohmann::json encode_scan_result(const scan::ScanResult &result) {
    nlohmann::json j = {{"status", result.status == scan::ScanStatus::SUCCESS ? "success" : "error"},
                        {"capabilities", encode_capabilities(result.capabilities)},
                        {"device_info", encode_device_profile(result.device_info)}};
    if (result.error) {
        j["error"] = *result.error;
    }
    if (result.request_id) {
        j["id"] = *result.request_id;
    }
    return j;
}

}  // namespace http
}  // namespace sonar
