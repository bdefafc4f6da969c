#include "types.hpp"

namespace sonar {
namespace scan {

const char *address_kind_to_string(AddressKind kind) {
    switch (kind) {
        case AddressKind::LINK_LAYER:
            return "link-layer";
        case AddressKind::IP_LITERAL:
            return "ip";
        case AddressKind::LOCAL_HANDLE:
            return "local-capture";
        case AddressKind::UNKNOWN:
        default:
            return "unknown";
    }
}

const char *transport_to_string(Transport transport) { return transport == Transport::UDP ? "udp" : "tcp"; }

const char *archetype_to_string(Archetype archetype) {
    switch (archetype) {
        case Archetype::ROUTER:
            return "router";
        case Archetype::PRINTER:
            return "printer";
        case Archetype::CAMERA:
            return "camera";
        case Archetype::STORAGE:
            return "storage";
        case Archetype::WORKSTATION:
            return "workstation";
        case Archetype::SERVER:
            return "server";
        case Archetype::EMBEDDED:
            return "embedded";
        case Archetype::MEDIA:
            return "media";
        default:
            return "unknown";
    }
}

std::optional<Archetype> archetype_from_string(const std::string &name) {
    for (Archetype archetype : kArchetypePriority) {
        if (name == archetype_to_string(archetype)) {
            return archetype;
        }
    }
    return std::nullopt;
}

const char *device_status_to_string(DeviceStatus status) {
    switch (status) {
        case DeviceStatus::ONLINE:
            return "online";
        case DeviceStatus::OFFLINE:
            return "offline";
        case DeviceStatus::UNKNOWN:
        default:
            return "unknown";
    }
}

const char *scan_method_to_string(ScanMethod method) {
    switch (method) {
        case ScanMethod::AUTO:
            return "auto";
        case ScanMethod::LINK_LAYER:
            return "link-layer";
        case ScanMethod::ADDRESS_BASED:
            return "address-based";
        case ScanMethod::LOCAL_CAPTURE:
            return "local-capture";
        default:
            return "auto";
    }
}

std::optional<ScanMethod> scan_method_from_string(const std::string &name) {
    if (name.empty() || name == "auto") {
        return ScanMethod::AUTO;
    }
    if (name == "link-layer") {
        return ScanMethod::LINK_LAYER;
    }
    if (name == "address-based") {
        return ScanMethod::ADDRESS_BASED;
    }
    if (name == "local-capture") {
        return ScanMethod::LOCAL_CAPTURE;
    }
    return std::nullopt;
}

Capability service_capability(const std::string &name, const std::string &description, const std::string &protocol,
                              uint16_t port, const std::string &operation, const std::string &url) {
    Capability cap;
    cap.name = name;
    cap.description = description;
    cap.protocol = protocol;
    cap.port = port;
    cap.operation = operation;
    if (!url.empty()) {
        cap.url = url;
    }
    return cap;
}

Capability plain_capability(const std::string &name, const std::string &description, const std::string &operation,
                            bool available) {
    Capability cap;
    cap.name = name;
    cap.description = description;
    cap.operation = operation;
    cap.available = available;
    return cap;
}

std::string format_url(const std::string &scheme, const std::string &host, uint16_t port, const std::string &path) {
    std::string url = scheme + "://";
    if (host.find(':') != std::string::npos) {
        url += "[" + host + "]";
    } else {
        url += host;
    }
    url += ":" + std::to_string(port);
    url += path.empty() || path[0] != '/' ? "/" + path : path;
    return url;
}

}  // namespace scan
}  // namespace sonar
