#include "capability_synthesizer.hpp"

#include <set>
#include <string>
#include <utility>

#include "capability_catalog.hpp"

namespace sonar {
namespace scan {

namespace {

Capability from_catalog(const CapabilityText &text, const std::string &operation) {
    return plain_capability(text.name, text.description, operation);
}

}  // namespace

std::vector<Capability> CapabilitySynthesizer::archetype_template(Archetype archetype) {
    switch (archetype) {
        case Archetype::ROUTER:
            return {plain_capability("Network settings", "Manage routing, Wi-Fi and DHCP settings", "configure_network"),
                    plain_capability("Connected devices", "List clients attached to the network", "list_clients")};
        case Archetype::PRINTER:
            return {from_catalog(catalog::kPrintQueue, "print_queue"),
                    from_catalog(catalog::kPrinterStatus, "printer_status")};
        case Archetype::CAMERA:
            return {from_catalog(catalog::kLiveView, "live_view"),
                    plain_capability("Take snapshot", "Capture a still image", "snapshot")};
        case Archetype::STORAGE:
            return {from_catalog(catalog::kBrowseFiles, "browse_files"),
                    plain_capability("Storage status", "Check disk usage and health", "storage_status")};
        case Archetype::WORKSTATION:
            return {plain_capability("Remote access", "Connect to the computer remotely", "remote_access")};
        case Archetype::SERVER:
            return {plain_capability("Service health", "Check the services this host provides", "service_health")};
        case Archetype::EMBEDDED:
            return {plain_capability("Device telemetry", "Read sensor and state data from the device",
                                     "read_telemetry")};
        case Archetype::MEDIA:
            return {plain_capability("Media playback", "Control media playback", "playback"),
                    from_catalog(catalog::kCastMedia, "cast")};
        default:
            return {};
    }
}

std::vector<Capability> CapabilitySynthesizer::offline_capabilities() {
    return {from_catalog(catalog::kWakeDevice, "wake"), from_catalog(catalog::kMonitorAvailability, "monitor")};
}

std::vector<Capability> CapabilitySynthesizer::dedupe(const std::vector<Capability> &capabilities) {
    std::vector<Capability> unique;
    std::set<std::pair<std::string, std::string>> seen;
    for (const auto &cap : capabilities) {
        if (seen.emplace(cap.name, cap.description).second) {
            unique.push_back(cap);
        }
    }
    return unique;
}

std::vector<Capability> CapabilitySynthesizer::synthesize(const DeviceProfile &profile,
                                                          const std::vector<Capability> &discovery_capabilities) {
    if (profile.status == DeviceStatus::OFFLINE) {
        return offline_capabilities();
    }

    std::vector<Capability> merged;
    for (const auto &service : profile.services) {
        merged.insert(merged.end(), service.operations.begin(), service.operations.end());
    }

    if (profile.archetype) {
        if (auto archetype = archetype_from_string(*profile.archetype)) {
            auto templ = archetype_template(*archetype);
            merged.insert(merged.end(), templ.begin(), templ.end());
        }
    }

    merged.insert(merged.end(), discovery_capabilities.begin(), discovery_capabilities.end());

    if (profile.services.empty()) {
        merged.push_back(from_catalog(catalog::kMonitorAvailability, "monitor"));
    }
    return dedupe(merged);
}

}  // namespace scan
}  // namespace sonar
