#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "backends/bluetooth_backend.hpp"
#include "types.hpp"

namespace sonar {
namespace scan {

/**
 * @brief Capability check for devices addressed by MAC.
 *
 * With a Bluetooth backend the cached service UUIDs are mapped to
 * capabilities. Without one, the usual link-layer capabilities are reported
 * with available=false and marked unverified. Wake-on-LAN is always offered.
 */
class LinkLayerCheck {
public:
    LinkLayerCheck(backends::IBluetoothBackend *backend, std::chrono::milliseconds timeout)
        : backend_(backend), timeout_(timeout) {}

    std::vector<Capability> run(DeviceProfile &profile) const;

    // Capabilities implied by one GATT/SDP service UUID (empty if unknown)
    static std::vector<Capability> capabilities_for_uuid(const std::string &uuid);

    static std::vector<Capability> unverified_capabilities();

    static Capability wake_on_lan();

private:
    backends::IBluetoothBackend *backend_;
    std::chrono::milliseconds timeout_;
};

}  // namespace scan
}  // namespace sonar
