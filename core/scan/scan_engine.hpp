#pragma once

#include <string>
#include <vector>

#include "backends/bluetooth_backend.hpp"
#include "backends/camera_backend.hpp"
#include "external_scanner.hpp"
#include "fingerprint/registry.hpp"
#include "net/i_network.hpp"
#include "scan_options.hpp"
#include "types.hpp"

namespace sonar {
namespace scan {

// Optional collaborators; nullptr means "absent" and selects the fallback path
struct EngineBackends {
    IExternalScanner *scanner = nullptr;
    backends::IBluetoothBackend *bluetooth = nullptr;
    backends::ICameraBackend *camera = nullptr;
};

/**
 * @brief Entry point of the capability discovery pipeline.
 *
 * scan() dispatches on the requested method (or on the address kind for
 * "auto"), runs the matching checks and always returns a well-formed
 * envelope: invalid input and unexpected failures become status=ERROR.
 *
 * Thread-safety: scan() is const and keeps all per-request state on its own
 * stack, so concurrent scans need no coordination. The network layer and
 * backends must tolerate concurrent calls.
 */
class ScanEngine {
public:
    ScanEngine(EngineOptions options, net::INetwork &network, EngineBackends backends);
    ScanEngine(EngineOptions options, net::INetwork &network, EngineBackends backends,
               fingerprint::FingerprinterRegistry registry);

    ScanEngine(const ScanEngine &) = delete;
    ScanEngine &operator=(const ScanEngine &) = delete;

    ScanResult scan(const ScanRequest &request) const;

    const EngineOptions &options() const { return options_; }
    const EngineBackends &backends() const { return backends_; }

    // Family selected by "auto" for an address kind
    static ScanMethod method_for_kind(AddressKind kind);

private:
    std::vector<Capability> scan_address(const std::string &host, DeviceProfile &profile) const;

    EngineOptions options_;
    net::INetwork &network_;
    EngineBackends backends_;
    fingerprint::FingerprinterRegistry registry_;
};

}  // namespace scan
}  // namespace sonar
