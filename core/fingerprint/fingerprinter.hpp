#pragma once

#include <optional>
#include <string>

#include "net/i_network.hpp"
#include "scan/scan_options.hpp"
#include "scan/types.hpp"

namespace sonar {
namespace fingerprint {

// Everything a fingerprinter may use for one (host, port) attempt
struct FingerprintContext {
    const std::string &host;
    const scan::ProbeResult &probe;
    net::INetwork &network;
    const net::Deadline &deadline;
    const scan::ScanOptions &options;

    std::chrono::milliseconds probe_timeout() const { return std::chrono::milliseconds(options.probe_timeout_ms); }
    std::chrono::milliseconds banner_window() const { return std::chrono::milliseconds(options.banner_window_ms); }
};

/**
 * @brief Confirms one protocol on an open port with a minimal handshake.
 *
 * probe() returns nullopt when the service is not confirmed: timeouts,
 * refusals and malformed replies are all "no match", never errors.
 * Implementations hold no per-call state and never retry.
 */
class IFingerprinter {
public:
    virtual ~IFingerprinter() = default;

    virtual std::string name() const = 0;
    virtual std::optional<scan::ServiceDescriptor> probe(const FingerprintContext &ctx) const = 0;
};

}  // namespace fingerprint
}  // namespace sonar
