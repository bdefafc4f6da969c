#pragma once

#include <vector>

#include "types.hpp"

namespace sonar {
namespace scan {

/**
 * @brief Builds the final capability list for a scanned device.
 *
 * Order: service operations (in service order), then the archetype template,
 * then discovery-protocol capabilities, then universal fallbacks. The result
 * holds one entry per (name, description); the first one seen wins.
 */
class CapabilitySynthesizer {
public:
    static std::vector<Capability> synthesize(const DeviceProfile &profile,
                                              const std::vector<Capability> &discovery_capabilities);

    static std::vector<Capability> archetype_template(Archetype archetype);

    // Capabilities for a device that did not answer
    static std::vector<Capability> offline_capabilities();

    // Stable, order-preserving dedup on (name, description)
    static std::vector<Capability> dedupe(const std::vector<Capability> &capabilities);
};

}  // namespace scan
}  // namespace sonar
