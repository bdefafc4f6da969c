#pragma once

#include <nlohmann/json.hpp>

#include "scan/types.hpp"

namespace sonar {
namespace http {

/**
 * @brief JSON encoding for scan results
 *
 * Field names are snake_case. Optional fields are omitted when unset rather
 * than emitted as null, except device_type which reads "unknown" when no
 * archetype scored.
 */
nlohmann::json encode_capability(const scan::Capability &capability);
nlohmann::json encode_capabilities(const std::vector<scan::Capability> &capabilities);
nlohmann::json encode_service(const scan::ServiceDescriptor &service);
nlohmann::json encode_device_profile(const scan::DeviceProfile &profile);
nlohmann::json encode_scan_result(const scan::ScanResult &result);

}  // namespace http
}  // namespace sonar
