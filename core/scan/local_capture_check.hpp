#pragma once

#include <vector>

#include "backends/camera_backend.hpp"
#include "types.hpp"

namespace sonar {
namespace scan {

/**
 * @brief Capability check for local capture handles (CAM:NN, /dev/videoN).
 *
 * With a camera backend the node is queried for driver details and capture
 * modes. Without one, or when the node cannot be opened, capture
 * capabilities are reported with available=false.
 */
class LocalCaptureCheck {
public:
    explicit LocalCaptureCheck(backends::ICameraBackend *backend) : backend_(backend) {}

    std::vector<Capability> run(DeviceProfile &profile) const;

    static std::vector<Capability> unverified_capabilities(const char *reason);

private:
    backends::ICameraBackend *backend_;
};

}  // namespace scan
}  // namespace sonar
