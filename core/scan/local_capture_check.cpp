#include "local_capture_check.hpp"

#include "capability_catalog.hpp"
#include "logging/logger.hpp"

namespace sonar {
namespace scan {

namespace {

Capability capture_capability(const std::string &name, const std::string &description, const std::string &operation,
                              const std::string &url, bool available) {
    Capability cap = plain_capability(name, description, operation, available);
    cap.protocol = "v4l2";
    if (!url.empty()) {
        cap.url = url;
    }
    return cap;
}

}  // namespace

std::vector<Capability> LocalCaptureCheck::unverified_capabilities(const char *reason) {
    const std::string suffix = std::string(" (") + reason + ")";
    return {capture_capability("Camera capture", "Capture frames from the local camera" + suffix, "capture_frame", "",
                               false),
            capture_capability("Video stream", "Stream video from the local camera" + suffix, "stream_video", "",
                               false)};
}

std::vector<Capability> LocalCaptureCheck::run(DeviceProfile &profile) const {
    profile.protocols_seen.insert("local-capture");

    auto path = backends::capture_device_path(profile.address);
    if (!path) {
        LOG_WARN("[LocalCapture] Cannot map handle '" << profile.address << "' to a capture device");
        profile.status = DeviceStatus::UNKNOWN;
        return unverified_capabilities("unverified");
    }
    profile.metadata["device_path"] = *path;

    if (backend_ == nullptr) {
        profile.metadata["camera_backend"] = "absent";
        return unverified_capabilities("unverified");
    }
    profile.metadata["camera_backend"] = backend_->name();

    std::string error;
    auto info = backend_->query(*path, error);
    if (!info) {
        LOG_WARN("[LocalCapture] " << error);
        profile.status = DeviceStatus::OFFLINE;
        profile.metadata["error"] = error;
        return unverified_capabilities("device unavailable");
    }

    profile.status = DeviceStatus::ONLINE;
    profile.protocols_seen.insert("v4l2");
    profile.metadata["driver"] = info->driver;
    profile.metadata["card"] = info->card;
    profile.metadata["bus_info"] = info->bus_info;
    profile.metadata["driver_version"] = info->driver_version;
    if (info->video_capture) {
        profile.archetype = archetype_to_string(Archetype::CAMERA);
    }

    const std::string url = "file://" + *path;
    std::vector<Capability> caps;
    caps.push_back(capture_capability("Camera capture", "Capture frames from the local camera", "capture_frame", url,
                                      info->video_capture));
    caps.push_back(capture_capability("Video stream", "Stream video from the local camera", "stream_video", url,
                                      info->video_capture && info->streaming));
    if (info->video_capture) {
        caps.push_back(capture_capability(catalog::kLiveView.name, catalog::kLiveView.description, "live_view", url,
                                          true));
    }
    LOG_INFO("[LocalCapture] " << *path << ": " << info->card);
    return caps;
}

}  // namespace scan
}  // namespace sonar
