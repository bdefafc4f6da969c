#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace sonar {
namespace backends {

struct CameraInfo {
    std::string device_path;
    std::string driver;
    std::string card;
    std::string bus_info;
    std::string driver_version;
    bool video_capture = false;
    bool streaming = false;
    bool read_write = false;
};

// Local capture device inspection
class ICameraBackend {
public:
    virtual ~ICameraBackend() = default;

    virtual std::string name() const = 0;

    // nullopt (with error set) when the device cannot be opened or queried
    virtual std::optional<CameraInfo> query(const std::string &device_path, std::string &error) = 0;
};

// VIDIOC_QUERYCAP against /dev/videoN
class V4l2CameraBackend : public ICameraBackend {
public:
    std::string name() const override { return "v4l2"; }
    std::optional<CameraInfo> query(const std::string &device_path, std::string &error) override;
};

// "/dev/video2" stays as is; "CAM:02:<anything>" maps to /dev/video2
std::optional<std::string> capture_device_path(const std::string &handle);

}  // namespace backends
}  // namespace sonar
