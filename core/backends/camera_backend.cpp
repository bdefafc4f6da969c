#include "camera_backend.hpp"

#include <fcntl.h>
#include <linux/videodev2.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstring>

#include "logging/logger.hpp"

namespace sonar {
namespace backends {

namespace {
constexpr const char *kVideoPrefix = "/dev/video";
constexpr size_t kCamPrefixLength = 4;  // "CAM:"

std::string from_fixed(const unsigned char *data, size_t size) {
    const auto *text = reinterpret_cast<const char *>(data);
    return std::string(text, strnlen(text, size));
}
}  // namespace

std::optional<std::string> capture_device_path(const std::string &handle) {
    if (handle.rfind(kVideoPrefix, 0) == 0) {
        return handle;
    }
    if (handle.size() <= kCamPrefixLength) {
        return std::nullopt;
    }

    size_t end = kCamPrefixLength;
    while (end < handle.size() && std::isdigit(static_cast<unsigned char>(handle[end]))) {
        ++end;
    }
    if (end == kCamPrefixLength || end - kCamPrefixLength > 3) {
        return std::nullopt;
    }
    const int index = std::stoi(handle.substr(kCamPrefixLength, end - kCamPrefixLength));
    return std::string(kVideoPrefix) + std::to_string(index);
}

std::optional<CameraInfo> V4l2CameraBackend::query(const std::string &device_path, std::string &error) {
    const int fd = ::open(device_path.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC);
    if (fd < 0) {
        error = "Cannot open " + device_path + ": " + std::strerror(errno);
        return std::nullopt;
    }

    v4l2_capability caps{};
    const int rc = ::ioctl(fd, VIDIOC_QUERYCAP, &caps);
    const int saved_errno = errno;
    ::close(fd);
    if (rc != 0) {
        error = "VIDIOC_QUERYCAP failed on " + device_path + ": " + std::strerror(saved_errno);
        return std::nullopt;
    }

    // device_caps describes this node when the driver fills it
    const uint32_t node_caps = (caps.capabilities & V4L2_CAP_DEVICE_CAPS) != 0 ? caps.device_caps : caps.capabilities;

    CameraInfo info;
    info.device_path = device_path;
    info.driver = from_fixed(caps.driver, sizeof(caps.driver));
    info.card = from_fixed(caps.card, sizeof(caps.card));
    info.bus_info = from_fixed(caps.bus_info, sizeof(caps.bus_info));
    info.driver_version = std::to_string((caps.version >> 16) & 0xFF) + "." + std::to_string((caps.version >> 8) & 0xFF) +
                          "." + std::to_string(caps.version & 0xFF);
    info.video_capture = (node_caps & (V4L2_CAP_VIDEO_CAPTURE | V4L2_CAP_VIDEO_CAPTURE_MPLANE)) != 0;
    info.streaming = (node_caps & V4L2_CAP_STREAMING) != 0;
    info.read_write = (node_caps & V4L2_CAP_READWRITE) != 0;

    LOG_DEBUG("[Camera] " << device_path << ": " << info.card << " (" << info.driver << ")");
    return info;
}

}  // namespace backends
}  // namespace sonar
