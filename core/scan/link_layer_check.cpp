#include "link_layer_check.hpp"

#include <map>

#include "capability_catalog.hpp"
#include "capability_synthesizer.hpp"
#include "logging/logger.hpp"

namespace sonar {
namespace scan {

namespace {

constexpr const char *kBaseUuidSuffix = "-0000-1000-8000-00805f9b34fb";
constexpr const char *kUnverified = " (unverified)";

Capability bluetooth_capability(const std::string &name, const std::string &description,
                                const std::string &operation) {
    Capability cap = plain_capability(name, description, operation);
    cap.protocol = "bluetooth";
    return cap;
}

const std::map<std::string, std::vector<Capability>> &uuid_table() {
    static const std::map<std::string, std::vector<Capability>> table = {
        {"110b", {bluetooth_capability("Play audio", "Stream audio to the device", "a2dp_sink")}},
        {"110a", {bluetooth_capability("Receive audio", "Receive audio streamed from the device", "a2dp_source")}},
        {"110c", {bluetooth_capability("Media controls", "Control playback remotely", "avrcp")}},
        {"110e", {bluetooth_capability("Media controls", "Control playback remotely", "avrcp")}},
        {"1108", {bluetooth_capability("Hands-free calling", "Route calls through the device", "handsfree")}},
        {"111e", {bluetooth_capability("Hands-free calling", "Route calls through the device", "handsfree")}},
        {"1105", {bluetooth_capability("Send files", "Push files to the device over OBEX", "obex_push")}},
        {"1106", {bluetooth_capability("Browse files", "Browse the device's files over OBEX", "obex_ftp")}},
        {"1101", {bluetooth_capability("Serial connection", "Open a serial port over RFCOMM", "rfcomm")}},
        {"1124", {bluetooth_capability("Input device", "Use the device as a keyboard or pointer", "hid")}},
        {"1812", {bluetooth_capability("Input device", "Use the device as a keyboard or pointer", "hid")}},
        {"180f", {bluetooth_capability("Battery level", "Read the battery level", "read_battery")}},
        {"180a", {bluetooth_capability("Device information", "Read manufacturer and model details", "read_info")}},
        {"180d", {bluetooth_capability("Heart rate", "Read heart rate measurements", "read_heart_rate")}},
        {"1809", {bluetooth_capability("Temperature", "Read temperature measurements", "read_temperature")}},
    };
    return table;
}

}  // namespace

Capability LinkLayerCheck::wake_on_lan() {
    Capability cap = plain_capability(catalog::kWakeDevice.name, catalog::kWakeDevice.description, "wake");
    cap.protocol = "wol";
    return cap;
}

std::vector<Capability> LinkLayerCheck::capabilities_for_uuid(const std::string &uuid) {
    std::string key = uuid;
    const std::string suffix = kBaseUuidSuffix;
    if (uuid.size() == 36 && uuid.compare(0, 4, "0000") == 0 && uuid.compare(8, suffix.size(), suffix) == 0) {
        key = uuid.substr(4, 4);
    }
    auto it = uuid_table().find(key);
    return it == uuid_table().end() ? std::vector<Capability>{} : it->second;
}

std::vector<Capability> LinkLayerCheck::unverified_capabilities() {
    std::vector<Capability> caps = {
        bluetooth_capability("Bluetooth connection", "Connect to the device over Bluetooth", "bt_connect"),
        bluetooth_capability("Play audio", "Stream audio to the device", "a2dp_sink"),
        bluetooth_capability("Send files", "Push files to the device over OBEX", "obex_push"),
        bluetooth_capability("Device information", "Read manufacturer and model details", "read_info"),
    };
    for (auto &cap : caps) {
        cap.description += kUnverified;
        cap.available = false;
    }
    return caps;
}

std::vector<Capability> LinkLayerCheck::run(DeviceProfile &profile) const {
    std::vector<Capability> caps;
    profile.protocols_seen.insert("link-layer");

    if (backend_ == nullptr) {
        profile.metadata["bluetooth_backend"] = "absent";
        caps = unverified_capabilities();
        caps.push_back(wake_on_lan());
        return caps;
    }

    profile.metadata["bluetooth_backend"] = backend_->name();
    auto info = backend_->query(profile.address, timeout_);
    if (!info) {
        LOG_INFO("[LinkLayer] " << profile.address << " not known to the Bluetooth adapter");
        profile.metadata["bluetooth"] = "not found";
        caps = unverified_capabilities();
        caps.push_back(wake_on_lan());
        return caps;
    }

    profile.protocols_seen.insert("bluetooth");
    if (!info->name.empty()) {
        profile.metadata["name"] = info->name;
    }
    if (!info->device_class.empty()) {
        profile.metadata["class"] = info->device_class;
    }
    if (!info->icon.empty()) {
        profile.metadata["icon"] = info->icon;
    }
    profile.metadata["paired"] = info->paired ? "true" : "false";
    profile.metadata["connected"] = info->connected ? "true" : "false";
    if (info->rssi) {
        profile.signal_strength = std::to_string(*info->rssi) + " dBm";
    }
    profile.status = (info->connected || info->rssi) ? DeviceStatus::ONLINE : DeviceStatus::UNKNOWN;

    Capability connect = bluetooth_capability("Bluetooth connection", "Connect to the device over Bluetooth",
                                              "bt_connect");
    caps.push_back(connect);
    for (const auto &service : info->services) {
        auto mapped = capabilities_for_uuid(service.uuid);
        caps.insert(caps.end(), mapped.begin(), mapped.end());
    }
    caps.push_back(wake_on_lan());

    LOG_INFO("[LinkLayer] " << profile.address << ": " << info->services.size() << " services advertised");
    return CapabilitySynthesizer::dedupe(caps);
}

}  // namespace scan
}  // namespace sonar
