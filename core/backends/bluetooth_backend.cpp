#include "bluetooth_backend.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "logging/logger.hpp"

namespace sonar {
namespace backends {

namespace {

std::string trim(const std::string &s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string normalize_mac(std::string mac) {
    std::replace(mac.begin(), mac.end(), '-', ':');
    std::transform(mac.begin(), mac.end(), mac.begin(), [](unsigned char c) { return std::toupper(c); });
    return mac;
}

}  // namespace

std::optional<BluetoothDeviceInfo> BluezBluetoothBackend::query(const std::string &mac,
                                                                std::chrono::milliseconds timeout) {
    process::ProcessOutput output;
    std::string error;
    if (!runner_.run(bluetoothctl_, {"info", normalize_mac(mac)}, timeout, output, error)) {
        LOG_WARN("[Bluetooth] bluetoothctl failed: " << error);
        return std::nullopt;
    }
    if (output.exit_code != 0) {
        LOG_DEBUG("[Bluetooth] Device " << mac << " not known to the adapter");
        return std::nullopt;
    }
    return parse_info(output.stdout_data);
}

std::optional<BluetoothDeviceInfo> BluezBluetoothBackend::parse_info(const std::string &output) {
    std::istringstream lines(output);
    std::string line;
    std::optional<BluetoothDeviceInfo> info;

    while (std::getline(lines, line)) {
        // Device AA:BB:CC:DD:EE:FF (public)
        if (line.rfind("Device ", 0) == 0) {
            if (line.find("not available") != std::string::npos) {
                return std::nullopt;
            }
            info.emplace();
            std::istringstream words(line.substr(7));
            words >> info->address;
            continue;
        }
        if (!info) {
            continue;
        }

        const std::string entry = trim(line);
        const auto colon = entry.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        const std::string key = entry.substr(0, colon);
        const std::string value = trim(entry.substr(colon + 1));

        if (key == "Name") {
            info->name = value;
        } else if (key == "Class") {
            info->device_class = value;
        } else if (key == "Icon") {
            info->icon = value;
        } else if (key == "Paired") {
            info->paired = value == "yes";
        } else if (key == "Connected") {
            info->connected = value == "yes";
        } else if (key == "RSSI") {
            // "RSSI: -60" or "RSSI: 0xffffffc4 (-60)"
            const auto paren = value.find('(');
            const std::string number = paren == std::string::npos ? value : value.substr(paren + 1);
            try {
                info->rssi = std::stoi(number);
            } catch (const std::exception &e) {
                LOG_DEBUG("[Bluetooth] Unparsable RSSI '" << value << "': " << e.what());
            }
        } else if (key == "UUID") {
            // UUID: Audio Sink                (0000110b-0000-1000-8000-00805f9b34fb)
            const auto open = value.rfind('(');
            const auto close = value.rfind(')');
            if (open == std::string::npos || close == std::string::npos || close < open) {
                continue;
            }
            BluetoothService service;
            service.label = trim(value.substr(0, open));
            service.uuid = value.substr(open + 1, close - open - 1);
            std::transform(service.uuid.begin(), service.uuid.end(), service.uuid.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            info->services.push_back(service);
        }
    }
    return info;
}

}  // namespace backends
}  // namespace sonar
