#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "process/process_runner.hpp"

namespace sonar {
namespace backends {

struct BluetoothService {
    std::string uuid;  // full 128-bit form, lowercase
    std::string label;
};

struct BluetoothDeviceInfo {
    std::string address;
    std::string name;
    std::string device_class;
    std::string icon;
    bool paired = false;
    bool connected = false;
    std::optional<int> rssi;
    std::vector<BluetoothService> services;
};

// Link-layer lookup of a Bluetooth device by MAC address
class IBluetoothBackend {
public:
    virtual ~IBluetoothBackend() = default;

    virtual std::string name() const = 0;

    // nullopt when the adapter does not know the device or the lookup failed
    virtual std::optional<BluetoothDeviceInfo> query(const std::string &mac, std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief BlueZ backend driving `bluetoothctl info <mac>`.
 *
 * Reports what the local adapter has cached for the device, including the
 * service UUIDs resolved during its last connection.
 */
class BluezBluetoothBackend : public IBluetoothBackend {
public:
    BluezBluetoothBackend(process::ProcessRunner &runner, std::string bluetoothctl = "bluetoothctl")
        : runner_(runner), bluetoothctl_(std::move(bluetoothctl)) {}

    std::string name() const override { return "bluez"; }
    std::optional<BluetoothDeviceInfo> query(const std::string &mac, std::chrono::milliseconds timeout) override;

    bool available() const { return process::ProcessRunner::find_executable(bluetoothctl_).has_value(); }

    static std::optional<BluetoothDeviceInfo> parse_info(const std::string &output);

private:
    process::ProcessRunner &runner_;
    std::string bluetoothctl_;
};

}  // namespace backends
}  // namespace sonar
