#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace sonar {
namespace scan {

enum class AddressKind { LINK_LAYER, IP_LITERAL, LOCAL_HANDLE, UNKNOWN };

/**
 * @brief Raw address string paired with its classified kind.
 *
 * Immutable once constructed.
 */
class DeviceAddress {
public:
    DeviceAddress(std::string raw, AddressKind kind) : raw_(std::move(raw)), kind_(kind) {}

    const std::string &raw() const { return raw_; }
    AddressKind kind() const { return kind_; }

private:
    std::string raw_;
    AddressKind kind_;
};

enum class Transport { TCP, UDP };

// One attempt against (address, port, transport). Evidence only, never mutated.
struct ProbeResult {
    uint16_t port = 0;
    Transport protocol = Transport::TCP;
    bool open = false;
    std::optional<uint32_t> latency_ms;
    std::optional<std::string> banner;
};

/**
 * @brief A user-meaningful operation the device appears to support.
 *
 * Identity for deduplication is (name, description) only.
 */
struct Capability {
    std::string name;
    std::string description;
    bool available = true;
    std::optional<std::string> protocol;
    std::optional<uint16_t> port;
    std::optional<std::string> operation;
    std::optional<std::string> url;

    bool same_identity(const Capability &other) const {
        return name == other.name && description == other.description;
    }
};

struct ServiceDescriptor {
    uint16_t port = 0;
    Transport transport = Transport::TCP;
    std::string service_name;
    std::optional<std::string> version_hint;
    std::map<std::string, std::string> details;
    std::vector<Capability> operations;
};

// Declaration order is the tie-break priority order
enum class Archetype { ROUTER, PRINTER, CAMERA, STORAGE, WORKSTATION, SERVER, EMBEDDED, MEDIA };

constexpr size_t kArchetypeCount = 8;

constexpr std::array<Archetype, kArchetypeCount> kArchetypePriority = {
    Archetype::ROUTER,      Archetype::PRINTER, Archetype::CAMERA,   Archetype::STORAGE,
    Archetype::WORKSTATION, Archetype::SERVER,  Archetype::EMBEDDED, Archetype::MEDIA};

enum class DeviceStatus { UNKNOWN, ONLINE, OFFLINE };

struct DeviceProfile {
    std::string address;
    AddressKind kind = AddressKind::UNKNOWN;
    std::string declared_type;
    DeviceStatus status = DeviceStatus::UNKNOWN;
    std::optional<uint32_t> latency_ms;
    std::set<uint16_t> open_ports;
    std::vector<ServiceDescriptor> services;
    std::optional<std::string> archetype;
    std::optional<std::string> signal_strength;
    std::set<std::string> protocols_seen;
    std::map<std::string, std::string> metadata;
    bool partial = false;  // Deadline cut the scan short
};

enum class ScanStatus { SUCCESS, ERROR };

// Why a scan ended in ScanStatus::ERROR
enum class ScanErrorKind { INVALID_INPUT, INTERNAL };

struct ScanResult {
    ScanStatus status = ScanStatus::SUCCESS;
    std::vector<Capability> capabilities;
    DeviceProfile device_info;
    std::optional<std::string> error;
    std::optional<ScanErrorKind> error_kind;
    std::optional<std::string> request_id;
};

enum class ScanMethod { AUTO, LINK_LAYER, ADDRESS_BASED, LOCAL_CAPTURE };

struct ScanRequest {
    std::string address;
    std::string declared_type;
    std::string method = "auto";
    std::string id;
    std::string signal_strength;
};

const char *address_kind_to_string(AddressKind kind);
const char *transport_to_string(Transport transport);
const char *archetype_to_string(Archetype archetype);
std::optional<Archetype> archetype_from_string(const std::string &name);
const char *device_status_to_string(DeviceStatus status);
const char *scan_method_to_string(ScanMethod method);
std::optional<ScanMethod> scan_method_from_string(const std::string &name);

// Capability bound to a network service on the device
Capability service_capability(const std::string &name, const std::string &description, const std::string &protocol,
                              uint16_t port, const std::string &operation, const std::string &url = "");

// Capability with no port binding (archetype templates, fallbacks)
Capability plain_capability(const std::string &name, const std::string &description, const std::string &operation,
                            bool available = true);

// scheme://host:port/path with IPv6 literals bracketed
std::string format_url(const std::string &scheme, const std::string &host, uint16_t port, const std::string &path = "/");

}  // namespace scan
}  // namespace sonar
