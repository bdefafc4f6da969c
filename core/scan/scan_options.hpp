#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sonar {
namespace scan {

inline std::vector<uint16_t> default_tcp_ports() {
    return {21,   22,   23,   25,   53,   80,   139,  443,  445,  515,  548,   554,   631,  1883,
            3389, 5000, 5001, 5900, 8000, 8008, 8080, 8443, 8554, 8883, 9100, 32400, 49152};
}

inline std::vector<uint16_t> default_udp_ports() { return {53, 161}; }

// Timing and port-set knobs for one scan
struct ScanOptions {
    std::vector<uint16_t> tcp_ports = default_tcp_ports();
    std::vector<uint16_t> udp_ports = default_udp_ports();
    int connect_timeout_ms = 1000;
    int probe_timeout_ms = 2000;
    int ping_timeout_ms = 1500;
    int ping_retries = 1;
    int deadline_ms = 12000;
    int worker_pool_size = 16;
    size_t http_body_limit = 4096;
    int banner_window_ms = 1500;
};

struct DiscoveryOptions {
    bool enabled = true;
    bool ssdp = true;
    bool mdns = true;
    bool wsd = true;
    int timeout_ms = 1500;
};

// Explicit engine configuration, fixed at construction
struct EngineOptions {
    ScanOptions scan;
    DiscoveryOptions discovery;
};

}  // namespace scan
}  // namespace sonar
