#include <chrono>

#include "../../logging/logger.hpp"
#include "../server.hpp"
#include "utils.hpp"

#ifndef SONAR_VERSION
#define SONAR_VERSION "0.0.0"
#endif

namespace sonar {
namespace http {

//=============================================================================
// GET /v0/runtime/status
//=============================================================================
void HttpServer::handle_get_runtime_status(const httplib::Request &, httplib::Response &res) {
    auto now = std::chrono::steady_clock::now();
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - started_at_).count();

    const auto &backends = engine_.backends();
    const auto &options = engine_.options();

    nlohmann::json scanner = {{"present", backends.scanner != nullptr}};
    if (backends.scanner != nullptr) {
        scanner["name"] = backends.scanner->name();
        scanner["available"] = backends.scanner->available();
    }
    nlohmann::json bluetooth = {{"present", backends.bluetooth != nullptr}};
    if (backends.bluetooth != nullptr) {
        bluetooth["name"] = backends.bluetooth->name();
    }
    nlohmann::json camera = {{"present", backends.camera != nullptr}};
    if (backends.camera != nullptr) {
        camera["name"] = backends.camera->name();
    }

    nlohmann::json response = {{"status", "ok"},
                               {"version", SONAR_VERSION},
                               {"uptime_seconds", uptime},
                               {"scans_served", scans_served_.load()},
                               {"deadline_ms", options.scan.deadline_ms},
                               {"discovery_enabled", options.discovery.enabled},
                               {"backends", {{"scanner", scanner}, {"bluetooth", bluetooth}, {"camera", camera}}}};

    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace sonar
