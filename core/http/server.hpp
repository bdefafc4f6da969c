#pragma once

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "runtime/config.hpp"
#include "scan/scan_engine.hpp"

namespace sonar {
namespace http {

/**
 * @brief HTTP adapter exposing the scan engine over REST
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool, so several scans may
 *   be in flight at once; ScanEngine::scan() is const and re-entrant
 *
 * Lifecycle:
 * - start() binds to configured port and spawns server thread
 * - stop() signals shutdown and joins server thread
 *
 * Endpoints (v0):
 * - GET     /v0/scan            -> handle_get_scan           (handlers/scan_handlers.cpp)
 * - GET     /v0/runtime/status  -> handle_get_runtime_status (handlers/system_handlers.cpp)
 * - OPTIONS /v0/*               -> CORS preflight
 *
 * /v0/scan answers with the scan envelope: 200 for status "success", 400 when
 * the request was rejected (missing address, unsupported method), 500 when
 * the scan itself failed.
 */
class HttpServer {
public:
    HttpServer(const runtime::HttpConfig &config, const scan::ScanEngine &engine);
    ~HttpServer();

    HttpServer(const HttpServer &) = delete;
    HttpServer &operator=(const HttpServer &) = delete;

    /**
     * @brief Bind to the configured address/port and start the server thread
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string &error);

    // Safe to call multiple times
    void stop();

    bool is_running() const { return running_.load(); }
    int get_port() const { return port_; }
    uint64_t scans_served() const { return scans_served_.load(); }

private:
    void install_cors();
    void install_error_handlers();
    void setup_routes();

    // Route handlers (handlers/*.cpp)
    void handle_get_scan(const httplib::Request &req, httplib::Response &res);
    void handle_get_runtime_status(const httplib::Request &req, httplib::Response &res);

    runtime::HttpConfig config_;
    int port_ = 0;

    const scan::ScanEngine &engine_;
    const std::chrono::steady_clock::time_point started_at_;
    std::atomic<uint64_t> scans_served_{0};

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};
};

}  // namespace http
}  // namespace sonar
