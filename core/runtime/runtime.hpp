#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "backends/bluetooth_backend.hpp"
#include "backends/camera_backend.hpp"
#include "config.hpp"
#include "http/server.hpp"
#include "net/posix_network.hpp"
#include "process/process_runner.hpp"
#include "scan/nmap_scanner.hpp"
#include "scan/scan_engine.hpp"

namespace sonar {
namespace runtime {

/**
 * @brief Owns the production object graph
 *
 * Network layer, subprocess runner, optional backends, the scan engine and
 * the HTTP adapter. Backends that the config asks for but the host cannot
 * provide are left out, which selects the engine's fallback path for them.
 */
class Runtime {
public:
    explicit Runtime(const RuntimeConfig &config);
    ~Runtime();

    Runtime(const Runtime &) = delete;
    Runtime &operator=(const Runtime &) = delete;

    // Build backends and engine; start HTTP when start_http is set and enabled in config
    bool initialize(std::string &error, bool start_http = true);

    // Main loop (blocking) until stop() or a shutdown signal
    void run();

    void stop() { running_ = false; }

    void shutdown();

    const scan::ScanEngine &engine() const { return *engine_; }

private:
    bool init_backends(std::string &error);
    bool init_http(std::string &error);
    void log_available_modules() const;

    RuntimeConfig config_;

    net::PosixNetwork network_;
    process::ProcessRunner process_runner_;
    std::unique_ptr<scan::NmapScanner> nmap_scanner_;
    std::unique_ptr<backends::BluezBluetoothBackend> bluetooth_backend_;
    std::unique_ptr<backends::V4l2CameraBackend> camera_backend_;
    std::unique_ptr<scan::ScanEngine> engine_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace sonar
