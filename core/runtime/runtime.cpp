#include "runtime.hpp"

#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace sonar {
namespace runtime {

Runtime::Runtime(const RuntimeConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error, bool start_http) {
    LOG_INFO("[Runtime] Initializing sonar");

    if (!init_backends(error)) {
        return false;
    }

    scan::EngineBackends wired;
    wired.scanner = nmap_scanner_.get();
    wired.bluetooth = bluetooth_backend_.get();
    wired.camera = camera_backend_.get();
    engine_ = std::make_unique<scan::ScanEngine>(config_.engine, network_, wired);

    log_available_modules();

    if (start_http && !init_http(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_backends(std::string &) {
    const auto &cfg = config_.backends;

    if (cfg.scanner != "none") {
        std::string path = cfg.nmap_path;
        if (path.empty()) {
            path = process::ProcessRunner::find_executable("nmap").value_or("");
        }
        if (!path.empty()) {
            auto scanner = std::make_unique<scan::NmapScanner>(process_runner_, path);
            if (scanner->available()) {
                nmap_scanner_ = std::move(scanner);
            }
        }
        if (!nmap_scanner_) {
            if (cfg.scanner == "nmap") {
                LOG_WARN("[Runtime] backends.scanner=nmap but nmap is not executable; using connect scan");
            } else {
                LOG_INFO("[Runtime] nmap not found; using connect scan");
            }
        }
    }

    if (cfg.bluetooth == "present") {
        const std::string tool = cfg.bluetoothctl_path.empty() ? "bluetoothctl" : cfg.bluetoothctl_path;
        auto backend = std::make_unique<backends::BluezBluetoothBackend>(process_runner_, tool);
        if (backend->available()) {
            bluetooth_backend_ = std::move(backend);
        } else {
            LOG_WARN("[Runtime] " << tool << " not found; link-layer capabilities will be unverified");
        }
    }

    if (cfg.camera == "present") {
        camera_backend_ = std::make_unique<backends::V4l2CameraBackend>();
    }

    return true;
}

bool Runtime::init_http(std::string &error) {
    if (!config_.http.enabled) {
        LOG_INFO("[Runtime] HTTP server disabled in config");
        return true;
    }

    http_server_ = std::make_unique<http::HttpServer>(config_.http, *engine_);
    if (!http_server_->start(error)) {
        error = "HTTP server failed to start: " + error;
        return false;
    }
    return true;
}

void Runtime::log_available_modules() const {
    LOG_INFO("[Runtime] Available modules:");
    LOG_INFO("[Runtime]   port scanner:  " << (nmap_scanner_ ? "nmap" : "connect scan"));
    LOG_INFO("[Runtime]   bluetooth:     " << (bluetooth_backend_ ? bluetooth_backend_->name() : "unavailable"));
    LOG_INFO("[Runtime]   camera:        " << (camera_backend_ ? camera_backend_->name() : "unavailable"));
    LOG_INFO("[Runtime]   discovery:     " << (config_.engine.discovery.enabled ? "enabled" : "disabled"));
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    while (running_) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal " << SignalHandler::received_signal() << " received, stopping...");
            running_ = false;
            break;
        }
    }

    LOG_INFO("[Runtime] Shutting down");
}

void Runtime::shutdown() {
    if (http_server_) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
        http_server_.reset();
    }
}

}  // namespace runtime
}  // namespace sonar
