// sonar
// Capability discovery service: HTTP mode by default, one-shot scan with --scan

#include <filesystem>
#include <iostream>
#include <string>

#include "http/json.hpp"
#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"

namespace {

void print_usage() {
    std::cerr << "Usage: sonar [OPTIONS]\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config=PATH    Path to config file (default: sonar.yaml, optional)\n";
    std::cerr << "  --scan ADDRESS   Scan one address, print the result as JSON and exit\n";
    std::cerr << "  --method M       auto | link-layer | address-based | local-capture (with --scan)\n";
    std::cerr << "  --type T         Declared device type hint (with --scan)\n";
    std::cerr << "  --help, -h       Show this help\n";
}

}  // namespace

int main(int argc, char **argv) {
    // Parse CLI arguments
    std::string config_path = "sonar.yaml";  // Default
    bool config_explicit = false;
    bool one_shot = false;
    sonar::scan::ScanRequest request;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
            config_explicit = true;
        } else if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(9);
            config_explicit = true;
        } else if (arg == "--scan" && i + 1 < argc) {
            request.address = argv[++i];
            one_shot = true;
        } else if (arg == "--method" && i + 1 < argc) {
            request.method = argv[++i];
        } else if (arg == "--type" && i + 1 < argc) {
            request.declared_type = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    sonar::runtime::RuntimeConfig config;
    std::string error;

    // The default config file is optional; an explicit one must exist
    if (std::filesystem::exists(config_path)) {
        LOG_INFO("Loading config: " + config_path);
        if (!sonar::runtime::load_config(config_path, config, error)) {
            LOG_ERROR("Failed to load config: " + error);
            return 1;
        }
    } else if (config_explicit) {
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        return 1;
    } else {
        LOG_INFO("No " << config_path << " found, using defaults");
    }

    sonar::logging::Logger::set_level(sonar::logging::string_to_level(config.logging.level));

    sonar::runtime::Runtime runtime(config);

    if (one_shot) {
        if (!runtime.initialize(error, false)) {
            LOG_ERROR("Runtime initialization failed: " + error);
            return 1;
        }
        sonar::scan::ScanResult result = runtime.engine().scan(request);
        std::cout << sonar::http::encode_scan_result(result).dump(2) << std::endl;
        return result.status == sonar::scan::ScanStatus::SUCCESS ? 0 : 2;
    }

    sonar::runtime::SignalHandler::install();

    if (!runtime.initialize(error)) {
        LOG_ERROR("Runtime initialization failed: " + error);
        return 1;
    }

    LOG_INFO("sonar ready");

    // Run main loop (blocking)
    runtime.run();
    runtime.shutdown();

    LOG_INFO("Shutdown complete");
    return 0;
}
