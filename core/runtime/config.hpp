#pragma once

#include <string>
#include <vector>

#include "scan/scan_options.hpp"

namespace sonar {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct HttpConfig {
    bool enabled = true;                                 // HTTP server enabled
    std::string bind = "127.0.0.1";                      // Bind address
    int port = 8080;                                     // HTTP port
    std::vector<std::string> cors_allowed_origins{"*"};  // CORS allowlist ("*" = allow all)
    bool cors_allow_credentials = false;                 // Whether to emit Access-Control-Allow-Credentials
    int thread_pool_size = 8;                            // Concurrent requests (each scan holds one thread)
};

// Which optional collaborators the runtime wires into the engine
struct BackendsConfig {
    std::string scanner = "auto";  // auto | nmap | none
    std::string nmap_path;         // empty = search PATH
    std::string bluetooth = "present";
    std::string bluetoothctl_path;  // empty = search PATH
    std::string camera = "present";
};

struct RuntimeConfig {
    HttpConfig http;
    scan::EngineOptions engine;  // scan: and discovery: sections
    BackendsConfig backends;
    LoggingConfig logging;
};

// Loads configuration from a YAML file
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Parses configuration from YAML text (used by load_config and tests)
bool parse_config(const std::string &yaml_text, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace sonar
