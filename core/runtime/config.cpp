#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <sstream>

#include "../logging/logger.hpp"

namespace sonar {
namespace runtime {

namespace {

bool is_one_of(const std::string &value, const std::vector<std::string> &allowed) {
    return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
}

void warn_unknown_keys(const YAML::Node &node, const std::string &section, const std::vector<std::string> &valid_keys) {
    if (!node.IsMap()) {
        return;
    }
    for (const auto &key_node : node) {
        std::string key = key_node.first.as<std::string>();
        if (!is_one_of(key, valid_keys)) {
            if (section.empty()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            } else {
                LOG_WARN("[Config] Unknown key '" << section << "." << key << "' (will be ignored)");
            }
        }
    }
}

// Port list as a YAML sequence of integers. Duplicates are dropped, first
// occurrence wins, so the probe order stays the order written.
bool load_port_list(const YAML::Node &node, const std::string &key, std::vector<uint16_t> &ports,
                    std::string &error) {
    if (!node.IsSequence()) {
        error = key + " must be a list of port numbers";
        return false;
    }
    ports.clear();
    for (const auto &item : node) {
        int port = item.as<int>();
        if (port < 1 || port > 65535) {
            error = key + " contains invalid port " + std::to_string(port) + " (must be between 1 and 65535)";
            return false;
        }
        auto value = static_cast<uint16_t>(port);
        if (std::find(ports.begin(), ports.end(), value) != ports.end()) {
            LOG_WARN("[Config] Duplicate port " << port << " in " << key << " (ignored)");
            continue;
        }
        ports.push_back(value);
    }
    return true;
}

bool load_yaml(const YAML::Node &yaml, RuntimeConfig &config, std::string &error) {
    if (!yaml.IsMap()) {
        if (yaml.IsNull()) {
            return true;  // empty file: all defaults
        }
        error = "Config root must be a mapping";
        return false;
    }

    warn_unknown_keys(yaml, "", {"http", "scan", "backends", "discovery", "logging"});

    // Load HTTP config
    if (yaml["http"]) {
        const auto http = yaml["http"];
        warn_unknown_keys(http, "http",
                          {"enabled", "bind", "port", "cors_allowed_origins", "cors_allow_credentials",
                           "thread_pool_size"});
        if (http["enabled"]) {
            config.http.enabled = http["enabled"].as<bool>();
        }
        if (http["bind"]) {
            config.http.bind = http["bind"].as<std::string>();
        }
        if (http["port"]) {
            config.http.port = http["port"].as<int>();
        }

        // CORS allowlist (supports scalar or sequence)
        if (http["cors_allowed_origins"]) {
            const auto &origins_node = http["cors_allowed_origins"];
            config.http.cors_allowed_origins.clear();
            if (origins_node.IsSequence()) {
                for (const auto &origin : origins_node) {
                    config.http.cors_allowed_origins.push_back(origin.as<std::string>());
                }
            } else if (origins_node.IsScalar()) {
                config.http.cors_allowed_origins.push_back(origins_node.as<std::string>());
            }

            if (config.http.cors_allowed_origins.empty()) {
                config.http.cors_allowed_origins.push_back("*");
            }
        }
        if (http["cors_allow_credentials"]) {
            config.http.cors_allow_credentials = http["cors_allow_credentials"].as<bool>();
        }
        if (http["thread_pool_size"]) {
            config.http.thread_pool_size = http["thread_pool_size"].as<int>();
        }
    }

    // Load scan config
    if (yaml["scan"]) {
        const auto scan = yaml["scan"];
        auto &opts = config.engine.scan;
        warn_unknown_keys(scan, "scan",
                          {"tcp_ports", "udp_ports", "connect_timeout_ms", "probe_timeout_ms", "ping_timeout_ms",
                           "ping_retries", "deadline_ms", "worker_pool_size", "http_body_limit", "banner_window_ms"});
        if (scan["tcp_ports"] && !load_port_list(scan["tcp_ports"], "scan.tcp_ports", opts.tcp_ports, error)) {
            return false;
        }
        if (scan["udp_ports"] && !load_port_list(scan["udp_ports"], "scan.udp_ports", opts.udp_ports, error)) {
            return false;
        }
        if (scan["connect_timeout_ms"]) {
            opts.connect_timeout_ms = scan["connect_timeout_ms"].as<int>();
        }
        if (scan["probe_timeout_ms"]) {
            opts.probe_timeout_ms = scan["probe_timeout_ms"].as<int>();
        }
        if (scan["ping_timeout_ms"]) {
            opts.ping_timeout_ms = scan["ping_timeout_ms"].as<int>();
        }
        if (scan["ping_retries"]) {
            opts.ping_retries = scan["ping_retries"].as<int>();
        }
        if (scan["deadline_ms"]) {
            opts.deadline_ms = scan["deadline_ms"].as<int>();
        }
        if (scan["worker_pool_size"]) {
            opts.worker_pool_size = scan["worker_pool_size"].as<int>();
        }
        if (scan["http_body_limit"]) {
            int limit = scan["http_body_limit"].as<int>();
            if (limit < 1) {
                error = "scan.http_body_limit must be at least 1";
                return false;
            }
            opts.http_body_limit = static_cast<size_t>(limit);
        }
        if (scan["banner_window_ms"]) {
            opts.banner_window_ms = scan["banner_window_ms"].as<int>();
        }
    }

    // Load backends config
    if (yaml["backends"]) {
        const auto backends = yaml["backends"];
        warn_unknown_keys(backends, "backends", {"scanner", "nmap_path", "bluetooth", "bluetoothctl_path", "camera"});
        if (backends["scanner"]) {
            config.backends.scanner = backends["scanner"].as<std::string>();
        }
        if (backends["nmap_path"]) {
            config.backends.nmap_path = backends["nmap_path"].as<std::string>();
        }
        if (backends["bluetooth"]) {
            config.backends.bluetooth = backends["bluetooth"].as<std::string>();
        }
        if (backends["bluetoothctl_path"]) {
            config.backends.bluetoothctl_path = backends["bluetoothctl_path"].as<std::string>();
        }
        if (backends["camera"]) {
            config.backends.camera = backends["camera"].as<std::string>();
        }
    }

    // Load discovery config
    if (yaml["discovery"]) {
        const auto discovery = yaml["discovery"];
        auto &opts = config.engine.discovery;
        warn_unknown_keys(discovery, "discovery", {"enabled", "ssdp", "mdns", "wsd", "timeout_ms"});
        if (discovery["enabled"]) {
            opts.enabled = discovery["enabled"].as<bool>();
        }
        if (discovery["ssdp"]) {
            opts.ssdp = discovery["ssdp"].as<bool>();
        }
        if (discovery["mdns"]) {
            opts.mdns = discovery["mdns"].as<bool>();
        }
        if (discovery["wsd"]) {
            opts.wsd = discovery["wsd"].as<bool>();
        }
        if (discovery["timeout_ms"]) {
            opts.timeout_ms = discovery["timeout_ms"].as<int>();
        }
    }

    // Load logging config
    if (yaml["logging"]) {
        warn_unknown_keys(yaml["logging"], "logging", {"level"});
        if (yaml["logging"]["level"]) {
            config.logging.level = yaml["logging"]["level"].as<std::string>();
        }
    }

    return true;
}

void log_summary(const RuntimeConfig &config) {
    const auto &scan = config.engine.scan;
    std::stringstream http_msg;
    http_msg << "[Config] HTTP: " << (config.http.enabled ? "enabled" : "disabled");
    if (config.http.enabled) {
        http_msg << " (" << config.http.bind << ":" << config.http.port << ")";
    }
    LOG_INFO(http_msg.str());
    LOG_INFO("[Config] Scan: " << scan.tcp_ports.size() << " tcp port(s), " << scan.udp_ports.size()
                               << " udp port(s), deadline " << scan.deadline_ms << "ms, " << scan.worker_pool_size
                               << " worker(s)");
    LOG_INFO("[Config] Backends: scanner=" << config.backends.scanner << " bluetooth=" << config.backends.bluetooth
                                           << " camera=" << config.backends.camera);
    LOG_INFO("[Config] Discovery: " << (config.engine.discovery.enabled ? "enabled" : "disabled"));
    LOG_INFO("[Config] Log level: " << config.logging.level);
}

}  // namespace

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Validate HTTP settings
    if (config.http.enabled) {
        if (config.http.port < 1 || config.http.port > 65535) {
            error = "HTTP port must be between 1 and 65535";
            return false;
        }
        if (config.http.thread_pool_size < 1) {
            error = "HTTP thread_pool_size must be at least 1";
            return false;
        }
        if (config.http.cors_allowed_origins.empty()) {
            error = "http.cors_allowed_origins must not be empty";
            return false;
        }
    }

    // Validate scan settings
    const auto &scan = config.engine.scan;
    if (scan.tcp_ports.empty()) {
        error = "scan.tcp_ports must not be empty";
        return false;
    }
    if (scan.udp_ports.empty()) {
        error = "scan.udp_ports must not be empty";
        return false;
    }
    const std::vector<std::pair<const char *, int>> timeouts = {{"scan.connect_timeout_ms", scan.connect_timeout_ms},
                                                                {"scan.probe_timeout_ms", scan.probe_timeout_ms},
                                                                {"scan.ping_timeout_ms", scan.ping_timeout_ms},
                                                                {"scan.deadline_ms", scan.deadline_ms},
                                                                {"scan.banner_window_ms", scan.banner_window_ms},
                                                                {"discovery.timeout_ms",
                                                                 config.engine.discovery.timeout_ms}};
    for (const auto &[name, value] : timeouts) {
        if (value <= 0) {
            error = std::string(name) + " must be positive";
            return false;
        }
    }
    if (scan.ping_retries < 0 || scan.ping_retries > 1) {
        error = "scan.ping_retries must be 0 or 1";
        return false;
    }
    if (scan.worker_pool_size < 1) {
        error = "scan.worker_pool_size must be at least 1";
        return false;
    }
    if (scan.http_body_limit < 1) {
        error = "scan.http_body_limit must be at least 1";
        return false;
    }

    // Validate backend names
    if (!is_one_of(config.backends.scanner, {"auto", "nmap", "none"})) {
        error = "Invalid backends.scanner: '" + config.backends.scanner + "' (must be auto, nmap or none)";
        return false;
    }
    if (!is_one_of(config.backends.bluetooth, {"present", "absent"})) {
        error = "Invalid backends.bluetooth: '" + config.backends.bluetooth + "' (must be present or absent)";
        return false;
    }
    if (!is_one_of(config.backends.camera, {"present", "absent"})) {
        error = "Invalid backends.camera: '" + config.backends.camera + "' (must be present or absent)";
        return false;
    }

    // Validate Logging settings
    if (!is_one_of(config.logging.level, {"debug", "info", "warn", "error"})) {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool parse_config(const std::string &yaml_text, RuntimeConfig &config, std::string &error) {
    try {
        if (!load_yaml(YAML::Load(yaml_text), config, error)) {
            return false;
        }
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const YAML::Exception &e) {
        error = "Config value error: " + std::string(e.what());
        return false;
    }
    return validate_config(config, error);
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    std::ifstream file(config_path);
    if (!file) {
        error = "Cannot open config file: " + config_path;
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    if (!parse_config(buffer.str(), config, error)) {
        return false;
    }
    log_summary(config);
    return true;
}

}  // namespace runtime
}  // namespace sonar
