#include "server.hpp"

#include <algorithm>

#include "errors.hpp"
#include "logging/logger.hpp"

namespace sonar {
namespace http {

namespace {
constexpr int kSocketTimeoutSeconds = 5;  // per read/write, a scan itself may take longer
constexpr int kStatusNoContent = 204;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusInternal = 500;

constexpr const char *kAllowedMethods = "GET, OPTIONS";
constexpr const char *kAllowedHeaders = "Content-Type";

// Allowlist entries are exact origins, "*" or a single-wildcard pattern
// such as "http://*.local:3000"
bool origin_allowed(const std::string &pattern, const std::string &origin) {
    if (pattern == "*") {
        return true;
    }
    const auto star = pattern.find('*');
    if (star == std::string::npos) {
        return pattern == origin;
    }

    const std::size_t head = star;
    const std::size_t tail = pattern.size() - star - 1;
    if (origin.size() < head + tail) {
        return false;
    }
    return origin.compare(0, head, pattern, 0, head) == 0 &&
           origin.compare(origin.size() - tail, tail, pattern, star + 1, tail) == 0;
}

StatusCode code_for_status(int status, std::string &message, const httplib::Request &req) {
    switch (status) {
        case kStatusNotFound:
            message = "Route not found: " + req.method + " " + req.path;
            return StatusCode::NOT_FOUND;
        case kStatusBadRequest:
            message = "Bad request";
            return StatusCode::INVALID_ARGUMENT;
        default:
            message = "HTTP " + std::to_string(status);
            return StatusCode::INTERNAL;
    }
}
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, const scan::ScanEngine &engine)
    : config_(config), engine_(engine), started_at_(std::chrono::steady_clock::now()) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    server_ = std::make_unique<httplib::Server>();
    server_->set_read_timeout(kSocketTimeoutSeconds, 0);
    server_->set_write_timeout(kSocketTimeoutSeconds, 0);

    // Each in-flight scan holds one pool thread for up to scan.deadline_ms
    const int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    install_cors();
    install_error_handlers();
    setup_routes();

    if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
        error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
        server_.reset();
        return false;
    }
    port_ = config_.port;

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        server_->listen_after_bind();
        LOG_DEBUG("[HTTP] Listener thread exiting");
    });

    LOG_INFO("[HTTP] Listening on " << config_.bind << ":" << config_.port << " (" << pool_size
                                    << " request threads)");
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    if (server_) {
        server_->stop();
    }
    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }
    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped after " << scans_served_.load() << " scans");
}

void HttpServer::install_cors() {
    const bool allow_credentials = config_.cors_allow_credentials;
    const std::vector<std::string> origins = config_.cors_allowed_origins;

    server_->set_post_routing_handler([allow_credentials, origins](const httplib::Request &req,
                                                                   httplib::Response &res) {
        if (!req.has_header("Origin")) {
            return;
        }
        const std::string origin = req.get_header_value("Origin");
        const auto match = std::find_if(origins.begin(), origins.end(),
                                        [&origin](const std::string &p) { return origin_allowed(p, origin); });
        if (match == origins.end()) {
            return;
        }

        res.set_header("Access-Control-Allow-Origin", *match == "*" ? std::string("*") : origin);
        res.set_header("Access-Control-Allow-Methods", kAllowedMethods);
        res.set_header("Access-Control-Allow-Headers", kAllowedHeaders);
        if (allow_credentials) {
            res.set_header("Access-Control-Allow-Credentials", "true");
        }
    });
}

void HttpServer::install_error_handlers() {
    // Routes write their own bodies; only bare httplib statuses (404 and friends) get one here
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }
        std::string message;
        const StatusCode code = code_for_status(res.status, message, req);
        res.set_content(make_error_response(code, message).dump(), "application/json");
    });

    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        std::string message;
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception &e) {
            message = e.what();
        } catch (...) {
            message = "non-standard exception";
        }
        LOG_ERROR("[HTTP] " << req.method << " " << req.path << " failed: " << message);

        res.status = kStatusInternal;
        res.set_content(make_error_response(StatusCode::INTERNAL, message).dump(), "application/json");
    });
}

void HttpServer::setup_routes() {
    server_->Get("/v0/scan", [this](const httplib::Request &req, httplib::Response &res) { handle_get_scan(req, res); });
    server_->Get("/v0/runtime/status",
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_runtime_status(req, res); });

    // CORS preflight for every versioned route
    server_->Options(R"(/v0/.*)", [](const httplib::Request &, httplib::Response &res) {
        res.status = kStatusNoContent;
        res.set_header("Access-Control-Allow-Methods", kAllowedMethods);
        res.set_header("Access-Control-Allow-Headers", kAllowedHeaders);
    });
}

}  // namespace http
}  // namespace sonar
