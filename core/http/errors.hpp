#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace sonar {
namespace http {

/**
 * @brief Transport status codes mapped to HTTP status codes
 *
 * - OK -> HTTP 200
 * - INVALID_ARGUMENT -> HTTP 400
 * - NOT_FOUND -> HTTP 404
 * - INTERNAL -> HTTP 500
 */
enum class StatusCode { OK, INVALID_ARGUMENT, NOT_FOUND, INTERNAL };

inline int status_code_to_http(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return 200;
        case StatusCode::INVALID_ARGUMENT:
            return 400;
        case StatusCode::NOT_FOUND:
            return 404;
        case StatusCode::INTERNAL:
        default:
            return 500;
    }
}

inline std::string status_code_to_string(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return "OK";
        case StatusCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case StatusCode::NOT_FOUND:
            return "NOT_FOUND";
        case StatusCode::INTERNAL:
        default:
            return "INTERNAL";
    }
}

/**
 * @brief Build the error body used for transport-level failures
 *
 * Shape matches the scan envelope so clients can branch on "status" alone:
 * {"status": "error", "error": message, "code": "NOT_FOUND", "capabilities": []}
 */
inline nlohmann::json make_error_response(StatusCode code, const std::string &message) {
    return {{"status", "error"},
            {"error", message},
            {"code", status_code_to_string(code)},
            {"capabilities", nlohmann::json::array()}};
}

}  // namespace http
}  // namespace sonar
