#pragma once

#include <httplib.h>

#include <nlohmann/json.hpp>
#include <string>

#include "../errors.hpp"

namespace sonar {
namespace http {

inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body) {
    res.status = status_code_to_http(code);
    res.set_content(body.dump(), "application/json");
}

// Query parameter or empty string; repeated keys keep the first value
inline std::string query_param(const httplib::Request &req, const std::string &key) {
    return req.has_param(key) ? req.get_param_value(key) : std::string();
}

}  // namespace http
}  // namespace sonar
