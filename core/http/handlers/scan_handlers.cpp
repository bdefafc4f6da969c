#include "../../logging/logger.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace sonar {
namespace http {

//=============================================================================
// GET /v0/scan
//=============================================================================
void HttpServer::handle_get_scan(const httplib::Request &req, httplib::Response &res) {
    scan::ScanRequest request;
    request.address = query_param(req, "address");
    request.declared_type = query_param(req, "type");
    request.method = query_param(req, "method");
    request.id = query_param(req, "id");
    request.signal_strength = query_param(req, "signal");

    LOG_DEBUG("[HTTP] Scan request address='" << request.address << "' method='" << request.method << "'");

    scan::ScanResult result = engine_.scan(request);
    scans_served_.fetch_add(1);

    StatusCode code = StatusCode::OK;
    if (result.status == scan::ScanStatus::ERROR) {
        code = result.error_kind == scan::ScanErrorKind::INVALID_INPUT ? StatusCode::INVALID_ARGUMENT
                                                                        : StatusCode::INTERNAL;
    }
    send_json(res, code, encode_scan_result(result));
}

}  // namespace http
}  // namespace sonar
