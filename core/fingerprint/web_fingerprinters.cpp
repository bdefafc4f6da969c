#include <vector>

#include "fingerprint_util.hpp"
#include "keywords.hpp"
#include "logging/logger.hpp"
#include "net/wire.hpp"
#include "protocol_fingerprinters.hpp"

namespace sonar {
namespace fingerprint {

namespace {

using net::append_be16;
using net::byte_at;
using net::bytes;

constexpr uint16_t kMqttTlsPort = 8883;
constexpr size_t kApiBodyLimit = 512;
constexpr size_t kTlsReplyBytes = 16;
constexpr const char *kOnvifPath = "/onvif/device_service";
constexpr const char *kIsapiPath = "/ISAPI/System/deviceInfo";
constexpr const char *kOnvifRequest =
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
    "<s:Envelope xmlns:s=\"http://www.w3.org/2003/05/soap-envelope\">"
    "<s:Body xmlns:tds=\"http://www.onvif.org/ver10/device/wsdl\">"
    "<tds:GetSystemDateAndTime/>"
    "</s:Body></s:Envelope>";

const std::vector<std::string> &api_paths() {
    static const std::vector<std::string> paths = {"/api", "/api/v1", "/rest", "/json", kIsapiPath};
    return paths;
}

struct WebEvidence {
    int status = 0;
    std::string server;
    std::string realm;
    std::optional<std::string> title;
    std::string body;
};

std::optional<std::string> extract_title(const std::string &body) {
    const std::string lowered = to_lower(body);
    const auto open = lowered.find("<title");
    if (open == std::string::npos) {
        return std::nullopt;
    }
    const auto gt = lowered.find('>', open);
    if (gt == std::string::npos) {
        return std::nullopt;
    }
    const auto close = lowered.find("</title", gt);
    if (close == std::string::npos) {
        return std::nullopt;
    }
    std::string title = printable(body.substr(gt + 1, close - gt - 1), 120);
    if (title.empty()) {
        return std::nullopt;
    }
    return title;
}

std::optional<WebEvidence> fetch_root(const FingerprintContext &ctx, bool tls) {
    net::HttpRequest head;
    head.method = "HEAD";
    head.tls = tls;
    auto head_reply = ctx.network.http_request(ctx.host, ctx.probe.port, head, ctx.probe_timeout(), 0, ctx.deadline);

    net::HttpRequest get;
    get.tls = tls;
    std::optional<net::HttpReply> get_reply;
    if (!ctx.deadline.expired()) {
        get_reply = ctx.network.http_request(ctx.host, ctx.probe.port, get, ctx.probe_timeout(),
                                             ctx.options.http_body_limit, ctx.deadline);
    }

    if (!head_reply && !get_reply) {
        return std::nullopt;
    }
    const net::HttpReply &primary = get_reply ? *get_reply : *head_reply;
    if (primary.status <= 0) {
        return std::nullopt;
    }

    WebEvidence evidence;
    evidence.status = primary.status;
    evidence.server = primary.header("server");
    if (evidence.server.empty() && head_reply) {
        evidence.server = head_reply->header("server");
    }
    evidence.realm = primary.header("www-authenticate");
    if (get_reply) {
        evidence.body = get_reply->body;
        evidence.title = extract_title(evidence.body);
    }
    return evidence;
}

void describe_web(const FingerprintContext &ctx, const WebEvidence &evidence, bool tls, scan::ServiceDescriptor &desc) {
    const std::string scheme = tls ? "https" : "http";
    const uint16_t port = ctx.probe.port;

    desc.details["status"] = std::to_string(evidence.status);
    if (!evidence.server.empty()) {
        desc.details["server"] = printable(evidence.server, 120);
        desc.version_hint = desc.details["server"];
    }
    if (evidence.title) {
        desc.details["title"] = *evidence.title;
    }

    const bool auth_required = evidence.status == 401 || evidence.status == 403;
    if (auth_required) {
        desc.details["auth_required"] = "true";
        if (!evidence.realm.empty()) {
            desc.details["auth_realm"] = printable(evidence.realm, 120);
        }
    }

    add_hint_details(evidence.title.value_or("") + " " + evidence.server + " " + evidence.realm + " " + evidence.body,
                     desc.details);

    const std::string url = scan::format_url(scheme, ctx.host, port);
    if (tls) {
        desc.operations.push_back(scan::service_capability(
            "Secure web interface", "Open the secure web interface" + port_suffix(port), scheme, port, "open_web", url));
    } else {
        desc.operations.push_back(scan::service_capability(
            "Web interface", "Open the web interface" + port_suffix(port), scheme, port, "open_web", url));
    }
    if (auth_required) {
        desc.operations.push_back(catalog_capability(scan::catalog::kLogIn, scheme, port, "login", url));
    }
}

bool is_api_reply(const net::HttpReply &reply, const std::string &path) {
    const std::string content_type = to_lower(reply.header("content-type"));
    const bool structured =
        content_type.find("json") != std::string::npos || content_type.find("xml") != std::string::npos;
    if (reply.status >= 200 && reply.status < 300 && structured) {
        return true;
    }
    // ISAPI answers unauthenticated callers with 401, which still proves the interface
    return path == kIsapiPath && reply.status == 401;
}

void probe_api(const FingerprintContext &ctx, bool tls, scan::ServiceDescriptor &desc) {
    const std::string scheme = tls ? "https" : "http";
    for (const auto &path : api_paths()) {
        if (ctx.deadline.expired()) {
            return;
        }
        net::HttpRequest request;
        request.path = path;
        request.tls = tls;
        request.headers["Accept"] = "application/json, application/xml";
        auto reply =
            ctx.network.http_request(ctx.host, ctx.probe.port, request, ctx.probe_timeout(), kApiBodyLimit, ctx.deadline);
        if (!reply || !is_api_reply(*reply, path)) {
            continue;
        }

        desc.details["api_path"] = path;
        if (path == kIsapiPath) {
            desc.details.emplace("hint_camera", "isapi");
        }
        desc.operations.push_back(scan::service_capability(
            "REST API", "Programmatic control interface at " + path + port_suffix(ctx.probe.port), scheme,
            ctx.probe.port, "api_call", scan::format_url(scheme, ctx.host, ctx.probe.port, path)));
        return;
    }
}

void probe_onvif(const FingerprintContext &ctx, bool tls, scan::ServiceDescriptor &desc) {
    if (ctx.deadline.expired()) {
        return;
    }
    const std::string scheme = tls ? "https" : "http";
    net::HttpRequest request;
    request.method = "POST";
    request.path = kOnvifPath;
    request.tls = tls;
    request.body = kOnvifRequest;
    request.content_type = "application/soap+xml; charset=utf-8";

    auto reply = ctx.network.http_request(ctx.host, ctx.probe.port, request, ctx.probe_timeout(),
                                          ctx.options.http_body_limit, ctx.deadline);
    if (!reply || reply->body.find("SystemDateAndTime") == std::string::npos) {
        return;
    }

    LOG_DEBUG("[Fingerprint] ONVIF device service on " << ctx.host << ":" << ctx.probe.port);
    desc.details["onvif"] = "true";
    desc.details.emplace("hint_camera", "onvif");
    desc.operations.push_back(scan::service_capability("ONVIF control", "Standard camera control over ONVIF", "onvif",
                                                       ctx.probe.port, "onvif_call",
                                                       scan::format_url(scheme, ctx.host, ctx.probe.port, kOnvifPath)));
}

}  // namespace

std::optional<scan::ServiceDescriptor> HttpFingerprinter::probe(const FingerprintContext &ctx) const {
    auto evidence = fetch_root(ctx, false);
    if (!evidence) {
        return std::nullopt;
    }

    scan::ServiceDescriptor desc = make_descriptor(ctx, service::kHttp);
    describe_web(ctx, *evidence, false, desc);
    probe_api(ctx, false, desc);
    probe_onvif(ctx, false, desc);
    return desc;
}

std::string TlsFingerprinter::client_hello() {
    std::string body = bytes({0x03, 0x03});  // TLS 1.2
    for (int i = 0; i < 32; ++i) {
        body.push_back(static_cast<char>(i * 7 + 1));
    }
    body += bytes({0x00});  // no session id

    const std::string suites = bytes({0xc0, 0x2f, 0xc0, 0x30, 0xc0, 0x2b, 0xc0, 0x2c, 0xcc, 0xa8,
                                      0xcc, 0xa9, 0x00, 0x9c, 0x00, 0x9d, 0x00, 0x2f, 0x00, 0x35});
    append_be16(body, static_cast<uint16_t>(suites.size()));
    body += suites;
    body += bytes({0x01, 0x00});  // null compression only

    std::string extensions;
    extensions += bytes({0x00, 0x0a, 0x00, 0x08, 0x00, 0x06, 0x00, 0x1d, 0x00, 0x17, 0x00, 0x18});  // groups
    extensions += bytes({0x00, 0x0b, 0x00, 0x02, 0x01, 0x00});                                      // point formats
    extensions += bytes({0x00, 0x0d, 0x00, 0x0a, 0x00, 0x08, 0x04, 0x01, 0x04, 0x03, 0x08, 0x04, 0x05, 0x01});
    append_be16(body, static_cast<uint16_t>(extensions.size()));
    body += extensions;

    std::string handshake = bytes({0x01, 0x00});  // ClientHello, 24-bit length
    append_be16(handshake, static_cast<uint16_t>(body.size()));
    handshake += body;

    std::string record = bytes({0x16, 0x03, 0x01});
    append_be16(record, static_cast<uint16_t>(handshake.size()));
    record += handshake;
    return record;
}

bool TlsFingerprinter::looks_like_tls_reply(const std::string &reply) {
    if (reply.size() < 3) {
        return false;
    }
    const uint8_t type = byte_at(reply, 0);
    return (type == 0x16 || type == 0x15) && byte_at(reply, 1) == 0x03;
}

std::optional<scan::ServiceDescriptor> TlsFingerprinter::probe(const FingerprintContext &ctx) const {
    auto reply = ctx.network.tcp_exchange(ctx.host, ctx.probe.port, client_hello(), ctx.probe_timeout(),
                                          kTlsReplyBytes, ctx.deadline);
    if (!reply || !looks_like_tls_reply(*reply)) {
        return std::nullopt;
    }

    const uint16_t port = ctx.probe.port;
    if (port == kMqttTlsPort) {
        scan::ServiceDescriptor desc = make_descriptor(ctx, service::kMqtts);
        desc.details["tls"] = "true";
        desc.operations.push_back(scan::service_capability("MQTT over TLS",
                                                           "Publish and subscribe to MQTT topics over TLS", "mqtts",
                                                           port, "mqtt_publish", scan::format_url("mqtts", ctx.host, port)));
        return desc;
    }

    scan::ServiceDescriptor desc = make_descriptor(ctx, service::kHttps);
    desc.details["tls"] = "true";
    auto evidence = fetch_root(ctx, true);
    if (evidence) {
        describe_web(ctx, *evidence, true, desc);
        probe_api(ctx, true, desc);
        probe_onvif(ctx, true, desc);
    } else {
        // TLS confirmed but the HTTPS layer could not be inspected
        desc.details["https_inspection"] = "unavailable";
        desc.operations.push_back(scan::service_capability("Secure web interface",
                                                           "Open the secure web interface" + port_suffix(port),
                                                           "https", port, "open_web",
                                                           scan::format_url("https", ctx.host, port)));
    }
    return desc;
}

std::optional<scan::ServiceDescriptor> IppFingerprinter::probe(const FingerprintContext &ctx) const {
    net::HttpRequest request;
    auto reply = ctx.network.http_request(ctx.host, ctx.probe.port, request, ctx.probe_timeout(),
                                          ctx.options.http_body_limit, ctx.deadline);
    if (!reply || reply->status <= 0) {
        return std::nullopt;
    }

    const uint16_t port = ctx.probe.port;
    scan::ServiceDescriptor desc = make_descriptor(ctx, service::kIpp);
    desc.details["status"] = std::to_string(reply->status);
    const std::string server = reply->header("server");
    if (!server.empty()) {
        desc.details["server"] = printable(server, 120);
        desc.version_hint = desc.details["server"];
    }
    if (auto title = extract_title(reply->body)) {
        desc.details["title"] = *title;
    }
    desc.details["hint_printer"] = "ipp";
    add_hint_details(server + " " + reply->body, desc.details);

    desc.operations.push_back(catalog_capability(scan::catalog::kPrintDocument, "ipp", port, "print",
                                                 scan::format_url("ipp", ctx.host, port, "/ipp/print")));
    desc.operations.push_back(catalog_capability(scan::catalog::kPrintQueue, "ipp", port, "print_queue",
                                                 scan::format_url("http", ctx.host, port, "/jobs")));
    desc.operations.push_back(catalog_capability(scan::catalog::kPrinterStatus, "ipp", port, "printer_status",
                                                 scan::format_url("http", ctx.host, port, "/printers")));
    return desc;
}

}  // namespace fingerprint
}  // namespace sonar
