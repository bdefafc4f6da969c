#include <algorithm>

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

constexpr size_t kBannerBytes = 512;
constexpr int kMqttAuthFailures[] = {4, 5};

// Reads what the service volunteers on connect
std::optional<std::string> read_banner(const FingerprintContext &ctx, size_t max_bytes = kBannerBytes) {
    return ctx.network.tcp_exchange(ctx.host, ctx.probe.port, "", ctx.banner_window(), max_bytes, ctx.deadline);
}

std::optional<std::string> exchange(const FingerprintContext &ctx, const std::string &request,
                                    size_t max_bytes = kBannerBytes) {
    return ctx.network.tcp_exchange(ctx.host, ctx.probe.port, request, ctx.probe_timeout(), max_bytes, ctx.deadline);
}

std::string header_value(const std::string &response, const std::string &lower_name) {
    const std::string lowered = to_lower(response);
    const std::string needle = "\n" + lower_name + ":";
    auto pos = lowered.find(needle);
    if (pos == std::string::npos) {
        return "";
    }
    pos += needle.size();
    const auto end = response.find_first_of("\r\n", pos);
    return printable(response.substr(pos, end == std::string::npos ? std::string::npos : end - pos), 200);
}

}  // namespace

std::optional<scan::ServiceDescriptor> SshFingerprinter::probe(const FingerprintContext &ctx) const {
    auto banner = read_banner(ctx, 256);
    if (!banner || banner->rfind("SSH-", 0) != 0) {
        return std::nullopt;
    }

    const uint16_t port = ctx.probe.port;
    const std::string line = printable(first_line(*banner), 200);
    scan::ServiceDescriptor desc = make_descriptor(ctx, service::kSsh);
    desc.version_hint = line;
    desc.details["banner"] = line;

    // SSH-2.0-OpenSSH_8.9 -> protocol "2.0", software "OpenSSH_8.9"
    const auto second_dash = line.find('-', 4);
    if (second_dash != std::string::npos) {
        desc.details["protocol_version"] = line.substr(4, second_dash - 4);
        desc.details["software"] = line.substr(second_dash + 1);
    }
    add_hint_details(line, desc.details);

    const std::string url = scan::format_url("ssh", ctx.host, port, "");
    desc.operations.push_back(
        scan::service_capability("SSH connection", "Open a remote shell over SSH", "ssh", port, "ssh_connect", url));
    desc.operations.push_back(scan::service_capability("Secure file transfer (SFTP)", "Transfer files over SSH",
                                                       "sftp", port, "file_transfer",
                                                       scan::format_url("sftp", ctx.host, port, "")));
    return desc;
}

std::optional<scan::ServiceDescriptor> FtpFingerprinter::probe(const FingerprintContext &ctx) const {
    auto banner = read_banner(ctx);
    if (!banner || (banner->rfind("220", 0) != 0 && banner->rfind("421", 0) != 0)) {
        return std::nullopt;
    }

    const uint16_t port = ctx.probe.port;
    const std::string line = printable(first_line(*banner), 200);
    scan::ServiceDescriptor desc = make_descriptor(ctx, service::kFtp);
    desc.details["banner"] = line;
    if (line.size() > 4) {
        desc.version_hint = line.substr(4);
    }
    if (banner->rfind("421", 0) == 0) {
        desc.details["refusing_sessions"] = "true";
    }
    add_hint_details(*banner, desc.details);

    desc.operations.push_back(scan::service_capability("File transfer (FTP)", "Upload and download files over FTP",
                                                       "ftp", port, "file_transfer",
                                                       scan::format_url("ftp", ctx.host, port)));
    return desc;
}

std::string SmbFingerprinter::negotiate_request() {
    std::string smb = bytes({0xff, 'S', 'M', 'B', 0x72,  // SMB_COM_NEGOTIATE
                             0x00, 0x00, 0x00, 0x00,     // status
                             0x18,                       // flags
                             0x53, 0xc8,                 // flags2
                             0x00, 0x00,                 // pid high
                             0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
                             0x00, 0x00,                 // reserved
                             0x00, 0x00,                 // tid
                             0x2f, 0x4b,                 // pid
                             0x00, 0x00,                 // uid
                             0x00, 0x00});               // mid
    smb += bytes({0x00});                                // word count

    std::string dialects;
    for (const char *dialect : {"NT LM 0.12", "SMB 2.002", "SMB 2.???"}) {
        dialects.push_back(0x02);
        dialects += dialect;
        dialects.push_back('\0');
    }
    smb.push_back(static_cast<char>(dialects.size() & 0xFF));  // byte count, little-endian
    smb.push_back(static_cast<char>((dialects.size() >> 8) & 0xFF));
    smb += dialects;

    std::string packet = bytes({0x00, 0x00});  // NetBIOS session message, 24-bit length
    append_be16(packet, static_cast<uint16_t>(smb.size()));
    return packet + smb;
}

std::optional<scan::ServiceDescriptor> SmbFingerprinter::probe(const FingerprintContext &ctx) const {
    auto reply = exchange(ctx, negotiate_request(), 128);
    if (!reply || reply->empty()) {
        return std::nullopt;
    }

    const uint16_t port = ctx.probe.port;
    scan::ServiceDescriptor desc = make_descriptor(ctx, service::kSmb);
    if (reply->size() >= 8 && reply->compare(5, 3, "SMB") == 0 &&
        (byte_at(*reply, 4) == 0xff || byte_at(*reply, 4) == 0xfe)) {
        desc.version_hint = byte_at(*reply, 4) == 0xfe ? "SMB2+" : "SMB1";
        desc.details["dialect"] = *desc.version_hint;
    } else if (byte_at(*reply, 0) == 0x82 || byte_at(*reply, 0) == 0x83) {
        // NetBIOS session service answered but did not run the negotiate
        desc.details["netbios_session"] = byte_at(*reply, 0) == 0x82 ? "accepted" : "rejected";
    } else {
        return std::nullopt;
    }

    desc.operations.push_back(scan::service_capability("File sharing (SMB)",
                                                       "Browse and transfer shared files over SMB", "smb", port,
                                                       "file_share", scan::format_url("smb", ctx.host, port)));
    return desc;
}

std::optional<scan::ServiceDescriptor> RtspFingerprinter::probe(const FingerprintContext &ctx) const {
    const uint16_t port = ctx.probe.port;
    const std::string url = scan::format_url("rtsp", ctx.host, port);
    const std::string request = "OPTIONS " + url + " RTSP/1.0\r\nCSeq: 1\r\nUser-Agent: sonar\r\n\r\n";

    auto reply = exchange(ctx, request);
    if (!reply || reply->rfind("RTSP/1.0", 0) != 0) {
        return std::nullopt;
    }

    scan::ServiceDescriptor desc = make_descriptor(ctx, service::kRtsp);
    const std::string status_line = printable(first_line(*reply), 120);
    desc.details["status_line"] = status_line;
    const std::string server = header_value(*reply, "server");
    if (!server.empty()) {
        desc.details["server"] = server;
        desc.version_hint = server;
    }
    const std::string methods = header_value(*reply, "public");
    if (!methods.empty()) {
        desc.details["methods"] = methods;
    }
    if (status_line.find(" 401") != std::string::npos) {
        desc.details["auth_required"] = "true";
    }
    add_hint_details(server, desc.details);

    desc.operations.push_back(scan::service_capability("Live video stream", "Stream audio and video over RTSP",
                                                       "rtsp", port, "stream_video", url));
    return desc;
}

std::string MqttFingerprinter::connect_packet() {
    std::string variable = bytes({0x00, 0x04, 'M', 'Q', 'T', 'T',  // protocol name
                                  0x04,                            // level 3.1.1
                                  0x02,                            // clean session
                                  0x00, 0x3c});                    // keep-alive 60s
    const std::string client_id = "sonar-probe";
    append_be16(variable, static_cast<uint16_t>(client_id.size()));
    variable += client_id;

    std::string packet = bytes({0x10, static_cast<int>(variable.size())});
    return packet + variable;
}

std::optional<scan::ServiceDescriptor> MqttFingerprinter::probe(const FingerprintContext &ctx) const {
    auto reply = exchange(ctx, connect_packet(), 4);
    if (!reply || reply->size() < 4 || byte_at(*reply, 0) != 0x20 || byte_at(*reply, 1) != 0x02) {
        return std::nullopt;
    }

    const uint16_t port = ctx.probe.port;
    const int return_code = byte_at(*reply, 3);
    scan::ServiceDescriptor desc = make_descriptor(ctx, service::kMqtt);
    desc.version_hint = "3.1.1";
    desc.details["connack"] = std::to_string(return_code);
    for (int code : kMqttAuthFailures) {
        if (return_code == code) {
            desc.details["auth_required"] = "true";
        }
    }

    const std::string url = scan::format_url("mqtt", ctx.host, port, "");
    desc.operations.push_back(scan::service_capability("Publish messages", "Publish messages to MQTT topics", "mqtt",
                                                       port, "mqtt_publish", url));
    desc.operations.push_back(scan::service_capability("Subscribe to topics", "Receive messages from MQTT topics",
                                                       "mqtt", port, "mqtt_subscribe", url));
    if (desc.details.count("auth_required") > 0) {
        desc.operations.push_back(catalog_capability(scan::catalog::kLogIn, "mqtt", port, "login", url));
    }
    return desc;
}

std::optional<scan::ServiceDescriptor> TelnetFingerprinter::probe(const FingerprintContext &ctx) const {
    auto banner = read_banner(ctx);
    if (!banner || banner->empty()) {
        return std::nullopt;
    }

    const bool negotiates = byte_at(*banner, 0) == 0xff;  // IAC
    const std::string text = to_lower(printable(*banner, 400));
    const bool prompts = text.find("login") != std::string::npos || text.find("username") != std::string::npos ||
                         text.find("password") != std::string::npos;
    if (!negotiates && !prompts) {
        return std::nullopt;
    }

    const uint16_t port = ctx.probe.port;
    scan::ServiceDescriptor desc = make_descriptor(ctx, service::kTelnet);
    if (!text.empty()) {
        desc.details["banner"] = printable(*banner, 200);
    }
    add_hint_details(text, desc.details);
    desc.operations.push_back(scan::service_capability("Telnet console", "Open an unencrypted remote console",
                                                       "telnet", port, "telnet_connect",
                                                       scan::format_url("telnet", ctx.host, port, "")));
    return desc;
}

std::optional<scan::ServiceDescriptor> VncFingerprinter::probe(const FingerprintContext &ctx) const {
    auto banner = read_banner(ctx, 12);
    if (!banner || banner->rfind("RFB ", 0) != 0) {
        return std::nullopt;
    }

    const uint16_t port = ctx.probe.port;
    scan::ServiceDescriptor desc = make_descriptor(ctx, service::kVnc);
    desc.version_hint = printable(banner->substr(4), 16);
    desc.details["rfb_version"] = *desc.version_hint;
    desc.operations.push_back(scan::service_capability("Remote desktop (VNC)",
                                                       "View and control the desktop over VNC", "vnc", port,
                                                       "remote_desktop", scan::format_url("vnc", ctx.host, port, "")));
    return desc;
}

std::string RdpFingerprinter::connection_request() {
    return bytes({0x03, 0x00, 0x00, 0x13,                          // TPKT
                  0x0e, 0xe0, 0x00, 0x00, 0x00, 0x00, 0x00,        // X.224 connection request
                  0x01, 0x00, 0x08, 0x00, 0x03, 0x00, 0x00, 0x00});  // RDP negotiation: TLS | CredSSP
}

std::optional<scan::ServiceDescriptor> RdpFingerprinter::probe(const FingerprintContext &ctx) const {
    auto reply = exchange(ctx, connection_request(), 19);
    if (!reply || reply->size() < 6 || byte_at(*reply, 0) != 0x03 || byte_at(*reply, 5) != 0xd0) {
        return std::nullopt;
    }

    const uint16_t port = ctx.probe.port;
    scan::ServiceDescriptor desc = make_descriptor(ctx, service::kRdp);
    if (reply->size() >= 12 && byte_at(*reply, 11) == 0x03) {
        desc.details["negotiation"] = "failure";
    } else if (reply->size() >= 12 && byte_at(*reply, 11) == 0x02) {
        desc.details["negotiation"] = "accepted";
    }
    desc.operations.push_back(scan::service_capability("Remote desktop (RDP)", "Connect to the desktop over RDP",
                                                       "rdp", port, "remote_desktop",
                                                       scan::format_url("rdp", ctx.host, port, "")));
    return desc;
}

std::optional<scan::ServiceDescriptor> JetDirectFingerprinter::probe(const FingerprintContext &ctx) const {
    const std::string request = "\x1b%-12345X@PJL INFO ID\r\n\x1b%-12345X\r\n";
    auto reply = exchange(ctx, request);
    if (!reply) {
        return std::nullopt;
    }

    const uint16_t port = ctx.probe.port;
    scan::ServiceDescriptor desc = make_descriptor(ctx, service::kJetDirect);
    desc.details["hint_printer"] = "jetdirect";
    if (reply->find("@PJL") != std::string::npos) {
        // Model name is the line after the echoed command, usually quoted
        const auto echo = reply->find("INFO ID");
        const auto line_start = echo == std::string::npos ? std::string::npos : reply->find('\n', echo);
        if (line_start != std::string::npos) {
            std::string model = printable(first_line(reply->substr(line_start + 1)), 120);
            model.erase(std::remove(model.begin(), model.end(), '"'), model.end());
            if (!model.empty()) {
                desc.details["model"] = model;
                desc.version_hint = model;
            }
        }
        add_hint_details(*reply, desc.details);
    } else if (!reply->empty()) {
        // Something other than a raw print port is listening
        return std::nullopt;
    } else {
        desc.details["pjl"] = "no reply";
    }

    desc.operations.push_back(scan::service_capability("Raw printing", "Send print jobs directly to the printer",
                                                       "jetdirect", port, "print_raw"));
    return desc;
}

std::optional<scan::ServiceDescriptor> LpdFingerprinter::probe(const FingerprintContext &ctx) const {
    // Short queue-state request for the default queue
    auto reply = exchange(ctx, "\x03lp\n");
    if (!reply) {
        return std::nullopt;
    }
    const std::string text = printable(*reply, 200);
    if (!reply->empty() && text.empty()) {
        return std::nullopt;
    }

    const uint16_t port = ctx.probe.port;
    scan::ServiceDescriptor desc = make_descriptor(ctx, service::kLpd);
    desc.details["hint_printer"] = "lpd";
    if (!text.empty()) {
        desc.details["queue_state"] = text;
    }
    desc.operations.push_back(scan::service_capability("Line printer queue (LPD)", "Submit print jobs over LPD",
                                                       "lpd", port, "print_lpd"));
    return desc;
}

std::optional<scan::ServiceDescriptor> BannerFingerprinter::probe(const FingerprintContext &ctx) const {
    auto banner = read_banner(ctx);
    if (!banner || banner->empty()) {
        return std::nullopt;
    }

    const std::string text = printable(*banner, 200);
    scan::ServiceDescriptor desc = make_descriptor(ctx, service::kUnknown);
    if (banner->rfind("SSH-", 0) == 0) {
        desc.service_name = service::kSsh;
    } else if (banner->rfind("RFB ", 0) == 0) {
        desc.service_name = service::kVnc;
    } else if (banner->rfind("HTTP/", 0) == 0) {
        desc.service_name = service::kHttp;
    } else if (banner->rfind("220", 0) == 0) {
        desc.service_name = service::kFtp;
    }
    if (!text.empty()) {
        desc.details["banner"] = text;
        desc.version_hint = printable(first_line(*banner), 120);
    }
    add_hint_details(text, desc.details);

    LOG_DEBUG("[Fingerprint] Banner on " << ctx.host << ":" << ctx.probe.port << " classified as "
                                         << desc.service_name);
    desc.operations.push_back(scan::service_capability("Raw TCP connection",
                                                       "Open a raw TCP session" + port_suffix(ctx.probe.port),
                                                       "tcp", ctx.probe.port, "raw_connect"));
    return desc;
}

}  // namespace fingerprint
}  // namespace sonar
