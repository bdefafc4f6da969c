#include "fingerprint_util.hpp"
#include "keywords.hpp"
#include "net/wire.hpp"
#include "protocol_fingerprinters.hpp"
#include "scan/port_scanner.hpp"

namespace sonar {
namespace fingerprint {

namespace {

using net::byte_at;

constexpr size_t kUdpReplyLimit = 1500;
constexpr size_t kDnsHeaderSize = 12;
constexpr uint16_t kDnsProbeId = 0xAAAA;

// Reply captured by the port scanner, or a fresh exchange when it has none
std::optional<std::string> udp_reply(const FingerprintContext &ctx) {
    if (ctx.probe.banner && !ctx.probe.banner->empty()) {
        return ctx.probe.banner;
    }
    return ctx.network.udp_exchange(ctx.host, ctx.probe.port, scan::PortScanner::udp_probe_payload(ctx.probe.port),
                                    ctx.probe_timeout(), kUdpReplyLimit, ctx.deadline);
}

}  // namespace

std::optional<std::string> SnmpFingerprinter::parse_sys_descr(const std::string &reply) {
    static const std::string kSysDescrOid = net::bytes({0x06, 0x08, 0x2b, 0x06, 0x01, 0x02, 0x01, 0x01, 0x01, 0x00});

    const auto oid = reply.find(kSysDescrOid);
    if (oid == std::string::npos) {
        return std::nullopt;
    }
    size_t pos = oid + kSysDescrOid.size();
    if (pos + 2 > reply.size() || byte_at(reply, pos) != 0x04) {
        return std::nullopt;
    }
    ++pos;

    // BER length: short form, or 0x81/0x82 long form
    size_t length = byte_at(reply, pos++);
    if (length == 0x81) {
        if (pos >= reply.size()) {
            return std::nullopt;
        }
        length = byte_at(reply, pos++);
    } else if (length == 0x82) {
        if (pos + 1 >= reply.size()) {
            return std::nullopt;
        }
        length = net::read_be16(reply, pos);
        pos += 2;
    } else if (length > 0x7f) {
        return std::nullopt;
    }
    if (pos + length > reply.size()) {
        return std::nullopt;
    }
    return reply.substr(pos, length);
}

std::optional<scan::ServiceDescriptor> SnmpFingerprinter::probe(const FingerprintContext &ctx) const {
    auto reply = udp_reply(ctx);
    if (!reply || reply->empty() || byte_at(*reply, 0) != 0x30) {
        return std::nullopt;
    }

    const uint16_t port = ctx.probe.port;
    scan::ServiceDescriptor desc = make_descriptor(ctx, service::kSnmp);
    desc.details["community"] = "public";
    if (auto sys_descr = parse_sys_descr(*reply)) {
        const std::string text = printable(*sys_descr, 200);
        if (!text.empty()) {
            desc.details["sys_descr"] = text;
            desc.version_hint = text;
            add_hint_details(text, desc.details);
        }
    }

    desc.operations.push_back(scan::service_capability("Device management (SNMP)",
                                                       "Read device information and counters over SNMP", "snmp",
                                                       port, "snmp_get"));
    return desc;
}

std::optional<scan::ServiceDescriptor> DnsFingerprinter::probe(const FingerprintContext &ctx) const {
    auto reply = udp_reply(ctx);
    if (!reply || reply->size() < kDnsHeaderSize || net::read_be16(*reply, 0) != kDnsProbeId ||
        (byte_at(*reply, 2) & 0x80) == 0) {
        return std::nullopt;
    }

    const uint16_t port = ctx.probe.port;
    scan::ServiceDescriptor desc = make_descriptor(ctx, service::kDns);
    desc.details["rcode"] = std::to_string(byte_at(*reply, 3) & 0x0f);
    desc.details["recursion_available"] = (byte_at(*reply, 3) & 0x80) != 0 ? "true" : "false";
    desc.details["answers"] = std::to_string(net::read_be16(*reply, 6));

    desc.operations.push_back(scan::service_capability("Name resolution (DNS)",
                                                       "Resolve host names through this device", "dns", port,
                                                       "dns_query"));
    return desc;
}

}  // namespace fingerprint
}  // namespace sonar
