#include "registry.hpp"

#include <algorithm>

#include "logging/logger.hpp"
#include "protocol_fingerprinters.hpp"

namespace sonar {
namespace fingerprint {

void FingerprinterRegistry::add(PortPredicate predicate, std::unique_ptr<IFingerprinter> fingerprinter) {
    entries_.push_back(Entry{std::move(predicate), std::move(fingerprinter)});
}

void FingerprinterRegistry::set_fallback(std::unique_ptr<IFingerprinter> fingerprinter) {
    fallback_ = std::move(fingerprinter);
}

std::optional<scan::ServiceDescriptor> FingerprinterRegistry::try_probe(const IFingerprinter &fingerprinter,
                                                                        const FingerprintContext &ctx) const {
    try {
        return fingerprinter.probe(ctx);
    } catch (const std::exception &e) {
        LOG_WARN("[Fingerprint] " << fingerprinter.name() << " failed on " << ctx.host << ":" << ctx.probe.port
                                  << ": " << e.what());
        return std::nullopt;
    }
}

std::vector<const IFingerprinter *> FingerprinterRegistry::candidates(const scan::ProbeResult &probe) const {
    std::vector<const IFingerprinter *> matching;
    for (const auto &entry : entries_) {
        if (entry.predicate(probe)) {
            matching.push_back(entry.fingerprinter.get());
        }
    }
    if (fallback_ && probe.protocol == scan::Transport::TCP) {
        matching.push_back(fallback_.get());
    }
    return matching;
}

std::optional<scan::ServiceDescriptor> FingerprinterRegistry::identify(const FingerprintContext &ctx) const {
    for (const IFingerprinter *fingerprinter : candidates(ctx.probe)) {
        if (ctx.deadline.expired()) {
            return std::nullopt;
        }
        if (auto desc = try_probe(*fingerprinter, ctx)) {
            LOG_DEBUG("[Fingerprint] " << ctx.host << ":" << ctx.probe.port << " -> " << desc->service_name);
            return desc;
        }
        LOG_DEBUG("[Fingerprint] " << fingerprinter->name() << " did not match " << ctx.host << ":"
                                   << ctx.probe.port);
    }
    return std::nullopt;
}

PortPredicate FingerprinterRegistry::tcp_ports(std::initializer_list<uint16_t> ports) {
    std::vector<uint16_t> list(ports);
    return [list](const scan::ProbeResult &probe) {
        return probe.protocol == scan::Transport::TCP && std::find(list.begin(), list.end(), probe.port) != list.end();
    };
}

PortPredicate FingerprinterRegistry::tcp_range(uint16_t first, uint16_t last) {
    return [first, last](const scan::ProbeResult &probe) {
        return probe.protocol == scan::Transport::TCP && probe.port >= first && probe.port <= last;
    };
}

PortPredicate FingerprinterRegistry::udp_ports(std::initializer_list<uint16_t> ports) {
    std::vector<uint16_t> list(ports);
    return [list](const scan::ProbeResult &probe) {
        return probe.protocol == scan::Transport::UDP && std::find(list.begin(), list.end(), probe.port) != list.end();
    };
}

FingerprinterRegistry FingerprinterRegistry::create_default() {
    FingerprinterRegistry registry;
    registry.add(tcp_ports({80, 5000, 8000, 8008, 8080, 8081, 8888, 32400, 49152}),
                 std::make_unique<HttpFingerprinter>());
    registry.add(tcp_ports({443, 5001, 8443, 8883}), std::make_unique<TlsFingerprinter>());
    registry.add(tcp_ports({22, 2222}), std::make_unique<SshFingerprinter>());
    registry.add(tcp_ports({21}), std::make_unique<FtpFingerprinter>());
    registry.add(tcp_ports({139, 445}), std::make_unique<SmbFingerprinter>());
    registry.add(tcp_ports({554, 8554}), std::make_unique<RtspFingerprinter>());
    registry.add(tcp_ports({1883}), std::make_unique<MqttFingerprinter>());
    registry.add(tcp_ports({23}), std::make_unique<TelnetFingerprinter>());
    registry.add(tcp_range(5900, 5903), std::make_unique<VncFingerprinter>());
    registry.add(tcp_ports({3389}), std::make_unique<RdpFingerprinter>());
    registry.add(tcp_ports({631}), std::make_unique<IppFingerprinter>());
    registry.add(tcp_ports({9100}), std::make_unique<JetDirectFingerprinter>());
    registry.add(tcp_ports({515}), std::make_unique<LpdFingerprinter>());
    registry.add(udp_ports({161}), std::make_unique<SnmpFingerprinter>());
    registry.add(udp_ports({53}), std::make_unique<DnsFingerprinter>());
    registry.set_fallback(std::make_unique<BannerFingerprinter>());
    return registry;
}

}  // namespace fingerprint
}  // namespace sonar
