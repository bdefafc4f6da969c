#pragma once

#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "fingerprinter.hpp"

namespace sonar {
namespace fingerprint {

using PortPredicate = std::function<bool(const scan::ProbeResult &)>;

/**
 * @brief Ordered (PortPredicate, Fingerprinter) table.
 *
 * identify() tries every entry whose predicate accepts the probe, in
 * registration order, and returns the first confirmed descriptor. TCP ports
 * nothing confirmed go to the fallback banner grabber. A fingerprinter that
 * throws counts as "not confirmed" and is logged.
 */
class FingerprinterRegistry {
public:
    FingerprinterRegistry() = default;

    FingerprinterRegistry(const FingerprinterRegistry &) = delete;
    FingerprinterRegistry &operator=(const FingerprinterRegistry &) = delete;
    FingerprinterRegistry(FingerprinterRegistry &&) = default;
    FingerprinterRegistry &operator=(FingerprinterRegistry &&) = default;

    void add(PortPredicate predicate, std::unique_ptr<IFingerprinter> fingerprinter);
    void set_fallback(std::unique_ptr<IFingerprinter> fingerprinter);

    std::optional<scan::ServiceDescriptor> identify(const FingerprintContext &ctx) const;

    // Fingerprinters identify() tries for probe, in order, fallback last
    std::vector<const IFingerprinter *> candidates(const scan::ProbeResult &probe) const;

    size_t size() const { return entries_.size(); }

    static PortPredicate tcp_ports(std::initializer_list<uint16_t> ports);
    static PortPredicate tcp_range(uint16_t first, uint16_t last);
    static PortPredicate udp_ports(std::initializer_list<uint16_t> ports);

    // The production table
    static FingerprinterRegistry create_default();

private:
    struct Entry {
        PortPredicate predicate;
        std::unique_ptr<IFingerprinter> fingerprinter;
    };

    std::optional<scan::ServiceDescriptor> try_probe(const IFingerprinter &fingerprinter,
                                                     const FingerprintContext &ctx) const;

    std::vector<Entry> entries_;
    std::unique_ptr<IFingerprinter> fallback_;
};

}  // namespace fingerprint
}  // namespace sonar
