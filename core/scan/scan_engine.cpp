#include "scan_engine.hpp"

#include <cctype>
#include <future>

#include "address_classifier.hpp"
#include "capability_synthesizer.hpp"
#include "device_classifier.hpp"
#include "discovery.hpp"
#include "link_layer_check.hpp"
#include "local_capture_check.hpp"
#include "logging/logger.hpp"
#include "port_scanner.hpp"
#include "reachability.hpp"
#include "worker_pool.hpp"

namespace sonar {
namespace scan {

namespace {

std::string trim(const std::string &s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

ScanResult error_result(ScanResult result, ScanErrorKind kind, const std::string &message) {
    result.status = ScanStatus::ERROR;
    result.error = message;
    result.error_kind = kind;
    result.capabilities.clear();
    return result;
}

std::string to_lower_ascii(std::string s) {
    for (auto &c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

}  // namespace

ScanEngine::ScanEngine(EngineOptions options, net::INetwork &network, EngineBackends backends)
    : ScanEngine(std::move(options), network, backends, fingerprint::FingerprinterRegistry::create_default()) {}

ScanEngine::ScanEngine(EngineOptions options, net::INetwork &network, EngineBackends backends,
                       fingerprint::FingerprinterRegistry registry)
    : options_(std::move(options)), network_(network), backends_(backends), registry_(std::move(registry)) {}

ScanMethod ScanEngine::method_for_kind(AddressKind kind) {
    switch (kind) {
        case AddressKind::LINK_LAYER:
            return ScanMethod::LINK_LAYER;
        case AddressKind::LOCAL_HANDLE:
            return ScanMethod::LOCAL_CAPTURE;
        case AddressKind::IP_LITERAL:
        case AddressKind::UNKNOWN:
        default:
            return ScanMethod::ADDRESS_BASED;
    }
}

ScanResult ScanEngine::scan(const ScanRequest &request) const {
    ScanResult result;
    if (!request.id.empty()) {
        result.request_id = request.id;
    }

    const std::string address = trim(request.address);
    DeviceProfile &profile = result.device_info;
    profile.address = address;
    profile.declared_type = request.declared_type;
    if (!request.signal_strength.empty()) {
        profile.signal_strength = request.signal_strength;
    }

    if (address.empty()) {
        return error_result(std::move(result), ScanErrorKind::INVALID_INPUT, "Missing required parameter: address");
    }
    auto method = scan_method_from_string(request.method);
    if (!method) {
        return error_result(std::move(result), ScanErrorKind::INVALID_INPUT,
                            "Unsupported scan method: '" + request.method +
                                "' (expected auto, link-layer, address-based or local-capture)");
    }

    try {
        profile.kind = AddressClassifier::classify(address);
        const ScanMethod effective = *method == ScanMethod::AUTO ? method_for_kind(profile.kind) : *method;
        profile.metadata["method"] = scan_method_to_string(effective);

        LOG_INFO("[Scan] " << address << " kind=" << address_kind_to_string(profile.kind)
                           << " method=" << scan_method_to_string(effective));

        switch (effective) {
            case ScanMethod::LINK_LAYER:
                result.capabilities =
                    LinkLayerCheck(backends_.bluetooth, std::chrono::milliseconds(options_.scan.probe_timeout_ms))
                        .run(profile);
                break;
            case ScanMethod::LOCAL_CAPTURE:
                result.capabilities = LocalCaptureCheck(backends_.camera).run(profile);
                break;
            case ScanMethod::ADDRESS_BASED:
            default:
                result.capabilities = scan_address(address, profile);
                break;
        }
    } catch (const std::exception &e) {
        LOG_ERROR("[Scan] " << address << " failed: " << e.what());
        return error_result(std::move(result), ScanErrorKind::INTERNAL, std::string("Scan failed: ") + e.what());
    }

    result.status = ScanStatus::SUCCESS;
    LOG_INFO("[Scan] " << address << " done: status=" << device_status_to_string(profile.status)
                       << " type=" << profile.archetype.value_or("unknown") << " capabilities="
                       << result.capabilities.size() << (profile.partial ? " (partial)" : ""));
    return result;
}

std::vector<Capability> ScanEngine::scan_address(const std::string &host, DeviceProfile &profile) const {
    const ScanOptions &opts = options_.scan;

    // Tasks reference everything declared before the pool; the pool is
    // destroyed (and its threads joined) first.
    net::Deadline deadline(std::chrono::milliseconds(opts.deadline_ms));
    const ReachabilityProbe reachability(network_, opts);
    const PortScanner port_scanner(network_, opts, backends_.scanner);
    const DiscoveryProbe discovery(network_, options_.discovery);
    WorkerPool pool(static_cast<size_t>(opts.worker_pool_size));

    const Reachability reach = reachability.check(host, deadline);
    profile.latency_ms = reach.latency_ms;
    if (!reach.reachable) {
        LOG_INFO("[Scan] " << host << " unreachable, reporting offline");
        profile.status = DeviceStatus::OFFLINE;
        return CapabilitySynthesizer::synthesize(profile, {});
    }
    profile.status = DeviceStatus::ONLINE;
    profile.metadata["reachability"] = reach.method;

    PortScanReport ports = port_scanner.scan(host, pool, deadline);
    profile.open_ports = PortScanner::open_ports(ports.results);
    profile.metadata["port_scanner"] = ports.backend;
    profile.partial = ports.partial;

    // Fan out: one fingerprint task per open probe, one task per discovery protocol
    std::vector<std::future<std::optional<ServiceDescriptor>>> fingerprints;
    for (const auto &probe : ports.results) {
        if (!probe.open) {
            continue;
        }
        fingerprints.push_back(pool.submit([this, &host, probe, &deadline]() {
            fingerprint::FingerprintContext ctx{host, probe, network_, deadline, options_.scan};
            return registry_.identify(ctx);
        }));
    }

    std::vector<std::future<std::optional<DiscoveryFinding>>> findings;
    for (auto &task : discovery.tasks(host, deadline)) {
        findings.push_back(pool.submit(std::move(task)));
    }

    // Fan in on this thread only; results keep port order
    for (auto &future : fingerprints) {
        if (future.wait_until(deadline.expires_at()) != std::future_status::ready) {
            profile.partial = true;
            continue;
        }
        try {
            if (auto service = future.get()) {
                profile.protocols_seen.insert(to_lower_ascii(service->service_name));
                profile.services.push_back(std::move(*service));
            }
        } catch (const std::exception &e) {
            LOG_WARN("[Scan] Fingerprint task failed: " << e.what());
        }
    }

    if (auto archetype = DeviceClassifier::classify(profile.services, profile.open_ports)) {
        profile.archetype = archetype_to_string(*archetype);
    }

    std::vector<Capability> discovery_capabilities;
    for (auto &future : findings) {
        if (future.wait_until(deadline.expires_at()) != std::future_status::ready) {
            profile.partial = true;
            continue;
        }
        try {
            auto finding = future.get();
            if (!finding) {
                continue;
            }
            profile.protocols_seen.insert(finding->protocol);
            for (const auto &[key, value] : finding->details) {
                profile.metadata[finding->protocol + "." + key] = value;
            }
            discovery_capabilities.insert(discovery_capabilities.end(), finding->capabilities.begin(),
                                          finding->capabilities.end());
        } catch (const std::exception &e) {
            LOG_WARN("[Scan] Discovery task failed: " << e.what());
        }
    }

    if (profile.partial) {
        LOG_WARN("[Scan] " << host << " hit the " << opts.deadline_ms << "ms deadline, returning partial results");
        deadline.cancel();
    }
    return CapabilitySynthesizer::synthesize(profile, discovery_capabilities);
}

}  // namespace scan
}  // namespace sonar
