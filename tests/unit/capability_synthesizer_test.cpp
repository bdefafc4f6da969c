#include <gtest/gtest.h>

#include "scan/capability_catalog.hpp"
#include "scan/capability_synthesizer.hpp"

using namespace sonar::scan;

namespace {

std::vector<std::string> names_of(const std::vector<Capability> &caps) {
    std::vector<std::string> names;
    for (const auto &cap : caps) {
        names.push_back(cap.name);
    }
    return names;
}

DeviceProfile online_profile() {
    DeviceProfile profile;
    profile.address = "10.0.0.9";
    profile.status = DeviceStatus::ONLINE;
    return profile;
}

}  // namespace

TEST(CapabilitySynthesizerTest, DedupeKeepsFirstOccurrence) {
    auto first = service_capability("Print queue", catalog::kPrintQueue.description, "ipp", 631, "print_queue");
    auto second = plain_capability("Print queue", catalog::kPrintQueue.description, "print_queue");
    auto other = plain_capability("Print queue", "A different description", "print_queue");

    auto unique = CapabilitySynthesizer::dedupe({first, second, other});
    ASSERT_EQ(unique.size(), 2u);
    EXPECT_EQ(unique[0].port, std::optional<uint16_t>(631));
    EXPECT_EQ(unique[1].description, "A different description");
}

TEST(CapabilitySynthesizerTest, OfflineDeviceGetsWakeAndMonitor) {
    DeviceProfile profile;
    profile.status = DeviceStatus::OFFLINE;
    ServiceDescriptor ignored;
    ignored.operations.push_back(plain_capability("Web interface", "x", "open_web"));
    profile.services.push_back(ignored);

    auto caps = CapabilitySynthesizer::synthesize(profile, {});
    EXPECT_EQ(names_of(caps), (std::vector<std::string>{"Wake device", "Monitor availability"}));
}

TEST(CapabilitySynthesizerTest, ServiceOperationsComeBeforeTemplate) {
    auto profile = online_profile();
    ServiceDescriptor ipp;
    ipp.port = 631;
    ipp.service_name = "IPP";
    ipp.operations.push_back(service_capability(catalog::kPrintDocument.name, catalog::kPrintDocument.description,
                                                "ipp", 631, "print"));
    ipp.operations.push_back(service_capability(catalog::kPrintQueue.name, catalog::kPrintQueue.description, "ipp",
                                                631, "print_queue"));
    profile.services.push_back(ipp);
    profile.archetype = "printer";

    auto caps = CapabilitySynthesizer::synthesize(profile, {});
    EXPECT_EQ(names_of(caps), (std::vector<std::string>{"Print document", "Print queue", "Printer status"}));
    // Service-bound entry won over the template's unbound copy
    EXPECT_EQ(caps[1].protocol, std::optional<std::string>("ipp"));
}

TEST(CapabilitySynthesizerTest, DiscoveryCapabilitiesFollowTemplate) {
    auto profile = online_profile();
    ServiceDescriptor ssh;
    ssh.port = 22;
    ssh.service_name = "SSH";
    ssh.operations.push_back(service_capability("SSH connection", "Open a remote shell over SSH", "ssh", 22,
                                                "ssh_connect"));
    profile.services.push_back(ssh);
    profile.archetype = "workstation";

    auto caps = CapabilitySynthesizer::synthesize(
        profile, {plain_capability(catalog::kCastMedia.name, catalog::kCastMedia.description, "cast")});
    EXPECT_EQ(names_of(caps), (std::vector<std::string>{"SSH connection", "Remote access", "Cast media"}));
}

TEST(CapabilitySynthesizerTest, OnlineWithoutServicesIsMonitored) {
    auto caps = CapabilitySynthesizer::synthesize(online_profile(), {});
    EXPECT_EQ(names_of(caps), (std::vector<std::string>{"Monitor availability"}));
}

TEST(CapabilitySynthesizerTest, EveryArchetypeHasATemplate) {
    for (Archetype archetype : kArchetypePriority) {
        EXPECT_FALSE(CapabilitySynthesizer::archetype_template(archetype).empty())
            << archetype_to_string(archetype);
    }
}
