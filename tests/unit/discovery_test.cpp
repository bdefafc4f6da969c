#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "mocks/mock_network.hpp"
#include "net/wire.hpp"
#include "scan/discovery.hpp"

using namespace sonar;
using namespace sonar::scan;
using namespace sonar::tests;
using namespace testing;

namespace {

void append_labels(std::string &out, std::initializer_list<const char *> labels) {
    for (const char *label : labels) {
        out.push_back(static_cast<char>(std::char_traits<char>::length(label)));
        out += label;
    }
}

void append_pointer(std::string &out, size_t offset) {
    out += net::bytes({0xC0 | static_cast<int>(offset >> 8), static_cast<int>(offset & 0xFF)});
}

// Response with two PTR answers under _services._dns-sd._udp.local, using name compression
std::string mdns_reply() {
    std::string packet = net::bytes({0x00, 0x00, 0x84, 0x00, 0x00, 0x00, 0x00, 0x02, 0x00, 0x00, 0x00, 0x00});

    const size_t owner_offset = packet.size();
    append_labels(packet, {"_services", "_dns-sd", "_udp"});
    const size_t local_offset = packet.size();
    append_labels(packet, {"local"});
    packet.push_back('\0');

    auto append_ptr_answer = [&](bool first, const char *service) {
        if (!first) {
            append_pointer(packet, owner_offset);
        }
        std::string rdata;
        append_labels(rdata, {service, "_tcp"});
        append_pointer(rdata, local_offset);
        packet += net::bytes({0x00, 0x0c, 0x00, 0x01, 0x00, 0x00, 0x11, 0x94});
        net::append_be16(packet, static_cast<uint16_t>(rdata.size()));
        packet += rdata;
    };
    append_ptr_answer(true, "_ipp");
    append_ptr_answer(false, "_airplay");
    return packet;
}

std::vector<std::string> names_of(const std::vector<Capability> &caps) {
    std::vector<std::string> names;
    for (const auto &cap : caps) {
        names.push_back(cap.name);
    }
    return names;
}

}  // namespace

class DiscoveryTest : public Test {
protected:
    void SetUp() override { network.set_silent_defaults(); }

    NiceMock<MockNetwork> network;
    DiscoveryOptions options;
    net::Deadline deadline{std::chrono::milliseconds(5000)};
};

TEST(DiscoveryParseTest, SsdpHeadersAreLowercased) {
    auto headers = DiscoveryProbe::parse_ssdp_response(
        "HTTP/1.1 200 OK\r\nCACHE-CONTROL: max-age=1800\r\nLOCATION: http://10.0.0.7:49152/desc.xml\r\n"
        "SERVER: Linux/5.4 UPnP/1.0 Sonos/70.3\r\n\r\n");
    ASSERT_TRUE(headers.has_value());
    EXPECT_EQ(headers->at("location"), "http://10.0.0.7:49152/desc.xml");
    EXPECT_EQ(headers->at("server"), "Linux/5.4 UPnP/1.0 Sonos/70.3");
    EXPECT_EQ(headers->at("cache-control"), "max-age=1800");
}

TEST(DiscoveryParseTest, SsdpRejectsNonHttp) {
    EXPECT_FALSE(DiscoveryProbe::parse_ssdp_response("garbage").has_value());
    EXPECT_FALSE(DiscoveryProbe::parse_ssdp_response("HTTP/1.1 404 Not Found\r\n\r\n").has_value());
}

TEST(DiscoveryParseTest, MdnsPtrTargetsFollowCompression) {
    auto targets = DiscoveryProbe::parse_mdns_ptr_records(mdns_reply());
    ASSERT_TRUE(targets.has_value());
    EXPECT_EQ(*targets, (std::vector<std::string>{"_ipp._tcp.local", "_airplay._tcp.local"}));
}

TEST(DiscoveryParseTest, MdnsQueryIsNotAResponse) {
    EXPECT_FALSE(DiscoveryProbe::parse_mdns_ptr_records(DiscoveryProbe::mdns_services_query()).has_value());
    EXPECT_FALSE(DiscoveryProbe::parse_mdns_ptr_records("short").has_value());
}

TEST(DiscoveryParseTest, MdnsPointerLoopIsRejected) {
    std::string packet = net::bytes({0x00, 0x00, 0x84, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00});
    append_pointer(packet, 12);  // points at itself
    packet += net::bytes({0x00, 0x0c, 0x00, 0x01, 0x00, 0x00, 0x00, 0x10, 0x00, 0x00});

    auto targets = DiscoveryProbe::parse_mdns_ptr_records(packet);
    ASSERT_TRUE(targets.has_value());
    EXPECT_TRUE(targets->empty());
}

TEST(DiscoveryParseTest, XmlElementTextIgnoresPrefix) {
    const std::string xml = "<env:Body><d:ProbeMatch><d:Types> dn:NetworkVideoTransmitter </d:Types>"
                            "<d:Scopes/><d:XAddrs>http://10.0.0.8/onvif/device_service</d:XAddrs></d:ProbeMatch>";
    EXPECT_EQ(DiscoveryProbe::xml_element_text(xml, "Types"), std::optional<std::string>("dn:NetworkVideoTransmitter"));
    EXPECT_EQ(DiscoveryProbe::xml_element_text(xml, "XAddrs"),
              std::optional<std::string>("http://10.0.0.8/onvif/device_service"));
    EXPECT_FALSE(DiscoveryProbe::xml_element_text(xml, "Scopes").has_value());
    EXPECT_FALSE(DiscoveryProbe::xml_element_text(xml, "Missing").has_value());
}

TEST_F(DiscoveryTest, SsdpMediaRendererCanCast) {
    ON_CALL(network, udp_exchange(_, DiscoveryProbe::kSsdpPort, _, _, _, _))
        .WillByDefault(Return(std::string("HTTP/1.1 200 OK\r\nLOCATION: http://10.0.0.7:1400/xml/device.xml\r\n"
                                          "ST: urn:schemas-upnp-org:device:MediaRenderer:1\r\n\r\n")));

    auto finding = DiscoveryProbe(network, options).probe_ssdp("10.0.0.7", deadline);
    ASSERT_TRUE(finding.has_value());
    EXPECT_EQ(finding->protocol, "ssdp");
    EXPECT_EQ(finding->details.at("location"), "http://10.0.0.7:1400/xml/device.xml");
    EXPECT_EQ(names_of(finding->capabilities), (std::vector<std::string>{"UPnP device description", "Cast media"}));
    EXPECT_EQ(finding->capabilities[0].url, std::optional<std::string>("http://10.0.0.7:1400/xml/device.xml"));
}

TEST_F(DiscoveryTest, MdnsServicesMapToCapabilities) {
    ON_CALL(network, udp_exchange(_, DiscoveryProbe::kMdnsPort, _, _, _, _)).WillByDefault(Return(mdns_reply()));

    auto finding = DiscoveryProbe(network, options).probe_mdns("10.0.0.9", deadline);
    ASSERT_TRUE(finding.has_value());
    EXPECT_EQ(finding->details.at("services"), "_ipp._tcp.local,_airplay._tcp.local");
    EXPECT_EQ(names_of(finding->capabilities),
              (std::vector<std::string>{"Service discovery (mDNS)", "Print document", "Cast media"}));
}

TEST_F(DiscoveryTest, WsdOnvifCameraOffersLiveView) {
    ON_CALL(network, udp_exchange(_, DiscoveryProbe::kWsdPort, _, _, _, _))
        .WillByDefault(Return(std::string("<s:Envelope><s:Body><d:ProbeMatches><d:ProbeMatch>"
                                          "<d:Types>dn:NetworkVideoTransmitter tds:Device</d:Types>"
                                          "<d:XAddrs>http://10.0.0.8/onvif/device_service</d:XAddrs>"
                                          "</d:ProbeMatch></d:ProbeMatches></s:Body></s:Envelope>")));

    auto finding = DiscoveryProbe(network, options).probe_wsd("10.0.0.8", deadline);
    ASSERT_TRUE(finding.has_value());
    EXPECT_EQ(finding->details.at("onvif"), "true");
    EXPECT_EQ(finding->details.at("xaddrs"), "http://10.0.0.8/onvif/device_service");
    EXPECT_EQ(names_of(finding->capabilities), (std::vector<std::string>{"WS-Discovery endpoint", "Live view"}));
}

TEST_F(DiscoveryTest, SilentHostYieldsNothing) {
    const std::string host = "10.0.0.10";
    DiscoveryProbe probe(network, options);
    auto tasks = probe.tasks(host, deadline);
    ASSERT_EQ(tasks.size(), 3u);
    for (auto &task : tasks) {
        EXPECT_FALSE(task().has_value());
    }
}

TEST_F(DiscoveryTest, OnlyEnabledProtocolsAreProbed) {
    options.ssdp = false;
    options.wsd = false;
    const std::string host = "10.0.0.10";
    EXPECT_CALL(network, udp_exchange(_, DiscoveryProbe::kMdnsPort, _, _, _, _)).Times(1);

    DiscoveryProbe probe(network, options);
    auto tasks = probe.tasks(host, deadline);
    ASSERT_EQ(tasks.size(), 1u);
    tasks[0]();
}

TEST_F(DiscoveryTest, DisabledDiscoverySendsNothing) {
    options.enabled = false;
    EXPECT_CALL(network, udp_exchange(_, _, _, _, _, _)).Times(0);
    EXPECT_TRUE(DiscoveryProbe(network, options).tasks("10.0.0.10", deadline).empty());
}
