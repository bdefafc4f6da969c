#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <stdexcept>

#include "fingerprint/keywords.hpp"
#include "fingerprint/protocol_fingerprinters.hpp"
#include "fingerprint/registry.hpp"
#include "mocks/mock_network.hpp"
#include "net/wire.hpp"

using namespace sonar;
using namespace sonar::fingerprint;
using namespace sonar::tests;
using namespace testing;

namespace {

bool has_capability(const scan::ServiceDescriptor &desc, const std::string &name) {
    for (const auto &cap : desc.operations) {
        if (cap.name == name) {
            return true;
        }
    }
    return false;
}

}  // namespace

class FingerprinterTest : public Test {
protected:
    void SetUp() override { network.set_silent_defaults(); }

    FingerprintContext context_for(uint16_t port, scan::Transport transport = scan::Transport::TCP) {
        probe.port = port;
        probe.protocol = transport;
        probe.open = true;
        return FingerprintContext{host, probe, network, deadline, options};
    }

    NiceMock<MockNetwork> network;
    std::string host = "10.0.0.5";
    scan::ProbeResult probe;
    scan::ScanOptions options;
    net::Deadline deadline{std::chrono::milliseconds(5000)};
};

TEST_F(FingerprinterTest, SshBannerIsParsed) {
    network.set_banner(22, "SSH-2.0-OpenSSH_8.9p1 Ubuntu-3\r\n");

    auto desc = SshFingerprinter().probe(context_for(22));
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->service_name, "SSH");
    EXPECT_EQ(desc->port, 22);
    EXPECT_EQ(desc->details.at("protocol_version"), "2.0");
    EXPECT_EQ(desc->details.at("software"), "OpenSSH_8.9p1 Ubuntu-3");
    ASSERT_FALSE(desc->operations.empty());
    EXPECT_EQ(desc->operations[0].name, "SSH connection");
    EXPECT_EQ(desc->operations[0].protocol, std::optional<std::string>("ssh"));
    EXPECT_EQ(desc->operations[0].port, std::optional<uint16_t>(22));
}

TEST_F(FingerprinterTest, NonSshBannerIsNotConfirmed) {
    network.set_banner(22, "220 ProFTPD Server ready\r\n");
    EXPECT_FALSE(SshFingerprinter().probe(context_for(22)).has_value());
}

TEST_F(FingerprinterTest, SilentPortIsNotConfirmed) {
    network.set_banner(22, "");
    EXPECT_FALSE(SshFingerprinter().probe(context_for(22)).has_value());
}

TEST_F(FingerprinterTest, HttpRootWithTitleAndHints) {
    ON_CALL(network, http_request(_, 80, Field(&net::HttpRequest::path, "/"), _, _, _))
        .WillByDefault(Return(http_reply(200, "<html><head><title>Synology DiskStation</title></head></html>",
                                         {{"server", "nginx"}})));

    auto desc = HttpFingerprinter().probe(context_for(80));
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->service_name, "HTTP");
    EXPECT_EQ(desc->details.at("title"), "Synology DiskStation");
    EXPECT_EQ(desc->details.at("server"), "nginx");
    EXPECT_EQ(desc->details.count("hint_storage"), 1u);
    EXPECT_TRUE(has_capability(*desc, "Web interface"));
    EXPECT_FALSE(has_capability(*desc, "Log in"));
}

TEST_F(FingerprinterTest, HttpAuthChallengeAddsLogin) {
    ON_CALL(network, http_request(_, 8080, Field(&net::HttpRequest::path, "/"), _, _, _))
        .WillByDefault(Return(http_reply(401, "", {{"www-authenticate", "Basic realm=\"router\""}})));

    auto desc = HttpFingerprinter().probe(context_for(8080));
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->details.at("auth_required"), "true");
    EXPECT_EQ(desc->details.count("hint_router"), 1u);
    bool has_login = false;
    for (const auto &cap : desc->operations) {
        has_login = has_login || cap.operation == std::optional<std::string>("login");
    }
    EXPECT_TRUE(has_login);
}

TEST_F(FingerprinterTest, HttpJsonApiIsDetected) {
    ON_CALL(network, http_request(_, 80, Field(&net::HttpRequest::path, "/"), _, _, _))
        .WillByDefault(Return(http_reply(200, "<html></html>")));
    ON_CALL(network, http_request(_, 80, Field(&net::HttpRequest::path, "/api"), _, _, _))
        .WillByDefault(Return(http_reply(200, "{}", {{"content-type", "application/json"}})));

    auto desc = HttpFingerprinter().probe(context_for(80));
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->details.at("api_path"), "/api");
    EXPECT_TRUE(has_capability(*desc, "REST API"));
}

TEST_F(FingerprinterTest, OnvifDeviceServiceIsDetected) {
    ON_CALL(network, http_request(_, 80, Field(&net::HttpRequest::path, "/"), _, _, _))
        .WillByDefault(Return(http_reply(200, "<html></html>")));
    ON_CALL(network, http_request(_, 80, Field(&net::HttpRequest::method, "POST"), _, _, _))
        .WillByDefault(Return(http_reply(200, "<tds:GetSystemDateAndTimeResponse><tds:SystemDateAndTime>")));

    auto desc = HttpFingerprinter().probe(context_for(80));
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->details.at("onvif"), "true");
    EXPECT_EQ(desc->details.count("hint_camera"), 1u);
    EXPECT_TRUE(has_capability(*desc, "ONVIF control"));
}

TEST_F(FingerprinterTest, NoHttpAnswerIsNotConfirmed) {
    EXPECT_FALSE(HttpFingerprinter().probe(context_for(80)).has_value());
}

TEST_F(FingerprinterTest, TlsOnMqttPortIsMqtts) {
    network.set_banner(8883, net::bytes({0x16, 0x03, 0x03, 0x00, 0x5d}));

    auto desc = TlsFingerprinter().probe(context_for(8883));
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->service_name, "MQTTS");
    EXPECT_TRUE(has_capability(*desc, "MQTT over TLS"));
}

TEST_F(FingerprinterTest, TlsWithoutHttpsInspectionStillOffersSecureWeb) {
    network.set_banner(443, net::bytes({0x16, 0x03, 0x03, 0x00, 0x5d}));

    auto desc = TlsFingerprinter().probe(context_for(443));
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->service_name, "HTTPS");
    EXPECT_EQ(desc->details.at("https_inspection"), "unavailable");
    EXPECT_TRUE(has_capability(*desc, "Secure web interface"));
}

TEST_F(FingerprinterTest, PlainTextOnTlsPortIsNotTls) {
    network.set_banner(443, "HTTP/1.1 400 Bad Request\r\n");
    EXPECT_FALSE(TlsFingerprinter().probe(context_for(443)).has_value());
}

TEST_F(FingerprinterTest, SmbShareUrlBracketsIpv6Host) {
    host = "fd00::5";
    network.set_banner(445, std::string("\x00\x00\x00\x40\xfeSMB", 8) + std::string(16, '\0'));

    auto desc = SmbFingerprinter().probe(context_for(445));
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->version_hint, std::optional<std::string>("SMB2+"));
    ASSERT_EQ(desc->operations.size(), 1u);
    EXPECT_EQ(desc->operations[0].url, std::optional<std::string>("smb://[fd00::5]:445/"));
}

TEST_F(FingerprinterTest, RtspOptionsReply) {
    network.set_banner(554, "RTSP/1.0 200 OK\r\nCSeq: 1\r\nServer: Hikvision-Webs\r\nPublic: OPTIONS, DESCRIBE\r\n\r\n");

    auto desc = RtspFingerprinter().probe(context_for(554));
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->service_name, "RTSP");
    EXPECT_EQ(desc->details.at("server"), "Hikvision-Webs");
    EXPECT_EQ(desc->details.count("hint_camera"), 1u);
    EXPECT_TRUE(has_capability(*desc, "Live video stream"));
}

TEST_F(FingerprinterTest, MqttConnackAccepted) {
    network.set_banner(1883, net::bytes({0x20, 0x02, 0x00, 0x00}));

    auto desc = MqttFingerprinter().probe(context_for(1883));
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->details.at("connack"), "0");
    EXPECT_TRUE(has_capability(*desc, "Publish messages"));
    EXPECT_TRUE(has_capability(*desc, "Subscribe to topics"));
    EXPECT_EQ(desc->details.count("auth_required"), 0u);
}

TEST_F(FingerprinterTest, MqttNotAuthorizedAsksForLogin) {
    network.set_banner(1883, net::bytes({0x20, 0x02, 0x00, 0x05}));

    auto desc = MqttFingerprinter().probe(context_for(1883));
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->details.at("auth_required"), "true");
}

TEST_F(FingerprinterTest, MqttPacketShape) {
    const std::string packet = MqttFingerprinter::connect_packet();
    EXPECT_EQ(net::byte_at(packet, 0), 0x10);
    EXPECT_EQ(static_cast<size_t>(net::byte_at(packet, 1)), packet.size() - 2);
    EXPECT_NE(packet.find("MQTT"), std::string::npos);
}

TEST_F(FingerprinterTest, VncProtocolVersion) {
    network.set_banner(5900, "RFB 003.008\n");

    auto desc = VncFingerprinter().probe(context_for(5900));
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->details.at("rfb_version"), "003.008");
}

TEST_F(FingerprinterTest, JetDirectAcceptsSilence) {
    network.set_banner(9100, "");

    auto desc = JetDirectFingerprinter().probe(context_for(9100));
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->service_name, "JetDirect");
    EXPECT_EQ(desc->details.at("hint_printer"), "jetdirect");
}

TEST_F(FingerprinterTest, JetDirectReadsModelFromPjl) {
    network.set_banner(9100, "@PJL INFO ID\r\n\"HP LaserJet 400 M401dn\"\r\n\f");

    auto desc = JetDirectFingerprinter().probe(context_for(9100));
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->details.at("model"), "HP LaserJet 400 M401dn");
}

TEST_F(FingerprinterTest, JetDirectRejectsOtherProtocols) {
    network.set_banner(9100, "SSH-2.0-dropbear\r\n");
    EXPECT_FALSE(JetDirectFingerprinter().probe(context_for(9100)).has_value());
}

TEST_F(FingerprinterTest, SnmpSysDescrFromScannerBanner) {
    const std::string descr = "RouterOS RB750Gr3";
    std::string reply = net::bytes({0x30, 0x30, 0x02, 0x01, 0x00});
    reply += net::bytes({0x06, 0x08, 0x2b, 0x06, 0x01, 0x02, 0x01, 0x01, 0x01, 0x00});
    reply += net::bytes({0x04, static_cast<int>(descr.size())}) + descr;
    probe.banner = reply;
    EXPECT_CALL(network, udp_exchange(_, _, _, _, _, _)).Times(0);

    auto desc = SnmpFingerprinter().probe(context_for(161, scan::Transport::UDP));
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->details.at("sys_descr"), descr);
    EXPECT_EQ(desc->details.count("hint_router"), 1u);
}

TEST_F(FingerprinterTest, BannerFallbackNamesKnownSignatures) {
    network.set_banner(2222, "SSH-2.0-dropbear_2020.81\r\n");

    auto desc = BannerFingerprinter().probe(context_for(2222));
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->service_name, "SSH");
    EXPECT_TRUE(has_capability(*desc, "Raw TCP connection"));
}

TEST(FingerprinterRegistryTest, DefaultTableOrder) {
    auto registry = FingerprinterRegistry::create_default();
    auto names = [&registry](const scan::ProbeResult &probe) {
        std::vector<std::string> out;
        for (const IFingerprinter *fingerprinter : registry.candidates(probe)) {
            out.push_back(fingerprinter->name());
        }
        return out;
    };

    scan::ProbeResult https;
    https.port = 443;
    EXPECT_EQ(names(https), (std::vector<std::string>{"tls", "banner"}));

    scan::ProbeResult snmp;
    snmp.port = 161;
    snmp.protocol = scan::Transport::UDP;
    EXPECT_EQ(names(snmp), (std::vector<std::string>{"snmp"}));

    scan::ProbeResult unknown;
    unknown.port = 12345;
    EXPECT_EQ(names(unknown), (std::vector<std::string>{"banner"}));
}

namespace {

class ThrowingFingerprinter : public IFingerprinter {
public:
    std::string name() const override { return "throwing"; }
    std::optional<scan::ServiceDescriptor> probe(const FingerprintContext &) const override {
        throw std::runtime_error("malformed reply");
    }
};

class FixedFingerprinter : public IFingerprinter {
public:
    explicit FixedFingerprinter(std::string service) : service_(std::move(service)) {}
    std::string name() const override { return service_; }
    std::optional<scan::ServiceDescriptor> probe(const FingerprintContext &ctx) const override {
        scan::ServiceDescriptor desc;
        desc.port = ctx.probe.port;
        desc.service_name = service_;
        return desc;
    }

private:
    std::string service_;
};

}  // namespace

TEST_F(FingerprinterTest, ThrowingFingerprinterFallsThroughToNext) {
    FingerprinterRegistry registry;
    registry.add(FingerprinterRegistry::tcp_ports({7000}), std::make_unique<ThrowingFingerprinter>());
    registry.add(FingerprinterRegistry::tcp_ports({7000}), std::make_unique<FixedFingerprinter>("Second"));

    auto desc = registry.identify(context_for(7000));
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->service_name, "Second");
}

TEST_F(FingerprinterTest, FallbackOnlyRunsForTcp) {
    FingerprinterRegistry registry;
    registry.set_fallback(std::make_unique<FixedFingerprinter>("Fallback"));

    EXPECT_TRUE(registry.identify(context_for(7000)).has_value());
    EXPECT_FALSE(registry.identify(context_for(7000, scan::Transport::UDP)).has_value());
}

TEST(KeywordTest, ShortKeywordsNeedWordBoundaries) {
    EXPECT_EQ(match_keywords("Synology NAS").count(scan::Archetype::STORAGE), 1u);
    EXPECT_EQ(match_keywords("Thinking about bananas").count(scan::Archetype::STORAGE), 0u);
    EXPECT_EQ(match_keywords("Blinking lights").count(scan::Archetype::PRINTER), 0u);
}
