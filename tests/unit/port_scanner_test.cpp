#include "scan/port_scanner.hpp"

#include <algorithm>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "mocks/mock_backends.hpp"
#include "mocks/mock_network.hpp"
#include "net/wire.hpp"

using namespace sonar;
using namespace sonar::scan;
using namespace sonar::tests;
using namespace testing;

class PortScannerTest : public Test {
protected:
    void SetUp() override {
        network.set_silent_defaults();
        options.tcp_ports = {80, 443, 22, 8080};
        options.udp_ports = {53, 161};
    }

    NiceMock<MockNetwork> network;
    ScanOptions options;
    net::Deadline deadline{std::chrono::milliseconds(5000)};
    WorkerPool pool{4};
};

TEST_F(PortScannerTest, ConnectLoopFindsSingleOpenPort) {
    network.set_port_open(22);

    PortScanReport report = PortScanner(network, options, nullptr).scan("10.0.0.5", pool, deadline);

    EXPECT_EQ(PortScanner::open_ports(report.results), (std::set<uint16_t>{22}));
    EXPECT_EQ(report.backend, "connect");
    EXPECT_FALSE(report.partial);
    EXPECT_EQ(report.results.size(), 6u);  // four TCP + two UDP probes
}

TEST_F(PortScannerTest, UnavailableExternalScannerFallsBackToConnectLoop) {
    NiceMock<MockExternalScanner> scanner;
    ON_CALL(scanner, name()).WillByDefault(Return("nmap"));
    EXPECT_CALL(scanner, available()).WillRepeatedly(Return(false));
    EXPECT_CALL(scanner, scan_tcp(_, _, _)).Times(0);
    network.set_port_open(22);

    PortScanReport report = PortScanner(network, options, &scanner).scan("10.0.0.5", pool, deadline);

    EXPECT_EQ(PortScanner::open_ports(report.results), (std::set<uint16_t>{22}));
    EXPECT_EQ(report.backend, "connect");
}

TEST_F(PortScannerTest, FailingExternalScannerFallsBackToConnectLoop) {
    NiceMock<MockExternalScanner> scanner;
    ON_CALL(scanner, name()).WillByDefault(Return("nmap"));
    ON_CALL(scanner, available()).WillByDefault(Return(true));
    EXPECT_CALL(scanner, scan_tcp(_, _, _)).WillOnce(Return(std::nullopt));
    network.set_port_open(80);

    PortScanReport report = PortScanner(network, options, &scanner).scan("10.0.0.5", pool, deadline);

    EXPECT_EQ(PortScanner::open_ports(report.results), (std::set<uint16_t>{80}));
    EXPECT_EQ(report.backend, "connect");
}

TEST_F(PortScannerTest, ExternalScannerResultsAreUsedWhenAvailable) {
    NiceMock<MockExternalScanner> scanner;
    ON_CALL(scanner, name()).WillByDefault(Return("nmap"));
    ON_CALL(scanner, available()).WillByDefault(Return(true));

    std::vector<ProbeResult> external;
    for (uint16_t port : options.tcp_ports) {
        ProbeResult probe;
        probe.port = port;
        probe.open = port == 443;
        external.push_back(probe);
    }
    EXPECT_CALL(scanner, scan_tcp(_, _, _)).WillOnce(Return(external));
    EXPECT_CALL(network, tcp_connect(_, _, _, _)).Times(0);

    PortScanReport report = PortScanner(network, options, &scanner).scan("10.0.0.5", pool, deadline);

    EXPECT_EQ(PortScanner::open_ports(report.results), (std::set<uint16_t>{443}));
    EXPECT_EQ(report.backend, "nmap");
}

TEST_F(PortScannerTest, UdpReplyIsKeptAsBanner) {
    const std::string reply = net::bytes({0xAA, 0xAA, 0x81, 0x80, 0x00, 0x01});
    ON_CALL(network, udp_exchange(_, 53, _, _, _, _)).WillByDefault(Return(reply));

    PortScanReport report = PortScanner(network, options, nullptr).scan("10.0.0.5", pool, deadline);

    auto it = std::find_if(report.results.begin(), report.results.end(), [](const ProbeResult &p) {
        return p.port == 53 && p.protocol == Transport::UDP;
    });
    ASSERT_NE(it, report.results.end());
    EXPECT_TRUE(it->open);
    ASSERT_TRUE(it->banner.has_value());
    EXPECT_EQ(*it->banner, reply);
}

TEST_F(PortScannerTest, ResultsAreSortedByPort) {
    PortScanReport report = PortScanner(network, options, nullptr).scan("10.0.0.5", pool, deadline);

    for (size_t i = 1; i < report.results.size(); ++i) {
        EXPECT_LE(report.results[i - 1].port, report.results[i].port);
    }
}

TEST(PortScannerPayloadTest, DnsQueryCarriesProbeId) {
    const std::string packet = PortScanner::dns_query_packet();
    ASSERT_GE(packet.size(), 12u);
    EXPECT_EQ(net::byte_at(packet, 0), 0xAA);
    EXPECT_EQ(net::byte_at(packet, 1), 0xAA);
    EXPECT_NE(packet.find("example"), std::string::npos);
}

TEST(PortScannerPayloadTest, SnmpGetIsWellFormedSequence) {
    const std::string packet = PortScanner::snmp_get_sysdescr_packet();
    ASSERT_GE(packet.size(), 2u);
    EXPECT_EQ(net::byte_at(packet, 0), 0x30);
    EXPECT_EQ(static_cast<size_t>(net::byte_at(packet, 1)), packet.size() - 2);
    EXPECT_NE(packet.find("public"), std::string::npos);
}
