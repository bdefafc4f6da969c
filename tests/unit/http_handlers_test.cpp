/**
 * @file http_handlers_test.cpp
 * @brief Unit tests for the HTTP scan surface
 *
 * Runs a real HttpServer over a ScanEngine whose network is mocked, so the
 * tests cover query parsing, envelope encoding, status mapping and CORS.
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <httplib.h>

#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <thread>

#include "http/server.hpp"
#include "mocks/mock_network.hpp"
#include "runtime/config.hpp"
#include "scan/scan_engine.hpp"

// Disabled under ThreadSanitizer: cpp-httplib's listen/bind threading
// triggers TSAN failures during server start-up.
#if defined(__SANITIZE_THREAD__)
#define SONAR_SKIP_HTTP_TESTS 1
#elif defined(__has_feature)
#if __has_feature(thread_sanitizer)
#define SONAR_SKIP_HTTP_TESTS 1
#else
#define SONAR_SKIP_HTTP_TESTS 0
#endif
#else
#define SONAR_SKIP_HTTP_TESTS 0
#endif

#if !SONAR_SKIP_HTTP_TESTS

using namespace sonar;
using namespace sonar::http;
using namespace testing;
using namespace sonar::tests;

/**
 * @brief Test fixture for HTTP handler tests
 *
 * The engine talks to a NiceMock network: 10.0.0.5 answers ping and has
 * SSH open, every other host and port stays silent. Uses test port 9999.
 */
class HttpHandlersTest : public Test {
protected:
    void SetUp() override {
        network.set_silent_defaults();
        ON_CALL(network, tcp_connect(_, _, _, _))
            .WillByDefault(Return(net::ConnectResult{net::ConnectStatus::TIMEOUT, std::nullopt}));
        net::PingResult reachable;
        reachable.reachable = true;
        reachable.latency_ms = 3;
        ON_CALL(network, ping("10.0.0.5", _, _)).WillByDefault(Return(reachable));
        ON_CALL(network, tcp_connect("10.0.0.5", 22, _, _))
            .WillByDefault(Return(net::ConnectResult{net::ConnectStatus::OPEN, 2u}));
        network.set_banner(22, "SSH-2.0-OpenSSH_8.9\r\n");

        scan::EngineOptions options;
        options.scan.tcp_ports = {22, 80};
        options.scan.udp_ports = {161};
        options.scan.deadline_ms = 3000;
        options.scan.worker_pool_size = 4;
        engine = std::make_unique<scan::ScanEngine>(options, network, scan::EngineBackends{});

        runtime::HttpConfig http_config;
        http_config.enabled = true;
        http_config.bind = "127.0.0.1";
        http_config.port = 9999;
        http_config.cors_allowed_origins = {"*"};
        http_config.thread_pool_size = 2;

        server = std::make_unique<HttpServer>(http_config, *engine);

        std::string error;
        ASSERT_TRUE(server->start(error)) << "Failed to start HTTP server: " << error;

        // Give server time to bind
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        client = std::make_unique<httplib::Client>("http://127.0.0.1:9999");
        client->set_connection_timeout(1, 0);
        client->set_read_timeout(10, 0);
    }

    void TearDown() override {
        client.reset();
        if (server) {
            server->stop();
        }
        server.reset();
        engine.reset();
    }

    NiceMock<MockNetwork> network;
    std::unique_ptr<scan::ScanEngine> engine;
    std::unique_ptr<HttpServer> server;
    std::unique_ptr<httplib::Client> client;
};

//=============================================================================
// Scan Handler Tests
//=============================================================================

TEST_F(HttpHandlersTest, ScanReachableHost) {
    auto res = client->Get("/v0/scan?address=10.0.0.5&type=computer&id=abc");

    ASSERT_TRUE(res);
    EXPECT_EQ(200, res->status);
    EXPECT_EQ("application/json", res->get_header_value("Content-Type"));

    auto json = nlohmann::json::parse(res->body);
    EXPECT_EQ("success", json["status"]);
    EXPECT_EQ("abc", json["id"]);
    EXPECT_FALSE(json.contains("error"));

    const auto &device = json["device_info"];
    EXPECT_EQ("10.0.0.5", device["address"]);
    EXPECT_EQ("computer", device["type"]);
    EXPECT_EQ("online", device["status"]);
    EXPECT_EQ("workstation", device["device_type"]);
    EXPECT_EQ(nlohmann::json::array({22}), device["open_ports"]);
    ASSERT_EQ(1, device["services"].size());
    EXPECT_EQ("SSH", device["services"][0]["service_name"]);
    EXPECT_EQ("2.0", device["services"][0]["details"]["protocol_version"]);

    bool has_ssh = false;
    for (const auto &cap : json["capabilities"]) {
        if (cap["name"] == "SSH connection") {
            has_ssh = true;
            EXPECT_EQ("ssh", cap["protocol"]);
            EXPECT_EQ(22, cap["port"]);
        }
    }
    EXPECT_TRUE(has_ssh);
}

TEST_F(HttpHandlersTest, ScanOfflineHost) {
    auto res = client->Get("/v0/scan?address=10.0.0.99");

    ASSERT_TRUE(res);
    EXPECT_EQ(200, res->status);

    auto json = nlohmann::json::parse(res->body);
    EXPECT_EQ("success", json["status"]);
    EXPECT_EQ("offline", json["device_info"]["status"]);
    EXPECT_EQ("unknown", json["device_info"]["device_type"]);
    ASSERT_EQ(2, json["capabilities"].size());
    EXPECT_EQ("Wake device", json["capabilities"][0]["name"]);
    EXPECT_FALSE(json["capabilities"][0].contains("port"));
}

TEST_F(HttpHandlersTest, ScanMissingAddress) {
    auto res = client->Get("/v0/scan");

    ASSERT_TRUE(res);
    EXPECT_EQ(400, res->status);

    auto json = nlohmann::json::parse(res->body);
    EXPECT_EQ("error", json["status"]);
    EXPECT_TRUE(json["capabilities"].empty());
    EXPECT_NE(std::string::npos, json["error"].get<std::string>().find("address"));
}

TEST_F(HttpHandlersTest, ScanUnsupportedMethod) {
    auto res = client->Get("/v0/scan?address=10.0.0.5&method=psychic");

    ASSERT_TRUE(res);
    EXPECT_EQ(400, res->status);

    auto json = nlohmann::json::parse(res->body);
    EXPECT_EQ("error", json["status"]);
}

TEST_F(HttpHandlersTest, ScanLinkLayerWithoutAdapter) {
    auto res = client->Get("/v0/scan?address=AA-BB-CC-DD-EE-FF&signal=-70");

    ASSERT_TRUE(res);
    EXPECT_EQ(200, res->status);

    auto json = nlohmann::json::parse(res->body);
    EXPECT_EQ("success", json["status"]);
    EXPECT_EQ("-70", json["device_info"]["signal_strength"]);

    bool has_unavailable = false;
    for (const auto &cap : json["capabilities"]) {
        has_unavailable = has_unavailable || !cap["available"].get<bool>();
    }
    EXPECT_TRUE(has_unavailable);
}

//=============================================================================
// Runtime Status Tests
//=============================================================================

TEST_F(HttpHandlersTest, GetRuntimeStatus) {
    ASSERT_TRUE(client->Get("/v0/scan"));

    auto res = client->Get("/v0/runtime/status");

    ASSERT_TRUE(res);
    EXPECT_EQ(200, res->status);

    auto json = nlohmann::json::parse(res->body);
    EXPECT_EQ("ok", json["status"]);
    EXPECT_TRUE(json.contains("version"));
    EXPECT_TRUE(json.contains("uptime_seconds"));
    EXPECT_EQ(1, json["scans_served"]);
    EXPECT_EQ(3000, json["deadline_ms"]);
    EXPECT_FALSE(json["backends"]["scanner"]["present"].get<bool>());
    EXPECT_FALSE(json["backends"]["bluetooth"]["present"].get<bool>());
    EXPECT_FALSE(json["backends"]["camera"]["present"].get<bool>());
}

//=============================================================================
// CORS Tests
//=============================================================================

TEST_F(HttpHandlersTest, CORSHeadersPresent) {
    httplib::Headers headers = {{"Origin", "http://localhost:3000"}};
    auto res = client->Get("/v0/runtime/status", headers);

    ASSERT_TRUE(res);
    EXPECT_EQ(200, res->status);
    EXPECT_EQ("*", res->get_header_value("Access-Control-Allow-Origin"));
    EXPECT_EQ("GET, OPTIONS", res->get_header_value("Access-Control-Allow-Methods"));
}

TEST_F(HttpHandlersTest, CORSHeadersAbsentWithoutOrigin) {
    auto res = client->Get("/v0/runtime/status");

    ASSERT_TRUE(res);
    EXPECT_FALSE(res->has_header("Access-Control-Allow-Origin"));
}

TEST_F(HttpHandlersTest, PreflightReturnsNoContent) {
    httplib::Headers headers = {{"Origin", "http://localhost:3000"}};
    auto res = client->Options("/v0/scan", headers);

    ASSERT_TRUE(res);
    EXPECT_EQ(204, res->status);
    EXPECT_TRUE(res->has_header("Access-Control-Allow-Methods"));
}

//=============================================================================
// Error Response Format Tests
//=============================================================================

TEST_F(HttpHandlersTest, ErrorResponseFormat) {
    auto res = client->Get("/v0/devices");

    ASSERT_TRUE(res);
    EXPECT_EQ(404, res->status);

    auto json = nlohmann::json::parse(res->body);
    EXPECT_EQ("error", json["status"]);
    EXPECT_EQ("NOT_FOUND", json["code"]);
    EXPECT_TRUE(json["capabilities"].is_array());
    EXPECT_FALSE(json["error"].get<std::string>().empty());
}

#else  // SONAR_SKIP_HTTP_TESTS
TEST(HttpHandlersTest, DISABLED_SkippedUnderThreadSanitizer) {
    GTEST_SKIP() << "HTTP handler tests disabled under ThreadSanitizer";
}

#endif  // !SONAR_SKIP_HTTP_TESTS
