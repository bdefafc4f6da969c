#include "runtime/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace sonar::runtime;

class ConfigTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "sonar_config_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    std::string create_config_file(const std::string &name, const std::string &content) {
        fs::path config_path = temp_dir / name;
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }
};

TEST_F(ConfigTest, ValidFullConfig) {
    std::string config_content = R"(
http:
  enabled: true
  bind: 0.0.0.0
  port: 9090
  cors_allowed_origins:
    - http://localhost:3000
  thread_pool_size: 4

scan:
  tcp_ports: [22, 80, 443]
  udp_ports: [161]
  deadline_ms: 8000
  ping_retries: 0
  http_body_limit: 2048

backends:
  scanner: none
  bluetooth: absent
  camera: present

discovery:
  enabled: true
  wsd: false
  timeout_ms: 800

logging:
  level: debug
)";

    std::string config_path = create_config_file("full.yaml", config_content);
    RuntimeConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.http.bind, "0.0.0.0");
    EXPECT_EQ(config.http.port, 9090);
    EXPECT_EQ(config.http.thread_pool_size, 4);
    ASSERT_EQ(config.http.cors_allowed_origins.size(), 1u);
    EXPECT_EQ(config.http.cors_allowed_origins[0], "http://localhost:3000");
    EXPECT_EQ(config.engine.scan.tcp_ports, (std::vector<uint16_t>{22, 80, 443}));
    EXPECT_EQ(config.engine.scan.udp_ports, (std::vector<uint16_t>{161}));
    EXPECT_EQ(config.engine.scan.deadline_ms, 8000);
    EXPECT_EQ(config.engine.scan.ping_retries, 0);
    EXPECT_EQ(config.engine.scan.http_body_limit, 2048u);
    EXPECT_EQ(config.backends.scanner, "none");
    EXPECT_EQ(config.backends.bluetooth, "absent");
    EXPECT_FALSE(config.engine.discovery.wsd);
    EXPECT_TRUE(config.engine.discovery.ssdp);
    EXPECT_EQ(config.engine.discovery.timeout_ms, 800);
    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigTest, EmptyDocumentKeepsDefaults) {
    RuntimeConfig config;
    std::string error;

    ASSERT_TRUE(parse_config("", config, error)) << "Error: " << error;
    EXPECT_EQ(config.http.port, 8080);
    EXPECT_EQ(config.http.bind, "127.0.0.1");
    EXPECT_EQ(config.engine.scan.tcp_ports, sonar::scan::default_tcp_ports());
    EXPECT_EQ(config.engine.scan.deadline_ms, 12000);
    EXPECT_EQ(config.backends.scanner, "auto");
    EXPECT_EQ(config.logging.level, "info");
}

TEST_F(ConfigTest, MissingFile) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(load_config((temp_dir / "nope.yaml").string(), config, error));
    EXPECT_NE(error.find("Cannot open config file"), std::string::npos);
}

TEST_F(ConfigTest, MalformedYaml) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(parse_config("scan: [unclosed", config, error));
    EXPECT_NE(error.find("YAML parse error"), std::string::npos);
}

TEST_F(ConfigTest, WrongValueType) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(parse_config("http:\n  port: eighty\n", config, error));
    EXPECT_NE(error.find("Config value error"), std::string::npos);
}

TEST_F(ConfigTest, PortOutOfRangeInList) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(parse_config("scan:\n  tcp_ports: [22, 70000]\n", config, error));
    EXPECT_NE(error.find("70000"), std::string::npos);
}

TEST_F(ConfigTest, DuplicatePortsCollapse) {
    RuntimeConfig config;
    std::string error;

    ASSERT_TRUE(parse_config("scan:\n  tcp_ports: [80, 22, 80]\n", config, error)) << "Error: " << error;
    EXPECT_EQ(config.engine.scan.tcp_ports, (std::vector<uint16_t>{80, 22}));
}

TEST_F(ConfigTest, EmptyPortListRejected) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(parse_config("scan:\n  tcp_ports: []\n", config, error));
    EXPECT_NE(error.find("scan.tcp_ports"), std::string::npos);
}

TEST_F(ConfigTest, NonPositiveDeadlineRejected) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(parse_config("scan:\n  deadline_ms: 0\n", config, error));
    EXPECT_NE(error.find("scan.deadline_ms"), std::string::npos);
}

TEST_F(ConfigTest, PingRetriesCapped) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(parse_config("scan:\n  ping_retries: 3\n", config, error));
    EXPECT_NE(error.find("ping_retries"), std::string::npos);
}

TEST_F(ConfigTest, InvalidScannerBackend) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(parse_config("backends:\n  scanner: masscan\n", config, error));
    EXPECT_NE(error.find("backends.scanner"), std::string::npos);
}

TEST_F(ConfigTest, InvalidLogLevel) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(parse_config("logging:\n  level: verbose\n", config, error));
    EXPECT_NE(error.find("Invalid log level"), std::string::npos);
}

TEST_F(ConfigTest, InvalidHttpPortOnlyMattersWhenEnabled) {
    RuntimeConfig config;
    std::string error;

    EXPECT_FALSE(parse_config("http:\n  port: 0\n", config, error));

    RuntimeConfig disabled;
    EXPECT_TRUE(parse_config("http:\n  enabled: false\n  port: 0\n", disabled, error)) << "Error: " << error;
}

TEST_F(ConfigTest, ScalarCorsOrigin) {
    RuntimeConfig config;
    std::string error;

    ASSERT_TRUE(parse_config("http:\n  cors_allowed_origins: http://dashboard.lan\n", config, error))
        << "Error: " << error;
    ASSERT_EQ(config.http.cors_allowed_origins.size(), 1u);
    EXPECT_EQ(config.http.cors_allowed_origins[0], "http://dashboard.lan");
}

TEST_F(ConfigTest, UnknownKeysAreIgnored) {
    RuntimeConfig config;
    std::string error;

    EXPECT_TRUE(parse_config("telemetry:\n  enabled: true\nscan:\n  colour: blue\n", config, error))
        << "Error: " << error;
}
