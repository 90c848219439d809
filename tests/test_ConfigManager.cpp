/**
 * GatewayConfig: defaults, clamping of numeric settings and load errors.
 */
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "core/ConfigManager.h"
#include "utils/Logger.h"

namespace fs = std::filesystem;

namespace {
class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLogFile("");
        Logger::getInstance().setConsoleEnabled(false);
        Logger::getInstance().setLevel(LogLevel::DEBUG);
        Logger::getInstance().setCallback([this](LogLevel level, const std::string& msg) {
            if (level == LogLevel::WARNING) warnings.push_back(msg);
        });
    }
    void TearDown() override {
        Logger::getInstance().setCallback(nullptr);
        Logger::getInstance().setLevel(LogLevel::INFO);
    }
    std::vector<std::string> warnings;
};

fs::path writeTemp(const std::string& name, const std::string& content) {
    fs::path p = fs::temp_directory_path() / name;
    std::ofstream f(p);
    f << content;
    return p;
}
} // namespace

TEST_F(ConfigManagerTest, DefaultsWhenSectionsMissing) {
    GatewayConfig cfg = GatewayConfig::fromJson(nlohmann::json::object());
    EXPECT_EQ(cfg.notebook.maxOutputSize, 2000);
    EXPECT_EQ(cfg.notebook.timeoutSeconds, 30);
    EXPECT_EQ(cfg.server.host, "127.0.0.1");
    EXPECT_EQ(cfg.server.port, 0);
    EXPECT_EQ(cfg.server.requestTimeoutSeconds, 600);
    EXPECT_EQ(cfg.server.maxRequestBytes(), 10u * 1024 * 1024);
    EXPECT_EQ(cfg.host.callTimeoutSeconds, 60);
    EXPECT_TRUE(cfg.workspaceRoots.empty());
    EXPECT_TRUE(warnings.empty());
}

TEST_F(ConfigManagerTest, OutOfRangeValuesAreClampedWithWarning) {
    auto j = nlohmann::json::parse(R"({
        "notebook": {"max_output_size": 50, "timeout_seconds": 1000},
        "server": {"request_timeout_seconds": 5, "max_request_size_mb": 500}
    })");
    GatewayConfig cfg = GatewayConfig::fromJson(j);
    EXPECT_EQ(cfg.notebook.maxOutputSize, 100);
    EXPECT_EQ(cfg.notebook.timeoutSeconds, 300);
    EXPECT_EQ(cfg.server.requestTimeoutSeconds, 30);
    EXPECT_DOUBLE_EQ(cfg.server.maxRequestSizeMB, 100);
    EXPECT_EQ(warnings.size(), 4u);
}

TEST_F(ConfigManagerTest, NonNumericValueFallsBackToDefault) {
    auto j = nlohmann::json::parse(R"({"notebook": {"timeout_seconds": "fast"}})");
    GatewayConfig cfg = GatewayConfig::fromJson(j);
    EXPECT_EQ(cfg.notebook.timeoutSeconds, 30);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find("timeout_seconds"), std::string::npos);
}

TEST_F(ConfigManagerTest, FractionalRequestSize) {
    auto j = nlohmann::json::parse(R"({"server": {"max_request_size_mb": 1.5}})");
    GatewayConfig cfg = GatewayConfig::fromJson(j);
    EXPECT_EQ(cfg.server.maxRequestBytes(), static_cast<size_t>(1.5 * 1024 * 1024));
}

TEST_F(ConfigManagerTest, LoadsFileWithAllSections) {
    fs::path p = writeTemp("nbgate_config_full.json", R"({
        "host": {"command": "node bridge.js", "call_timeout_seconds": 5},
        "workspace": {"roots": ["/srv/notebooks"]},
        "logging": {"level": "debug", "file": "", "console": false}
    })");
    GatewayConfig cfg = GatewayConfig::load(p.u8string());
    EXPECT_EQ(cfg.host.command, "node bridge.js");
    EXPECT_EQ(cfg.host.callTimeoutSeconds, 5);
    ASSERT_EQ(cfg.workspaceRoots.size(), 1u);
    EXPECT_EQ(cfg.workspaceRoots[0], "/srv/notebooks");
    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_TRUE(cfg.logging.file.empty());
    EXPECT_FALSE(cfg.logging.console);
}

TEST_F(ConfigManagerTest, MissingFileIsConfigError) {
    try {
        GatewayConfig::load((fs::temp_directory_path() / "nbgate_does_not_exist.json").u8string());
        FAIL() << "expected CONFIG_ERROR";
    } catch (const GatewayError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CONFIG_ERROR);
    }
}

TEST_F(ConfigManagerTest, SyntaxErrorIsConfigError) {
    fs::path p = writeTemp("nbgate_config_broken.json", "{ \"server\": ");
    try {
        GatewayConfig::load(p.u8string());
        FAIL() << "expected CONFIG_ERROR";
    } catch (const GatewayError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CONFIG_ERROR);
        EXPECT_NE(std::string(e.what()).find("JSON Parse Error"), std::string::npos);
    }
}

TEST(LoggerLevel, ParseLevel) {
    EXPECT_EQ(Logger::parseLevel("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::parseLevel("warn"), LogLevel::WARNING);
    EXPECT_EQ(Logger::parseLevel("error"), LogLevel::ERROR);
    EXPECT_EQ(Logger::parseLevel("chatty"), LogLevel::INFO);
}
