// =============================================================================
// Unit tests for config_loader.hpp
// Tests: defaults, section parsing, wrong types, missing/malformed files, env
// =============================================================================
#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include "config_loader.hpp"

using namespace droidpilot::config;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
static void writeTmpJson(const char* path, const char* content) {
    std::ofstream f(path);
    f << content;
}

class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("DROIDPILOT_IDENTIFIER");
        unsetenv("DROIDPILOT_ADB");
    }
    void TearDown() override {
        unsetenv("DROIDPILOT_IDENTIFIER");
        unsetenv("DROIDPILOT_ADB");
    }
};

TEST_F(ConfigLoaderTest, DefaultValues) {
    AppConfig cfg;
    EXPECT_EQ(cfg.bridge.adb_path,            "adb");
    EXPECT_TRUE(cfg.bridge.serial.empty());
    EXPECT_EQ(cfg.bridge.command_timeout_ms,  30000);
    EXPECT_EQ(cfg.server.host,                "127.0.0.1");
    EXPECT_EQ(cfg.server.host_port,           34777);
    EXPECT_EQ(cfg.server.test_server_port,    7102);
    EXPECT_EQ(cfg.timeouts.http_timeout_ms,   5000);
    EXPECT_EQ(cfg.timeouts.gesture_timeout_s, 30);
    EXPECT_TRUE(cfg.log.log_path.empty());
    EXPECT_EQ(cfg.log.level,                  "info");
}

TEST_F(ConfigLoaderTest, MissingFileReturnsDefaults) {
    AppConfig cfg = loadConfig("__nonexistent_droidpilot_xyz.json", true);
    EXPECT_EQ(cfg.bridge.adb_path, "adb");
    EXPECT_EQ(cfg.server.host_port, 34777);
}

TEST_F(ConfigLoaderTest, LoadsAllSections) {
    const char* path = "test_droidpilot_full.json";
    writeTmpJson(path, R"({
        "bridge":   {"adb_path": "/opt/sdk/adb", "serial": "emulator-5556", "command_timeout_ms": 9000},
        "server":   {"host": "localhost", "host_port": 40000, "test_server_port": 7200},
        "timeouts": {"http_timeout_ms": 2500, "gesture_timeout_s": 12},
        "log":      {"log_path": "run.log", "level": "debug"}
    })");

    AppConfig cfg = loadConfig(path, true);
    std::remove(path);

    EXPECT_EQ(cfg.bridge.adb_path,            "/opt/sdk/adb");
    EXPECT_EQ(cfg.bridge.serial,              "emulator-5556");
    EXPECT_EQ(cfg.bridge.command_timeout_ms,  9000);
    EXPECT_EQ(cfg.server.host,                "localhost");
    EXPECT_EQ(cfg.server.host_port,           40000);
    EXPECT_EQ(cfg.server.test_server_port,    7200);
    EXPECT_EQ(cfg.timeouts.http_timeout_ms,   2500);
    EXPECT_EQ(cfg.timeouts.gesture_timeout_s, 12);
    EXPECT_EQ(cfg.log.log_path,               "run.log");
    EXPECT_EQ(cfg.log.level,                  "debug");
}

TEST_F(ConfigLoaderTest, PartialFileKeepsOtherDefaults) {
    const char* path = "test_droidpilot_partial.json";
    writeTmpJson(path, R"({"server": {"host_port": 41000}})");

    AppConfig cfg = loadConfig(path, true);
    std::remove(path);

    EXPECT_EQ(cfg.server.host_port,        41000);
    EXPECT_EQ(cfg.server.test_server_port, 7102);
    EXPECT_EQ(cfg.bridge.adb_path,         "adb");
}

TEST_F(ConfigLoaderTest, WrongTypeFallsBackToDefault) {
    nlohmann::json j = nlohmann::json::parse(R"({"server": {"host_port": "not a number"}})");
    EXPECT_EQ(jsonGet<int>(j, "server", "host_port", 34777), 34777);
}

TEST_F(ConfigLoaderTest, MalformedJsonReturnsDefaults) {
    const char* path = "test_droidpilot_bad.json";
    writeTmpJson(path, "{ this is not json");

    AppConfig cfg = loadConfig(path, true);
    std::remove(path);

    EXPECT_EQ(cfg.server.host_port, 34777);
}

TEST_F(ConfigLoaderTest, EnvironmentOverridesFile) {
    const char* path = "test_droidpilot_env.json";
    writeTmpJson(path, R"({"bridge": {"serial": "from-file", "adb_path": "adb"}})");
    setenv("DROIDPILOT_IDENTIFIER", "from-env", 1);
    setenv("DROIDPILOT_ADB", "/usr/local/bin/adb", 1);

    AppConfig cfg = loadConfig(path, true);
    std::remove(path);

    EXPECT_EQ(cfg.bridge.serial,   "from-env");
    EXPECT_EQ(cfg.bridge.adb_path, "/usr/local/bin/adb");
}

TEST_F(ConfigLoaderTest, LogLevelNames) {
    using droidpilot::log::Level;
    using droidpilot::log::parseLevel;
    EXPECT_EQ(parseLevel("debug"), Level::Debug);
    EXPECT_EQ(parseLevel("WARN"), Level::Warn);
    EXPECT_EQ(parseLevel("warning"), Level::Warn);
    EXPECT_EQ(parseLevel("nonsense", Level::Error), Level::Error);
}
