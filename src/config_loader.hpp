#pragma once
// =============================================================================
// DroidPilot Config Loader
// =============================================================================
// Loads settings from config.json with nlohmann/json. Environment variables
// DROIDPILOT_IDENTIFIER and DROIDPILOT_ADB override the file.
// =============================================================================

#include <string>
#include <fstream>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include "droidpilot_log.hpp"

namespace droidpilot {
namespace config {

struct BridgeConfig {
    std::string adb_path = "adb";
    std::string serial;                 // empty: pick the only attached device
    int command_timeout_ms = 30000;
};

struct ServerConfig {
    std::string host = "127.0.0.1";
    int host_port = 34777;              // forwarded to test_server_port on device
    int test_server_port = 7102;
};

struct TimeoutConfig {
    int http_timeout_ms = 5000;
    int gesture_timeout_s = 30;
};

struct LogConfig {
    std::string log_path;               // empty: stderr only
    std::string level = "info";
};

struct AppConfig {
    BridgeConfig bridge;
    ServerConfig server;
    TimeoutConfig timeouts;
    LogConfig log;
};

// Safe JSON accessor with section/key and default value
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    if (!j.contains(section) || !j[section].is_object()) return def;
    const auto& sec = j[section];
    if (!sec.contains(key)) return def;
    try {
        return sec[key].get<T>();
    } catch (const nlohmann::json::type_error& e) {
        DPLOG_WARN("config", "%s.%s has wrong type (%s), using default",
                   section.c_str(), key.c_str(), e.what());
    }
    return def;
}

inline void applyEnvOverrides(AppConfig& config) {
    if (const char* serial = std::getenv("DROIDPILOT_IDENTIFIER")) {
        if (*serial) config.bridge.serial = serial;
    }
    if (const char* adb = std::getenv("DROIDPILOT_ADB")) {
        if (*adb) config.bridge.adb_path = adb;
    }
}

inline AppConfig parseConfig(const nlohmann::json& j) {
    AppConfig config;

    config.bridge.adb_path = jsonGet<std::string>(j, "bridge", "adb_path", "adb");
    config.bridge.serial = jsonGet<std::string>(j, "bridge", "serial", "");
    config.bridge.command_timeout_ms = jsonGet<int>(j, "bridge", "command_timeout_ms", 30000);

    config.server.host = jsonGet<std::string>(j, "server", "host", "127.0.0.1");
    config.server.host_port = jsonGet<int>(j, "server", "host_port", 34777);
    config.server.test_server_port = jsonGet<int>(j, "server", "test_server_port", 7102);

    config.timeouts.http_timeout_ms = jsonGet<int>(j, "timeouts", "http_timeout_ms", 5000);
    config.timeouts.gesture_timeout_s = jsonGet<int>(j, "timeouts", "gesture_timeout_s", 30);

    config.log.log_path = jsonGet<std::string>(j, "log", "log_path", "");
    config.log.level = jsonGet<std::string>(j, "log", "level", "info");

    return config;
}

// @param configPath  Path to config file
// @param strict      If true, only try the exact path (no fallback search)
inline AppConfig loadConfig(const std::string& configPath = "droidpilot.json",
                            bool strict = false) {
    AppConfig config;

    std::ifstream file(configPath);
    if (!file.is_open() && !strict) {
        file.open("config.json");
    }
    if (!file.is_open()) {
        DPLOG_WARN("config", "%s not found, using defaults", configPath.c_str());
        applyEnvOverrides(config);
        return config;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config = parseConfig(j);
    } catch (const nlohmann::json::exception& e) {
        DPLOG_ERROR("config", "JSON parse error: %s", e.what());
        config = AppConfig{};
    }

    applyEnvOverrides(config);

    DPLOG_INFO("config", "Loaded: adb=%s serial=%s endpoint=%s:%d test_server_port=%d",
               config.bridge.adb_path.c_str(),
               config.bridge.serial.empty() ? "(auto)" : config.bridge.serial.c_str(),
               config.server.host.c_str(), config.server.host_port,
               config.server.test_server_port);

    return config;
}

} // namespace config
} // namespace droidpilot
