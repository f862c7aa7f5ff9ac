#pragma once
// =============================================================================
// SimPilot Config Loader
// =============================================================================
// Loads settings from config.json (nlohmann/json), then applies environment
// overrides (WDA_HOST, WDA_PORT, LOG_LEVEL, SIMPILOT_ARTIFACT_DIR).
// =============================================================================

#include <string>
#include <fstream>
#include <map>
#include <cstdlib>
#include <nlohmann/json.hpp>
#include "simpilot_log.hpp"

namespace simpilot {
namespace config {

struct AgentConfig {
    std::string host = "127.0.0.1";
    int port = 8100;
    int timeout_ms = 30000;
    int connect_timeout_ms = 5000;
};

struct ScreenshotConfig {
    double scale = 0.5;
    std::string format = "jpeg";
    int quality = 80;
    std::string source = "simctl";  // "simctl" | "agent"
};

struct ArtifactConfig {
    std::string dir = "artifacts";
};

struct SimctlConfig {
    std::string xcrun_path = "xcrun";
};

struct LogConfig {
    std::string level = "info";
    std::string log_path;  // empty = stderr only
};

struct AppConfig {
    AgentConfig agent;
    ScreenshotConfig screenshot;
    ArtifactConfig artifacts;
    SimctlConfig simctl;
    LogConfig log;
    std::map<std::string, int> device_ports;  // udid -> agent port

    int agentPortFor(const std::string& udid) const {
        auto it = device_ports.find(udid);
        return it != device_ports.end() ? it->second : agent.port;
    }
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
    } catch (const nlohmann::json::exception& e) {
        SPLOG_WARN("config", "%s.%s has wrong type (%s), using default",
                   section.c_str(), key.c_str(), e.what());
    }
    return def;
}

inline void applyEnvOverrides(AppConfig& config) {
    if (const char* host = std::getenv("WDA_HOST"); host && *host) {
        config.agent.host = host;
    }
    if (const char* port = std::getenv("WDA_PORT"); port && *port) {
        try {
            config.agent.port = std::stoi(port);
        } catch (const std::exception&) {
            SPLOG_WARN("config", "Ignoring invalid WDA_PORT=%s", port);
        }
    }
    if (const char* level = std::getenv("LOG_LEVEL"); level && *level) {
        config.log.level = level;
    }
    if (const char* dir = std::getenv("SIMPILOT_ARTIFACT_DIR"); dir && *dir) {
        config.artifacts.dir = dir;
    }
}

inline AppConfig parseConfig(const nlohmann::json& j) {
    AppConfig config;

    config.agent.host = jsonGet<std::string>(j, "agent", "host", "127.0.0.1");
    config.agent.port = jsonGet<int>(j, "agent", "port", 8100);
    config.agent.timeout_ms = jsonGet<int>(j, "agent", "timeout_ms", 30000);
    config.agent.connect_timeout_ms = jsonGet<int>(j, "agent", "connect_timeout_ms", 5000);

    config.screenshot.scale = jsonGet<double>(j, "screenshot", "scale", 0.5);
    config.screenshot.format = jsonGet<std::string>(j, "screenshot", "format", "jpeg");
    config.screenshot.quality = jsonGet<int>(j, "screenshot", "quality", 80);
    config.screenshot.source = jsonGet<std::string>(j, "screenshot", "source", "simctl");

    config.artifacts.dir = jsonGet<std::string>(j, "artifacts", "dir", "artifacts");
    config.simctl.xcrun_path = jsonGet<std::string>(j, "simctl", "xcrun_path", "xcrun");

    config.log.level = jsonGet<std::string>(j, "log", "level", "info");
    config.log.log_path = jsonGet<std::string>(j, "log", "log_path", "");

    if (j.contains("devices") && j["devices"].is_array()) {
        for (const auto& dev : j["devices"]) {
            if (!dev.is_object()) continue;
            std::string udid = dev.value("udid", "");
            int port = dev.value("agent_port", 0);
            if (!udid.empty() && port > 0) {
                config.device_ports[udid] = port;
            }
        }
    }
    return config;
}

// @param configPath  Path to config file
// @param strict      If true, only try the exact path (no fallback search)
inline AppConfig loadConfig(const std::string& configPath = "config.json",
                            bool strict = false) {
    AppConfig config;

    std::ifstream file(configPath);
    if (!file.is_open() && !strict) {
        file.open("config.json");
        if (!file.is_open()) {
            file.open("../config.json");
        }
    }
    if (!file.is_open()) {
        SPLOG_WARN("config", "%s not found, using defaults", configPath.c_str());
    } else {
        try {
            config = parseConfig(nlohmann::json::parse(file));
        } catch (const nlohmann::json::exception& e) {
            SPLOG_ERROR("config", "JSON parse error: %s", e.what());
            config = AppConfig{};
        }
    }

    applyEnvOverrides(config);

    SPLOG_INFO("config", "Loaded: agent=%s:%d timeout=%dms artifacts=%s devices=%zu",
               config.agent.host.c_str(), config.agent.port, config.agent.timeout_ms,
               config.artifacts.dir.c_str(), config.device_ports.size());
    return config;
}

} // namespace config
} // namespace simpilot
