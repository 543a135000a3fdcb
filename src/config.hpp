#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace perouter {

struct ServerConfig {
    std::string name = "openperouter-mcp";
    std::string version = "1.0.0";
    std::string protocol_version = "2024-11-05";
};

// Upper bounds applied to values read from the config file
constexpr uint32_t kMaxTimeoutMs = 24u * 60u * 60u * 1000u;
constexpr uint32_t kMaxObservationLines = 10000;

struct CaptureConfig {
    std::string output_root = "./captures";
    uint32_t observation_timeout_ms = 5000;
    uint32_t observation_max_lines = 20;
    uint32_t stop_timeout_ms = 15000;
};

struct Config {
    std::string scripts_dir = default_scripts_dir();
    std::string shell = "bash";

    ServerConfig server;
    CaptureConfig capture;

    // Load from the given path (or $PEROUTER_MCP_CONFIG, or
    // ~/.perouter-mcp/config.json when empty) + env vars
    static Config load(const std::string& path = "");

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Build a Config from already-merged JSON (no env overrides)
    static Config from_json(const nlohmann::json& j);

    // Path of a bundled script inside scripts_dir
    std::string script_path(const std::string& name) const;

    // Compile-time install location of the bundled scripts
    static std::string default_scripts_dir();
};

} // namespace perouter
