#include "config.hpp"
#include "util.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

#ifndef PEROUTER_MCP_SCRIPTS_DIR
#define PEROUTER_MCP_SCRIPTS_DIR "./scripts"
#endif

namespace perouter {

std::string Config::default_scripts_dir() {
    return PEROUTER_MCP_SCRIPTS_DIR;
}

nlohmann::json Config::defaults_json() {
    return {
        {"scripts_dir", default_scripts_dir()},
        {"shell", "bash"},
        {"server", {
            {"name", "openperouter-mcp"},
            {"version", "1.0.0"},
            {"protocol_version", "2024-11-05"}
        }},
        {"capture", {
            {"output_root", "./captures"},
            {"observation_timeout_ms", 5000},
            {"observation_max_lines", 20},
            {"stop_timeout_ms", 15000}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// Zero or a wrong type keeps the default; large values are capped
static uint32_t bounded(const nlohmann::json& obj, const char* key,
                        uint32_t fallback, uint32_t max) {
    if (!obj.contains(key) || !obj[key].is_number_unsigned()) return fallback;
    uint64_t v = obj[key].get<uint64_t>();
    if (v == 0) return fallback;
    return static_cast<uint32_t>(std::min<uint64_t>(v, max));
}

static uint32_t bounded_ms(const nlohmann::json& obj, const char* key, uint32_t fallback) {
    return bounded(obj, key, fallback, kMaxTimeoutMs);
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("scripts_dir") && j["scripts_dir"].is_string())
        cfg.scripts_dir = j["scripts_dir"].get<std::string>();
    if (j.contains("shell") && j["shell"].is_string())
        cfg.shell = j["shell"].get<std::string>();

    if (j.contains("server") && j["server"].is_object()) {
        auto& s = j["server"];
        if (s.contains("name") && s["name"].is_string())
            cfg.server.name = s["name"].get<std::string>();
        if (s.contains("version") && s["version"].is_string())
            cfg.server.version = s["version"].get<std::string>();
        if (s.contains("protocol_version") && s["protocol_version"].is_string())
            cfg.server.protocol_version = s["protocol_version"].get<std::string>();
    }

    if (j.contains("capture") && j["capture"].is_object()) {
        auto& c = j["capture"];
        if (c.contains("output_root") && c["output_root"].is_string())
            cfg.capture.output_root = c["output_root"].get<std::string>();
        cfg.capture.observation_timeout_ms = bounded_ms(c, "observation_timeout_ms",
                                                        cfg.capture.observation_timeout_ms);
        cfg.capture.observation_max_lines = bounded(c, "observation_max_lines",
                                                    cfg.capture.observation_max_lines,
                                                    kMaxObservationLines);
        cfg.capture.stop_timeout_ms = bounded_ms(c, "stop_timeout_ms",
                                                 cfg.capture.stop_timeout_ms);
    }

    return cfg;
}

Config Config::load(const std::string& path) {
    std::string config_path = path;
    if (config_path.empty()) {
        if (const char* v = std::getenv("PEROUTER_MCP_CONFIG"))
            config_path = v;
    }
    if (config_path.empty()) {
        config_path = "~/.perouter-mcp/config.json";
    }
    config_path = expand_home(config_path);

    nlohmann::json j;
    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            j = merge_defaults(nlohmann::json::parse(file), defaults_json());
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed config " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("PEROUTER_MCP_SCRIPTS_DIR"))
        cfg.scripts_dir = v;
    if (const char* v = std::getenv("PEROUTER_MCP_SHELL"))
        cfg.shell = v;
    if (const char* v = std::getenv("PEROUTER_MCP_CAPTURE_DIR"))
        cfg.capture.output_root = v;

    return cfg;
}

std::string Config::script_path(const std::string& name) const {
    return join_path(expand_home(scripts_dir), name);
}

} // namespace perouter
