#pragma once
#include "../tool.hpp"
#include <nlohmann/json.hpp>
#include <optional>

namespace perouter {

// Parse JSON tool arguments. Returns error ToolResult on failure.
inline std::optional<ToolResult> parse_tool_json(
    const std::string& args_json, nlohmann::json& out) {
    try {
        out = args_json.empty() ? nlohmann::json::object() : nlohmann::json::parse(args_json);
    } catch (const std::exception& e) {
        return ToolResult{false, std::string("Failed to parse arguments: ") + e.what()};
    }
    if (out.is_null()) out = nlohmann::json::object();
    if (!out.is_object()) {
        return ToolResult{false, "Arguments must be a JSON object"};
    }
    return std::nullopt;
}

// Read an optional string field into out (left untouched when absent or
// null). Returns error ToolResult if present with another type.
inline std::optional<ToolResult> optional_string(const nlohmann::json& args,
                                                 const char* field, std::string& out) {
    if (!args.contains(field) || args[field].is_null()) return std::nullopt;
    if (!args[field].is_string()) {
        return ToolResult{false, std::string("Parameter must be a string: ") + field};
    }
    out = args[field].get<std::string>();
    return std::nullopt;
}

} // namespace perouter
