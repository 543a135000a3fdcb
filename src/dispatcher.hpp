#pragma once
#include "tool.hpp"
#include <string>
#include <vector>
#include <memory>
#include <nlohmann/json.hpp>

namespace perouter {

// Find a tool by name (nullptr if unknown)
Tool* find_tool(const std::string& name,
                const std::vector<std::unique_ptr<Tool>>& tools);

// Execute a single tool call, finding the tool by name
ToolResult dispatch_tool(const std::string& name,
                         const std::string& args_json,
                         const ToolContext& ctx,
                         const std::vector<std::unique_ptr<Tool>>& tools);

// tools/call result payload: one text content item, isError on failure
nlohmann::json format_tool_result(const ToolResult& result);

// tools/list result payload
nlohmann::json format_tool_list(const std::vector<std::unique_ptr<Tool>>& tools);

} // namespace perouter
