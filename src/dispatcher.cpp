#include "dispatcher.hpp"

namespace perouter {

Tool* find_tool(const std::string& name,
                const std::vector<std::unique_ptr<Tool>>& tools) {
    for (const auto& tool : tools) {
        if (tool->tool_name() == name) return tool.get();
    }
    return nullptr;
}

ToolResult dispatch_tool(const std::string& name,
                         const std::string& args_json,
                         const ToolContext& ctx,
                         const std::vector<std::unique_ptr<Tool>>& tools) {
    if (Tool* tool = find_tool(name, tools)) {
        return tool->execute(args_json, ctx);
    }
    return ToolResult{false, "Unknown tool: " + name};
}

nlohmann::json format_tool_result(const ToolResult& result) {
    nlohmann::json item = {{"type", "text"}, {"text", result.output}};
    nlohmann::json payload;
    payload["content"] = nlohmann::json::array();
    payload["content"].push_back(std::move(item));
    if (!result.success) payload["isError"] = true;
    return payload;
}

nlohmann::json format_tool_list(const std::vector<std::unique_ptr<Tool>>& tools) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& tool : tools) {
        auto spec = tool->spec();
        nlohmann::json schema;
        try {
            schema = nlohmann::json::parse(spec.parameters_json);
        } catch (const nlohmann::json::parse_error&) {
            schema = {{"type", "object"}};
        }
        list.push_back({{"name", spec.name},
                        {"description", spec.description},
                        {"inputSchema", schema}});
    }
    return {{"tools", list}};
}

} // namespace perouter
