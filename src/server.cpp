#include "server.hpp"
#include "dispatcher.hpp"
#include "util.hpp"
#include <iostream>

namespace perouter {

McpServer::McpServer(ServerConfig info, std::vector<std::unique_ptr<Tool>> tools)
    : info_(std::move(info)), tools_(std::move(tools)) {}

std::optional<nlohmann::json> McpServer::handle_line(const std::string& line) {
    if (trim(line).empty()) return std::nullopt;

    auto req = decode_request(line);
    if (!req) {
        std::cerr << "[server] Parse error on input line\n";
        return make_error(nullptr, RpcError{rpc_errors::ParseError, "Parse error"});
    }
    return handle_request(*req);
}

nlohmann::json McpServer::handle_request(const RpcRequest& req) {
    if (req.method == "initialize") {
        return handle_initialize(req);
    }
    if (req.method == "tools/list") {
        return make_result(req.id, format_tool_list(tools_));
    }
    if (req.method == "tools/call") {
        return handle_tools_call(req);
    }
    return make_error(req.id, RpcError{rpc_errors::MethodNotFound, "Method not found"});
}

nlohmann::json McpServer::handle_initialize(const RpcRequest& req) {
    const auto& p = req.params;
    if (!p.is_object() ||
        (p.contains("protocolVersion") && !p["protocolVersion"].is_string()) ||
        (p.contains("capabilities") && !p["capabilities"].is_object() && !p["capabilities"].is_null()) ||
        (p.contains("clientInfo") && !p["clientInfo"].is_object() && !p["clientInfo"].is_null())) {
        return make_error(req.id, RpcError{rpc_errors::InvalidParams, "Invalid params"});
    }

    if (p.contains("clientInfo") && p["clientInfo"].is_object()) {
        const auto& client = p["clientInfo"];
        if (client.contains("name") && client["name"].is_string()) {
            std::cerr << "[server] Client: " << client["name"].get<std::string>() << "\n";
        }
    }

    nlohmann::json result = {
        {"protocolVersion", info_.protocol_version},
        {"capabilities", {{"tools", {{"listChanged", true}}}}},
        {"serverInfo", {{"name", info_.name}, {"version", info_.version}}}
    };
    return make_result(req.id, std::move(result));
}

nlohmann::json McpServer::handle_tools_call(const RpcRequest& req) {
    const auto& p = req.params;
    if (!p.is_object() || !p.contains("name") || !p["name"].is_string() ||
        (p.contains("arguments") && !p["arguments"].is_object() && !p["arguments"].is_null())) {
        return make_error(req.id, RpcError{rpc_errors::InvalidParams, "Invalid params"});
    }

    std::string name = p["name"].get<std::string>();
    if (!find_tool(name, tools_)) {
        return make_error(req.id, RpcError{rpc_errors::UnknownTool, "Unknown tool: " + name});
    }

    std::string args_json = "{}";
    if (p.contains("arguments") && p["arguments"].is_object()) {
        args_json = p["arguments"].dump();
    }

    ToolContext ctx{call_id_from(req.id)};
    std::cerr << "[tool] " << name << " (request " << ctx.call_id << ")\n";
    ToolResult result = dispatch_tool(name, args_json, ctx, tools_);
    return make_result(req.id, format_tool_result(result));
}

void McpServer::run(std::istream& in, std::ostream& out) {
    std::string line;
    while (std::getline(in, line)) {
        auto response = handle_line(line);
        if (!response) continue;
        out << encode_response(*response) << '\n' << std::flush;
    }
}

} // namespace perouter
