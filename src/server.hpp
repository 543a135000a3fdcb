#pragma once
#include "config.hpp"
#include "rpc.hpp"
#include "tool.hpp"
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace perouter {

// Line-delimited JSON-RPC front end. Strictly sequential: each request is
// fully handled, including any bounded wait in a tool, before the next
// line is read.
class McpServer {
public:
    McpServer(ServerConfig info, std::vector<std::unique_ptr<Tool>> tools);

    // Response for one input line; nullopt for a blank line
    std::optional<nlohmann::json> handle_line(const std::string& line);

    nlohmann::json handle_request(const RpcRequest& req);

    // Serve until the input stream ends
    void run(std::istream& in, std::ostream& out);

    const std::vector<std::unique_ptr<Tool>>& tools() const { return tools_; }

private:
    nlohmann::json handle_initialize(const RpcRequest& req);
    nlohmann::json handle_tools_call(const RpcRequest& req);

    ServerConfig info_;
    std::vector<std::unique_ptr<Tool>> tools_;
};

} // namespace perouter
