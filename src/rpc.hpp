#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace perouter {

namespace rpc_errors {
    constexpr int ParseError     = -32700;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams  = -32602;
    constexpr int UnknownTool    = -32001;
} // namespace rpc_errors

struct RpcRequest {
    nlohmann::json id;      // null when absent
    std::string method;
    nlohmann::json params;  // null when absent
};

struct RpcError {
    int code;
    std::string message;
};

// Decode one request line. nullopt if it is not a JSON object with the
// expected member types.
std::optional<RpcRequest> decode_request(const std::string& line);

nlohmann::json make_result(const nlohmann::json& id, nlohmann::json result);
nlohmann::json make_error(const nlohmann::json& id, const RpcError& error);

// Serialize a response as one line. Invalid UTF-8 from tool output is replaced.
std::string encode_response(const nlohmann::json& response);

// Invocation identifier used to key background calls: strings as-is,
// integers in decimal, anything else as compact JSON, empty when absent.
std::string call_id_from(const nlohmann::json& id);

} // namespace perouter
