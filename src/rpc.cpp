#include "rpc.hpp"

namespace perouter {

std::optional<RpcRequest> decode_request(const std::string& line) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error&) {
        return std::nullopt;
    }
    if (!j.is_object()) return std::nullopt;

    if (j.contains("jsonrpc") && !j["jsonrpc"].is_string() && !j["jsonrpc"].is_null())
        return std::nullopt;
    if (j.contains("method") && !j["method"].is_string() && !j["method"].is_null())
        return std::nullopt;

    RpcRequest req;
    if (j.contains("id")) req.id = j["id"];
    if (j.contains("method") && j["method"].is_string())
        req.method = j["method"].get<std::string>();
    if (j.contains("params")) req.params = j["params"];
    return req;
}

static nlohmann::json envelope(const nlohmann::json& id) {
    nlohmann::json resp = {{"jsonrpc", "2.0"}};
    if (!id.is_null()) resp["id"] = id;
    return resp;
}

nlohmann::json make_result(const nlohmann::json& id, nlohmann::json result) {
    nlohmann::json resp = envelope(id);
    resp["result"] = std::move(result);
    return resp;
}

nlohmann::json make_error(const nlohmann::json& id, const RpcError& error) {
    nlohmann::json resp = envelope(id);
    resp["error"] = {{"code", error.code}, {"message", error.message}};
    return resp;
}

std::string encode_response(const nlohmann::json& response) {
    return response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string call_id_from(const nlohmann::json& id) {
    if (id.is_null()) return "";
    if (id.is_string()) return id.get<std::string>();
    if (id.is_number_integer()) return id.dump();
    if (id.is_number_float()) {
        double v = id.get<double>();
        auto as_int = static_cast<long long>(v);
        if (static_cast<double>(as_int) == v) return std::to_string(as_int);
    }
    return id.dump();
}

} // namespace perouter
