#include "json_rpc.hpp"
#include "../errors.hpp"
#include "../util.hpp"

using json = nlohmann::json;

namespace ledgerchat {

json make_rpc_request(int64_t id, const std::string& method, json params) {
    json msg = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
    if (!params.is_null()) msg["params"] = std::move(params);
    return msg;
}

json make_rpc_notification(const std::string& method, json params) {
    json msg = {{"jsonrpc", "2.0"}, {"method", method}};
    if (!params.is_null()) msg["params"] = std::move(params);
    return msg;
}

std::optional<RpcResponse> parse_rpc_message(const std::string& line) {
    json msg = json::parse(line, nullptr, false);
    if (msg.is_discarded() || !msg.is_object()) {
        throw ProtocolError("Invalid JSON-RPC message", line);
    }
    if (json_string(msg, "jsonrpc") != "2.0") {
        throw ProtocolError("Unsupported JSON-RPC version", line);
    }

    // Requests and notifications from the server carry a method
    if (msg.contains("method")) return std::nullopt;

    RpcResponse resp;
    resp.id = msg.contains("id") ? msg["id"] : json(nullptr);
    if (msg.contains("error") && msg["error"].is_object()) {
        const auto& e = msg["error"];
        RpcError err;
        if (e.contains("code") && e["code"].is_number_integer()) err.code = e["code"].get<int>();
        err.message = json_string(e, "message", "json-rpc error");
        if (e.contains("data")) err.data = e["data"];
        resp.error = std::move(err);
    } else if (msg.contains("result")) {
        resp.result = msg["result"];
    } else {
        throw ProtocolError("JSON-RPC response has neither result nor error", line);
    }
    return resp;
}

} // namespace ledgerchat
