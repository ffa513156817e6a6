#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace ledgerchat {

struct RpcError {
    int code = 0;
    std::string message;
    nlohmann::json data;
};

struct RpcResponse {
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    bool ok() const { return result.has_value(); }
};

// JSON-RPC 2.0 request with a numeric id
nlohmann::json make_rpc_request(int64_t id, const std::string& method,
                                nlohmann::json params = nullptr);

// JSON-RPC 2.0 notification (no id, no reply expected)
nlohmann::json make_rpc_notification(const std::string& method,
                                     nlohmann::json params = nullptr);

// Parse one line received from a peer. Returns nullopt for requests and
// notifications sent by the peer. Throws ProtocolError for anything that is
// not a JSON-RPC 2.0 object.
std::optional<RpcResponse> parse_rpc_message(const std::string& line);

} // namespace ledgerchat
