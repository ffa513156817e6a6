#pragma once
#include "../tool.hpp"
#include "json_rpc.hpp"
#include "stdio_transport.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace ledgerchat {

// Tool provider speaking the Model Context Protocol over a line transport.
// Requests are serialized; a single client may be shared between threads.
class McpClient : public ToolProvider {
public:
    explicit McpClient(std::unique_ptr<McpTransport> transport,
                       std::chrono::milliseconds request_timeout = std::chrono::seconds(30));

    // initialize handshake followed by notifications/initialized
    void initialize();

    std::vector<ToolInfo> list_tools() override;
    ToolResult call_tool(const std::string& name,
                         const nlohmann::json& arguments) override;
    // "mcp", or "mcp (<server name>)" once the handshake reported one
    std::string provider_name() const override;

private:
    // Sends a request and waits for the response with the same id.
    // Returns the result; JSON-RPC errors become ToolError naming `context`.
    nlohmann::json request(const std::string& method, nlohmann::json params,
                           const std::string& context);
    std::vector<ToolInfo> fetch_tools();

    std::unique_ptr<McpTransport> transport_;
    std::chrono::milliseconds request_timeout_;
    std::mutex mutex_;
    int64_t next_id_ = 1;
    std::string server_name_;
    std::set<std::string> known_tools_;
};

// Parse the result object of a tools/call response.
ToolResult parse_tool_result(const nlohmann::json& result);

// Spawn `command` and complete the handshake.
std::shared_ptr<McpClient> connect_stdio_server(const std::string& command,
                                                std::chrono::milliseconds request_timeout);

} // namespace ledgerchat
