#include "mcp_client.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include "../version.hpp"
#include <iostream>

using json = nlohmann::json;

namespace ledgerchat {

namespace {

constexpr const char* kProtocolVersion = "2024-11-05";

ToolInfo parse_tool_info(const json& tool) {
    ToolInfo info;
    info.name = json_string(tool, "name");
    if (tool.contains("description") && tool["description"].is_string()) {
        info.description = tool["description"].get<std::string>();
    }
    if (tool.contains("inputSchema") && tool["inputSchema"].is_object()) {
        info.input_schema = tool["inputSchema"];
    }
    return info;
}

} // namespace

ToolResult parse_tool_result(const json& result) {
    ToolResult out;
    out.is_error = json_bool(result, "isError");
    if (!result.contains("content") || !result["content"].is_array()) {
        return out;
    }
    for (const auto& block : result["content"]) {
        std::string type = json_string(block, "type");
        if (type == "text") {
            out.content.emplace_back(TextContent{json_string(block, "text")});
        } else if (type == "image") {
            out.content.emplace_back(ImageContent{json_string(block, "data"),
                                                  json_string(block, "mimeType")});
        } else if (type == "resource") {
            // Embedded resources nest their fields under "resource"
            const json& res = block.contains("resource") && block["resource"].is_object()
                ? block["resource"] : block;
            ResourceContent rc;
            rc.uri = json_string(res, "uri");
            if (res.contains("mimeType") && res["mimeType"].is_string()) {
                rc.mime_type = res["mimeType"].get<std::string>();
            }
            out.content.emplace_back(std::move(rc));
        } else {
            std::cerr << "[mcp] ignoring content block of type '" << type << "'\n";
        }
    }
    return out;
}

McpClient::McpClient(std::unique_ptr<McpTransport> transport,
                     std::chrono::milliseconds request_timeout)
    : transport_(std::move(transport))
    , request_timeout_(request_timeout)
{}

json McpClient::request(const std::string& method, json params,
                        const std::string& context) {
    int64_t id = next_id_++;
    transport_->send(make_rpc_request(id, method, std::move(params)).dump());

    auto deadline = std::chrono::steady_clock::now() + request_timeout_;
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            throw TransportError("Tool server did not answer " + method + " within " +
                                 std::to_string(request_timeout_.count()) + " ms");
        }

        auto line = transport_->receive(remaining);
        if (!line) continue;
        if (line->empty()) continue;

        std::optional<RpcResponse> response;
        try {
            response = parse_rpc_message(*line);
        } catch (const ProtocolError& e) {
            std::cerr << "[mcp] skipping line: " << e.what() << '\n';
            continue;
        }
        if (!response) continue; // server notification or request
        if (!response->id.is_number_integer() || response->id.get<int64_t>() != id) {
            std::cerr << "[mcp] skipping response for id " << response->id.dump() << '\n';
            continue;
        }
        if (response->error) {
            throw ToolError(context, method + " failed: " + response->error->message +
                                     " (code " + std::to_string(response->error->code) + ")");
        }
        return std::move(*response->result);
    }
}

void McpClient::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    json params = {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", json::object()},
        {"clientInfo", {{"name", "ledgerchat"}, {"version", LEDGERCHAT_VERSION}}},
    };
    json result = request("initialize", std::move(params), "initialize");

    if (result.contains("serverInfo") && result["serverInfo"].is_object()) {
        server_name_ = json_string(result["serverInfo"], "name");
    }
    std::string version = json_string(result, "protocolVersion");
    if (!version.empty() && version != kProtocolVersion) {
        std::cerr << "[mcp] server speaks protocol " << version << '\n';
    }

    transport_->send(make_rpc_notification("notifications/initialized").dump());
    std::cerr << "[mcp] connected"
              << (server_name_.empty() ? "" : " to " + server_name_) << '\n';
}

std::string McpClient::provider_name() const {
    return server_name_.empty() ? std::string("mcp") : "mcp (" + server_name_ + ")";
}

// Caller holds mutex_
std::vector<ToolInfo> McpClient::fetch_tools() {
    std::vector<ToolInfo> tools;
    std::string cursor;
    do {
        json params = json::object();
        if (!cursor.empty()) params["cursor"] = cursor;
        json result = request("tools/list", std::move(params), "tools/list");

        if (result.contains("tools") && result["tools"].is_array()) {
            for (const auto& tool : result["tools"]) {
                ToolInfo info = parse_tool_info(tool);
                if (!info.name.empty()) tools.push_back(std::move(info));
            }
        }
        cursor.clear();
        if (result.contains("nextCursor") && result["nextCursor"].is_string()) {
            cursor = result["nextCursor"].get<std::string>();
        }
    } while (!cursor.empty());

    known_tools_.clear();
    for (const auto& t : tools) known_tools_.insert(t.name);
    return tools;
}

std::vector<ToolInfo> McpClient::list_tools() {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetch_tools();
}

ToolResult McpClient::call_tool(const std::string& name, const json& arguments) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (known_tools_.count(name) == 0) {
        fetch_tools();
        if (known_tools_.count(name) == 0) {
            throw ToolError(name, "Unknown tool: " + name);
        }
    }

    json params = {{"name", name}, {"arguments", arguments.is_null() ? json::object() : arguments}};
    json result = request("tools/call", std::move(params), name);
    return parse_tool_result(result);
}

std::shared_ptr<McpClient> connect_stdio_server(const std::string& command,
                                                std::chrono::milliseconds request_timeout) {
    auto client = std::make_shared<McpClient>(std::make_unique<StdioTransport>(command),
                                              request_timeout);
    client->initialize();
    return client;
}

} // namespace ledgerchat
