#include <catch2/catch.hpp>
#include "mcp/json_rpc.hpp"
#include "mcp/mcp_client.hpp"
#include "errors.hpp"
#include <deque>
#include <functional>

using namespace ledgerchat;
using json = nlohmann::json;

namespace {

// In-memory transport. Every request sent is handed to `respond`, whose
// returned lines are queued for receive().
class FakeTransport : public McpTransport {
public:
    using Responder = std::function<std::vector<std::string>(const json& request)>;

    explicit FakeTransport(Responder r) : respond_(std::move(r)) {}

    void send(const std::string& message) override {
        if (closed_) throw TransportError("Tool server connection is closed");
        json msg = json::parse(message);
        sent.push_back(msg);
        if (!msg.contains("id")) return;
        for (auto& line : respond_(msg)) queue_.push_back(std::move(line));
    }

    std::optional<std::string> receive(std::chrono::milliseconds) override {
        if (queue_.empty()) {
            if (disconnect_when_empty) throw TransportError("Tool server closed the connection");
            return std::nullopt;
        }
        std::string line = std::move(queue_.front());
        queue_.pop_front();
        return line;
    }

    void close() override { closed_ = true; }

    std::vector<json> sent;
    bool disconnect_when_empty = false;

private:
    Responder respond_;
    std::deque<std::string> queue_;
    bool closed_ = false;
};

std::string reply(const json& request, json result) {
    return json{{"jsonrpc", "2.0"}, {"id", request["id"]}, {"result", std::move(result)}}.dump();
}

std::string reply_error(const json& request, int code, const std::string& message) {
    return json{{"jsonrpc", "2.0"}, {"id", request["id"]},
                {"error", {{"code", code}, {"message", message}}}}.dump();
}

json tool_json(const std::string& name) {
    return {{"name", name}, {"description", name + " tool"},
            {"inputSchema", {{"type", "object"}, {"properties", json::object()}}}};
}

// A small Lago-like server: two pages of tools, list_invoices answers text.
std::vector<std::string> lago_server(const json& req) {
    std::string method = req["method"];
    if (method == "initialize") {
        return {reply(req, {{"protocolVersion", "2024-11-05"},
                            {"serverInfo", {{"name", "lago"}, {"version", "1.0"}}},
                            {"capabilities", {{"tools", json::object()}}}})};
    }
    if (method == "tools/list") {
        if (req["params"].contains("cursor")) {
            return {reply(req, {{"tools", {tool_json("get_invoice")}}})};
        }
        return {reply(req, {{"tools", {tool_json("list_invoices")}}, {"nextCursor", "page2"}})};
    }
    if (method == "tools/call") {
        if (req["params"]["name"] == "get_invoice") {
            return {reply_error(req, -32602, "invoice not found")};
        }
        return {reply(req, {{"content", {{{"type", "text"}, {"text", "3 invoices"}}}}})};
    }
    return {reply_error(req, -32601, "Method not found")};
}

std::pair<std::unique_ptr<McpClient>, FakeTransport*> make_client(FakeTransport::Responder r) {
    auto transport = std::make_unique<FakeTransport>(std::move(r));
    FakeTransport* raw = transport.get();
    auto client = std::make_unique<McpClient>(std::move(transport), std::chrono::milliseconds(200));
    return {std::move(client), raw};
}

} // namespace

// ── JSON-RPC framing ─────────────────────────────────────────────

TEST_CASE("make_rpc_request: version, id, method and optional params", "[mcp]") {
    json req = make_rpc_request(7, "tools/list");
    REQUIRE(req["jsonrpc"] == "2.0");
    REQUIRE(req["id"] == 7);
    REQUIRE(req["method"] == "tools/list");
    REQUIRE_FALSE(req.contains("params"));

    json with = make_rpc_request(8, "tools/call", {{"name", "x"}});
    REQUIRE(with["params"]["name"] == "x");
}

TEST_CASE("make_rpc_notification: carries no id", "[mcp]") {
    json n = make_rpc_notification("notifications/initialized");
    REQUIRE_FALSE(n.contains("id"));
    REQUIRE(n["method"] == "notifications/initialized");
}

TEST_CASE("parse_rpc_message: result and error responses", "[mcp]") {
    auto ok = parse_rpc_message(R"({"jsonrpc":"2.0","id":1,"result":{"x":1}})");
    REQUIRE(ok.has_value());
    REQUIRE(ok->ok());
    REQUIRE((*ok->result)["x"] == 1);

    auto err = parse_rpc_message(R"({"jsonrpc":"2.0","id":2,"error":{"code":-32601,"message":"nope"}})");
    REQUIRE(err.has_value());
    REQUIRE_FALSE(err->ok());
    REQUIRE(err->error->code == -32601);
    REQUIRE(err->error->message == "nope");
}

TEST_CASE("parse_rpc_message: messages from the server with a method are skipped", "[mcp]") {
    REQUIRE_FALSE(parse_rpc_message(
        R"({"jsonrpc":"2.0","method":"notifications/message","params":{}})").has_value());
}

TEST_CASE("parse_rpc_message: malformed input throws ProtocolError", "[mcp]") {
    REQUIRE_THROWS_AS(parse_rpc_message("starting server..."), ProtocolError);
    REQUIRE_THROWS_AS(parse_rpc_message(R"([1,2])"), ProtocolError);
    REQUIRE_THROWS_AS(parse_rpc_message(R"({"jsonrpc":"1.0","id":1,"result":{}})"), ProtocolError);
    REQUIRE_THROWS_AS(parse_rpc_message(R"({"jsonrpc":"2.0","id":1})"), ProtocolError);
}

// ── Handshake ────────────────────────────────────────────────────

TEST_CASE("McpClient: initialize then initialized notification", "[mcp]") {
    auto [client, transport] = make_client(lago_server);
    client->initialize();

    REQUIRE(transport->sent.size() == 2);
    const json& init = transport->sent[0];
    REQUIRE(init["method"] == "initialize");
    REQUIRE(init["params"]["protocolVersion"] == "2024-11-05");
    REQUIRE(init["params"]["clientInfo"]["name"] == "ledgerchat");
    REQUIRE(transport->sent[1]["method"] == "notifications/initialized");
    REQUIRE_FALSE(transport->sent[1].contains("id"));
    REQUIRE(client->provider_name() == "mcp (lago)");
}

TEST_CASE("McpClient: initialize error is reported", "[mcp]") {
    auto [client, transport] = make_client([](const json& req) {
        return std::vector<std::string>{reply_error(req, -32600, "bad version")};
    });
    REQUIRE_THROWS_AS(client->initialize(), ToolError);
    REQUIRE(transport->sent.size() == 1);
}

// ── tools/list ───────────────────────────────────────────────────

TEST_CASE("McpClient: list_tools follows nextCursor", "[mcp]") {
    auto [client, transport] = make_client(lago_server);
    auto tools = client->list_tools();

    REQUIRE(tools.size() == 2);
    REQUIRE(tools[0].name == "list_invoices");
    REQUIRE(tools[1].name == "get_invoice");
    REQUIRE(tools[0].description == std::optional<std::string>("list_invoices tool"));
    REQUIRE(tools[0].input_schema["type"] == "object");
    REQUIRE(transport->sent.size() == 2);
    REQUIRE(transport->sent[1]["params"]["cursor"] == "page2");
}

TEST_CASE("McpClient: tools without description keep it unset", "[mcp]") {
    auto [client, transport] = make_client([](const json& req) {
        return std::vector<std::string>{
            reply(req, {{"tools", {{{"name", "bare"}}, {{"description", "nameless"}}}}})};
    });
    auto tools = client->list_tools();
    REQUIRE(tools.size() == 1);
    REQUIRE(tools[0].name == "bare");
    REQUIRE_FALSE(tools[0].description.has_value());
}

TEST_CASE("McpClient: null names and descriptions from the server", "[mcp]") {
    auto [client, transport] = make_client([](const json& req) {
        return std::vector<std::string>{
            reply(req, {{"tools", {{{"name", nullptr}, {"description", "ghost"}},
                                   {{"name", "list_invoices"}, {"description", nullptr}}}},
                        {"nextCursor", nullptr}})};
    });
    auto tools = client->list_tools();
    REQUIRE(tools.size() == 1);
    REQUIRE(tools[0].name == "list_invoices");
    REQUIRE_FALSE(tools[0].description.has_value());
    REQUIRE(transport->sent.size() == 1);
}

// ── Unrelated traffic ────────────────────────────────────────────

TEST_CASE("McpClient: notifications, stale ids and noise are skipped", "[mcp]") {
    auto [client, transport] = make_client([](const json& req) {
        json stale = req;
        stale["id"] = req["id"].get<int64_t>() + 100;
        return std::vector<std::string>{
            R"({"jsonrpc":"2.0","method":"notifications/progress","params":{}})",
            "server log line",
            "",
            reply(stale, {{"tools", {tool_json("wrong")}}}),
            reply(req, {{"tools", {tool_json("right")}}}),
        };
    });
    auto tools = client->list_tools();
    REQUIRE(tools.size() == 1);
    REQUIRE(tools[0].name == "right");
}

TEST_CASE("McpClient: silent server times out with TransportError", "[mcp]") {
    auto [client, transport] = make_client([](const json&) {
        return std::vector<std::string>{};
    });
    REQUIRE_THROWS_AS(client->list_tools(), TransportError);
}

TEST_CASE("McpClient: closed connection surfaces as TransportError", "[mcp]") {
    auto [client, transport] = make_client([](const json&) {
        return std::vector<std::string>{};
    });
    transport->disconnect_when_empty = true;
    REQUIRE_THROWS_AS(client->list_tools(), TransportError);
}

// ── tools/call ───────────────────────────────────────────────────

TEST_CASE("McpClient: call_tool sends name and arguments", "[mcp]") {
    auto [client, transport] = make_client(lago_server);
    client->list_tools();

    ToolResult result = client->call_tool("list_invoices", {{"status", "finalized"}});
    REQUIRE(content_to_text("list_invoices", result) == "3 invoices");

    const json& call = transport->sent.back();
    REQUIRE(call["method"] == "tools/call");
    REQUIRE(call["params"]["name"] == "list_invoices");
    REQUIRE(call["params"]["arguments"]["status"] == "finalized");
}

TEST_CASE("McpClient: null arguments are sent as an empty object", "[mcp]") {
    auto [client, transport] = make_client(lago_server);
    client->list_tools();
    client->call_tool("list_invoices", nullptr);
    REQUIRE(transport->sent.back()["params"]["arguments"].is_object());
    REQUIRE(transport->sent.back()["params"]["arguments"].empty());
}

TEST_CASE("McpClient: unknown name refreshes the list before failing", "[mcp]") {
    auto [client, transport] = make_client(lago_server);
    REQUIRE_THROWS_AS(client->call_tool("delete_everything", json::object()), ToolError);
    for (const auto& msg : transport->sent) {
        REQUIRE(msg["method"] != "tools/call");
    }
}

TEST_CASE("McpClient: tool first seen on refresh is callable", "[mcp]") {
    auto [client, transport] = make_client(lago_server);
    ToolResult result = client->call_tool("list_invoices", json::object());
    REQUIRE(joined_text(result) == "3 invoices");
}

TEST_CASE("McpClient: JSON-RPC error on call becomes ToolError", "[mcp]") {
    auto [client, transport] = make_client(lago_server);
    client->list_tools();
    try {
        client->call_tool("get_invoice", {{"lago_id", "x"}});
        FAIL("expected ToolError");
    } catch (const ToolError& e) {
        REQUIRE(e.tool_name() == "get_invoice");
        REQUIRE(std::string(e.what()).find("invoice not found") != std::string::npos);
    }
}

// ── parse_tool_result ────────────────────────────────────────────

TEST_CASE("parse_tool_result: text, image and resource blocks", "[mcp]") {
    json result = {
        {"content", {
            {{"type", "text"}, {"text", "hello"}},
            {{"type", "image"}, {"data", "AAAA"}, {"mimeType", "image/png"}},
            {{"type", "resource"}, {"resource", {{"uri", "lago://invoice/1"}, {"mimeType", "application/json"}}}},
            {{"type", "resource"}, {"uri", "lago://customer/2"}},
            {{"type", "audio"}, {"data", "BBBB"}},
        }},
    };
    ToolResult r = parse_tool_result(result);
    REQUIRE(r.content.size() == 4);
    REQUIRE_FALSE(r.is_error);
    REQUIRE(std::get<TextContent>(r.content[0]).text == "hello");
    REQUIRE(std::get<ImageContent>(r.content[1]).mime_type == "image/png");
    REQUIRE(std::get<ResourceContent>(r.content[2]).uri == "lago://invoice/1");
    REQUIRE(std::get<ResourceContent>(r.content[2]).mime_type ==
            std::optional<std::string>("application/json"));
    REQUIRE(std::get<ResourceContent>(r.content[3]).uri == "lago://customer/2");
    REQUIRE_FALSE(std::get<ResourceContent>(r.content[3]).mime_type.has_value());
}

TEST_CASE("parse_tool_result: isError and missing content", "[mcp]") {
    ToolResult r = parse_tool_result({{"isError", true},
                                      {"content", {{{"type", "text"}, {"text", "boom"}}}}});
    REQUIRE(r.is_error);
    REQUIRE(joined_text(r) == "boom");

    ToolResult empty = parse_tool_result(json::object());
    REQUIRE(empty.content.empty());
    REQUIRE_FALSE(empty.is_error);
}

TEST_CASE("parse_tool_result: null fields read as absent", "[mcp]") {
    ToolResult r = parse_tool_result({
        {"isError", nullptr},
        {"content", {
            {{"type", "text"}, {"text", nullptr}},
            {{"type", nullptr}, {"text", "dropped"}},
            {{"type", "resource"}, {"resource", nullptr}, {"uri", "lago://plan/3"}, {"mimeType", nullptr}},
        }},
    });
    REQUIRE_FALSE(r.is_error);
    REQUIRE(r.content.size() == 2);
    REQUIRE(std::get<TextContent>(r.content[0]).text.empty());
    REQUIRE(std::get<ResourceContent>(r.content[1]).uri == "lago://plan/3");
    REQUIRE_FALSE(std::get<ResourceContent>(r.content[1]).mime_type.has_value());
}
