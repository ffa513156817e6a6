#include <catch2/catch.hpp>
#include "tool.hpp"
#include <nlohmann/json.hpp>

using namespace ledgerchat;

// ── to_tool_spec ─────────────────────────────────────────────────

TEST_CASE("to_tool_spec: copies name, description and schema", "[tool]") {
    ToolInfo info;
    info.name = "get_invoice";
    info.description = "Fetch one invoice";
    info.input_schema = {{"type", "object"},
                         {"properties", {{"lago_id", {{"type", "string"}}}}},
                         {"required", {"lago_id"}}};
    ToolSpec spec = to_tool_spec(info);
    REQUIRE(spec.name == "get_invoice");
    REQUIRE(spec.description == "Fetch one invoice");
    auto schema = nlohmann::json::parse(spec.parameters_json);
    REQUIRE(schema["required"][0] == "lago_id");
}

TEST_CASE("to_tool_spec: missing description gets a default", "[tool]") {
    ToolInfo info;
    info.name = "list_invoices";
    REQUIRE(to_tool_spec(info).description == "No description available");
}

TEST_CASE("to_tool_spec: non-object schema becomes an empty object schema", "[tool]") {
    ToolInfo info;
    info.name = "x";
    info.input_schema = nullptr;
    auto schema = nlohmann::json::parse(to_tool_spec(info).parameters_json);
    REQUIRE(schema["type"] == "object");
    REQUIRE(schema["properties"].empty());
}

// ── content_to_text ──────────────────────────────────────────────

TEST_CASE("content_to_text: first text block is returned", "[tool]") {
    ToolResult r;
    r.content.emplace_back(TextContent{"first"});
    r.content.emplace_back(TextContent{"second"});
    REQUIRE(content_to_text("t", r) == "first");
}

TEST_CASE("content_to_text: placeholders are never empty", "[tool]") {
    ToolResult none;
    REQUIRE(content_to_text("t", none) == "Tool 't' returned no content");

    ToolResult blank;
    blank.content.emplace_back(TextContent{""});
    REQUIRE(content_to_text("t", blank) == "Tool 't' returned empty result");

    ToolResult image;
    image.content.emplace_back(ImageContent{"AAAA", "image/png"});
    REQUIRE(content_to_text("t", image) ==
            "Tool 't' returned image content (not supported in text mode)");

    ToolResult resource;
    resource.content.emplace_back(ResourceContent{"lago://invoice/1", std::nullopt});
    REQUIRE(content_to_text("t", resource) ==
            "Tool 't' returned resource content (not supported in text mode)");
}

TEST_CASE("content_to_text: only the first block decides", "[tool]") {
    ToolResult r;
    r.content.emplace_back(ImageContent{"AAAA", "image/png"});
    r.content.emplace_back(TextContent{"caption"});
    REQUIRE(content_to_text("chart", r).find("image content") != std::string::npos);
}

// ── joined_text ──────────────────────────────────────────────────

TEST_CASE("joined_text: concatenates text blocks with newlines", "[tool]") {
    ToolResult r;
    r.content.emplace_back(TextContent{"line 1"});
    r.content.emplace_back(ImageContent{"AAAA", "image/png"});
    r.content.emplace_back(TextContent{"line 2"});
    REQUIRE(joined_text(r) == "line 1\nline 2");
    REQUIRE(joined_text(ToolResult{}).empty());
}
