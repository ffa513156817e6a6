#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ledgerchat {

// Tool definition as sent to the backend.
struct ToolSpec {
    std::string name;
    std::string description;
    std::string parameters_json; // JSON schema for parameters
};

// Tool definition as advertised by a tool provider.
struct ToolInfo {
    std::string name;
    std::optional<std::string> description;
    nlohmann::json input_schema = nlohmann::json::object();
};

struct TextContent {
    std::string text;
};

struct ImageContent {
    std::string data; // base64
    std::string mime_type;
};

struct ResourceContent {
    std::string uri;
    std::optional<std::string> mime_type;
};

using ContentBlock = std::variant<TextContent, ImageContent, ResourceContent>;

struct ToolResult {
    std::vector<ContentBlock> content;
    bool is_error = false;
};

// The external process or service that executes named actions.
class ToolProvider {
public:
    virtual ~ToolProvider() = default;

    virtual std::vector<ToolInfo> list_tools() = 0;

    // Throws ToolError for unknown names, TransportError when the provider
    // cannot be reached.
    virtual ToolResult call_tool(const std::string& name,
                                 const nlohmann::json& arguments) = 0;

    virtual std::string provider_name() const = 0;
};

ToolSpec to_tool_spec(const ToolInfo& info);

// Render the first content block of a result as text. Never returns an
// empty string: absent, blank and non-text content map to a placeholder
// that names the tool.
std::string content_to_text(const std::string& tool_name, const ToolResult& result);

// Concatenated text of every Text block (used for error reporting).
std::string joined_text(const ToolResult& result);

} // namespace ledgerchat
