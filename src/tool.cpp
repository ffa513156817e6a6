#include "tool.hpp"
#include "util.hpp"
#include <type_traits>

namespace ledgerchat {

ToolSpec to_tool_spec(const ToolInfo& info) {
    nlohmann::json schema = info.input_schema.is_object()
        ? info.input_schema
        : nlohmann::json{{"type", "object"}, {"properties", nlohmann::json::object()}};
    return ToolSpec{info.name,
                    info.description.value_or("No description available"),
                    schema.dump()};
}

std::string content_to_text(const std::string& tool_name, const ToolResult& result) {
    if (result.content.empty()) {
        return "Tool '" + tool_name + "' returned no content";
    }

    return std::visit([&tool_name](const auto& block) -> std::string {
        using T = std::decay_t<decltype(block)>;
        if constexpr (std::is_same_v<T, TextContent>) {
            if (trim(block.text).empty())
                return "Tool '" + tool_name + "' returned empty result";
            return block.text;
        } else if constexpr (std::is_same_v<T, ImageContent>) {
            return "Tool '" + tool_name + "' returned image content (not supported in text mode)";
        } else {
            static_assert(std::is_same_v<T, ResourceContent>, "unhandled content block");
            return "Tool '" + tool_name + "' returned resource content (not supported in text mode)";
        }
    }, result.content.front());
}

std::string joined_text(const ToolResult& result) {
    std::string out;
    for (const auto& block : result.content) {
        if (const auto* text = std::get_if<TextContent>(&block)) {
            if (!out.empty()) out += '\n';
            out += text->text;
        }
    }
    return out;
}

} // namespace ledgerchat
