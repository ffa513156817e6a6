#include "dispatcher.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <future>
#include <thread>

namespace ledgerchat {

static nlohmann::json parse_arguments(const ToolCall& call) {
    // Calls without parameters may arrive with an empty argument string
    if (trim(call.arguments).empty()) return nlohmann::json::object();
    try {
        return nlohmann::json::parse(call.arguments);
    } catch (const nlohmann::json::exception& e) {
        throw ToolError(call.name, "Failed to parse tool arguments for '" + call.name +
                        "': " + e.what() + ". Arguments were: " + call.arguments);
    }
}

std::string execute_tool_call(const std::shared_ptr<ToolProvider>& tools,
                              const ToolCall& call,
                              std::chrono::seconds timeout) {
    nlohmann::json args = parse_arguments(call);

    // The worker owns a reference to the provider so an abandoned call can
    // finish safely after the caller has moved on.
    auto promise = std::make_shared<std::promise<ToolResult>>();
    std::future<ToolResult> future = promise->get_future();
    std::thread([tools, name = call.name, args = std::move(args), promise]() {
        try {
            promise->set_value(tools->call_tool(name, args));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(timeout) != std::future_status::ready) {
        throw ToolError(call.name, "Tool '" + call.name + "' timed out after " +
                        std::to_string(timeout.count()) + " seconds");
    }

    ToolResult result = future.get();
    if (result.is_error) {
        std::string detail = joined_text(result);
        throw ToolError(call.name, "Tool '" + call.name + "' failed: " +
                        (detail.empty() ? std::string("no details") : detail));
    }
    return content_to_text(call.name, result);
}

ChatMessage format_tool_result_message(const std::string& tool_call_id,
                                       const std::string& output) {
    return ChatMessage{Role::Tool, output, std::nullopt, tool_call_id};
}

} // namespace ledgerchat
