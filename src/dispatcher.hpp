#pragma once
#include "provider.hpp"
#include "tool.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace ledgerchat {

// Execute one requested tool call: parse its arguments, invoke the provider
// bounded by timeout, and render the first content block as text.
// Throws ToolError for malformed arguments, timeouts and tool-reported
// failures; errors raised by the provider itself propagate unchanged.
std::string execute_tool_call(const std::shared_ptr<ToolProvider>& tools,
                              const ToolCall& call,
                              std::chrono::seconds timeout);

// Tool-role message answering the call with the given id.
ChatMessage format_tool_result_message(const std::string& tool_call_id,
                                       const std::string& output);

} // namespace ledgerchat
