#include "prompt.hpp"
#include "util.hpp"
#include <sstream>

namespace ledgerchat {

std::string build_system_prompt() {
    std::ostringstream ss;
    ss << "You are a helpful assistant that can help users manage their Lago invoices. "
       << "You have access to tools through an MCP server that can get and list invoices "
       << "from a Lago instance. Use the tools when users ask questions about invoices, "
       << "and provide helpful, clear responses based on the data you retrieve.\n";
    ss << "Current date: " << timestamp_now() << "\n";
    return ss.str();
}

std::string build_final_answer_prompt() {
    return "You are a helpful assistant that can help users manage their Lago invoices. "
           "Provide a clear, helpful response based on the tool results.";
}

std::string build_streaming_prompt() {
    std::ostringstream ss;
    ss << "You are a helpful assistant for managing Lago invoices. "
       << "You have access to tools that can help you retrieve and analyze invoice data. "
       << "Use the tools when appropriate to provide accurate and detailed responses "
       << "about invoices.\n";
    ss << "Current date: " << timestamp_now() << "\n";
    return ss.str();
}

} // namespace ledgerchat
