#pragma once
#include "config.hpp"
#include "provider.hpp"
#include "stream_channel.hpp"
#include "tool.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ledgerchat {

// Owns one conversation and drives it against a backend and a tool provider.
//
// The history lock is held only while the outbound request is copied out and
// while results are appended, never across a network call or tool call.
// The system preamble is not stored in the history; it is prepended to each
// request.
class Agent {
public:
    Agent(std::unique_ptr<Provider> provider,
          std::shared_ptr<ToolProvider> tools,
          const Config& config);

    // One turn, answered in full. Executes requested tool calls and makes a
    // second round trip for the final answer. Throws TransportError,
    // ProtocolError or ToolError; a failed turn appends no assistant or
    // tool messages.
    std::string ask(const std::string& user_message);

    // One turn, streamed. Text fragments arrive on the returned receiver,
    // followed by Complete (the reply is then in the history) or Error.
    // Tool calls requested by a streamed reply are logged but not executed.
    // The receiver must be destroyed before this agent.
    StreamReceiver ask_streaming(const std::string& user_message);

    // Snapshot copy of the conversation
    std::vector<ChatMessage> history() const;
    size_t history_size() const;
    void clear_history();

    // Estimated tokens of the stored history (~4 chars per token)
    uint32_t estimated_tokens() const;

    void set_model(const std::string& model);
    std::string model() const;

    std::string provider_name() const { return provider_->provider_name(); }
    ToolProvider& tool_provider() const { return *tools_; }

private:
    std::vector<ToolSpec> current_tool_specs() const;
    std::vector<ChatMessage> request_messages(const std::string& preamble) const;
    void commit_streamed(const ChatResponse& response);

    std::unique_ptr<Provider> provider_;
    std::shared_ptr<ToolProvider> tools_;
    Config config_;

    mutable std::mutex mutex_;
    std::vector<ChatMessage> history_;
    std::string model_;
};

} // namespace ledgerchat
