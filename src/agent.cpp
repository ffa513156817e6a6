#include "agent.hpp"
#include "dispatcher.hpp"
#include "prompt.hpp"
#include "stream_relay.hpp"
#include "util.hpp"
#include <chrono>
#include <iostream>

namespace ledgerchat {

Agent::Agent(std::unique_ptr<Provider> provider,
             std::shared_ptr<ToolProvider> tools,
             const Config& config)
    : provider_(std::move(provider))
    , tools_(std::move(tools))
    , config_(config)
    , model_(config.model)
{}

std::vector<ToolSpec> Agent::current_tool_specs() const {
    std::vector<ToolSpec> specs;
    for (const auto& info : tools_->list_tools()) {
        specs.push_back(to_tool_spec(info));
    }
    return specs;
}

// Caller holds mutex_
std::vector<ChatMessage> Agent::request_messages(const std::string& preamble) const {
    std::vector<ChatMessage> messages;
    messages.reserve(history_.size() + 1);
    messages.push_back(ChatMessage{Role::System, preamble, std::nullopt, std::nullopt});
    messages.insert(messages.end(), history_.begin(), history_.end());
    return messages;
}

std::string Agent::ask(const std::string& user_message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.push_back(ChatMessage{Role::User, user_message, std::nullopt, std::nullopt});
    }

    std::vector<ToolSpec> tool_specs = current_tool_specs();

    std::vector<ChatMessage> messages;
    ChatOptions options = config_.chat_options();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        messages = request_messages(build_system_prompt());
        options.model = model_;
    }

    ChatResponse response = provider_->chat(messages, tool_specs, options);

    if (!response.has_tool_calls()) {
        std::string answer = response.content.value_or("");
        std::lock_guard<std::mutex> lock(mutex_);
        history_.push_back(ChatMessage{Role::Assistant, answer, std::nullopt, std::nullopt});
        return answer;
    }

    // Nothing past the user message is stored until the final answer arrives
    auto timeout = std::chrono::seconds(config_.agent.tool_timeout_seconds);
    std::vector<ChatMessage> turn;
    turn.reserve(response.tool_calls.size() + 2);
    turn.push_back(ChatMessage{Role::Assistant, response.content.value_or(""),
                               response.tool_calls, std::nullopt});
    for (const auto& call : response.tool_calls) {
        std::cerr << "[tool] " << call.name << '\n';
        std::string output = execute_tool_call(tools_, call, timeout);
        turn.push_back(format_tool_result_message(call.id, output));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        messages = request_messages(build_final_answer_prompt());
    }
    messages.insert(messages.end(), turn.begin(), turn.end());

    ChatResponse final_response = provider_->chat(messages, {}, options);
    std::string answer = final_response.content.value_or("");
    turn.push_back(ChatMessage{Role::Assistant, answer, std::nullopt, std::nullopt});

    std::lock_guard<std::mutex> lock(mutex_);
    history_.insert(history_.end(), turn.begin(), turn.end());
    return answer;
}

StreamReceiver Agent::ask_streaming(const std::string& user_message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        history_.push_back(ChatMessage{Role::User, user_message, std::nullopt, std::nullopt});
    }

    RelayJob job;
    job.provider = provider_.get();
    job.tools = current_tool_specs();
    job.options = config_.stream_options();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        job.messages = request_messages(build_streaming_prompt());
        job.options.model = model_;
    }
    job.on_complete = [this](const ChatResponse& response) { commit_streamed(response); };

    return start_relay(std::move(job));
}

void Agent::commit_streamed(const ChatResponse& response) {
    if (response.has_tool_calls()) {
        std::cerr << "[stream] reply requested " << response.tool_calls.size()
                  << " tool call(s) (";
        for (size_t i = 0; i < response.tool_calls.size(); i++) {
            if (i > 0) std::cerr << ", ";
            std::cerr << response.tool_calls[i].name;
        }
        std::cerr << "); tool calls are not executed in streaming mode\n";
    }

    // Only the text is kept: unanswered tool_calls would make the next
    // request invalid.
    std::lock_guard<std::mutex> lock(mutex_);
    history_.push_back(ChatMessage{Role::Assistant, response.content.value_or(""),
                                   std::nullopt, std::nullopt});
}

std::vector<ChatMessage> Agent::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

size_t Agent::history_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.size();
}

void Agent::clear_history() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
}

uint32_t Agent::estimated_tokens() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t total = 0;
    for (const auto& msg : history_) {
        total += estimate_tokens(msg.content);
    }
    return total;
}

void Agent::set_model(const std::string& model) {
    std::lock_guard<std::mutex> lock(mutex_);
    model_ = model;
}

std::string Agent::model() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return model_;
}

} // namespace ledgerchat
