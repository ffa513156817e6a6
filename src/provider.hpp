#pragma once
#include "tool.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ledgerchat {

enum class Role { System, User, Assistant, Tool };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "user";
}

struct ToolCall {
    std::string id;
    std::string name;
    std::string arguments; // raw JSON string
    // Position of the call inside a streamed reply; fragments of one call
    // share it until the call is complete.
    std::optional<int> stream_index;
};

// tool_calls is only set on assistant messages that requested tools,
// tool_call_id only on tool messages.
struct ChatMessage {
    Role role;
    std::string content;
    std::optional<std::vector<ToolCall>> tool_calls;
    std::optional<std::string> tool_call_id;
};

struct TokenUsage {
    uint32_t prompt_tokens = 0;
    uint32_t completion_tokens = 0;
    uint32_t total_tokens = 0;
};

struct ChatResponse {
    std::optional<std::string> content;
    std::vector<ToolCall> tool_calls;
    TokenUsage usage;
    std::string model;

    bool has_tool_calls() const { return !tool_calls.empty(); }
};

// One decoded step of a streamed reply. Unset fields mean "nothing of that
// kind in this step". done marks the terminal delta.
struct StreamDelta {
    std::optional<std::string> text;
    std::optional<std::vector<ToolCall>> tool_call_fragments;
    bool done = false;
};

struct ChatOptions {
    std::string model = "mistral-large-latest";
    double temperature = 0.7;
    uint32_t max_tokens = 4096;
    long timeout_seconds = 120;
};

// Callback for streamed deltas. Return false to abort the read loop.
using DeltaCallback = std::function<bool(const StreamDelta& delta)>;

// Abstract chat-completion backend
class Provider {
public:
    virtual ~Provider() = default;

    // Non-streaming round trip. Tools, when given, are offered with
    // tool_choice "auto".
    virtual ChatResponse chat(const std::vector<ChatMessage>& messages,
                              const std::vector<ToolSpec>& tools,
                              const ChatOptions& options) = 0;

    // Streaming round trip. on_delta sees every decoded delta in order; the
    // returned response carries the concatenated text and the merged tool
    // calls. If on_delta returns false the read stops and whatever was
    // assembled so far is returned.
    virtual ChatResponse chat_stream(const std::vector<ChatMessage>& messages,
                                     const std::vector<ToolSpec>& tools,
                                     const ChatOptions& options,
                                     const DeltaCallback& on_delta) = 0;

    virtual std::string provider_name() const = 0;
};

class HttpClient;

// Factory: create provider by name. Throws ConfigurationError for a
// missing credential or an unknown provider.
std::unique_ptr<Provider> create_provider(const std::string& name,
                                          const std::string& api_key,
                                          HttpClient& http,
                                          const std::string& base_url = "",
                                          bool strict_stream_frames = false);

} // namespace ledgerchat
