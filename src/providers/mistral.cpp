#include "mistral.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <exception>

using json = nlohmann::json;

namespace ledgerchat {

MistralProvider::MistralProvider(const std::string& api_key, HttpClient& http,
                                 const std::string& base_url,
                                 FramePolicy frame_policy)
    : api_key_(api_key), http_(http),
      base_url_(base_url.empty() ? "https://api.mistral.ai/v1" : base_url),
      frame_policy_(frame_policy) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

static json message_to_json(const ChatMessage& msg) {
    json m;
    m["role"] = role_to_string(msg.role);
    m["content"] = msg.content;

    if (msg.role == Role::Tool && msg.tool_call_id) {
        m["tool_call_id"] = *msg.tool_call_id;
    }

    if (msg.role == Role::Assistant && msg.tool_calls && !msg.tool_calls->empty()) {
        json tool_calls = json::array();
        for (const auto& tc : *msg.tool_calls) {
            tool_calls.push_back({
                {"id", tc.id},
                {"type", "function"},
                {"function", {{"name", tc.name}, {"arguments", tc.arguments}}}
            });
        }
        m["tool_calls"] = tool_calls;
    }
    return m;
}

json MistralProvider::build_request(const std::vector<ChatMessage>& messages,
                                    const std::vector<ToolSpec>& tools,
                                    const ChatOptions& options) const {
    json request;
    request["model"] = options.model;
    request["temperature"] = options.temperature;
    request["max_tokens"] = options.max_tokens;

    json msgs = json::array();
    for (const auto& msg : messages) {
        msgs.push_back(message_to_json(msg));
    }
    request["messages"] = msgs;

    if (!tools.empty()) {
        json tools_arr = json::array();
        for (const auto& tool : tools) {
            json params = json::parse(tool.parameters_json, nullptr, false);
            if (params.is_discarded()) params = json::object();
            tools_arr.push_back({
                {"type", "function"},
                {"function", {
                    {"name", tool.name},
                    {"description", tool.description},
                    {"parameters", params}
                }}
            });
        }
        request["tools"] = tools_arr;
        request["tool_choice"] = "auto";
    }

    request["stream"] = false;
    return request;
}

std::vector<Header> MistralProvider::build_headers() const {
    return {
        {"Authorization", "Bearer " + api_key_},
        {"Content-Type", "application/json"}
    };
}

void MistralProvider::check_response(const HttpResponse& response) const {
    if (response.status_code == 0) {
        throw TransportError(provider_name() + " API request failed: " +
            (response.error.empty() ? std::string("no response") : response.error));
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        throw TransportError(provider_name() + " API error (HTTP " +
            std::to_string(response.status_code) + "): " + response.body,
            response.status_code);
    }
}

static ToolCall parse_tool_call(const json& tc) {
    ToolCall call;
    call.id = json_string(tc, "id");
    if (tc.contains("function") && tc["function"].is_object()) {
        const auto& fn = tc["function"];
        call.name = json_string(fn, "name");
        if (fn.contains("arguments") && !fn["arguments"].is_null()) {
            call.arguments = fn["arguments"].is_string()
                ? fn["arguments"].get<std::string>()
                : fn["arguments"].dump();
        }
    }
    return call;
}

ChatResponse MistralProvider::chat(const std::vector<ChatMessage>& messages,
                                   const std::vector<ToolSpec>& tools,
                                   const ChatOptions& options) {
    json request = build_request(messages, tools, options);

    auto response = http_.post(base_url_ + "/chat/completions", request.dump(),
                               build_headers(), options.timeout_seconds);
    check_response(response);

    json resp;
    try {
        resp = json::parse(response.body);
    } catch (const json::exception& e) {
        throw ProtocolError(std::string("Failed to parse Mistral API response: ") + e.what(),
                            response.body);
    }

    if (!resp.contains("choices") || !resp["choices"].is_array() || resp["choices"].empty() ||
        !resp["choices"][0].contains("message")) {
        throw ProtocolError("Mistral API response has no choices", response.body);
    }

    ChatResponse result;
    result.model = json_string(resp, "model", options.model);

    const auto& message = resp["choices"][0]["message"];
    if (message.contains("content") && message["content"].is_string()) {
        result.content = message["content"].get<std::string>();
    }
    if (message.contains("tool_calls") && message["tool_calls"].is_array()) {
        for (const auto& tc : message["tool_calls"]) {
            result.tool_calls.push_back(parse_tool_call(tc));
        }
    }

    if (resp.contains("usage") && resp["usage"].is_object()) {
        const auto& usage = resp["usage"];
        result.usage.prompt_tokens = json_uint(usage, "prompt_tokens");
        result.usage.completion_tokens = json_uint(usage, "completion_tokens");
        result.usage.total_tokens = json_uint(usage, "total_tokens");
    }

    return result;
}

ChatResponse MistralProvider::chat_stream(const std::vector<ChatMessage>& messages,
                                          const std::vector<ToolSpec>& tools,
                                          const ChatOptions& options,
                                          const DeltaCallback& on_delta) {
    json request = build_request(messages, tools, options);
    request["stream"] = true;

    ChatResponse result;
    result.model = options.model;
    std::string accumulated_text;
    ToolCallAssembler assembler;
    StreamDecoder decoder(frame_policy_);

    bool cancelled = false;
    std::exception_ptr failure;

    auto http_response = http_.stream_post_raw(
        base_url_ + "/chat/completions", request.dump(), build_headers(),
        [&](const char* data, size_t len) -> bool {
            // Exceptions must not cross the transport's C callbacks
            try {
                for (auto& delta : decoder.feed(std::string(data, len))) {
                    if (delta.text) accumulated_text += *delta.text;
                    if (delta.tool_call_fragments) assembler.add(*delta.tool_call_fragments);
                    if (on_delta && !on_delta(delta)) {
                        cancelled = true;
                        return false;
                    }
                }
            } catch (...) {
                failure = std::current_exception();
                return false;
            }
            return true;
        },
        options.timeout_seconds);

    if (failure) std::rethrow_exception(failure);
    if (!cancelled) check_response(http_response);

    if (!accumulated_text.empty()) {
        result.content = accumulated_text;
    }
    result.tool_calls = assembler.complete();
    return result;
}

} // namespace ledgerchat
