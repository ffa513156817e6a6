#pragma once
#include "../provider.hpp"
#include "../http.hpp"
#include "stream_decoder.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ledgerchat {

// Mistral chat-completions backend (OpenAI-compatible wire format).
class MistralProvider : public Provider {
public:
    MistralProvider(const std::string& api_key, HttpClient& http,
                    const std::string& base_url = "",
                    FramePolicy frame_policy = FramePolicy::Lenient);

    ChatResponse chat(const std::vector<ChatMessage>& messages,
                      const std::vector<ToolSpec>& tools,
                      const ChatOptions& options) override;

    ChatResponse chat_stream(const std::vector<ChatMessage>& messages,
                             const std::vector<ToolSpec>& tools,
                             const ChatOptions& options,
                             const DeltaCallback& on_delta) override;

    std::string provider_name() const override { return "mistral"; }

    nlohmann::json build_request(const std::vector<ChatMessage>& messages,
                                 const std::vector<ToolSpec>& tools,
                                 const ChatOptions& options) const;

private:
    std::vector<Header> build_headers() const;
    void check_response(const HttpResponse& response) const;

    std::string api_key_;
    HttpClient& http_;
    std::string base_url_;
    FramePolicy frame_policy_;
};

} // namespace ledgerchat
