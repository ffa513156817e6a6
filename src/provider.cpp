#include "provider.hpp"
#include "errors.hpp"
#include "providers/mistral.hpp"

namespace ledgerchat {

std::unique_ptr<Provider> create_provider(const std::string& name,
                                          const std::string& api_key,
                                          HttpClient& http,
                                          const std::string& base_url,
                                          bool strict_stream_frames) {
    if (name != "mistral") {
        throw ConfigurationError("Unknown provider: " + name);
    }
    if (api_key.empty()) {
        throw ConfigurationError("MISTRAL_API_KEY environment variable not set");
    }
    auto policy = strict_stream_frames ? FramePolicy::Strict : FramePolicy::Lenient;
    return std::make_unique<MistralProvider>(api_key, http, base_url, policy);
}

} // namespace ledgerchat
