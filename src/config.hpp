#pragma once
#include "provider.hpp"
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace ledgerchat {

struct AgentConfig {
    uint32_t tool_timeout_seconds = 30;
    uint32_t request_timeout_seconds = 120;
    uint32_t stream_timeout_seconds = 300; // deadline for a whole streamed reply
    bool strict_stream_frames = false;     // malformed frames abort the stream
};

struct ServerConfig {
    std::string listen = "127.0.0.1:8080";
    uint32_t max_body = 1048576;
};

struct Config {
    std::string provider = "mistral";
    std::string model = "mistral-large-latest";
    double temperature = 0.7;
    double stream_temperature = 0.3;
    uint32_t max_tokens = 4096;
    std::string base_url;    // empty = provider default
    std::string api_key;
    std::string mcp_server;  // command line that launches the tool provider

    AgentConfig agent;
    ServerConfig server;

    // Load from ~/.ledgerchat/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Options for a non-streaming / streaming backend round trip
    ChatOptions chat_options() const;
    ChatOptions stream_options() const;
};

// Read KEY=VALUE lines from a .env file into the environment. Variables that
// are already set are left alone. Returns the number of variables set; a
// missing file sets none.
size_t load_dotenv(const std::string& path);

} // namespace ledgerchat
