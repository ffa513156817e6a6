#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace ledgerchat {

nlohmann::json Config::defaults_json() {
    return {
        {"provider", "mistral"},
        {"model", "mistral-large-latest"},
        {"temperature", 0.7},
        {"stream_temperature", 0.3},
        {"max_tokens", 4096},
        {"base_url", ""},
        {"api_key", ""},
        {"mcp_server", ""},
        {"agent", {
            {"tool_timeout_seconds", 30},
            {"request_timeout_seconds", 120},
            {"stream_timeout_seconds", 300},
            {"strict_stream_frames", false}
        }},
        {"server", {
            {"listen", "127.0.0.1:8080"},
            {"max_body", 1048576}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                     const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

template <typename T>
static void read_unsigned(const nlohmann::json& obj, const char* key, T& out) {
    if (obj.contains(key) && obj[key].is_number_unsigned())
        out = obj[key].get<T>();
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string())
        out = obj[key].get<std::string>();
}

Config Config::load() {
    Config cfg;

    std::string config_path = expand_home("~/.ledgerchat/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(config_path, j.dump(4) + "\n"))
                    std::cerr << "[config] Migrated config with new defaults: "
                              << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path << ": "
                      << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    read_string(j, "provider", cfg.provider);
    read_string(j, "model", cfg.model);
    if (j.contains("temperature") && j["temperature"].is_number())
        cfg.temperature = j["temperature"].get<double>();
    if (j.contains("stream_temperature") && j["stream_temperature"].is_number())
        cfg.stream_temperature = j["stream_temperature"].get<double>();
    read_unsigned(j, "max_tokens", cfg.max_tokens);
    read_string(j, "base_url", cfg.base_url);
    read_string(j, "api_key", cfg.api_key);
    read_string(j, "mcp_server", cfg.mcp_server);

    if (j.contains("agent") && j["agent"].is_object()) {
        const auto& a = j["agent"];
        read_unsigned(a, "tool_timeout_seconds", cfg.agent.tool_timeout_seconds);
        read_unsigned(a, "request_timeout_seconds", cfg.agent.request_timeout_seconds);
        read_unsigned(a, "stream_timeout_seconds", cfg.agent.stream_timeout_seconds);
        if (a.contains("strict_stream_frames") && a["strict_stream_frames"].is_boolean())
            cfg.agent.strict_stream_frames = a["strict_stream_frames"].get<bool>();
    }

    if (j.contains("server") && j["server"].is_object()) {
        const auto& s = j["server"];
        read_string(s, "listen", cfg.server.listen);
        read_unsigned(s, "max_body", cfg.server.max_body);
    }

    // Environment variables always override config file
    if (const char* v = std::getenv("MISTRAL_API_KEY"))
        cfg.api_key = v;
    if (const char* v = std::getenv("MISTRAL_API_URL"))
        cfg.base_url = v;
    if (const char* v = std::getenv("LEDGERCHAT_MODEL"))
        cfg.model = v;
    if (const char* v = std::getenv("LEDGERCHAT_MCP_SERVER"))
        cfg.mcp_server = v;
    if (const char* v = std::getenv("LEDGERCHAT_LISTEN"))
        cfg.server.listen = v;

    return cfg;
}

ChatOptions Config::chat_options() const {
    ChatOptions options;
    options.model = model;
    options.temperature = temperature;
    options.max_tokens = max_tokens;
    options.timeout_seconds = static_cast<long>(agent.request_timeout_seconds);
    return options;
}

ChatOptions Config::stream_options() const {
    ChatOptions options = chat_options();
    options.temperature = stream_temperature;
    options.timeout_seconds = static_cast<long>(agent.stream_timeout_seconds);
    return options;
}

size_t load_dotenv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return 0;

    size_t count = 0;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        if (line.rfind("export ", 0) == 0) line = trim(line.substr(7));

        auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        if (std::getenv(key.c_str())) continue;
        if (setenv(key.c_str(), value.c_str(), 0) == 0) count++;
    }
    return count;
}

} // namespace ledgerchat
