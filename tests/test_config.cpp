#include <catch2/catch.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace ledgerchat;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.provider == "mistral");
    REQUIRE(cfg.model == "mistral-large-latest");
    REQUIRE(cfg.temperature == 0.7);
    REQUIRE(cfg.stream_temperature == 0.3);
    REQUIRE(cfg.max_tokens == 4096);
    REQUIRE(cfg.api_key.empty());
    REQUIRE(cfg.mcp_server.empty());
}

TEST_CASE("AgentConfig: default values", "[config]") {
    AgentConfig ac;
    REQUIRE(ac.tool_timeout_seconds == 30);
    REQUIRE(ac.request_timeout_seconds == 120);
    REQUIRE(ac.stream_timeout_seconds == 300);
    REQUIRE_FALSE(ac.strict_stream_frames);
}

TEST_CASE("ServerConfig: default values", "[config]") {
    ServerConfig sc;
    REQUIRE(sc.listen == "127.0.0.1:8080");
    REQUIRE(sc.max_body == 1048576);
}

// ── Round-trip options ───────────────────────────────────────────

TEST_CASE("Config::chat_options: carries model, sampling and deadline", "[config]") {
    Config cfg;
    cfg.model = "mistral-small-latest";
    cfg.max_tokens = 512;
    cfg.agent.request_timeout_seconds = 60;
    ChatOptions opts = cfg.chat_options();
    REQUIRE(opts.model == "mistral-small-latest");
    REQUIRE(opts.temperature == 0.7);
    REQUIRE(opts.max_tokens == 512);
    REQUIRE(opts.timeout_seconds == 60);
}

TEST_CASE("Config::stream_options: uses stream temperature and deadline", "[config]") {
    Config cfg;
    cfg.agent.stream_timeout_seconds = 90;
    ChatOptions opts = cfg.stream_options();
    REQUIRE(opts.temperature == 0.3);
    REQUIRE(opts.timeout_seconds == 90);
    REQUIRE(opts.model == cfg.model);
}

// ── Config::load ────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "ledgerchat_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

static const char* kEnvVars[] = {
    "MISTRAL_API_KEY", "MISTRAL_API_URL", "LEDGERCHAT_MODEL",
    "LEDGERCHAT_MCP_SERVER", "LEDGERCHAT_LISTEN",
};

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        for (const char* var : kEnvVars) unsetenv(var);
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        for (const char* var : kEnvVars) unsetenv(var);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.ledgerchat/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.ledgerchat");
        std::ofstream f(config_path());
        f << content;
    }

    nlohmann::json read_config() const {
        std::ifstream f(config_path());
        return nlohmann::json::parse(f);
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "model": "mistral-small-latest",
        "temperature": 0.5,
        "max_tokens": 1000,
        "api_key": "sk-file",
        "mcp_server": "./lago-mcp-server",
        "agent": {
            "tool_timeout_seconds": 10,
            "request_timeout_seconds": 45,
            "strict_stream_frames": true
        },
        "server": { "listen": "0.0.0.0:9000", "max_body": 2048 }
    })");

    Config cfg = Config::load();

    REQUIRE(cfg.model == "mistral-small-latest");
    REQUIRE(cfg.temperature == 0.5);
    REQUIRE(cfg.max_tokens == 1000);
    REQUIRE(cfg.api_key == "sk-file");
    REQUIRE(cfg.mcp_server == "./lago-mcp-server");
    REQUIRE(cfg.agent.tool_timeout_seconds == 10);
    REQUIRE(cfg.agent.request_timeout_seconds == 45);
    REQUIRE(cfg.agent.stream_timeout_seconds == 300);
    REQUIRE(cfg.agent.strict_stream_frames);
    REQUIRE(cfg.server.listen == "0.0.0.0:9000");
    REQUIRE(cfg.server.max_body == 2048);
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"api_key": "from-file", "model": "file-model"})");
    setenv("MISTRAL_API_KEY", "from-env", 1);
    setenv("LEDGERCHAT_MODEL", "env-model", 1);
    setenv("MISTRAL_API_URL", "http://localhost:1234/v1", 1);
    setenv("LEDGERCHAT_MCP_SERVER", "cat", 1);
    setenv("LEDGERCHAT_LISTEN", "127.0.0.1:0", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.api_key == "from-env");
    REQUIRE(cfg.model == "env-model");
    REQUIRE(cfg.base_url == "http://localhost:1234/v1");
    REQUIRE(cfg.mcp_server == "cat");
    REQUIRE(cfg.server.listen == "127.0.0.1:0");
}

TEST_CASE("Config::load: missing file creates defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config cfg = Config::load();
    REQUIRE(cfg.provider == "mistral");
    REQUIRE(std::filesystem::exists(g.config_path()));

    auto written = g.read_config();
    REQUIRE(written["agent"]["tool_timeout_seconds"] == 30);
    REQUIRE(written["server"]["listen"] == "127.0.0.1:8080");
}

TEST_CASE("Config::load: partial file is migrated with new defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"model": "keep-me", "agent": {"tool_timeout_seconds": 5}})");
    Config cfg = Config::load();
    REQUIRE(cfg.model == "keep-me");
    REQUIRE(cfg.agent.tool_timeout_seconds == 5);

    auto written = g.read_config();
    REQUIRE(written["model"] == "keep-me");
    REQUIRE(written["agent"]["tool_timeout_seconds"] == 5);
    REQUIRE(written["agent"]["stream_timeout_seconds"] == 300);
    REQUIRE(written.contains("server"));
}

TEST_CASE("Config::load: malformed file falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("{ this is not json");
    Config cfg = Config::load();
    REQUIRE(cfg.model == "mistral-large-latest");
    REQUIRE(cfg.agent.tool_timeout_seconds == 30);
}

TEST_CASE("Config::load: wrong types are ignored", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"model": 42, "max_tokens": "lots", "agent": {"tool_timeout_seconds": -1}})");
    Config cfg = Config::load();
    REQUIRE(cfg.model == "mistral-large-latest");
    REQUIRE(cfg.max_tokens == 4096);
    REQUIRE(cfg.agent.tool_timeout_seconds == 30);
}

// ── load_dotenv ──────────────────────────────────────────────────

TEST_CASE("load_dotenv: sets unset variables only", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    std::string path = g.dir + "/.env";
    {
        std::ofstream f(path);
        f << "# comment\n"
          << "\n"
          << "MISTRAL_API_KEY=from-dotenv\n"
          << "export LEDGERCHAT_MODEL=\"quoted-model\"\n"
          << "LEDGERCHAT_MCP_SERVER='./server --flag'\n"
          << "LEDGERCHAT_LISTEN=should-not-win\n"
          << "not a variable\n";
    }
    setenv("LEDGERCHAT_LISTEN", "127.0.0.1:1", 1);

    REQUIRE(load_dotenv(path) == 3);
    REQUIRE(std::string(std::getenv("MISTRAL_API_KEY")) == "from-dotenv");
    REQUIRE(std::string(std::getenv("LEDGERCHAT_MODEL")) == "quoted-model");
    REQUIRE(std::string(std::getenv("LEDGERCHAT_MCP_SERVER")) == "./server --flag");
    REQUIRE(std::string(std::getenv("LEDGERCHAT_LISTEN")) == "127.0.0.1:1");
}

TEST_CASE("load_dotenv: missing file sets nothing", "[config]") {
    REQUIRE(load_dotenv("/nonexistent/ledgerchat/.env") == 0);
}
