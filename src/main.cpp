#include "agent.hpp"
#include "commands.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "http.hpp"
#include "mcp/mcp_client.hpp"
#include "provider.hpp"
#include "server/api_routes.hpp"
#include "server/http_server.hpp"
#include "tui.hpp"
#include "util.hpp"
#include "version.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

static std::atomic<bool> g_shutdown{false};
static std::atomic<bool> g_interrupt{false};

static void shutdown_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static void interrupt_handler(int /*sig*/) {
    g_interrupt.store(true);
}

static void print_usage() {
    std::cout << "Usage: ledgerchat <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  chat                 Interactive session, answers in one piece\n"
              << "  tui                  Interactive session with streamed answers\n"
              << "  ask QUESTION         Answer a single question and exit\n"
              << "  serve                Run the OpenAI-compatible HTTP API\n"
              << "\n"
              << "Options:\n"
              << "  -s, --mcp-server CMD Command that launches the MCP tool server\n"
              << "  --model NAME         Use specific model\n"
              << "  --listen HOST:PORT   Listen address for serve (default 127.0.0.1:8080)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /status              Show current model, provider, history info\n"
              << "  /tools               List available tools\n"
              << "  /model NAME          Switch model\n"
              << "  /clear               Clear conversation history\n"
              << "  /help                Show available commands\n"
              << "  /quit, /exit         Exit the session\n"
              << "\n"
              << "Environment variables (a .env file in the working directory is read first):\n"
              << "  MISTRAL_API_KEY        API key for Mistral (required)\n"
              << "  MISTRAL_API_URL        Base URL (default: https://api.mistral.ai/v1)\n"
              << "  LEDGERCHAT_MODEL       Model name\n"
              << "  LEDGERCHAT_MCP_SERVER  Command that launches the MCP tool server\n"
              << "  LEDGERCHAT_LISTEN      Listen address for serve\n";
}

static void print_banner(const ledgerchat::Agent& agent, const char* mode) {
    std::cout << "ledgerchat " << LEDGERCHAT_VERSION << " (" << mode << ")\n"
              << "Provider: " << agent.provider_name()
              << " | Model: " << agent.model() << "\n"
              << "Type /help for commands, /quit to exit.\n\n";
}

// Returns false on EOF
static bool read_prompt(std::string& line) {
    std::cout << "ledgerchat> " << std::flush;
    if (!std::getline(std::cin, line)) {
        std::cout << "\n";
        return false;
    }
    line = ledgerchat::trim(line);
    return true;
}

static void run_chat(ledgerchat::Agent& agent) {
    print_banner(agent, "chat");
    std::string line;
    while (read_prompt(line)) {
        if (line.empty()) continue;
        if (auto cmd = ledgerchat::handle_command(line, agent)) {
            if (cmd->quit) break;
            std::cout << cmd->output << "\n";
            continue;
        }

        try {
            std::string response = agent.ask(line);
            std::cout << "\n" << response << "\n\n";
        } catch (const std::exception& e) {
            std::cout << "\nError: " << e.what() << "\n\n";
        }
    }
}

static void run_tui(ledgerchat::Agent& agent) {
    std::signal(SIGINT, interrupt_handler);
    ledgerchat::http_set_abort_flag(&g_interrupt);
    print_banner(agent, "streaming");
    std::string line;
    while (read_prompt(line)) {
        if (line.empty()) continue;
        if (auto cmd = ledgerchat::handle_command(line, agent)) {
            if (cmd->quit) break;
            std::cout << cmd->output << "\n";
            continue;
        }

        g_interrupt.store(false);
        std::cout << "\n";
        try {
            ledgerchat::StreamReceiver receiver = agent.ask_streaming(line);
            ledgerchat::render_stream(receiver, std::cout,
                                      std::chrono::milliseconds(50), &g_interrupt);
        } catch (const std::exception& e) {
            std::cout << "Error: " << e.what();
        }
        std::cout << "\n\n";
        std::cin.clear();
    }
    ledgerchat::http_set_abort_flag(nullptr);
    std::signal(SIGINT, SIG_DFL);
}

static int run_serve(ledgerchat::Agent& agent, const ledgerchat::Config& config) {
    std::signal(SIGINT, shutdown_handler);
    std::signal(SIGTERM, shutdown_handler);
    ledgerchat::http_set_abort_flag(&g_shutdown);

    ledgerchat::ApiRoutes routes(agent, config.model);
    ledgerchat::HttpServer server(
        config.server.listen, config.server.max_body,
        [&routes](const ledgerchat::HttpRequest& req, ledgerchat::ResponseWriter& out) {
            routes.handle(req, out);
        });

    std::string error;
    if (!server.start(error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }
    std::cerr << "[server] endpoints: GET /health, GET /v1/models, POST /v1/chat/completions\n";

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[server] shutting down\n";
    server.stop();
    return 0;
}

int main(int argc, char* argv[]) try {
    std::string command;
    std::string question;
    std::string mcp_server;
    std::string model_name;
    std::string listen;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-s") == 0 || std::strcmp(argv[i], "--mcp-server") == 0) && i + 1 < argc) {
            mcp_server = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else if (std::strcmp(argv[i], "--listen") == 0 && i + 1 < argc) {
            listen = argv[++i];
        } else if (argv[i][0] != '-' && command.empty()) {
            command = argv[i];
        } else if (argv[i][0] != '-' && command == "ask" && question.empty()) {
            question = argv[i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    if (command != "chat" && command != "tui" && command != "ask" && command != "serve") {
        if (!command.empty()) std::cerr << "Unknown command: " << command << "\n";
        print_usage();
        return 1;
    }
    if (command == "ask" && question.empty()) {
        std::cerr << "ask requires a QUESTION\n";
        return 1;
    }

    ledgerchat::load_dotenv(".env");
    ledgerchat::http_init();
    auto config = ledgerchat::Config::load();

    // Override config with CLI args
    if (!mcp_server.empty()) config.mcp_server = mcp_server;
    if (!model_name.empty()) config.model = model_name;
    if (!listen.empty()) config.server.listen = listen;

    if (config.mcp_server.empty()) {
        throw ledgerchat::ConfigurationError(
            "No MCP server configured (use --mcp-server or LEDGERCHAT_MCP_SERVER)");
    }

    ledgerchat::PlatformHttpClient http_client;
    auto provider = ledgerchat::create_provider(
        config.provider, config.api_key, http_client,
        config.base_url, config.agent.strict_stream_frames);

    auto tools = ledgerchat::connect_stdio_server(
        config.mcp_server, std::chrono::seconds(config.agent.tool_timeout_seconds));

    int rc = 0;
    {
        ledgerchat::Agent agent(std::move(provider), tools, config);

        if (command == "ask") {
            std::cout << agent.ask(question) << '\n';
        } else if (command == "chat") {
            run_chat(agent);
        } else if (command == "tui") {
            run_tui(agent);
        } else {
            rc = run_serve(agent, config);
        }
    }

    ledgerchat::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
}
