#include "commands.hpp"
#include "agent.hpp"
#include "util.hpp"
#include <exception>

namespace ledgerchat {

std::string cmd_status(const Agent& agent) {
    return "Provider: " + agent.provider_name() + "\n"
        + "Model: " + agent.model() + "\n"
        + "Tools: " + agent.tool_provider().provider_name() + "\n"
        + "History: " + std::to_string(agent.history_size()) + " messages\n"
        + "Estimated tokens: " + std::to_string(agent.estimated_tokens()) + "\n";
}

std::string cmd_tools(const Agent& agent) {
    std::vector<ToolInfo> tools;
    try {
        tools = agent.tool_provider().list_tools();
    } catch (const std::exception& e) {
        return std::string("Error: ") + e.what();
    }
    if (tools.empty()) return "No tools available.";

    std::string result = "Tools (" + std::to_string(tools.size()) + "):\n";
    for (const auto& t : tools) {
        result += "  " + t.name;
        if (t.description) result += " - " + *t.description;
        result += "\n";
    }
    return result;
}

std::string cmd_model(const std::string& new_model, Agent& agent) {
    std::string model = trim(new_model);
    if (model.empty()) return "Usage: /model NAME";
    agent.set_model(model);
    return "Model set to: " + model;
}

std::string cmd_clear(Agent& agent) {
    agent.clear_history();
    return "History cleared.";
}

std::string cmd_help() {
    return "Commands:\n"
           "  /status   Show current status\n"
           "  /tools    List available tools\n"
           "  /model X  Switch to model X\n"
           "  /clear    Clear conversation history\n"
           "  /quit     Exit\n"
           "  /exit     Exit\n"
           "  /help     Show this help\n";
}

std::optional<CommandOutcome> handle_command(const std::string& line, Agent& agent) {
    if (line.empty() || line[0] != '/') return std::nullopt;

    if (line == "/quit" || line == "/exit") return CommandOutcome{"", true};
    if (line == "/status") return CommandOutcome{cmd_status(agent)};
    if (line == "/tools") return CommandOutcome{cmd_tools(agent)};
    if (line == "/clear") return CommandOutcome{cmd_clear(agent)};
    if (line == "/help") return CommandOutcome{cmd_help()};
    if (line == "/model") return CommandOutcome{agent.model()};
    if (line.rfind("/model ", 0) == 0) return CommandOutcome{cmd_model(line.substr(7), agent)};
    return CommandOutcome{"Unknown command: " + line};
}

} // namespace ledgerchat
