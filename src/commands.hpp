#pragma once
#include <optional>
#include <string>

namespace ledgerchat {

class Agent;

// Slash commands shared by the chat and tui sessions. Each returns a string
// result for the caller to print.

std::string cmd_status(const Agent& agent);
std::string cmd_tools(const Agent& agent);
std::string cmd_model(const std::string& new_model, Agent& agent);
std::string cmd_clear(Agent& agent);
std::string cmd_help();

struct CommandOutcome {
    std::string output;
    bool quit = false;
};

// Dispatch a line starting with '/'. Returns nullopt for ordinary input.
std::optional<CommandOutcome> handle_command(const std::string& line, Agent& agent);

} // namespace ledgerchat
