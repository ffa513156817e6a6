#pragma once
#include "server/http_server.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace ledgerchat {

class Agent;

// OpenAI-compatible REST surface over one shared conversation:
//   GET  /health
//   GET  /models, /v1/models
//   POST /chat/completions, /v1/chat/completions  (stream: true for SSE)
class ApiRoutes {
public:
    ApiRoutes(Agent& agent, std::string backend_model);

    void handle(const HttpRequest& req, ResponseWriter& out);

private:
    void health(ResponseWriter& out) const;
    void models(ResponseWriter& out) const;
    void chat_completions(const HttpRequest& req, ResponseWriter& out);
    void complete(const std::string& model, const std::string& question, ResponseWriter& out);
    void stream(const std::string& model, const std::string& question, ResponseWriter& out);

    Agent& agent_;
    std::string backend_model_;
};

// Text of the last "user" message. String content is used as is; an array
// of {type:"text"} parts is joined with single spaces. "Hello" when there is
// no user message. Throws std::invalid_argument for any other content shape.
std::string last_user_message(const nlohmann::json& messages);

// OpenAI-style error body
std::string api_error_body(const std::string& message, const std::string& type);

} // namespace ledgerchat
