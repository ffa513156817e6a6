#include "server/api_routes.hpp"
#include "agent.hpp"
#include "util.hpp"
#include "version.hpp"
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace ledgerchat {

namespace {

constexpr const char* kJson = "application/json";
constexpr uint64_t kModelCreated = 1640995200;

std::string sse_data(const json& payload) {
    return "data: " + payload.dump() + "\n\n";
}

json chunk_payload(const std::string& id, uint64_t created, const std::string& model,
                   const json& delta, const json& finish_reason) {
    return json{
        {"id", id},
        {"object", "chat.completion.chunk"},
        {"created", created},
        {"model", model},
        {"choices", json::array({json{
            {"index", 0},
            {"delta", delta},
            {"finish_reason", finish_reason},
        }})},
    };
}

} // namespace

std::string last_user_message(const json& messages) {
    if (!messages.is_array()) {
        throw std::invalid_argument("messages must be an array");
    }
    const json* last = nullptr;
    for (const auto& msg : messages) {
        if (json_string(msg, "role") == "user") last = &msg;
    }
    if (!last || !last->contains("content")) return "Hello";

    const json& content = (*last)["content"];
    if (content.is_string()) return content.get<std::string>();
    if (content.is_array()) {
        std::string joined;
        bool first = true;
        for (const auto& part : content) {
            if (json_string(part, "type") != "text") continue;
            if (!part.contains("text") || !part["text"].is_string()) continue;
            if (!first) joined += ' ';
            joined += part["text"].get<std::string>();
            first = false;
        }
        return joined;
    }
    throw std::invalid_argument("Content must be a string or array");
}

std::string api_error_body(const std::string& message, const std::string& type) {
    return json{{"error", {{"message", message}, {"type", type}, {"code", nullptr}}}}.dump();
}

ApiRoutes::ApiRoutes(Agent& agent, std::string backend_model)
    : agent_(agent), backend_model_(std::move(backend_model))
{}

void ApiRoutes::handle(const HttpRequest& req, ResponseWriter& out) {
    if (req.method == "OPTIONS") {
        out.send(204, "text/plain", "");
        return;
    }
    if (req.path == "/health") {
        if (req.method != "GET") {
            out.send(405, kJson, api_error_body("Method not allowed", "invalid_request_error"));
            return;
        }
        health(out);
        return;
    }
    if (req.path == "/models" || req.path == "/v1/models") {
        if (req.method != "GET") {
            out.send(405, kJson, api_error_body("Method not allowed", "invalid_request_error"));
            return;
        }
        models(out);
        return;
    }
    if (req.path == "/chat/completions" || req.path == "/v1/chat/completions") {
        if (req.method != "POST") {
            out.send(405, kJson, api_error_body("Method not allowed", "invalid_request_error"));
            return;
        }
        chat_completions(req, out);
        return;
    }
    out.send(404, kJson, api_error_body("Not found: " + req.path, "invalid_request_error"));
}

void ApiRoutes::health(ResponseWriter& out) const {
    json body = {
        {"status", "healthy"},
        {"service", "ledgerchat API"},
        {"version", LEDGERCHAT_VERSION},
    };
    out.send(200, kJson, body.dump());
}

void ApiRoutes::models(ResponseWriter& out) const {
    json data = json::array();
    data.push_back({{"id", "ledgerchat"}, {"object", "model"},
                    {"created", kModelCreated}, {"owned_by", "ledgerchat"}});
    if (backend_model_ != "ledgerchat") {
        data.push_back({{"id", backend_model_}, {"object", "model"},
                        {"created", kModelCreated}, {"owned_by", "mistral"}});
    }
    out.send(200, kJson, json{{"object", "list"}, {"data", data}}.dump());
}

void ApiRoutes::chat_completions(const HttpRequest& req, ResponseWriter& out) {
    if (req.has_header("authorization")) {
        std::string auth = req.header("authorization");
        if (auth.rfind("Bearer ", 0) != 0) {
            out.send(401, kJson, api_error_body("Invalid authorization header",
                                                "authentication_error"));
            return;
        }
    }

    json body = json::parse(req.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        out.send(400, kJson, api_error_body("Request body is not valid JSON",
                                            "invalid_request_error"));
        return;
    }

    std::string question;
    try {
        question = last_user_message(body.value("messages", json::array()));
    } catch (const std::invalid_argument& e) {
        out.send(400, kJson, api_error_body(e.what(), "invalid_request_error"));
        return;
    }

    std::string model = body.contains("model") && body["model"].is_string()
        ? body["model"].get<std::string>() : std::string("ledgerchat");
    bool streaming = body.contains("stream") && body["stream"].is_boolean() &&
                     body["stream"].get<bool>();

    if (streaming) {
        stream(model, question, out);
    } else {
        complete(model, question, out);
    }
}

void ApiRoutes::complete(const std::string& model, const std::string& question,
                         ResponseWriter& out) {
    std::string answer;
    try {
        answer = agent_.ask(question);
    } catch (const std::exception& e) {
        std::cerr << "[server] turn failed: " << e.what() << '\n';
        out.send(500, kJson, api_error_body(e.what(), "server_error"));
        return;
    }

    uint32_t prompt_tokens = estimate_tokens(question);
    uint32_t completion_tokens = estimate_tokens(answer);
    json body = {
        {"id", "chatcmpl-" + generate_id()},
        {"object", "chat.completion"},
        {"created", epoch_seconds()},
        {"model", model},
        {"choices", json::array({json{
            {"index", 0},
            {"message", {{"role", "assistant"}, {"content", answer}}},
            {"finish_reason", "stop"},
        }})},
        {"usage", {
            {"prompt_tokens", prompt_tokens},
            {"completion_tokens", completion_tokens},
            {"total_tokens", estimate_tokens(question + answer)},
        }},
    };
    out.send(200, kJson, body.dump());
}

void ApiRoutes::stream(const std::string& model, const std::string& question,
                       ResponseWriter& out) {
    StreamReceiver receiver = agent_.ask_streaming(question);

    std::string id = "chatcmpl-" + generate_id();
    uint64_t created = epoch_seconds();
    out.begin_stream(200, "text/event-stream");

    StreamEvent event;
    size_t chunks = 0;
    while (receiver.receive(event)) {
        if (event.kind == StreamEvent::Kind::Chunk) {
            json delta = {{"content", event.text}};
            if (!out.write_chunk(sse_data(chunk_payload(id, created, model, delta, nullptr)))) {
                std::cerr << "[server] client went away after " << chunks << " chunk(s)\n";
                return; // receiver destructor stops the producer
            }
            chunks++;
            continue;
        }
        if (event.kind == StreamEvent::Kind::Complete) {
            out.write_chunk(sse_data(chunk_payload(id, created, model, json::object(), "stop")));
        } else {
            std::cerr << "[server] stream failed: " << event.text << '\n';
        }
        break;
    }

    out.write_chunk("data: [DONE]\n\n");
    out.end_stream();
}

} // namespace ledgerchat
