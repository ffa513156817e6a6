#include "stream_decoder.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace ledgerchat {

StreamDecoder::StreamDecoder(FramePolicy policy) : policy_(policy) {}

std::vector<StreamDelta> StreamDecoder::feed(const std::string& chunk) {
    std::vector<StreamDelta> out;
    if (closed_) return out;

    buffer_ += chunk;

    StreamDelta pending;
    size_t pos = 0;
    while (pos < buffer_.size()) {
        size_t newline = buffer_.find('\n', pos);
        if (newline == std::string::npos) break; // incomplete record

        std::string line = buffer_.substr(pos, newline - pos);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        pos = newline + 1;

        // Blank separators, comments (":") and other fields are ignored
        if (line.rfind("data:", 0) != 0) continue;

        // Accept both "data: payload" and "data:payload"
        std::string payload = line.substr(line.size() > 5 && line[5] == ' ' ? 6 : 5);
        if (payload.empty()) continue;

        if (payload == "[DONE]") {
            if (pending.text || pending.tool_call_fragments) {
                out.push_back(std::move(pending));
            }
            StreamDelta terminal;
            terminal.done = true;
            out.push_back(std::move(terminal));
            closed_ = true;
            buffer_.clear();
            return out;
        }

        decode_record(payload, pending);
    }

    buffer_.erase(0, pos);

    if (pending.text || pending.tool_call_fragments) {
        out.push_back(std::move(pending));
    }
    return out;
}

void StreamDecoder::decode_record(const std::string& payload, StreamDelta& pending) {
    json frame = json::parse(payload, nullptr, false);
    if (frame.is_discarded() || !frame.is_object()) {
        if (policy_ == FramePolicy::Strict) {
            throw ProtocolError("Malformed stream frame", payload);
        }
        skipped_frames_++;
        return;
    }

    if (!frame.contains("choices") || !frame["choices"].is_array() ||
        frame["choices"].empty()) {
        return;
    }
    const auto& choice = frame["choices"][0];
    if (!choice.contains("delta") || !choice["delta"].is_object()) return;
    const auto& delta = choice["delta"];

    if (delta.contains("content") && delta["content"].is_string()) {
        std::string text = delta["content"].get<std::string>();
        if (!text.empty()) {
            if (!pending.text) pending.text.emplace();
            *pending.text += text;
        }
    }

    if (delta.contains("tool_calls") && delta["tool_calls"].is_array()) {
        for (const auto& tc : delta["tool_calls"]) {
            if (!tc.is_object()) continue;
            ToolCall fragment;
            fragment.id = json_string(tc, "id");
            if (tc.contains("index") && tc["index"].is_number_integer()) {
                fragment.stream_index = tc["index"].get<int>();
            }
            if (tc.contains("function") && tc["function"].is_object()) {
                const auto& fn = tc["function"];
                fragment.name = json_string(fn, "name");
                if (fn.contains("arguments") && !fn["arguments"].is_null()) {
                    // Some backends send arguments as an object instead of text
                    fragment.arguments = fn["arguments"].is_string()
                        ? fn["arguments"].get<std::string>()
                        : fn["arguments"].dump();
                }
            }
            if (!pending.tool_call_fragments) pending.tool_call_fragments.emplace();
            pending.tool_call_fragments->push_back(std::move(fragment));
        }
    }
}

void StreamDecoder::reset() {
    buffer_.clear();
    closed_ = false;
    skipped_frames_ = 0;
}

// ── ToolCallAssembler ────────────────────────────────────────────

int ToolCallAssembler::key_for(const ToolCall& fragment) const {
    if (fragment.stream_index) return *fragment.stream_index;
    if (calls_.empty()) return 0;
    if (fragment.id.empty()) return calls_.rbegin()->first;
    for (const auto& [key, call] : calls_) {
        if (call.id == fragment.id) return key;
    }
    return calls_.rbegin()->first + 1;
}

void ToolCallAssembler::add(const ToolCall& fragment) {
    int key = key_for(fragment);
    auto& entry = calls_[key];
    entry.stream_index = key;
    if (entry.id.empty() && !fragment.id.empty()) entry.id = fragment.id;
    if (entry.name.empty() && !fragment.name.empty()) entry.name = fragment.name;
    entry.arguments += fragment.arguments;
}

void ToolCallAssembler::add(const std::vector<ToolCall>& fragments) {
    for (const auto& fragment : fragments) add(fragment);
}

std::vector<ToolCall> ToolCallAssembler::complete() const {
    std::vector<ToolCall> calls;
    calls.reserve(calls_.size());
    for (const auto& [key, call] : calls_) {
        calls.push_back(call);
    }
    return calls;
}

} // namespace ledgerchat
