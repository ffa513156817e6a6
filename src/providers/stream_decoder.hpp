#pragma once
#include "../provider.hpp"
#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace ledgerchat {

// What to do with a "data:" record whose payload is not valid JSON.
enum class FramePolicy {
    Lenient, // drop it and count it
    Strict   // throw ProtocolError carrying the payload
};

// Incremental decoder for a chat-completion event stream:
//
//   data: {"choices":[{"delta":{"content":"Hel"}}]}
//   data: {"choices":[{"delta":{"content":"lo"}}]}
//   data: [DONE]
//
// Network reads do not align with records, so bytes after the last newline
// are carried over to the next feed().
class StreamDecoder {
public:
    explicit StreamDecoder(FramePolicy policy = FramePolicy::Lenient);

    // Decode one network read. Text from every record completed by this
    // chunk is joined into a single delta; tool-call fragments are passed
    // through with their stream_index. On [DONE] a terminal delta
    // (done == true, no text, no fragments) is appended and the decoder
    // closes: later calls return an empty vector.
    std::vector<StreamDelta> feed(const std::string& chunk);

    // Drop buffered bytes and reopen a closed decoder.
    void reset();

    bool closed() const { return closed_; }
    size_t skipped_frames() const { return skipped_frames_; }

private:
    void decode_record(const std::string& payload, StreamDelta& pending);

    FramePolicy policy_;
    std::string buffer_;
    bool closed_ = false;
    size_t skipped_frames_ = 0;
};

// Merges streamed tool-call fragments into complete calls. Fragments are
// correlated by stream_index; a fragment without one is matched by id, and
// one with neither continues the most recent call.
class ToolCallAssembler {
public:
    void add(const ToolCall& fragment);
    void add(const std::vector<ToolCall>& fragments);

    bool empty() const { return calls_.empty(); }

    // Merged calls ordered by stream_index.
    std::vector<ToolCall> complete() const;

private:
    int key_for(const ToolCall& fragment) const;

    std::map<int, ToolCall> calls_;
};

} // namespace ledgerchat
